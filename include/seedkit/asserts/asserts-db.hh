/* ========================================================================== *
 *
 * @file seedkit/asserts/asserts-db.hh
 *
 * @brief An assertion database backed by SQLite3.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sqlite3pp.hh>

#include "seedkit/asserts/database.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::asserts {

/* -------------------------------------------------------------------------- */

using SQLiteDb = sqlite3pp::database; /**< SQLite3 database handle. */
using sql_rc   = int;                 /**< `SQLITE_*` result code. */

/** @brief Bumped whenever the `Assertions` table changes. */
constexpr unsigned ASSERTS_DB_SCHEMA_VERSION = 1;


/* -------------------------------------------------------------------------- */

/**
 * @brief A SQLite3 assertion database which only accepts assertions issued
 *        by a fixed set of authorities.
 *
 * The database is created if it does not exist. Use `:memory:` for a
 * throwaway database.
 */
class AssertsDb : public AssertionDatabase
{

  /* Data */

public:

  std::string           dbPath; /**< Path to database, or `:memory:`. */
  SQLiteDb              db;     /**< SQLite3 database handle. */
  std::set<std::string> trustedAuthorities;


  /* Internal Helpers */

private:

  /** @brief Create tables and version rows if they do not exist. */
  void
  init();

  /** @brief Fail unless every prerequisite of @a assertion is present. */
  void
  checkPrerequisites( const Assertion & assertion );


  /* Constructors */

public:

  AssertsDb( std::string_view dbPath, std::set<std::string> trustedAuthorities );

  explicit AssertsDb( std::set<std::string> trustedAuthorities )
    : AssertsDb( ":memory:", std::move( trustedAuthorities ) )
  {}

  AssertsDb( const AssertsDb & ) = delete;
  AssertsDb( AssertsDb && )      = delete;

  ~AssertsDb() override = default;

  AssertsDb &
  operator=( const AssertsDb & )
    = delete;
  AssertsDb &
  operator=( AssertsDb && )
    = delete;


  /* Basic Operations */

  /**
   * @brief Execute raw sqlite statements on the database.
   * @return `SQLITE_*` [error code](https://www.sqlite.org/rescode.html).
   */
  sql_rc
  execute_all( const char * stmt )
  {
    sqlite3pp::command cmd( this->db, stmt );
    return cmd.execute_all();
  }


  /* Queries */

  [[nodiscard]] std::optional<Assertion>
  find( assertion_type type, const std::vector<std::string> & primaryKey )
    override;

  using AssertionDatabase::find;

  /** @brief Count the assertions in the database. */
  [[nodiscard]] std::size_t
  size();

  /** @brief Get the schema version recorded in the database. */
  [[nodiscard]] unsigned
  getSchemaVersion();


  /* Insert */

  void
  add( const Assertion & assertion ) override;


}; /* End class `AssertsDb' */


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::asserts


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
