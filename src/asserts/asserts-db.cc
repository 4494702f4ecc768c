/* ========================================================================== *
 *
 * @file asserts/asserts-db.cc
 *
 * @brief Implementations for a SQLite3 assertion database.
 *
 *
 * -------------------------------------------------------------------------- */

#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <sqlite3pp.hh>

#include "seedkit/asserts/asserts-db.hh"
#include "seedkit/core/util.hh"

#include "./schemas.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::asserts {

/* -------------------------------------------------------------------------- */

/** @brief Serialize a primary key the way it is stored in `Assertions`. */
static std::string
primaryKeyColumn( const std::vector<std::string> & primaryKey )
{
  return nlohmann::json( primaryKey ).dump();
}


/* -------------------------------------------------------------------------- */

AssertsDb::AssertsDb( std::string_view      dbPath,
                      std::set<std::string> trustedAuthorities )
  : dbPath( dbPath ), trustedAuthorities( std::move( trustedAuthorities ) )
{
  this->db.connect( this->dbPath.c_str(),
                    SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE );
  this->init();
}


/* -------------------------------------------------------------------------- */

void
AssertsDb::init()
{
  if ( sql_rc rcode = this->execute_all( sql_versions ); isSQLError( rcode ) )
    {
      throw AssertsDbException(
        nix::fmt( "failed to initialize DbVersions table:(%d) %s",
                  rcode,
                  this->db.error_msg() ) );
    }

  if ( sql_rc rcode = this->execute_all( sql_assertions ); isSQLError( rcode ) )
    {
      throw AssertsDbException(
        nix::fmt( "failed to initialize Assertions table:(%d) %s",
                  rcode,
                  this->db.error_msg() ) );
    }

  sqlite3pp::command defineVersion(
    this->db,
    "INSERT OR IGNORE INTO DbVersions ( name, version ) VALUES"
    "  ( 'asserts_db_schema', ? )" );
  defineVersion.bind( 1, static_cast<int>( ASSERTS_DB_SCHEMA_VERSION ) );
  if ( sql_rc rcode = defineVersion.execute(); isSQLError( rcode ) )
    {
      throw AssertsDbException(
        nix::fmt( "failed to write DbVersions info:(%d) %s",
                  rcode,
                  this->db.error_msg() ) );
    }
}


/* -------------------------------------------------------------------------- */

unsigned
AssertsDb::getSchemaVersion()
{
  sqlite3pp::query qry(
    this->db,
    "SELECT version FROM DbVersions WHERE name = 'asserts_db_schema'" );
  auto rsl = qry.begin();
  if ( rsl == qry.end() ) { throw AssertsDbException( "no DbVersions row" ); }
  return static_cast<unsigned>( std::stoul( ( *rsl ).get<std::string>( 0 ) ) );
}


/* -------------------------------------------------------------------------- */

std::size_t
AssertsDb::size()
{
  sqlite3pp::query qry( this->db, "SELECT COUNT( * ) FROM Assertions" );
  return static_cast<std::size_t>( ( *qry.begin() ).get<long long>( 0 ) );
}


/* -------------------------------------------------------------------------- */

std::optional<Assertion>
AssertsDb::find( assertion_type type, const std::vector<std::string> & primaryKey )
{
  sqlite3pp::query qry( this->db,
                        "SELECT authorityId, headers FROM Assertions "
                        "WHERE ( type = ? ) AND ( primaryKey = ? )" );
  qry.bind( 1, std::string( to_string( type ) ), sqlite3pp::copy );
  qry.bind( 2, primaryKeyColumn( primaryKey ), sqlite3pp::copy );

  auto rsl = qry.begin();
  if ( rsl == qry.end() ) { return std::nullopt; }

  return Assertion {
    .type        = type,
    .authorityId = ( *rsl ).get<std::string>( 0 ),
    .headers     = nlohmann::json::parse( ( *rsl ).get<std::string>( 1 ) ),
  };
}


/* -------------------------------------------------------------------------- */

void
AssertsDb::checkPrerequisites( const Assertion & assertion )
{
  for ( const auto & prereq : assertion.prerequisites() )
    {
      if ( ! this->find( prereq ).has_value() )
        {
          throw AssertsDbException(
            nix::fmt( "cannot add %s",
                      refToString( assertion.ref() ) ),
            nix::fmt( "prerequisite %s not found",
                      refToString( prereq ) ) );
        }
    }
}


/* -------------------------------------------------------------------------- */

void
AssertsDb::add( const Assertion & assertion )
{
  AssertionRef ref = assertion.ref();

  if ( this->trustedAuthorities.find( assertion.authorityId )
       == this->trustedAuthorities.end() )
    {
      throw AssertsDbException(
        nix::fmt( "cannot add %s", refToString( ref ) ),
        nix::fmt( "authority '%s' is not trusted", assertion.authorityId ) );
    }

  if ( auto existing = this->find( ref ); existing.has_value() )
    {
      if ( *existing == assertion )
        {
          traceLog( "assertion " + refToString( ref ) + " already present" );
          return;
        }
      throw AssertsDbException(
        nix::fmt( "cannot add %s", refToString( ref ) ),
        "conflicts with an existing assertion" );
    }

  this->checkPrerequisites( assertion );

  sqlite3pp::command cmd( this->db,
                          "INSERT INTO Assertions "
                          "( type, primaryKey, authorityId, headers ) "
                          "VALUES ( ?, ?, ?, ? )" );
  cmd.bind( 1, std::string( to_string( assertion.type ) ), sqlite3pp::copy );
  cmd.bind( 2, primaryKeyColumn( ref.second ), sqlite3pp::copy );
  cmd.bind( 3, assertion.authorityId, sqlite3pp::nocopy );
  cmd.bind( 4, assertion.headers.dump(), sqlite3pp::copy );
  if ( sql_rc rcode = cmd.execute(); isSQLError( rcode ) )
    {
      throw AssertsDbException(
        nix::fmt( "failed to write %s:(%d) %s",
                  refToString( ref ),
                  rcode,
                  this->db.error_msg() ) );
    }
  debugLog( "added assertion " + refToString( ref ) );
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::asserts


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
