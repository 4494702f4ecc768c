/* ========================================================================== *
 *
 * @file seedkit/asserts/database.hh
 *
 * @brief Abstract interface for stores of trusted assertions.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "seedkit/asserts/assertion.hh"
#include "seedkit/core/exceptions.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::asserts {

/* -------------------------------------------------------------------------- */

/**
 * @class seedkit::asserts::AssertsDbException
 * @brief An exception thrown when adding to or querying an assertion
 *        database fails.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( AssertsDbException,
                          EC_ASSERTS_DB,
                          "error running assertions database" )
/** @} */


/* -------------------------------------------------------------------------- */

/**
 * @brief A database of assertions which have already been checked against
 *        their authority.
 *
 * Implementations decide which authorities they trust and how assertions
 * are persisted.
 */
class AssertionDatabase
{

public:

  virtual ~AssertionDatabase() = default;

  /**
   * @brief Add @a assertion, after its prerequisites.
   *
   * Adding an assertion identical to one already present does nothing.
   * Throws @a seedkit::asserts::AssertsDbException on conflicts, untrusted
   * authorities, or missing prerequisites.
   */
  virtual void
  add( const Assertion & assertion )
    = 0;

  /** @brief Find an assertion by its type and primary key. */
  [[nodiscard]] virtual std::optional<Assertion>
  find( assertion_type type, const std::vector<std::string> & primaryKey )
    = 0;

  [[nodiscard]] std::optional<Assertion>
  find( const AssertionRef & ref )
  {
    return this->find( ref.first, ref.second );
  }

  /** @brief Find the `snap-revision` for a snap file digest. */
  [[nodiscard]] std::optional<Assertion>
  findSnapRevision( const std::string & digest )
  {
    return this->find( AT_SNAP_REVISION, { digest } );
  }

  [[nodiscard]] std::optional<Assertion>
  findSnapDeclaration( const SnapId & snapId )
  {
    return this->find( AT_SNAP_DECLARATION, { snapId } );
  }

  [[nodiscard]] std::optional<Assertion>
  findModel( const std::string & brandId, const std::string & model )
  {
    return this->find( AT_MODEL, { brandId, model } );
  }


}; /* End class `AssertionDatabase' */


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::asserts


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
