/* ========================================================================== *
 *
 * @file seedkit/asserts/batch.hh
 *
 * @brief A set of assertions which travel together, such as those stored
 *        beside a recovery system.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <vector>

#include "seedkit/asserts/assertion.hh"
#include "seedkit/asserts/database.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::asserts {

/* -------------------------------------------------------------------------- */

/** @brief An ordered, de-duplicated collection of assertions. */
class Batch
{

private:

  std::vector<Assertion> assertions;


public:

  /**
   * @brief Add @a assertion unless an identical one is already present.
   *
   * Throws @a seedkit::asserts::InvalidAssertionException if a different
   * assertion with the same type and primary key was added before.
   */
  void
  add( const Assertion & assertion );

  [[nodiscard]] const std::vector<Assertion> &
  getAssertions() const
  {
    return this->assertions;
  }

  [[nodiscard]] bool
  contains( const AssertionRef & ref ) const;

  /**
   * @brief Fail if any prerequisite of a member assertion is missing from
   *        the batch.
   */
  void
  checkPrerequisites() const;

  /**
   * @brief Add every member to @a db, prerequisites first.
   *
   * `model` and `snap-declaration` assertions are added before
   * `snap-revision` assertions.
   */
  void
  commitTo( AssertionDatabase & db ) const;

  /** @brief Write the batch as a JSON list. */
  void
  write( const std::filesystem::path & path ) const;

  /** @brief Read a batch written by @a write. */
  [[nodiscard]] static Batch
  read( const std::filesystem::path & path );


}; /* End class `Batch' */


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::asserts


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
