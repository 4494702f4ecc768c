/* ========================================================================== *
 *
 * @file seedkit/seed/placement.hh
 *
 * @brief Decide where a snap lands in a seed and copy it there.
 *
 * Asserted snaps are shared by every recovery system in the seed, and are
 * only copied if no other system brought them in already. Unasserted snaps
 * are private to one system.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <string>

#include "seedkit/build-result.hh"
#include "seedkit/core/exceptions.hh"
#include "seedkit/snap.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::seed {

/* -------------------------------------------------------------------------- */

/**
 * @class seedkit::seed::DestinationExistsException
 * @brief An exception thrown when a private snap would overwrite an
 *        existing file.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( DestinationExistsException,
                          EC_DESTINATION_EXISTS,
                          "destination exists" )
/** @} */


/**
 * @class seedkit::seed::SnapCopyException
 * @brief An exception thrown when copying a snap into the seed fails.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( SnapCopyException,
                          EC_SNAP_COPY,
                          "cannot copy snap" )
/** @} */


/* -------------------------------------------------------------------------- */

/** @brief Where a snap goes. */
struct PlacementDecision
{

  std::filesystem::path destination;

  /** Whether @a destination is in the shared `<seed>/snaps` directory. */
  bool shared = false;

  /** Whether @a destination existed when the decision was made. */
  bool exists = false;


  /** @brief Name of the file relative to its directory. */
  [[nodiscard]] std::string
  fileName() const
  {
    return this->destination.filename().string();
  }


}; /* End struct `PlacementDecision' */


/**
 * @brief Decide where @a info lands in the seed at @a seedDir for the system
 *        labelled @a label.
 */
[[nodiscard]] PlacementDecision
decidePlacement( const SnapInfo &              info,
                 const std::filesystem::path & seedDir,
                 const std::string &           label );


/**
 * @brief Copy @a info to the destination chosen by @a decision.
 *
 * - Shared snaps which already exist are skipped and not recorded.
 * - Private snaps are recorded in @a result before anything else, and
 *   @a seedkit::seed::DestinationExistsException is thrown if they exist.
 * - A shared snap created by someone else between the decision and the copy
 *   counts as already present, and is dropped from @a result.
 *
 * Existing files are never overwritten.
 */
void
placeSnap( const SnapInfo &          info,
           const PlacementDecision & decision,
           BuildResult &             result );


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::seed


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
