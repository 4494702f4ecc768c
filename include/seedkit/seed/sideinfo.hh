/* ========================================================================== *
 *
 * @file seedkit/seed/sideinfo.hh
 *
 * @brief Metadata recorded in a seed for each snap, and the check binding
 *        asserted snaps to their store assertions.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "seedkit/asserts/assertion.hh"
#include "seedkit/asserts/database.hh"
#include "seedkit/core/exceptions.hh"
#include "seedkit/core/types.hh"
#include "seedkit/resolver/requirements.hh"
#include "seedkit/snap.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::seed {

/* -------------------------------------------------------------------------- */

/**
 * @class seedkit::seed::SnapVerificationException
 * @brief An exception thrown when an asserted snap does not match the
 *        assertions known for it.
 *
 * This indicates a trust violation rather than a user error.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( SnapVerificationException,
                          EC_SNAP_VERIFICATION,
                          "internal error" )
/** @} */


/* -------------------------------------------------------------------------- */

/** @brief What a seed records about one snap. */
struct SideInfo
{

  SnapName    name;
  SnapId      snapId;
  Revision    revision;
  std::string version;
  Channel     channel;
  bool        asserted = false;

  /** The `snap-declaration` and `snap-revision`, for asserted snaps. */
  std::vector<asserts::Assertion> assertions;


}; /* End struct `SideInfo' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Digest of a snap file's contents, as used by `snap-revision`
 *        assertions.
 *
 * This is the base16 SHA-512 of the file.
 */
[[nodiscard]] std::string
snapDigest( const std::filesystem::path & path );


/**
 * @brief Derive the side info for @a info.
 *
 * Asserted snaps are looked up in @a db by the digest of `info.mountFile`;
 * a missing `snap-revision`, one for another snap id or revision, or a
 * missing `snap-declaration` throws
 * @a seedkit::seed::SnapVerificationException.
 * Unasserted snaps are described by @a info alone. A zero revision is
 * rejected for both.
 */
[[nodiscard]] SideInfo
deriveSideInfo( const SnapInfo &              info,
                const resolver::Requirement & requirement,
                asserts::AssertionDatabase &  db );


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::seed


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
