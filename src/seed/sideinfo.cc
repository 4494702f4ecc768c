/* ========================================================================== *
 *
 * @file seed/sideinfo.cc
 *
 * @brief Metadata recorded in a seed for each snap.
 *
 *
 * -------------------------------------------------------------------------- */

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include <nix/error.hh>
#include <nix/hash.hh>

#include "seedkit/core/util.hh"
#include "seedkit/seed/sideinfo.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::seed {

/* -------------------------------------------------------------------------- */

std::string
snapDigest( const std::filesystem::path & path )
{
  return nix::hashFile( nix::htSHA512, path.string() )
    .to_string( nix::Base16, false );
}


/* -------------------------------------------------------------------------- */

/** @brief The message used for every missing or mismatched assertion. */
static std::string
noAssertionsMsg( const SnapId & snapId )
{
  return "no assertions for asserted snap with ID: " + snapId;
}


SideInfo
deriveSideInfo( const SnapInfo &              info,
                const resolver::Requirement & requirement,
                asserts::AssertionDatabase &  db )
{
  /* Zero is neither a store nor a local revision. */
  if ( info.revision.unset() )
    {
      throw SnapVerificationException( "snap '" + info.name
                                       + "' has an unset revision" );
    }

  SideInfo sideInfo { .name       = info.name,
                      .snapId     = info.snapId,
                      .revision   = info.revision,
                      .version    = info.version,
                      .channel    = requirement.channel,
                      .asserted   = info.asserted(),
                      .assertions = {} };

  if ( ! sideInfo.asserted )
    {
      debugLog( nix::fmt( "snap '%s' is unasserted, revision %s",
                          info.name,
                          info.revision.toString() ) );
      return sideInfo;
    }

  std::string digest;
  try
    {
      digest = snapDigest( info.mountFile );
    }
  catch ( const nix::Error & err )
    {
      throw SnapVerificationException( "cannot compute digest of snap '"
                                         + info.name + "'",
                                       err.what() );
    }

  std::optional<asserts::Assertion> revision = db.findSnapRevision( digest );
  if ( ( ! revision.has_value() )
       || ( revision->header( "snap-id" ) != info.snapId ) )
    {
      throw SnapVerificationException( noAssertionsMsg( info.snapId ) );
    }

  if ( revision->header( "snap-revision" ) != info.revision.toString() )
    {
      throw SnapVerificationException(
        nix::fmt( "snap-revision assertion for snap with ID: %s is for "
                  "revision %s, not %s",
                  info.snapId,
                  revision->header( "snap-revision" ),
                  info.revision.toString() ) );
    }

  std::optional<asserts::Assertion> declaration
    = db.findSnapDeclaration( info.snapId );
  if ( ! declaration.has_value() )
    {
      throw SnapVerificationException( noAssertionsMsg( info.snapId ) );
    }

  sideInfo.assertions = { std::move( *declaration ), std::move( *revision ) };
  traceLog( nix::fmt( "verified snap '%s' with digest %s", info.name, digest ) );
  return sideInfo;
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::seed


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
