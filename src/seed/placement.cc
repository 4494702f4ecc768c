/* ========================================================================== *
 *
 * @file seed/placement.cc
 *
 * @brief Decide where a snap lands in a seed and copy it there.
 *
 *
 * -------------------------------------------------------------------------- */

#include <filesystem>
#include <string>
#include <system_error>

#include "seedkit/core/util.hh"
#include "seedkit/seed/layout.hh"
#include "seedkit/seed/placement.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::seed {

/* -------------------------------------------------------------------------- */

PlacementDecision
decidePlacement( const SnapInfo &              info,
                 const std::filesystem::path & seedDir,
                 const std::string &           label )
{
  PlacementDecision decision;
  decision.shared = info.asserted();
  if ( decision.shared )
    {
      decision.destination = sharedSnapsDir( seedDir )
                             / sharedSnapFileName( info.name, info.revision );
    }
  else
    {
      decision.destination = systemSnapsDir( seedDir, label )
                             / privateSnapFileName( info.name, info.version );
    }
  decision.exists = std::filesystem::exists( decision.destination );
  return decision;
}


/* -------------------------------------------------------------------------- */

void
placeSnap( const SnapInfo &          info,
           const PlacementDecision & decision,
           BuildResult &             result )
{
  const std::filesystem::path & dest = decision.destination;

  if ( decision.shared && decision.exists )
    {
      debugLog( nix::fmt( "snap '%s' is already in the seed at '%s'",
                          info.name,
                          dest.string() ) );
      return;
    }

  result.recordNewFile( dest );
  if ( decision.exists ) { throw DestinationExistsException( dest.string() ); }

  std::error_code err;
  std::filesystem::create_directories( dest.parent_path(), err );
  if ( err )
    {
      throw SnapCopyException( "cannot create directory '"
                                 + dest.parent_path().string() + "'",
                               err.message() );
    }

  std::filesystem::copy_file( info.mountFile,
                              dest,
                              std::filesystem::copy_options::none,
                              err );
  if ( err == std::errc::file_exists )
    {
      if ( decision.shared )
        {
          debugLog( nix::fmt( "snap '%s' was added to the seed concurrently",
                              info.name ) );
          result.forgetNewFile( dest );
          return;
        }
      throw DestinationExistsException( dest.string() );
    }
  if ( err )
    {
      throw SnapCopyException( nix::fmt( "cannot copy '%s' to '%s'",
                                         info.mountFile.string(),
                                         dest.string() ),
                               err.message() );
    }

  infoLog( nix::fmt( "copied snap '%s' to '%s'", info.name, dest.string() ) );
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::seed


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
