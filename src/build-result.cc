/* ========================================================================== *
 *
 * @file build-result.cc
 *
 * @brief The state accumulated while a recovery system is written.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "seedkit/build-result.hh"
#include "seedkit/core/util.hh"
#include "seedkit/seed/layout.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

void
BuildResult::forgetNewFile( const std::filesystem::path & path )
{
  auto itr = std::find( this->newFiles.begin(), this->newFiles.end(), path );
  if ( itr != this->newFiles.end() ) { this->newFiles.erase( itr ); }
}


/* -------------------------------------------------------------------------- */

void
BuildResult::ensureSystemDir( const std::filesystem::path & dir )
{
  if ( ! this->systemDir.empty() ) { return; }
  std::error_code err;
  std::filesystem::create_directories( dir, err );
  if ( err )
    {
      throw seed::SeedWriteException( "cannot create system directory '"
                                        + dir.string() + "'",
                                      err.message() );
    }
  debugLog( "created system directory " + dir.string() );
  this->systemDir = dir;
}


/* -------------------------------------------------------------------------- */

void
purgeSystemFiles( const BuildResult & result )
{
  for ( const auto & path : result.newFiles )
    {
      std::error_code err;
      if ( std::filesystem::remove( path, err ) )
        {
          debugLog( "removed " + path.string() );
        }
      else if ( err )
        {
          throw seed::SeedWriteException( "cannot remove '" + path.string()
                                            + "'",
                                          err.message() );
        }
    }

  if ( result.systemDir.empty() ) { return; }

  std::error_code err;
  std::filesystem::remove_all( result.systemDir, err );
  if ( err )
    {
      throw seed::SeedWriteException( "cannot remove system directory '"
                                        + result.systemDir.string() + "'",
                                      err.message() );
    }
  debugLog( "removed " + result.systemDir.string() );
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
