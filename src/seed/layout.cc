/* ========================================================================== *
 *
 * @file seed/layout.cc
 *
 * @brief Paths inside a seed directory.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <filesystem>
#include <string>

#include "seedkit/seed/layout.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::seed {

/* -------------------------------------------------------------------------- */

std::filesystem::path
getSeedDir()
{
  if ( const char * envVar = std::getenv( "SEEDKIT_SEED_DIR" );
       ( envVar != nullptr ) && ( *envVar != '\0' ) )
    {
      return envVar;
    }
  return SEEDKIT_DEFAULT_SEED_DIR;
}


/* -------------------------------------------------------------------------- */

std::filesystem::path
sharedSnapsDir( const std::filesystem::path & seedDir )
{
  return seedDir / "snaps";
}


std::filesystem::path
systemDir( const std::filesystem::path & seedDir, const std::string & label )
{
  return seedDir / "systems" / label;
}


std::filesystem::path
systemSnapsDir( const std::filesystem::path & seedDir,
                const std::string &           label )
{
  return systemDir( seedDir, label ) / "snaps";
}


std::filesystem::path
assertionsPath( const std::filesystem::path & seedDir,
                const std::string &           label )
{
  return systemDir( seedDir, label ) / "assertions";
}


std::filesystem::path
seedYamlPath( const std::filesystem::path & seedDir,
              const std::string &           label )
{
  return systemDir( seedDir, label ) / "seed.yaml";
}


/* -------------------------------------------------------------------------- */

std::string
sharedSnapFileName( const SnapName & name, const Revision & revision )
{
  return name + "_" + revision.toString() + ".snap";
}


std::string
privateSnapFileName( const SnapName & name, const std::string & version )
{
  return name + "_" + version + ".snap";
}


std::string
bootSystemDir( const std::string & label )
{
  return "/systems/" + label;
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::seed


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
