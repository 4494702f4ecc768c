/* ========================================================================== *
 *
 * @file create-system.cc
 *
 * @brief Create a recovery system for a model in a seed.
 *
 *
 * -------------------------------------------------------------------------- */

#include <exception>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "seedkit/boot/recovery.hh"
#include "seedkit/core/util.hh"
#include "seedkit/create-system.hh"
#include "seedkit/resolver/acquire.hh"
#include "seedkit/resolver/requirements.hh"
#include "seedkit/seed/layout.hh"
#include "seedkit/seed/placement.hh"
#include "seedkit/seed/sideinfo.hh"
#include "seedkit/seed/writer.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

static void
checkLabel( const std::string & label )
{
  if ( label.empty() || ( label == "." ) || ( label == ".." )
       || ( label.find( '/' ) != std::string::npos ) )
    {
      throw seed::SeedWriteException( "invalid recovery system label '" + label
                                      + "'" );
    }
}


/* -------------------------------------------------------------------------- */

/** @brief Log the names of unasserted snaps, if there are any. */
static void
warnUnasserted( const std::string &                  label,
                const std::vector<seed::SeedEntry> & entries )
{
  std::vector<std::string> names;
  for ( const auto & entry : entries )
    {
      if ( ! entry.sideInfo.asserted ) { names.emplace_back( entry.info.name ); }
    }
  if ( names.empty() ) { return; }
  warningLog( nix::fmt( "system \"%s\" contains unasserted snaps %s",
                        label,
                        quoteStrings( names ) ) );
}


/* -------------------------------------------------------------------------- */

static const seed::SeedEntry &
findEssentialEntry( const std::vector<seed::SeedEntry> & entries,
                    snap_type                            type )
{
  for ( const auto & entry : entries )
    {
      if ( entry.requirement.essential && ( entry.requirement.type == type ) )
        {
          return entry;
        }
    }
  /* Acquisition guarantees every essential snap is present. */
  throw resolver::EssentialSnapNotPresentException(
    "no " + std::string( to_string( type ) ) + " snap in recovery system" );
}


/* -------------------------------------------------------------------------- */

/** @brief Run every step, leaving partial state in @a result on failure. */
static void
buildSystem( const InfoGetter &              getInfo,
             asserts::AssertionDatabase &    db,
             boot::RecoveryAwareBootloader & bootloader,
             const std::string &             label,
             const Model &                   model,
             const std::filesystem::path &   seedDir,
             BuildResult &                   result )
{
  checkLabel( label );

  std::vector<resolver::Requirement> requirements
    = resolver::resolveRequirements( model );

  std::vector<resolver::Candidate> candidates
    = resolver::acquireSnaps( getInfo, requirements );

  /* Everything below may write to the seed. */
  result.ensureSystemDir( seed::systemDir( seedDir, label ) );

  std::vector<seed::SeedEntry> entries;
  entries.reserve( candidates.size() );
  for ( auto & candidate : candidates )
    {
      seed::SideInfo sideInfo
        = seed::deriveSideInfo( candidate.info, candidate.requirement, db );
      entries.emplace_back(
        seed::SeedEntry { .requirement = std::move( candidate.requirement ),
                          .info        = std::move( candidate.info ),
                          .sideInfo    = std::move( sideInfo ),
                          .placement   = {} } );
    }

  for ( auto & entry : entries )
    {
      entry.placement = seed::decidePlacement( entry.info, seedDir, label );
      seed::placeSnap( entry.info, entry.placement, result );
    }

  warnUnasserted( label, entries );

  seed::writeSeed( seedDir, label, model, entries, result );

  const seed::SeedEntry & kernel = findEssentialEntry( entries, ST_KERNEL );
  const seed::SeedEntry & gadget = findEssentialEntry( entries, ST_GADGET );
  boot::BootVars          vars   = boot::recoverySystemVars(
    gadget.info.cmdline,
    boot::recoveryKernelPath( label, kernel.placement ) );
  boot::setRecoverySystemEnv( bootloader, label, vars );
}


/* -------------------------------------------------------------------------- */

BuildResult
createSystem( const InfoGetter &              getInfo,
              asserts::AssertionDatabase &    db,
              boot::RecoveryAwareBootloader & bootloader,
              const std::string &             label,
              const Model &                   model,
              const std::filesystem::path &   seedDir )
{
  BuildResult result;
  try
    {
      buildSystem( getInfo, db, bootloader, label, model, seedDir, result );
      infoLog( nix::fmt( "created recovery system '%s' for model '%s'",
                         label,
                         model.reference() ) );
    }
  catch ( const std::exception & err )
    {
      debugLog( nix::fmt( "creating recovery system '%s' failed: %s",
                          label,
                          err.what() ) );
      result.error = std::current_exception();
    }
  catch ( ... )
    {
      debugLog( nix::fmt( "creating recovery system '%s' failed", label ) );
      result.error = std::current_exception();
    }
  return result;
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
