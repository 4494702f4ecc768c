/* ========================================================================== *
 *
 * @file seed/writer.cc
 *
 * @brief Write the assertions and manifest of a recovery system.
 *
 *
 * -------------------------------------------------------------------------- */

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "seedkit/asserts/assertion.hh"
#include "seedkit/core/util.hh"
#include "seedkit/seed/layout.hh"
#include "seedkit/seed/writer.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::seed {

/* -------------------------------------------------------------------------- */

asserts::Batch
makeAssertionsBatch( const Model & model, const std::vector<SeedEntry> & entries )
{
  asserts::Batch batch;
  batch.add( asserts::makeModelAssertion( model ) );
  for ( const auto & entry : entries )
    {
      for ( const auto & assertion : entry.sideInfo.assertions )
        {
          batch.add( assertion );
        }
    }
  batch.checkPrerequisites();
  return batch;
}


/* -------------------------------------------------------------------------- */

SeedManifest
makeManifest( const std::string &            label,
              const Model &                  model,
              const std::vector<SeedEntry> & entries )
{
  SeedManifest manifest { .label         = label,
                          .model         = model.reference(),
                          .snaps         = {},
                          .kernelCmdline = {} };
  manifest.snaps.reserve( entries.size() );

  for ( const auto & entry : entries )
    {
      SeedSnap snap { .name      = entry.info.name,
                      .snapId    = entry.info.snapId,
                      .type      = entry.requirement.type,
                      .essential = entry.requirement.essential,
                      .asserted  = entry.sideInfo.asserted,
                      .revision  = std::nullopt,
                      .file      = entry.placement.fileName(),
                      .channel   = entry.sideInfo.channel };
      if ( snap.asserted ) { snap.revision = entry.info.revision; }
      manifest.snaps.emplace_back( std::move( snap ) );

      if ( entry.requirement.type == ST_GADGET )
        {
          manifest.kernelCmdline = entry.info.cmdline;
        }
    }
  return manifest;
}


/* -------------------------------------------------------------------------- */

void
writeSeed( const std::filesystem::path &  seedDir,
           const std::string &            label,
           const Model &                  model,
           const std::vector<SeedEntry> & entries,
           BuildResult &                  result )
{
  asserts::Batch batch    = makeAssertionsBatch( model, entries );
  SeedManifest   manifest = makeManifest( label, model, entries );

  result.ensureSystemDir( systemDir( seedDir, label ) );

  std::filesystem::path path = assertionsPath( seedDir, label );
  try
    {
      batch.write( path );
    }
  catch ( const SeedkitException & err )
    {
      throw SeedWriteException( "cannot write assertions for system '" + label
                                  + "'",
                                err.what() );
    }
  debugLog( nix::fmt( "wrote %d assertions to '%s'",
                      batch.getAssertions().size(),
                      path.string() ) );

  path = seedYamlPath( seedDir, label );
  writeManifest( path, manifest );
  debugLog( "wrote seed manifest to '" + path.string() + "'" );
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::seed


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
