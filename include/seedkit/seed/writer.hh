/* ========================================================================== *
 *
 * @file seedkit/seed/writer.hh
 *
 * @brief Write the assertions and manifest of a recovery system.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "seedkit/asserts/batch.hh"
#include "seedkit/build-result.hh"
#include "seedkit/model.hh"
#include "seedkit/resolver/requirements.hh"
#include "seedkit/seed/manifest.hh"
#include "seedkit/seed/placement.hh"
#include "seedkit/seed/sideinfo.hh"
#include "seedkit/snap.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::seed {

/* -------------------------------------------------------------------------- */

/** @brief Everything known about one snap going into a recovery system. */
struct SeedEntry
{
  resolver::Requirement requirement;
  SnapInfo              info;
  SideInfo              sideInfo;
  PlacementDecision     placement;
}; /* End struct `SeedEntry' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Collect the model and the assertions of every asserted snap.
 *
 * Throws @a seedkit::asserts::InvalidAssertionException if a
 * `snap-revision` lacks its `snap-declaration`.
 */
[[nodiscard]] asserts::Batch
makeAssertionsBatch( const Model & model, const std::vector<SeedEntry> & entries );


/** @brief Describe @a entries as a `seed.yaml` manifest. */
[[nodiscard]] SeedManifest
makeManifest( const std::string &            label,
              const Model &                  model,
              const std::vector<SeedEntry> & entries );


/**
 * @brief Write `systems/<label>/assertions` and `systems/<label>/seed.yaml`.
 *
 * The system directory is created through @a result if it does not exist yet.
 * Failures are reported as @a seedkit::seed::SeedWriteException.
 */
void
writeSeed( const std::filesystem::path &  seedDir,
           const std::string &            label,
           const Model &                  model,
           const std::vector<SeedEntry> & entries,
           BuildResult &                  result );


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::seed


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
