/* ========================================================================== *
 *
 * @file seedkit/seed/manifest.hh
 *
 * @brief The `seed.yaml` manifest of a recovery system.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "seedkit/core/exceptions.hh"
#include "seedkit/core/types.hh"
#include "seedkit/snap.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::seed {

/* -------------------------------------------------------------------------- */

/**
 * @class seedkit::seed::SeedLoadException
 * @brief An exception thrown when a recovery system in a seed is missing or
 *        inconsistent.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( SeedLoadException,
                          EC_SEED_LOAD,
                          "error loading seed" )
/** @} */


/* -------------------------------------------------------------------------- */

/** @brief One snap listed in `seed.yaml`. */
struct SeedSnap
{

  SnapName  name;
  SnapId    snapId;
  snap_type type      = ST_APP;
  bool      essential = false;
  bool      asserted  = false;

  /** Store revision, only set for asserted snaps. */
  std::optional<Revision> revision;

  /**
   * File name under `<seed>/snaps` for asserted snaps, or under
   * `<seed>/systems/<label>/snaps` otherwise.
   */
  std::string file;

  Channel channel;


  [[nodiscard]] bool
  operator==( const SeedSnap & other ) const
    = default;


}; /* End struct `SeedSnap' */


void
from_json( const nlohmann::json & jfrom, SeedSnap & snap );

void
to_json( nlohmann::json & jto, const SeedSnap & snap );


/* -------------------------------------------------------------------------- */

/** @brief Contents of `seed.yaml`. */
struct SeedManifest
{

  std::string label;

  /** `<brand-id>/<model>` of the model the system was created for. */
  std::string model;

  std::vector<SeedSnap> snaps;

  /** The gadget's kernel command line fragments. */
  GadgetCmdline kernelCmdline;


  /** @brief Find the snap of type @a type, or `nullptr`. */
  [[nodiscard]] const SeedSnap *
  findSnapByType( snap_type type ) const;


}; /* End struct `SeedManifest' */


void
from_json( const nlohmann::json & jfrom, SeedManifest & manifest );

void
to_json( nlohmann::json & jto, const SeedManifest & manifest );


/** @brief Write @a manifest to @a path as YAML. */
void
writeManifest( const std::filesystem::path & path,
               const SeedManifest &          manifest );

/** @brief Read a manifest written by @a seedkit::seed::writeManifest. */
[[nodiscard]] SeedManifest
readManifest( const std::filesystem::path & path );


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::seed


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
