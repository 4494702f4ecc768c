/* ========================================================================== *
 *
 * @file seedkit/seed/seed.hh
 *
 * @brief Open a recovery system written to a seed.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "seedkit/asserts/database.hh"
#include "seedkit/model.hh"
#include "seedkit/seed/manifest.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::seed {

/* -------------------------------------------------------------------------- */

/**
 * @brief A recovery system inside a seed.
 *
 * Assertions are loaded first, into a database the caller provides, and
 * the manifest is then checked against them.
 * @code{.cpp}
 * asserts::AssertsDb db( ":memory:", { "canonical", "my-brand" } );
 * Seed seed( "/run/mnt/ubuntu-seed", "20230901" );
 * seed.loadAssertions( db );
 * seed.loadMeta( db );
 * @endcode
 */
class Seed
{

private:

  std::filesystem::path seedDir;
  std::string           label;

  std::optional<Model>        model;
  std::optional<SeedManifest> manifest;


public:

  /**
   * @brief Open the system labelled @a label.
   *
   * Throws @a seedkit::seed::SeedLoadException if it does not exist.
   */
  Seed( std::filesystem::path seedDir, std::string label );

  /**
   * @brief Add the system's assertions to @a db and decode its model.
   *
   * The model assertion must be part of the batch.
   */
  void
  loadAssertions( asserts::AssertionDatabase & db );

  /**
   * @brief Read `seed.yaml` and check it.
   *
   * Every essential snap must be listed, every snap file must be present,
   * and every asserted snap must match a `snap-revision` in @a db.
   */
  void
  loadMeta( asserts::AssertionDatabase & db );

  /** @brief The model, after @a loadAssertions. */
  [[nodiscard]] const Model &
  getModel() const;

  /** @brief The manifest, after @a loadMeta. */
  [[nodiscard]] const SeedManifest &
  getManifest() const;

  /** @brief Whether the system boots with the `snapd` snap. */
  [[nodiscard]] bool
  usesSnapdSnap() const;

  /** @brief Absolute path of a snap listed in the manifest. */
  [[nodiscard]] std::filesystem::path
  snapPath( const SeedSnap & snap ) const;


}; /* End class `Seed' */


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::seed


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
