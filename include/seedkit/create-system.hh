/* ========================================================================== *
 *
 * @file seedkit/create-system.hh
 *
 * @brief Create a recovery system for a model in a seed.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <string>

#include "seedkit/asserts/database.hh"
#include "seedkit/boot/bootloader.hh"
#include "seedkit/build-result.hh"
#include "seedkit/model.hh"
#include "seedkit/seed/layout.hh"
#include "seedkit/snap.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

/**
 * @brief Create the recovery system @a label for @a model in the seed at
 *        @a seedDir.
 *
 * The steps are, in order:
 * 1. Check that @a model is recovery-capable and resolve its snaps.
 * 2. Look up every snap with @a getInfo.
 * 3. Create `<seed>/systems/<label>` and check every asserted snap against
 *    @a db.
 * 4. Copy snaps into the seed, in the order they were resolved.
 * 5. Write the system's assertions and `seed.yaml`.
 * 6. Set the system's boot environment through @a bootloader.
 *
 * Nothing is written before step 3. Failures do not throw: the error is
 * returned in the result together with every file and directory created so
 * far, so that the caller can inspect it or pass it to
 * @a seedkit::purgeSystemFiles.
 *
 * @param getInfo Returns the snap for a name, `std::nullopt` if there is none,
 *                or throws.
 * @param db Holds the `snap-declaration` and `snap-revision` assertions of
 *           every asserted snap.
 */
[[nodiscard]] BuildResult
createSystem( const InfoGetter &              getInfo,
              asserts::AssertionDatabase &    db,
              boot::RecoveryAwareBootloader & bootloader,
              const std::string &             label,
              const Model &                   model,
              const std::filesystem::path &   seedDir = seed::getSeedDir() );


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
