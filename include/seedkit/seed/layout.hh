/* ========================================================================== *
 *
 * @file seedkit/seed/layout.hh
 *
 * @brief Paths inside a seed directory.
 *
 * @code{.txt}
 * <seed>/snaps/<name>_<revision>.snap
 * <seed>/systems/<label>/
 * <seed>/systems/<label>/snaps/<name>_<version>.snap
 * <seed>/systems/<label>/assertions
 * <seed>/systems/<label>/seed.yaml
 * @endcode
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <string>

#include "seedkit/core/exceptions.hh"
#include "seedkit/snap.hh"


/* -------------------------------------------------------------------------- */

/** @brief Interfaces for reading and writing seeds. */
namespace seedkit::seed {

/* -------------------------------------------------------------------------- */

/**
 * @class seedkit::seed::SeedWriteException
 * @brief An exception thrown when a file or directory cannot be created
 *        inside a seed.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( SeedWriteException,
                          EC_SEED_WRITE,
                          "error writing seed" )
/** @} */


/* -------------------------------------------------------------------------- */

/* Where the seed partition is mounted on a running system. */
#ifndef SEEDKIT_DEFAULT_SEED_DIR
#  define SEEDKIT_DEFAULT_SEED_DIR "/run/mnt/ubuntu-seed"
#endif


/**
 * @brief Get the seed root.
 *
 * This is `SEEDKIT_SEED_DIR` if it is set, otherwise the compiled in
 * default `/run/mnt/ubuntu-seed`.
 */
[[nodiscard]] std::filesystem::path
getSeedDir();


/* -------------------------------------------------------------------------- */

/** @brief `<seed>/snaps`, shared by every recovery system. */
[[nodiscard]] std::filesystem::path
sharedSnapsDir( const std::filesystem::path & seedDir );

/** @brief `<seed>/systems/<label>`. */
[[nodiscard]] std::filesystem::path
systemDir( const std::filesystem::path & seedDir, const std::string & label );

/** @brief `<seed>/systems/<label>/snaps`, for unasserted snaps. */
[[nodiscard]] std::filesystem::path
systemSnapsDir( const std::filesystem::path & seedDir,
                const std::string &           label );

[[nodiscard]] std::filesystem::path
assertionsPath( const std::filesystem::path & seedDir,
                const std::string &           label );

[[nodiscard]] std::filesystem::path
seedYamlPath( const std::filesystem::path & seedDir,
              const std::string &           label );


/** @brief `<name>_<revision>.snap` for asserted snaps. */
[[nodiscard]] std::string
sharedSnapFileName( const SnapName & name, const Revision & revision );

/** @brief `<name>_<version>.snap` for unasserted snaps. */
[[nodiscard]] std::string
privateSnapFileName( const SnapName & name, const std::string & version );


/**
 * @brief The system directory as the bootloader sees it,
 *        i.e. `/systems/<label>`.
 */
[[nodiscard]] std::string
bootSystemDir( const std::string & label );


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::seed


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
