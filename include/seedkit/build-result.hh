/* ========================================================================== *
 *
 * @file seedkit/build-result.hh
 *
 * @brief The state accumulated while a recovery system is written.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <exception>
#include <filesystem>
#include <vector>


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

/**
 * @brief Files and directories created by a recovery system build, and the
 *        error which stopped it, if any.
 *
 * A non-empty @a systemDir means the writing phase was reached. Every path a
 * copy was attempted to is listed in @a newFiles, in the order attempted,
 * so a failed build can be undone with @a seedkit::purgeSystemFiles.
 */
struct BuildResult
{

  /** Snap files created ( or attempted ) by this build. */
  std::vector<std::filesystem::path> newFiles;

  /** `<seed>/systems/<label>`, empty until the writing phase starts. */
  std::filesystem::path systemDir;

  /** The failure which ended the build, if any. */
  std::exception_ptr error;


  void
  recordNewFile( const std::filesystem::path & path )
  {
    this->newFiles.emplace_back( path );
  }

  /** @brief Drop @a path, which turned out to belong to someone else. */
  void
  forgetNewFile( const std::filesystem::path & path );

  /**
   * @brief Create @a dir if needed and remember it as @a systemDir.
   *
   * Throws @a seedkit::seed::SeedWriteException on failure, leaving
   * @a systemDir empty.
   */
  void
  ensureSystemDir( const std::filesystem::path & dir );

  [[nodiscard]] bool
  failed() const
  {
    return this->error != nullptr;
  }

  /** @brief Re-throw the captured error, if any. */
  void
  rethrow() const
  {
    if ( this->error != nullptr ) { std::rethrow_exception( this->error ); }
  }


}; /* End struct `BuildResult' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Remove everything a build reported creating.
 *
 * Each of @a result `newFiles` is removed, followed by its `systemDir`
 * ( recursively ). Entries which no longer exist are skipped. Shared snaps a
 * build skipped are never listed, so they are left alone.
 */
void
purgeSystemFiles( const BuildResult & result );


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
