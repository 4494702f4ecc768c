/* ========================================================================== *
 *
 * @file seedkit/boot/bootloader.hh
 *
 * @brief Interface to bootloaders which can boot recovery systems.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <map>
#include <string>


/* -------------------------------------------------------------------------- */

/** @brief Interfaces for wiring recovery systems into the boot process. */
namespace seedkit::boot {

/* -------------------------------------------------------------------------- */

/** @brief Boot environment variables, by name. */
using BootVars = std::map<std::string, std::string>;


/**
 * @brief A bootloader with a per recovery system environment.
 *
 * How the environment is persisted is up to the implementation.
 */
class RecoveryAwareBootloader
{

public:

  virtual ~RecoveryAwareBootloader() = default;

  /**
   * @brief Replace the environment of the recovery system at
   *        @a recoverySystemDir with @a vars.
   *
   * @param recoverySystemDir Path relative to the seed root,
   *                          e.g. `/systems/20230901`.
   */
  virtual void
  setRecoverySystemEnv( const std::string & recoverySystemDir,
                        const BootVars &    vars )
    = 0;


}; /* End class `RecoveryAwareBootloader' */


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::boot


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
