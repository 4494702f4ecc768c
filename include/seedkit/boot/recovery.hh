/* ========================================================================== *
 *
 * @file seedkit/boot/recovery.hh
 *
 * @brief Compute and apply the boot environment of a recovery system.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <string>

#include "seedkit/boot/bootloader.hh"
#include "seedkit/core/exceptions.hh"
#include "seedkit/seed/placement.hh"
#include "seedkit/snap.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::boot {

/* -------------------------------------------------------------------------- */

/**
 * @class seedkit::boot::BootEnvironmentException
 * @brief An exception thrown when the boot environment of a recovery system
 *        cannot be set.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( BootEnvironmentException,
                          EC_BOOT_ENVIRONMENT,
                          "cannot set recovery system environment" )
/** @} */


/* -------------------------------------------------------------------------- */

constexpr const char * VAR_FULL_CMDLINE_ARGS  = "snapd_full_cmdline_args";
constexpr const char * VAR_EXTRA_CMDLINE_ARGS = "snapd_extra_cmdline_args";
constexpr const char * VAR_RECOVERY_KERNEL    = "snapd_recovery_kernel";


/* -------------------------------------------------------------------------- */

/**
 * @brief Path of the kernel as the bootloader sees it.
 *
 * `/snaps/<name>_<revision>.snap` for asserted kernels, or
 * `/systems/<label>/snaps/<name>_<version>.snap` otherwise.
 */
[[nodiscard]] std::string
recoveryKernelPath( const std::string &             label,
                    const seed::PlacementDecision & kernel );


/**
 * @brief Compute the variables of a recovery system.
 *
 * Both command line variables are always set, at most one of them to a
 * non-empty value. A gadget declaring both fragments is rejected with
 * @a seedkit::boot::BootEnvironmentException.
 */
[[nodiscard]] BootVars
recoverySystemVars( const GadgetCmdline & cmdline,
                    const std::string &   kernelPath );


/**
 * @brief Hand the variables of the system labelled @a label to
 *        @a bootloader.
 *
 * Bootloader failures are reported as
 * @a seedkit::boot::BootEnvironmentException. Nothing is rolled back.
 */
void
setRecoverySystemEnv( RecoveryAwareBootloader & bootloader,
                      const std::string &       label,
                      const BootVars &          vars );


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::boot


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
