/* ========================================================================== *
 *
 * @file seedkit/core/logger.hh
 *
 * @brief Installs the `nix::Logger` used for all `seedkit` log messages.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once


/* -------------------------------------------------------------------------- */

/* Forward Declarations. */

namespace nix {
class Logger;
}


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

/** @brief Create a custom `nix::Logger` for seed building messages. */
nix::Logger *
makeFilteredLogger();


/* -------------------------------------------------------------------------- */

/**
 * @brief Perform one time logging setup.
 *
 * You may safely call this function multiple times, after the first invocation
 * it is effectively a no-op.
 *
 * This replaces the default `nix::Logger` with a @a seedkit::FilteredLogger
 * and raises `nix::verbosity` to `lvlDebug` if `SEEDKIT_DEBUG` is set.
 */
void
initLogger();


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
