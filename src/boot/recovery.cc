/* ========================================================================== *
 *
 * @file boot/recovery.cc
 *
 * @brief Compute and apply the boot environment of a recovery system.
 *
 *
 * -------------------------------------------------------------------------- */

#include <exception>
#include <string>

#include "seedkit/boot/recovery.hh"
#include "seedkit/core/util.hh"
#include "seedkit/seed/layout.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::boot {

/* -------------------------------------------------------------------------- */

std::string
recoveryKernelPath( const std::string &             label,
                    const seed::PlacementDecision & kernel )
{
  if ( kernel.shared ) { return "/snaps/" + kernel.fileName(); }
  return seed::bootSystemDir( label ) + "/snaps/" + kernel.fileName();
}


/* -------------------------------------------------------------------------- */

BootVars
recoverySystemVars( const GadgetCmdline & cmdline,
                    const std::string &   kernelPath )
{
  std::string extra = trim_copy( cmdline.extra.value_or( "" ) );
  std::string full  = trim_copy( cmdline.full.value_or( "" ) );

  if ( ( ! extra.empty() ) && ( ! full.empty() ) )
    {
      throw BootEnvironmentException(
        "gadget declares both extra and full kernel command line arguments" );
    }

  return BootVars {
    { VAR_FULL_CMDLINE_ARGS, full },
    { VAR_EXTRA_CMDLINE_ARGS, extra },
    { VAR_RECOVERY_KERNEL, kernelPath },
  };
}


/* -------------------------------------------------------------------------- */

void
setRecoverySystemEnv( RecoveryAwareBootloader & bootloader,
                      const std::string &       label,
                      const BootVars &          vars )
{
  std::string dir = seed::bootSystemDir( label );
  try
    {
      bootloader.setRecoverySystemEnv( dir, vars );
    }
  catch ( const BootEnvironmentException & )
    {
      throw;
    }
  catch ( const std::exception & err )
    {
      throw BootEnvironmentException( "for '" + dir + "'", err.what() );
    }
  debugLog( "set boot environment of recovery system " + dir );
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::boot


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
