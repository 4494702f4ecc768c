/* ========================================================================== *
 *
 * @file boot.cc
 *
 * @brief Tests for the recovery system boot environment.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include "seedkit/boot/recovery.hh"
#include "seedkit/seed/placement.hh"

#include "fixtures.hh"
#include "test.hh"


/* -------------------------------------------------------------------------- */

using namespace seedkit;
using namespace seedkit::boot;
using namespace seedkit::test;


/* -------------------------------------------------------------------------- */

bool
test_recoveryKernelPath0()
{
  seed::PlacementDecision shared;
  shared.destination = "/run/mnt/ubuntu-seed/snaps/pc-kernel_1.snap";
  shared.shared      = true;
  EXPECT_EQ( recoveryKernelPath( "1234", shared ), "/snaps/pc-kernel_1.snap" );

  seed::PlacementDecision priv;
  priv.destination
    = "/run/mnt/ubuntu-seed/systems/1234/snaps/pc-kernel_1.0.snap";
  priv.shared = false;
  EXPECT_EQ( recoveryKernelPath( "1234", priv ),
             "/systems/1234/snaps/pc-kernel_1.0.snap" );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Both command line variables are always set. */
bool
test_recoverySystemVars0()
{
  GadgetCmdline cmdline;
  BootVars      vars = recoverySystemVars( cmdline, "/snaps/pc-kernel_1.snap" );
  EXPECT( vars
          == ( BootVars { { "snapd_extra_cmdline_args", "" },
                          { "snapd_full_cmdline_args", "" },
                          { "snapd_recovery_kernel",
                            "/snaps/pc-kernel_1.snap" } } ) );

  cmdline.extra = "  console=ttyS0\n";
  vars          = recoverySystemVars( cmdline, "/snaps/pc-kernel_1.snap" );
  EXPECT_EQ( vars.at( VAR_EXTRA_CMDLINE_ARGS ), "console=ttyS0" );
  EXPECT_EQ( vars.at( VAR_FULL_CMDLINE_ARGS ), "" );

  cmdline.extra = std::nullopt;
  cmdline.full  = "console=ttyS0 quiet";
  vars          = recoverySystemVars( cmdline, "/snaps/pc-kernel_1.snap" );
  EXPECT_EQ( vars.at( VAR_EXTRA_CMDLINE_ARGS ), "" );
  EXPECT_EQ( vars.at( VAR_FULL_CMDLINE_ARGS ), "console=ttyS0 quiet" );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_recoverySystemVars1()
{
  GadgetCmdline cmdline;
  cmdline.extra = "quiet";
  cmdline.full  = "console=ttyS0";
  EXPECT_THROW_MSG( recoverySystemVars( cmdline, "/snaps/pc-kernel_1.snap" ),
                    BootEnvironmentException,
                    "cannot set recovery system environment: gadget declares "
                    "both extra and full kernel command line arguments" );

  /* Whitespace only counts as unset. */
  cmdline.full = " \n";
  BootVars vars = recoverySystemVars( cmdline, "/snaps/pc-kernel_1.snap" );
  EXPECT_EQ( vars.at( VAR_EXTRA_CMDLINE_ARGS ), "quiet" );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_setRecoverySystemEnv0()
{
  MockBootloader bootloader;
  BootVars       vars = { { VAR_RECOVERY_KERNEL, "/snaps/pc-kernel_1.snap" } };

  setRecoverySystemEnv( bootloader, "1234", vars );
  EXPECT_EQ( bootloader.calls, 1 );
  EXPECT_EQ( bootloader.recoverySystemDir, "/systems/1234" );
  EXPECT( bootloader.recoverySystemBootVars == vars );

  bootloader.failWith = "cannot write grubenv";
  EXPECT_THROW_MSG( setRecoverySystemEnv( bootloader, "5678", vars ),
                    BootEnvironmentException,
                    "cannot set recovery system environment: for "
                    "'/systems/5678': cannot write grubenv" );
  EXPECT_EQ( bootloader.calls, 2 );
  return true;
}


/* -------------------------------------------------------------------------- */

int
main( int argc, char * argv[] )
{
  int exitCode = EXIT_SUCCESS;
#define RUN_TEST( ... ) _RUN_TEST( exitCode, __VA_ARGS__ )

  nix::verbosity = nix::lvlWarn;
  if ( ( 1 < argc ) && ( std::string_view( argv[1] ) == "-v" ) )
    {
      nix::verbosity = nix::lvlDebug;
    }

  RUN_TEST( recoveryKernelPath0 );
  RUN_TEST( recoverySystemVars0 );
  RUN_TEST( recoverySystemVars1 );
  RUN_TEST( setRecoverySystemEnv0 );

  return exitCode;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
