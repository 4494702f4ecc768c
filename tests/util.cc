/* ========================================================================== *
 *
 * @file util.cc
 *
 * @brief Tests for `seedkit` utility interfaces.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <nix/logging.hh>
#include <nlohmann/json.hpp>

#include "seedkit/core/exceptions.hh"
#include "seedkit/core/logger.hh"
#include "seedkit/core/util.hh"
#include "test.hh"


/* -------------------------------------------------------------------------- */

using namespace seedkit;

/* -------------------------------------------------------------------------- */

/** @brief Quoted scalars stay strings, plain ones are coerced. */
bool
test_yamlToJSON0()
{
  nlohmann::json jfrom = yamlToJSON( "label: \"20231012\"\n"
                                     "count: 3\n"
                                     "asserted: true\n"
                                     "channel: latest/stable\n"
                                     "revision: ~\n"
                                     "snaps:\n"
                                     "  - pc\n"
                                     "  - pc-kernel\n" );

  nlohmann::json expected = {
    { "label", "20231012" },
    { "count", 3 },
    { "asserted", true },
    { "channel", "latest/stable" },
    { "revision", nullptr },
    { "snaps", { "pc", "pc-kernel" } },
  };
  EXPECT_EQ( jfrom, expected );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_yamlToJSON1()
{
  try
    {
      (void) yamlToJSON( "snaps: [ pc" );
      EXPECT_FAIL( "parsing an unterminated sequence did not throw" );
    }
  catch ( const SeedkitException & err )
    {
      EXPECT_EQ( err.getErrorCode(), EC_YAML_TO_JSON );
      EXPECT( std::string( err.what() )
                .starts_with( "error converting YAML to JSON: while parsing "
                              "a YAML string: " ) );
    }
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Strings which look like numbers survive emitting. */
bool
test_jsonToYAML0()
{
  nlohmann::json jfrom = {
    { "label", "1234" },
    { "essential", false },
    { "revision", 7 },
    { "kernel-cmdline", { { "extra", "quiet" } } },
  };
  std::string yaml = jsonToYAML( jfrom );
  EXPECT( yaml.find( "\"1234\"" ) != std::string::npos );
  EXPECT_EQ( yamlToJSON( yaml ), jfrom );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_readAndCoerceJSON0()
{
  std::filesystem::path dir = TEST_DATA_DIR "/models";
  EXPECT_EQ( readAndCoerceJSON( dir / "pc.yaml" ).at( "grade" ), "dangerous" );
  EXPECT_EQ( readAndCoerceJSON( dir / "pc.json" ).at( "grade" ), "signed" );

  EXPECT_THROW_MSG( (void) readAndCoerceJSON( dir / "missing.json" ),
                    SeedkitException,
                    "general error: File '" + ( dir / "missing.json" ).string()
                      + "' does not exist" );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_trim0()
{
  EXPECT_EQ( trim_copy( "  console=ttyS0 quiet\n" ),
             std::string( "console=ttyS0 quiet" ) );
  EXPECT_EQ( trim_copy( " \t " ), std::string( "" ) );
  EXPECT_EQ( trim_copy( "\tx " ), std::string( "x" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_strings0()
{
  std::vector<std::string> names = { "hello", "world" };
  EXPECT_EQ( concatStringsSep( "/", names ), std::string( "hello/world" ) );
  EXPECT_EQ( quoteStrings( names ), std::string( "\"hello\", \"world\"" ) );
  EXPECT_EQ( quoteStrings( {} ), std::string( "" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_assertIsJSONObject0()
{
  assertIsJSONObject( nlohmann::json::object() );
  EXPECT_THROW_MSG( assertIsJSONObject( nlohmann::json::array(), "model" ),
                    SeedkitException,
                    "general error: expected model to be an object, but found "
                    "an array." );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief `SEEDKIT_DEBUG` raises verbosity when the logger is installed. */
bool
test_initLogger0()
{
  nix::Verbosity old = nix::verbosity;
  nix::verbosity     = nix::lvlWarn;
  setenv( "SEEDKIT_DEBUG", "1", 1 );

  initLogger();
  EXPECT_EQ( nix::verbosity, nix::lvlDebug );
  EXPECT( nix::logger != nullptr );

  /* Emits through the new logger. */
  debugLog( "logger installed" );

  unsetenv( "SEEDKIT_DEBUG" );
  nix::verbosity = old;
  return true;
}


/* -------------------------------------------------------------------------- */

int
main()
{
  int exitCode = EXIT_SUCCESS;
#define RUN_TEST( ... ) _RUN_TEST( exitCode, __VA_ARGS__ )

  RUN_TEST( yamlToJSON0 );
  RUN_TEST( yamlToJSON1 );
  RUN_TEST( jsonToYAML0 );
  RUN_TEST( readAndCoerceJSON0 );
  RUN_TEST( trim0 );
  RUN_TEST( strings0 );
  RUN_TEST( assertIsJSONObject0 );
  RUN_TEST( initLogger0 );

  return exitCode;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
