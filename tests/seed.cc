/* ========================================================================== *
 *
 * @file seed.cc
 *
 * @brief Tests for the seed manifest and for loading recovery systems.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "seedkit/create-system.hh"
#include "seedkit/seed/layout.hh"
#include "seedkit/seed/manifest.hh"
#include "seedkit/seed/seed.hh"

#include "fixtures.hh"
#include "test.hh"


/* -------------------------------------------------------------------------- */

using namespace seedkit;
using namespace seedkit::seed;
using namespace seedkit::test;


/* -------------------------------------------------------------------------- */

static SeedManifest
sampleManifest()
{
  SeedManifest manifest;
  manifest.label = "1234";
  manifest.model = "my-brand/pc";
  manifest.snaps = {
    SeedSnap { .name      = "pc",
               .snapId    = snapIdFor( "pc" ),
               .type      = ST_GADGET,
               .essential = true,
               .asserted  = true,
               .revision  = Revision( 2 ),
               .file      = "pc_2.snap",
               .channel   = "20" },
    SeedSnap { .name      = "hello",
               .snapId    = "",
               .type      = ST_APP,
               .essential = false,
               .asserted  = false,
               .revision  = Revision( -1 ),
               .file      = "hello_1.0.snap",
               .channel   = "latest/stable" },
  };
  manifest.kernelCmdline.extra = "console=ttyS0";
  return manifest;
}


/** @brief Build system @a label from the essential snaps plus `hello`. */
static void
buildSampleSystem( SeedFixture & fixture, const std::string & label )
{
  fixture.makeEssentialSnaps();
  fixture.makeSnap( "hello", Revision( -1 ) );
  Model model = makeModel( "pc", { extraSnap( "hello", PR_REQUIRED, false ) } );

  BuildResult result = createSystem( fixture.getter(),
                                     fixture.db,
                                     fixture.bootloader,
                                     label,
                                     model,
                                     fixture.seedDir );
  result.rethrow();
}


/* -------------------------------------------------------------------------- */

/** @brief Labels and channels which look like numbers stay strings. */
bool
test_manifest0()
{
  SeedFixture           fixture;
  std::filesystem::path path     = fixture.root / "seed.yaml";
  SeedManifest          manifest = sampleManifest();

  writeManifest( path, manifest );
  EXPECT( readFile( path ).find( "label: \"1234\"" ) != std::string::npos );

  SeedManifest read = readManifest( path );
  EXPECT_EQ( read.label, "1234" );
  EXPECT_EQ( read.model, "my-brand/pc" );
  EXPECT( read.snaps == manifest.snaps );
  EXPECT( read.kernelCmdline.extra == std::string( "console=ttyS0" ) );
  EXPECT( ! read.kernelCmdline.full.has_value() );

  EXPECT( read.findSnapByType( ST_GADGET ) != nullptr );
  EXPECT_EQ( read.findSnapByType( ST_GADGET )->name, "pc" );
  EXPECT( read.findSnapByType( ST_KERNEL ) == nullptr );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_manifestInvalid0()
{
  SeedFixture           fixture;
  std::filesystem::path path = fixture.root / "seed.yaml";

  EXPECT_THROW_MSG( (void) readManifest( path ),
                    SeedLoadException,
                    "error loading seed: no seed manifest at '" + path.string()
                      + "'" );

  writeFile( path, "label: \"1234\"\nsize: 3\n" );
  EXPECT_THROW_MSG( (void) readManifest( path ),
                    SeedLoadException,
                    "error loading seed: unrecognized seed manifest field "
                    "'size'" );

  writeFile( path,
             "label: \"1234\"\n"
             "snaps:\n"
             "  - name: pc\n"
             "    file: pc_x1.snap\n"
             "    asserted: true\n"
             "    revision: -1\n" );
  EXPECT_THROW_MSG( (void) readManifest( path ),
                    SeedLoadException,
                    "error loading seed: asserted seed snap 'pc' lacks a "
                    "store revision" );

  writeFile( path, "snaps:\n  - name: pc\n" );
  EXPECT_THROW_MSG( (void) readManifest( path ),
                    SeedLoadException,
                    "error loading seed: seed snap entries must have a "
                    "'name' and a 'file'" );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_Seed0()
{
  SeedFixture fixture;
  EXPECT_THROW_MSG( Seed( fixture.seedDir, "1234" ),
                    SeedLoadException,
                    "error loading seed: no system '1234' in seed '"
                      + fixture.seedDir.string() + "'" );

  buildSampleSystem( fixture, "1234" );
  Seed sd( fixture.seedDir, "1234" );
  EXPECT_THROW_MSG( sd.getModel(),
                    SeedLoadException,
                    "error loading seed: assertions of system '1234' were "
                    "not loaded" );
  EXPECT_THROW_MSG( sd.getManifest(),
                    SeedLoadException,
                    "error loading seed: metadata of system '1234' was not "
                    "loaded" );

  asserts::AssertsDb db( { storeAuthority, brandId } );
  sd.loadAssertions( db );
  sd.loadMeta( db );
  EXPECT( sd.getModel() == makeModel( "pc",
                                      { extraSnap( "hello",
                                                   PR_REQUIRED,
                                                   false ) } ) );
  EXPECT_EQ( sd.getManifest().snaps.size(), std::size_t( 5 ) );
  EXPECT( sd.usesSnapdSnap() );

  const SeedSnap * kernel = sd.getManifest().findSnapByType( ST_KERNEL );
  EXPECT( kernel != nullptr );
  EXPECT_EQ( sd.snapPath( *kernel ), fixture.seedPath( "snaps/pc-kernel_1.snap" ) );
  const SeedSnap * hello = sd.getManifest().findSnapByType( ST_APP );
  EXPECT( hello != nullptr );
  EXPECT_EQ( sd.snapPath( *hello ),
             fixture.seedPath( "systems/1234/snaps/hello_1.0.snap" ) );
  return true;
}


/* -------------------------------------------------------------------------- */

/** @brief Assertions from untrusted authorities are refused. */
bool
test_SeedUntrusted0()
{
  SeedFixture fixture;
  buildSampleSystem( fixture, "1234" );

  asserts::AssertsDb db( { storeAuthority } );
  Seed               sd( fixture.seedDir, "1234" );
  try
    {
      sd.loadAssertions( db );
      EXPECT_FAIL( "loading a model from an untrusted brand did not throw" );
    }
  catch ( const SeedLoadException & err )
    {
      EXPECT( err.getContextMessage()
              == std::string( "cannot load assertions of system '1234'" ) );
    }
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_SeedMissingSnap0()
{
  SeedFixture fixture;
  buildSampleSystem( fixture, "1234" );

  std::filesystem::path hello
    = fixture.seedPath( "systems/1234/snaps/hello_1.0.snap" );
  std::filesystem::remove( hello );

  asserts::AssertsDb db( { storeAuthority, brandId } );
  Seed               sd( fixture.seedDir, "1234" );
  sd.loadAssertions( db );
  EXPECT_THROW_MSG( sd.loadMeta( db ),
                    SeedLoadException,
                    "error loading seed: snap 'hello' is missing from '"
                      + hello.string() + "'" );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_SeedTamperedSnap0()
{
  SeedFixture fixture;
  buildSampleSystem( fixture, "1234" );

  writeFile( fixture.seedPath( "snaps/pc_2.snap" ), "tampered" );

  asserts::AssertsDb db( { storeAuthority, brandId } );
  Seed               sd( fixture.seedDir, "1234" );
  sd.loadAssertions( db );
  EXPECT_THROW_MSG( sd.loadMeta( db ),
                    SeedLoadException,
                    "error loading seed: no snap-revision assertion for snap "
                    "'pc'" );
  return true;
}


/* -------------------------------------------------------------------------- */

bool
test_getSeedDir0()
{
  unsetenv( "SEEDKIT_SEED_DIR" );
  EXPECT_EQ( getSeedDir(), std::filesystem::path( "/run/mnt/ubuntu-seed" ) );

  setenv( "SEEDKIT_SEED_DIR", "/tmp/seed", 1 );
  EXPECT_EQ( getSeedDir(), std::filesystem::path( "/tmp/seed" ) );

  setenv( "SEEDKIT_SEED_DIR", "", 1 );
  EXPECT_EQ( getSeedDir(), std::filesystem::path( "/run/mnt/ubuntu-seed" ) );

  unsetenv( "SEEDKIT_SEED_DIR" );
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

  RUN_TEST( manifest0 );
  RUN_TEST( manifestInvalid0 );

  RUN_TEST( Seed0 );
  RUN_TEST( SeedUntrusted0 );
  RUN_TEST( SeedMissingSnap0 );
  RUN_TEST( SeedTamperedSnap0 );

  RUN_TEST( getSeedDir0 );

  return exitCode;
}


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
