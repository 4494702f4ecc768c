/* ========================================================================== *
 *
 * @file fixtures.hh
 *
 * @brief Seeds, snaps, assertions, and bootloaders for tests.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <nix/error.hh>
#include <nix/logging.hh>
#include <nix/util.hh>

#include "seedkit/asserts/asserts-db.hh"
#include "seedkit/boot/bootloader.hh"
#include "seedkit/model.hh"
#include "seedkit/seed/sideinfo.hh"
#include "seedkit/snap.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::test {

/* -------------------------------------------------------------------------- */

inline const std::string storeAuthority = "canonical";
inline const std::string brandId        = "my-brand";


/** @brief A fake 32 character store id derived from @a name. */
inline std::string
snapIdFor( const SnapName & name )
{
  std::string snapId = name;
  while ( snapId.size() < 32 ) { snapId += "id"; }
  snapId.resize( 32 );
  return snapId;
}


/** @brief Guess a snap's type from the names used in tests. */
inline snap_type
snapTypeFor( const SnapName & name )
{
  if ( name == "snapd" ) { return ST_SNAPD; }
  if ( name == "pc-kernel" ) { return ST_KERNEL; }
  if ( name == "pc" ) { return ST_GADGET; }
  if ( ( name == "core20" ) || ( name == "core18" ) ) { return ST_BASE; }
  return ST_APP;
}


/* -------------------------------------------------------------------------- */

/** @brief Records what it is asked to do, and fails on request. */
class MockBootloader : public boot::RecoveryAwareBootloader
{

public:

  std::string    recoverySystemDir;
  boot::BootVars recoverySystemBootVars;
  int            calls = 0;

  /** Throw this from @a setRecoverySystemEnv when set. */
  std::optional<std::string> failWith;


  void
  setRecoverySystemEnv( const std::string &    dir,
                        const boot::BootVars & vars ) override
  {
    ++this->calls;
    if ( this->failWith.has_value() )
      {
        throw std::runtime_error( *this->failWith );
      }
    this->recoverySystemDir      = dir;
    this->recoverySystemBootVars = vars;
  }


}; /* End class `MockBootloader' */


/* -------------------------------------------------------------------------- */

/** @brief A `nix::Logger` which keeps every line in @a buffer. */
class CapturingLogger : public nix::Logger
{

public:

  std::string buffer;

  void
  log( nix::Verbosity /* lvl */, std::string_view str ) override
  {
    this->buffer.append( str );
    this->buffer.push_back( '\n' );
  }

  void
  logEI( const nix::ErrorInfo & einfo ) override
  {
    std::stringstream oss;
    nix::showErrorInfo( oss, einfo, false );
    this->log( einfo.level, oss.str() );
  }


}; /* End class `CapturingLogger' */


/** @brief Install a @a CapturingLogger for the lifetime of this object. */
class LogCapture
{

private:

  nix::Logger *   previous;
  CapturingLogger capturing;


public:

  LogCapture() : previous( nix::logger ) { nix::logger = &this->capturing; }

  LogCapture( const LogCapture & ) = delete;
  LogCapture( LogCapture && )      = delete;

  ~LogCapture() { nix::logger = this->previous; }

  LogCapture &
  operator=( const LogCapture & )
    = delete;
  LogCapture &
  operator=( LogCapture && )
    = delete;

  [[nodiscard]] const std::string &
  str() const
  {
    return this->capturing.buffer;
  }


}; /* End class `LogCapture' */


/* -------------------------------------------------------------------------- */

/** @brief Read a whole file, for comparing copies. */
inline std::string
readFile( const std::filesystem::path & path )
{
  std::ifstream      file( path );
  std::ostringstream oss;
  oss << file.rdbuf();
  return oss.str();
}


inline void
writeFile( const std::filesystem::path & path, const std::string & contents )
{
  std::filesystem::create_directories( path.parent_path() );
  std::ofstream file( path, std::ios::trunc );
  file << contents;
}


/* -------------------------------------------------------------------------- */

/** @brief A model with the essential snaps, plus @a extra. */
inline Model
makeModel( const std::string & name, const std::vector<ModelSnap> & extra = {} )
{
  Model model;
  model.brandId      = brandId;
  model.model        = name;
  model.architecture = "amd64";
  model.base         = "core20";
  model.grade        = MG_DANGEROUS;
  model.snaps        = {
    ModelSnap { .name           = "pc-kernel",
                .snapId         = snapIdFor( "pc-kernel" ),
                .type           = ST_KERNEL,
                .presence       = PR_REQUIRED,
                .defaultChannel = "20" },
    ModelSnap { .name           = "pc",
                .snapId         = snapIdFor( "pc" ),
                .type           = ST_GADGET,
                .presence       = PR_REQUIRED,
                .defaultChannel = "20" },
    ModelSnap { .name           = "snapd",
                .snapId         = snapIdFor( "snapd" ),
                .type           = ST_SNAPD,
                .presence       = PR_REQUIRED,
                .defaultChannel = std::nullopt },
  };
  model.snaps.insert( model.snaps.end(), extra.begin(), extra.end() );
  return model;
}


/** @brief An additional snap entry for @a makeModel. */
inline ModelSnap
extraSnap( const SnapName & name,
           presence_type    presence = PR_REQUIRED,
           bool             asserted = true )
{
  return ModelSnap { .name           = name,
                     .snapId         = asserted ? snapIdFor( name ) : "",
                     .type           = snapTypeFor( name ),
                     .presence       = presence,
                     .defaultChannel = std::nullopt };
}


/* -------------------------------------------------------------------------- */

/**
 * @brief A temporary seed with a trusted assertion database and a set of
 *        snap files to build recovery systems from.
 */
class SeedFixture
{

public:

  std::filesystem::path root;
  std::filesystem::path seedDir;
  std::filesystem::path blobDir;

  asserts::AssertsDb           db;
  std::map<SnapName, SnapInfo> infos;
  MockBootloader               bootloader;


  SeedFixture()
    : root( nix::createTempDir() )
    , seedDir( root / "ubuntu-seed" )
    , blobDir( root / "blobs" )
    , db( ":memory:", { storeAuthority, brandId } )
  {
    std::filesystem::create_directories( this->seedDir );
    std::filesystem::create_directories( this->blobDir );
  }

  SeedFixture( const SeedFixture & ) = delete;
  SeedFixture( SeedFixture && )      = delete;

  ~SeedFixture()
  {
    std::error_code err;
    std::filesystem::remove_all( this->root, err );
  }

  SeedFixture &
  operator=( const SeedFixture & )
    = delete;
  SeedFixture &
  operator=( SeedFixture && )
    = delete;


  /**
   * @brief Create a snap file with version `1.0`.
   *
   * Snaps with a store revision get a `snap-declaration` and a
   * `snap-revision` in @a db. Gadgets get extra kernel command line
   * arguments.
   */
  SnapInfo &
  makeSnap( const SnapName & name, Revision revision )
  {
    std::filesystem::path file
      = this->blobDir / ( name + "_" + revision.toString() + ".snap" );
    writeFile( file, "snap " + name + " at revision " + revision.toString() );

    SnapInfo info;
    info.name      = name;
    info.revision  = revision;
    info.snapId    = revision.store() ? snapIdFor( name ) : "";
    info.version   = "1.0";
    info.type      = snapTypeFor( name );
    info.mountFile = file;
    if ( info.type == ST_GADGET ) { info.cmdline.extra = "args from gadget"; }

    if ( revision.store() ) { this->assertSnap( info ); }

    return this->infos[name] = info;
  }

  /** @brief Add the store assertions for @a info to @a db. */
  void
  assertSnap( const SnapInfo & info )
  {
    this->db.add( asserts::makeSnapDeclaration( info.snapId,
                                                info.name,
                                                brandId,
                                                storeAuthority ) );
    this->db.add(
      asserts::makeSnapRevision( seed::snapDigest( info.mountFile ),
                                 info.snapId,
                                 info.revision,
                                 std::filesystem::file_size( info.mountFile ),
                                 brandId,
                                 storeAuthority ) );
  }

  /** @brief Look snaps up in @a infos. */
  [[nodiscard]] InfoGetter
  getter()
  {
    return [this]( const SnapName & name ) -> std::optional<SnapInfo>
    {
      auto itr = this->infos.find( name );
      if ( itr == this->infos.end() ) { return std::nullopt; }
      return itr->second;
    };
  }

  /** @brief The essential snaps of @a makeModel. */
  void
  makeEssentialSnaps()
  {
    this->makeSnap( "pc-kernel", Revision( 1 ) );
    this->makeSnap( "pc", Revision( 2 ) );
    this->makeSnap( "core20", Revision( 3 ) );
    this->makeSnap( "snapd", Revision( 4 ) );
  }

  [[nodiscard]] std::filesystem::path
  seedPath( const std::string & relPath ) const
  {
    return this->seedDir / relPath;
  }


}; /* End class `SeedFixture' */


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::test


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
