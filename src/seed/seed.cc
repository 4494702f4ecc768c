/* ========================================================================== *
 *
 * @file seed/seed.cc
 *
 * @brief Open a recovery system written to a seed.
 *
 *
 * -------------------------------------------------------------------------- */

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include <nix/error.hh>

#include "seedkit/asserts/batch.hh"
#include "seedkit/core/util.hh"
#include "seedkit/seed/layout.hh"
#include "seedkit/seed/seed.hh"
#include "seedkit/seed/sideinfo.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::seed {

/* -------------------------------------------------------------------------- */

Seed::Seed( std::filesystem::path seedDir, std::string label )
  : seedDir( std::move( seedDir ) ), label( std::move( label ) )
{
  std::filesystem::path dir = systemDir( this->seedDir, this->label );
  if ( ! std::filesystem::is_directory( dir ) )
    {
      throw SeedLoadException( "no system '" + this->label + "' in seed '"
                               + this->seedDir.string() + "'" );
    }
}


/* -------------------------------------------------------------------------- */

void
Seed::loadAssertions( asserts::AssertionDatabase & db )
{
  asserts::Batch batch;
  try
    {
      batch = asserts::Batch::read( assertionsPath( this->seedDir,
                                                    this->label ) );
      batch.commitTo( db );
    }
  catch ( const SeedkitException & err )
    {
      throw SeedLoadException( "cannot load assertions of system '"
                                 + this->label + "'",
                               err.what() );
    }

  for ( const auto & assertion : batch.getAssertions() )
    {
      if ( assertion.type != asserts::AT_MODEL ) { continue; }
      if ( this->model.has_value() )
        {
          throw SeedLoadException( "system '" + this->label
                                   + "' has more than one model assertion" );
        }
      try
        {
          this->model = asserts::modelFromAssertion( assertion );
        }
      catch ( const SeedkitException & err )
        {
          throw SeedLoadException( "cannot decode model of system '"
                                     + this->label + "'",
                                   err.what() );
        }
    }

  if ( ! this->model.has_value() )
    {
      throw SeedLoadException( "system '" + this->label
                               + "' has no model assertion" );
    }
  debugLog( nix::fmt( "loaded assertions of system '%s' for model '%s'",
                      this->label,
                      this->model->reference() ) );
}


/* -------------------------------------------------------------------------- */

std::filesystem::path
Seed::snapPath( const SeedSnap & snap ) const
{
  if ( snap.asserted ) { return sharedSnapsDir( this->seedDir ) / snap.file; }
  return systemSnapsDir( this->seedDir, this->label ) / snap.file;
}


/* -------------------------------------------------------------------------- */

/** @brief Fail unless @a snap matches a `snap-revision` in @a db. */
static void
checkAssertedSnap( const SeedSnap &              snap,
                   const std::filesystem::path & path,
                   asserts::AssertionDatabase &  db )
{
  std::string digest;
  try
    {
      digest = snapDigest( path );
    }
  catch ( const nix::Error & err )
    {
      throw SeedLoadException( "cannot compute digest of '" + path.string()
                                 + "'",
                               err.what() );
    }

  std::optional<asserts::Assertion> revision = db.findSnapRevision( digest );
  if ( ! revision.has_value() )
    {
      throw SeedLoadException( "no snap-revision assertion for snap '"
                               + snap.name + "'" );
    }
  if ( ( revision->header( "snap-id" ) != snap.snapId )
       || ( revision->header( "snap-revision" ) != snap.revision->toString() ) )
    {
      throw SeedLoadException( nix::fmt(
        "snap '%s' does not match its snap-revision assertion",
        snap.name ) );
    }
}


void
Seed::loadMeta( asserts::AssertionDatabase & db )
{
  SeedManifest loaded
    = readManifest( seedYamlPath( this->seedDir, this->label ) );

  if ( loaded.label != this->label )
    {
      throw SeedLoadException( "seed manifest of system '" + this->label
                               + "' is labelled '" + loaded.label + "'" );
    }
  if ( this->model.has_value() && ( loaded.model != this->model->reference() ) )
    {
      throw SeedLoadException(
        nix::fmt( "seed manifest of system '%s' is for model '%s', not '%s'",
                  this->label,
                  loaded.model,
                  this->model->reference() ) );
    }

  static const std::array<snap_type, 4> essentialTypes
    = { ST_SNAPD, ST_KERNEL, ST_BASE, ST_GADGET };
  for ( snap_type type : essentialTypes )
    {
      bool found = false;
      for ( const auto & snap : loaded.snaps )
        {
          found = found || ( snap.essential && ( snap.type == type ) );
        }
      if ( ! found )
        {
          throw SeedLoadException(
            nix::fmt( "system '%s' lacks an essential %s snap",
                      this->label,
                      std::string( to_string( type ) ) ) );
        }
    }

  for ( const auto & snap : loaded.snaps )
    {
      std::filesystem::path path = this->snapPath( snap );
      if ( ! std::filesystem::exists( path ) )
        {
          throw SeedLoadException( "snap '" + snap.name + "' is missing from '"
                                   + path.string() + "'" );
        }
      if ( snap.asserted ) { checkAssertedSnap( snap, path, db ); }
    }

  this->manifest = std::move( loaded );
}


/* -------------------------------------------------------------------------- */

const Model &
Seed::getModel() const
{
  if ( ! this->model.has_value() )
    {
      throw SeedLoadException( "assertions of system '" + this->label
                               + "' were not loaded" );
    }
  return *this->model;
}


const SeedManifest &
Seed::getManifest() const
{
  if ( ! this->manifest.has_value() )
    {
      throw SeedLoadException( "metadata of system '" + this->label
                               + "' was not loaded" );
    }
  return *this->manifest;
}


bool
Seed::usesSnapdSnap() const
{
  return this->getManifest().findSnapByType( ST_SNAPD ) != nullptr;
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::seed


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
