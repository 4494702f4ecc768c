/* ========================================================================== *
 *
 * @file seed/manifest.cc
 *
 * @brief The `seed.yaml` manifest of a recovery system.
 *
 *
 * -------------------------------------------------------------------------- */

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "seedkit/core/util.hh"
#include "seedkit/seed/layout.hh"
#include "seedkit/seed/manifest.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::seed {

/* -------------------------------------------------------------------------- */

void
from_json( const nlohmann::json & jfrom, SeedSnap & snap )
{
  assertIsJSONObject<SeedLoadException>( jfrom, "seed snap entry" );

  snap = SeedSnap {};
  try
    {
      for ( const auto & [key, value] : jfrom.items() )
        {
          if ( key == "name" ) { value.get_to( snap.name ); }
          else if ( key == "id" ) { value.get_to( snap.snapId ); }
          else if ( key == "type" )
            {
              snap.type = parseSnapType( value.get<std::string>() );
            }
          else if ( key == "essential" ) { value.get_to( snap.essential ); }
          else if ( key == "asserted" ) { value.get_to( snap.asserted ); }
          else if ( key == "revision" )
            {
              snap.revision = Revision( value.get<int>() );
            }
          else if ( key == "file" ) { value.get_to( snap.file ); }
          else if ( key == "channel" ) { value.get_to( snap.channel ); }
          else
            {
              throw SeedLoadException( "unrecognized seed snap field '" + key
                                       + "'" );
            }
        }
    }
  catch ( const nlohmann::json::exception & err )
    {
      throw SeedLoadException( "failed to parse seed snap entry",
                               extract_json_errmsg( err ) );
    }
  catch ( const InvalidModelException & err )
    {
      throw SeedLoadException( "failed to parse seed snap entry",
                               err.what() );
    }

  if ( snap.name.empty() || snap.file.empty() )
    {
      throw SeedLoadException( "seed snap entries must have a 'name' and a "
                               "'file'" );
    }
  if ( snap.asserted
       && ( ( ! snap.revision.has_value() ) || ( ! snap.revision->store() ) ) )
    {
      throw SeedLoadException( "asserted seed snap '" + snap.name
                               + "' lacks a store revision" );
    }
}


void
to_json( nlohmann::json & jto, const SeedSnap & snap )
{
  jto = {
    { "name", snap.name },
    { "type", snap.type },
    { "essential", snap.essential },
    { "asserted", snap.asserted },
    { "file", snap.file },
    { "channel", snap.channel },
  };
  if ( ! snap.snapId.empty() ) { jto["id"] = snap.snapId; }
  if ( snap.revision.has_value() ) { jto["revision"] = snap.revision->n; }
}


/* -------------------------------------------------------------------------- */

const SeedSnap *
SeedManifest::findSnapByType( snap_type type ) const
{
  for ( const auto & snap : this->snaps )
    {
      if ( snap.type == type ) { return &snap; }
    }
  return nullptr;
}


/* -------------------------------------------------------------------------- */

void
from_json( const nlohmann::json & jfrom, SeedManifest & manifest )
{
  assertIsJSONObject<SeedLoadException>( jfrom, "seed manifest" );

  manifest = SeedManifest {};
  try
    {
      for ( const auto & [key, value] : jfrom.items() )
        {
          if ( key == "label" ) { value.get_to( manifest.label ); }
          else if ( key == "model" ) { value.get_to( manifest.model ); }
          else if ( key == "snaps" ) { value.get_to( manifest.snaps ); }
          else if ( key == "kernel-cmdline" )
            {
              assertIsJSONObject<SeedLoadException>( value,
                                                     "'kernel-cmdline'" );
              if ( value.contains( "extra" ) )
                {
                  manifest.kernelCmdline.extra
                    = value.at( "extra" ).get<std::string>();
                }
              if ( value.contains( "full" ) )
                {
                  manifest.kernelCmdline.full
                    = value.at( "full" ).get<std::string>();
                }
            }
          else
            {
              throw SeedLoadException( "unrecognized seed manifest field '"
                                       + key + "'" );
            }
        }
    }
  catch ( const nlohmann::json::exception & err )
    {
      throw SeedLoadException( "failed to parse seed manifest",
                               extract_json_errmsg( err ) );
    }
}


void
to_json( nlohmann::json & jto, const SeedManifest & manifest )
{
  jto = {
    { "label", manifest.label },
    { "model", manifest.model },
    { "snaps", manifest.snaps },
  };

  nlohmann::json cmdline = nlohmann::json::object();
  if ( manifest.kernelCmdline.extra.has_value() )
    {
      cmdline["extra"] = *manifest.kernelCmdline.extra;
    }
  if ( manifest.kernelCmdline.full.has_value() )
    {
      cmdline["full"] = *manifest.kernelCmdline.full;
    }
  if ( ! cmdline.empty() ) { jto["kernel-cmdline"] = std::move( cmdline ); }
}


/* -------------------------------------------------------------------------- */

void
writeManifest( const std::filesystem::path & path,
               const SeedManifest &          manifest )
{
  std::string yaml = jsonToYAML( nlohmann::json( manifest ) );

  std::ofstream file( path );
  if ( ! file.is_open() )
    {
      throw SeedWriteException( "cannot open '" + path.string()
                                + "' for writing" );
    }
  file << yaml;
  if ( file.fail() )
    {
      throw SeedWriteException( "cannot write '" + path.string() + "'" );
    }
}


SeedManifest
readManifest( const std::filesystem::path & path )
{
  if ( ! std::filesystem::exists( path ) )
    {
      throw SeedLoadException( "no seed manifest at '" + path.string() + "'" );
    }

  nlohmann::json jfrom;
  try
    {
      jfrom = readAndCoerceJSON( path );
    }
  catch ( const SeedkitException & err )
    {
      throw SeedLoadException( "cannot read '" + path.string() + "'",
                               err.what() );
    }
  return jfrom.get<SeedManifest>();
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::seed


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
