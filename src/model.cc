/* ========================================================================== *
 *
 * @file model.cc
 *
 * @brief The device model and its JSON parsers.
 *
 *
 * -------------------------------------------------------------------------- */

#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "seedkit/core/util.hh"
#include "seedkit/model.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

/** @brief Read a string header, reporting @a who on type errors. */
static std::string
getStringHeader( const nlohmann::json & value, const std::string & who )
{
  try
    {
      return value.get<std::string>();
    }
  catch ( const nlohmann::json::exception & err )
    {
      throw InvalidModelException( "failed to parse model field '" + who
                                     + "' with value: " + value.dump(),
                                   extract_json_errmsg( err ) );
    }
}


/* -------------------------------------------------------------------------- */

void
from_json( const nlohmann::json & jfrom, ModelSnap & snap )
{
  assertIsJSONObject<InvalidModelException>( jfrom, "model field 'snaps.*'" );

  snap = ModelSnap {};
  for ( const auto & [key, value] : jfrom.items() )
    {
      if ( key == "name" ) { snap.name = getStringHeader( value, "name" ); }
      else if ( key == "id" ) { snap.snapId = getStringHeader( value, "id" ); }
      else if ( key == "type" )
        {
          snap.type = parseSnapType( getStringHeader( value, "type" ) );
        }
      else if ( key == "presence" )
        {
          snap.presence
            = parsePresence( getStringHeader( value, "presence" ) );
        }
      else if ( key == "default-channel" )
        {
          snap.defaultChannel = getStringHeader( value, "default-channel" );
        }
      /* Install modes are not relevant for the recovery seed. */
      else if ( key == "modes" ) { ; }
      else
        {
          throw InvalidModelException( "unrecognized model field 'snaps.*."
                                       + key + "'." );
        }
    }

  if ( snap.name.empty() )
    {
      throw InvalidModelException( "model snap entries must have a 'name'" );
    }
}


void
to_json( nlohmann::json & jto, const ModelSnap & snap )
{
  jto = { { "name", snap.name } };
  if ( ! snap.snapId.empty() ) { jto["id"] = snap.snapId; }
  if ( snap.type != ST_APP ) { jto["type"] = snap.type; }
  if ( snap.presence != PR_REQUIRED ) { jto["presence"] = snap.presence; }
  if ( snap.defaultChannel.has_value() )
    {
      jto["default-channel"] = *snap.defaultChannel;
    }
}


/* -------------------------------------------------------------------------- */

const ModelSnap *
Model::findSnap( const SnapName & name ) const
{
  for ( const auto & snap : this->snaps )
    {
      if ( snap.name == name ) { return &snap; }
    }
  return nullptr;
}


/* -------------------------------------------------------------------------- */

void
Model::check() const
{
  if ( this->brandId.empty() )
    {
      throw InvalidModelException( "model is missing the 'brand-id' header" );
    }
  if ( this->model.empty() )
    {
      throw InvalidModelException( "model is missing the 'model' header" );
    }

  std::set<std::string> seen;
  for ( const auto & snap : this->snaps )
    {
      if ( ! seen.emplace( snap.name ).second )
        {
          throw InvalidModelException( "model lists snap '" + snap.name
                                       + "' more than once" );
        }
    }
}


/* -------------------------------------------------------------------------- */

void
from_json( const nlohmann::json & jfrom, Model & model )
{
  assertIsJSONObject<InvalidModelException>( jfrom, "model" );

  model = Model {};
  for ( const auto & [key, value] : jfrom.items() )
    {
      if ( key == "brand-id" )
        {
          model.brandId = getStringHeader( value, key );
        }
      else if ( key == "model" ) { model.model = getStringHeader( value, key ); }
      else if ( key == "architecture" )
        {
          model.architecture = getStringHeader( value, key );
        }
      else if ( key == "base" ) { model.base = getStringHeader( value, key ); }
      else if ( key == "grade" )
        {
          model.grade = parseGrade( getStringHeader( value, key ) );
        }
      else if ( key == "kernel" )
        {
          model.kernel = getStringHeader( value, key );
        }
      else if ( key == "gadget" )
        {
          model.gadget = getStringHeader( value, key );
        }
      else if ( key == "snaps" )
        {
          if ( ! value.is_array() )
            {
              throw InvalidModelException(
                "model field 'snaps' must be a list" );
            }
          /* Rely on the underlying exception handlers. */
          for ( const auto & elem : value )
            {
              model.snaps.emplace_back( elem.get<ModelSnap>() );
            }
        }
      /* Informational headers. */
      else if ( ( key == "type" ) || ( key == "authority-id" )
                || ( key == "series" ) || ( key == "display-name" )
                || ( key == "timestamp" ) || ( key == "revision" ) )
        {
          ;
        }
      else
        {
          throw InvalidModelException( "unrecognized model field '" + key
                                       + "'." );
        }
    }
  model.check();
}


void
to_json( nlohmann::json & jto, const Model & model )
{
  model.check();
  jto = {
    { "brand-id", model.brandId },
    { "model", model.model },
  };
  if ( ! model.architecture.empty() )
    {
      jto["architecture"] = model.architecture;
    }
  if ( ! model.base.empty() ) { jto["base"] = model.base; }
  if ( model.grade != MG_UNSET ) { jto["grade"] = model.grade; }
  if ( model.kernel.has_value() ) { jto["kernel"] = *model.kernel; }
  if ( model.gadget.has_value() ) { jto["gadget"] = *model.gadget; }
  if ( ! model.snaps.empty() ) { jto["snaps"] = model.snaps; }
}


/* -------------------------------------------------------------------------- */

Model
readModel( const std::filesystem::path & path )
{
  try
    {
      return readAndCoerceJSON( path ).get<Model>();
    }
  catch ( const nlohmann::json::exception & err )
    {
      throw InvalidModelException( "while reading '" + path.string() + "'",
                                   extract_json_errmsg( err ) );
    }
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
