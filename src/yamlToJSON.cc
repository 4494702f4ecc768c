/* ========================================================================== *
 *
 * @file yamlToJSON.cc
 *
 * @brief Convert between YAML documents and JSON values.
 *
 *
 * -------------------------------------------------------------------------- */

#include <cstdint>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "seedkit/core/exceptions.hh"
#include "seedkit/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

/**
 * @class seedkit::YAMLToJSONException
 * @brief An exception thrown when converting YAML to JSON.
 *
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( YAMLToJSONException,
                          EC_YAML_TO_JSON,
                          "error converting YAML to JSON" )
/** @} */


/* -------------------------------------------------------------------------- */

/** @brief Detect integers, floats, bools, and real strings in a scalar. */
static nlohmann::json
scalarToJSON( const YAML::Node & yfrom )
{
  /* `yaml-cpp' tags quoted scalars with `!' and plain ones with `?'. */
  if ( yfrom.Tag() == "!" ) { return yfrom.as<std::string>(); }

  int64_t asInt = 0;
  if ( YAML::convert<int64_t>::decode( yfrom, asInt ) ) { return asInt; }

  double asDouble = 0;
  if ( YAML::convert<double>::decode( yfrom, asDouble ) ) { return asDouble; }

  bool asBool = false;
  if ( YAML::convert<bool>::decode( yfrom, asBool ) ) { return asBool; }

  return yfrom.as<std::string>();
}


/* -------------------------------------------------------------------------- */

nlohmann::json
yamlToJSON( std::string_view yaml )
{
  std::function<void( nlohmann::json &, const YAML::Node & )> visit;

  visit = [&]( nlohmann::json & jto, const YAML::Node & yfrom )
  {
    switch ( yfrom.Type() )
      {
        case YAML::NodeType::Null: jto = nullptr; break;

        case YAML::NodeType::Scalar: jto = scalarToJSON( yfrom ); break;

        case YAML::NodeType::Sequence:
          jto = nlohmann::json::array();
          for ( const auto & elem : yfrom )
            {
              nlohmann::json jval;
              visit( jval, elem );
              jto.emplace_back( std::move( jval ) );
            }
          break;

        case YAML::NodeType::Map:
          jto = nlohmann::json::object();
          for ( const auto & elem : yfrom )
            {
              nlohmann::json jval;
              visit( jval, elem.second );
              jto.emplace( elem.first.as<std::string>(), std::move( jval ) );
            }
          break;

        case YAML::NodeType::Undefined:
          throw YAMLToJSONException( "YAML node has an undefined type" );
          break;

        default:
          throw YAMLToJSONException( "YAML node has an unrecognized type" );
          break;
      }
  }; /* End fn `visit()' */

  try
    {
      std::string    yamlStr( yaml );
      YAML::Node     node = YAML::Load( yamlStr );
      nlohmann::json rsl;
      visit( rsl, node );
      return rsl;
    }
  catch ( const YAMLToJSONException & )
    {
      throw;
    }
  catch ( const YAML::Exception & e )
    {
      throw YAMLToJSONException( "while parsing a YAML string", e.what() );
    }
} /* End fn `yamlToJSON()' */


/* -------------------------------------------------------------------------- */

std::string
jsonToYAML( const nlohmann::json & json )
{
  std::function<void( YAML::Emitter &, const nlohmann::json & )> visit;

  visit = [&]( YAML::Emitter & out, const nlohmann::json & jfrom )
  {
    switch ( jfrom.type() )
      {
        case nlohmann::json::value_t::null: out << YAML::Null; break;

        case nlohmann::json::value_t::boolean:
          out << jfrom.get<bool>();
          break;

        case nlohmann::json::value_t::number_integer:
          out << jfrom.get<int64_t>();
          break;

        case nlohmann::json::value_t::number_unsigned:
          out << jfrom.get<uint64_t>();
          break;

        case nlohmann::json::value_t::number_float:
          out << jfrom.get<double>();
          break;

        case nlohmann::json::value_t::string:
          out << YAML::DoubleQuoted << jfrom.get<std::string>();
          break;

        case nlohmann::json::value_t::array:
          out << YAML::BeginSeq;
          for ( const auto & elem : jfrom ) { visit( out, elem ); }
          out << YAML::EndSeq;
          break;

        case nlohmann::json::value_t::object:
          out << YAML::BeginMap;
          for ( const auto & [key, value] : jfrom.items() )
            {
              out << YAML::Key << key << YAML::Value;
              visit( out, value );
            }
          out << YAML::EndMap;
          break;

        default:
          throw JSONToYAMLException( "cannot emit JSON value of type "
                                     + std::string( jfrom.type_name() ) );
          break;
      }
  }; /* End fn `visit()' */

  YAML::Emitter out;
  visit( out, json );
  if ( ! out.good() )
    {
      throw JSONToYAMLException( "while emitting YAML", out.GetLastError() );
    }
  return std::string( out.c_str() ) + "\n";
} /* End fn `jsonToYAML()' */


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
