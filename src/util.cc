/* ========================================================================== *
 *
 * @file util.cc
 *
 * @brief Miscellaneous helper functions.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <sqlite3pp.hh>

#include "seedkit/core/exceptions.hh"
#include "seedkit/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

bool
isSQLError( int rcode )
{
  switch ( rcode )
    {
      case SQLITE_OK:
      case SQLITE_ROW:
      case SQLITE_DONE: return false; break;
      default: return true; break;
    }
}


/* -------------------------------------------------------------------------- */

nlohmann::json
readAndCoerceJSON( const std::filesystem::path & path )
{
  if ( ! std::filesystem::exists( path ) )
    {
      throw SeedkitException( "File '" + path.string() + "' does not exist" );
    }

  std::ifstream ifs( path );
  auto          ext = path.extension();
  if ( ext == ".json" ) { return nlohmann::json::parse( ifs ); }

  /* Read file to buffer */
  std::ostringstream oss;
  if ( ( ext == ".yaml" ) || ( ext == ".yml" ) )
    {
      oss << ifs.rdbuf();
      return yamlToJSON( oss.str() );
    }
  throw SeedkitException( "Cannot convert file extension '" + ext.string()
                          + "' to JSON" );
}


/* -------------------------------------------------------------------------- */

std::string
trim_copy( std::string_view str )
{
  auto notSpace = []( unsigned char chr ) { return ! std::isspace( chr ); };
  std::string rsl( str );
  rsl.erase( std::find_if( rsl.rbegin(), rsl.rend(), notSpace ).base(),
             rsl.end() );
  rsl.erase( rsl.begin(), std::find_if( rsl.begin(), rsl.end(), notSpace ) );
  return rsl;
}


/* -------------------------------------------------------------------------- */

std::string
extract_json_errmsg( const nlohmann::json::exception & err )
{
  /* All of the nlohmann::json::exception messages are formatted like so:
   * [something] actually useful message. */
  std::string            full( err.what() );
  std::string::size_type idx = full.find( "] " );
  if ( idx == std::string::npos ) { return full; }
  return full.substr( idx + 2 ); /* Don't include the leading space */
}


/* -------------------------------------------------------------------------- */

std::string
quoteStrings( const std::vector<std::string> & strings )
{
  std::vector<std::string> quoted;
  quoted.reserve( strings.size() );
  for ( const auto & str : strings ) { quoted.emplace_back( '"' + str + '"' ); }
  return concatStringsSep( ", ", quoted );
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
