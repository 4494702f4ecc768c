/* ========================================================================== *
 *
 * @file seedkit/core/util.hh
 *
 * @brief Miscellaneous helper functions.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <sstream>
#include <string>  // For `std::string' and `std::string_view'
#include <string_view>
#include <vector>

#include <nix/logging.hh>
#include <nix/util.hh>
#include <nlohmann/json.hpp>

#include "seedkit/core/exceptions.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

/**
 * @brief Predicate to detect failing SQLite3 return codes.
 * @param rcode A SQLite3 _return code_.
 * @return `true` iff @a rcode is a SQLite3 error.
 */
bool
isSQLError( int rcode );


/* -------------------------------------------------------------------------- */

/**
 * @brief Convert a YAML string to JSON.
 *
 * Quoted scalars are always kept as strings, so a label such as `"1234"`
 * survives a round trip through @a seedkit::jsonToYAML.
 */
[[nodiscard]] nlohmann::json
yamlToJSON( std::string_view yaml );

/**
 * @brief Convert a JSON value to a YAML document.
 *
 * Strings are emitted double quoted.
 */
[[nodiscard]] std::string
jsonToYAML( const nlohmann::json & json );


/* -------------------------------------------------------------------------- */

/**
 * @brief Read a file and coerce its contents to JSON based on its extension.
 *
 * Files with the extension `.json` are parsed directly.
 * Files with the extension `.yaml` or `.yml` are converted to JSON from YAML.
 */
[[nodiscard]] nlohmann::json
readAndCoerceJSON( const std::filesystem::path & path );


/* -------------------------------------------------------------------------- */

/** @brief trim from both ends ( copying ). */
[[nodiscard]] std::string
trim_copy( std::string_view str );


/* -------------------------------------------------------------------------- */

/**
 * @brief Extract the user-friendly portion of a @a nlohmann::json::exception.
 */
[[nodiscard]] std::string
extract_json_errmsg( const nlohmann::json::exception & err );


/* -------------------------------------------------------------------------- */

/**
 * @brief Assert that a JSON value is an object, or throw an exception.
 *
 * The type of exception and an optional _path_ for messages can be provided.
 */
template<typename Exception = SeedkitException>
static void
assertIsJSONObject( const nlohmann::json & value,
                    const std::string &    who = "JSON value" )
{
  if ( ! value.is_object() )
    {
      std::stringstream oss;
      oss << "expected " << who << " to be an object, but found "
          << ( value.is_array() ? "an" : "a" ) << ' ' << value.type_name()
          << '.';
      throw Exception( oss.str() );
    }
}


/* -------------------------------------------------------------------------- */

/**
 * @brief Concatenate the given strings with a separator between
 *        the elements.
 */
template<class Container>
[[nodiscard]] std::string
concatStringsSep( const std::string_view sep, const Container & strings )
{
  size_t size = 0;
  for ( const auto & str : strings )
    {
      size += sep.size() + std::string_view( str ).size();
    }
  std::string rsl;
  rsl.reserve( size );
  for ( auto & idx : strings )
    {
      if ( ! rsl.empty() ) { rsl += sep; }
      rsl += idx;
    }
  return rsl;
}

/** @brief Wrap each string in double quotes, e.g. `"pc", "pc-kernel"`. */
[[nodiscard]] std::string
quoteStrings( const std::vector<std::string> & strings );


/* -------------------------------------------------------------------------- */

/** @brief Print a log message with the provided log level.
 *
 * This is a macro so that any allocations needed for msg can be optimized out.
 */
#define printLog( lvl, msg ) \
  if ( ! ( ( lvl ) > nix::verbosity ) ) { nix::logger->log( lvl, msg ); }

/** @brief Prints a log message to `stderr` at `vomit` verbosity. */
#define traceLog( msg ) printLog( nix::Verbosity::lvlVomit, msg )

/** @brief Prints a log message to `stderr` when `SEEDKIT_DEBUG` is set. */
#define debugLog( msg ) printLog( nix::Verbosity::lvlDebug, msg )

/** @brief Prints a log message to `stderr` at default verbosity. */
#define infoLog( msg ) printLog( nix::Verbosity::lvlInfo, msg )

/** @brief Prints a log message to `stderr` when verbosity is at least warn. */
#define warningLog( msg ) printLog( nix::Verbosity::lvlWarn, msg )


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
