/* ========================================================================== *
 *
 * @file asserts/assertion.cc
 *
 * @brief Decoded assertions and their JSON form.
 *
 *
 * -------------------------------------------------------------------------- */

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "seedkit/asserts/assertion.hh"
#include "seedkit/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::asserts {

/* -------------------------------------------------------------------------- */

std::string
Assertion::header( const std::string & name ) const
{
  auto itr = this->headers.find( name );
  if ( itr == this->headers.end() )
    {
      throw InvalidAssertionException(
        nix::fmt( "%s assertion is missing header '%s'",
                  std::string( to_string( this->type ) ),
                  name ) );
    }
  if ( itr->is_string() ) { return itr->get<std::string>(); }
  if ( itr->is_number_integer() ) { return itr->dump(); }
  throw InvalidAssertionException(
    nix::fmt( "%s assertion header '%s' must be a string, got: %s",
              std::string( to_string( this->type ) ),
              name,
              itr->dump() ) );
}


/* -------------------------------------------------------------------------- */

std::vector<std::string>
Assertion::primaryKey() const
{
  switch ( this->type )
    {
      case AT_MODEL:
        return { this->header( "brand-id" ), this->header( "model" ) };
      case AT_SNAP_DECLARATION: return { this->header( "snap-id" ) };
      case AT_SNAP_REVISION: return { this->header( "snap-digest" ) };
      default: throw InvalidAssertionException( "unknown assertion type" );
    }
}


/* -------------------------------------------------------------------------- */

std::vector<AssertionRef>
Assertion::prerequisites() const
{
  if ( this->type == AT_SNAP_REVISION )
    {
      return { { AT_SNAP_DECLARATION, { this->header( "snap-id" ) } } };
    }
  return {};
}


/* -------------------------------------------------------------------------- */

std::string
refToString( const AssertionRef & ref )
{
  return std::string( to_string( ref.first ) ) + "/"
         + concatStringsSep( "/", ref.second );
}


/* -------------------------------------------------------------------------- */

void
from_json( const nlohmann::json & jfrom, Assertion & assertion )
{
  assertIsJSONObject<InvalidAssertionException>( jfrom, "assertion" );

  try
    {
      std::string type = jfrom.at( "type" ).get<std::string>();
      if ( type == "model" ) { assertion.type = AT_MODEL; }
      else if ( type == "snap-declaration" )
        {
          assertion.type = AT_SNAP_DECLARATION;
        }
      else if ( type == "snap-revision" ) { assertion.type = AT_SNAP_REVISION; }
      else
        {
          throw InvalidAssertionException( "unknown assertion type '" + type
                                           + "'" );
        }
      jfrom.at( "authority-id" ).get_to( assertion.authorityId );
      assertion.headers = jfrom.at( "headers" );
    }
  catch ( const nlohmann::json::exception & err )
    {
      throw InvalidAssertionException( "failed to parse assertion",
                                       extract_json_errmsg( err ) );
    }
  assertIsJSONObject<InvalidAssertionException>( assertion.headers,
                                                 "assertion headers" );
  /* Catch missing primary key headers early. */
  (void) assertion.primaryKey();
}


void
to_json( nlohmann::json & jto, const Assertion & assertion )
{
  jto = {
    { "type", assertion.type },
    { "authority-id", assertion.authorityId },
    { "headers", assertion.headers },
  };
}


/* -------------------------------------------------------------------------- */

Assertion
makeModelAssertion( const Model & model )
{
  return Assertion { .type        = AT_MODEL,
                     .authorityId = model.brandId,
                     .headers     = model };
}


Model
modelFromAssertion( const Assertion & assertion )
{
  if ( assertion.type != AT_MODEL )
    {
      throw InvalidAssertionException(
        "expected a model assertion, got "
        + std::string( to_string( assertion.type ) ) );
    }
  return assertion.headers.get<Model>();
}


/* -------------------------------------------------------------------------- */

Assertion
makeSnapDeclaration( const SnapId &      snapId,
                     const SnapName &    snapName,
                     const std::string & publisherId,
                     const std::string & authorityId )
{
  return Assertion { .type        = AT_SNAP_DECLARATION,
                     .authorityId = authorityId,
                     .headers     = {
                       { "snap-id", snapId },
                       { "snap-name", snapName },
                       { "publisher-id", publisherId },
                     } };
}


Assertion
makeSnapRevision( const std::string & digest,
                  const SnapId &      snapId,
                  Revision            revision,
                  uint64_t            size,
                  const std::string & developerId,
                  const std::string & authorityId )
{
  if ( ! revision.store() )
    {
      throw InvalidAssertionException(
        "snap-revision assertions need a store revision, got "
        + revision.toString() );
    }
  return Assertion { .type        = AT_SNAP_REVISION,
                     .authorityId = authorityId,
                     .headers     = {
                       { "snap-digest", digest },
                       { "snap-id", snapId },
                       { "snap-revision", revision.n },
                       { "snap-size", size },
                       { "developer-id", developerId },
                     } };
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::asserts


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
