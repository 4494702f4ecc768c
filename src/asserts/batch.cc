/* ========================================================================== *
 *
 * @file asserts/batch.cc
 *
 * @brief A set of assertions which travel together.
 *
 *
 * -------------------------------------------------------------------------- */

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

#include <nlohmann/json.hpp>

#include "seedkit/asserts/batch.hh"
#include "seedkit/core/util.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::asserts {

/* -------------------------------------------------------------------------- */

bool
Batch::contains( const AssertionRef & ref ) const
{
  return std::any_of( this->assertions.begin(),
                      this->assertions.end(),
                      [&]( const Assertion & assertion )
                      { return assertion.ref() == ref; } );
}


/* -------------------------------------------------------------------------- */

void
Batch::add( const Assertion & assertion )
{
  AssertionRef ref = assertion.ref();
  for ( const auto & member : this->assertions )
    {
      if ( member.ref() != ref ) { continue; }
      if ( member == assertion ) { return; }
      throw InvalidAssertionException(
        "batch already holds a different " + refToString( ref ) );
    }
  this->assertions.emplace_back( assertion );
}


/* -------------------------------------------------------------------------- */

void
Batch::checkPrerequisites() const
{
  for ( const auto & assertion : this->assertions )
    {
      for ( const auto & prereq : assertion.prerequisites() )
        {
          if ( ! this->contains( prereq ) )
            {
              throw InvalidAssertionException(
                refToString( assertion.ref() ),
                "prerequisite " + refToString( prereq )
                  + " is not in the batch" );
            }
        }
    }
}


/* -------------------------------------------------------------------------- */

void
Batch::commitTo( AssertionDatabase & db ) const
{
  std::vector<const Assertion *> ordered;
  ordered.reserve( this->assertions.size() );
  for ( const auto & assertion : this->assertions )
    {
      ordered.emplace_back( &assertion );
    }
  /* Only `snap-revision' assertions have prerequisites. */
  std::stable_sort( ordered.begin(),
                    ordered.end(),
                    []( const Assertion * lhs, const Assertion * rhs )
                    { return lhs->type < rhs->type; } );

  for ( const Assertion * assertion : ordered ) { db.add( *assertion ); }
}


/* -------------------------------------------------------------------------- */

void
Batch::write( const std::filesystem::path & path ) const
{
  std::ofstream file( path );
  if ( ! file.is_open() )
    {
      throw SeedkitException( "failed to open assertions file for writing",
                              path.string() );
    }
  file << nlohmann::json( this->assertions ).dump( 2 ) << std::endl;
  if ( file.fail() )
    {
      throw SeedkitException( "failed to write assertions file",
                              path.string() );
    }
}


/* -------------------------------------------------------------------------- */

Batch
Batch::read( const std::filesystem::path & path )
{
  std::ifstream file( path );
  if ( ! file.is_open() )
    {
      throw InvalidAssertionException( "failed to open assertions file",
                                       path.string() );
    }

  nlohmann::json jfrom;
  try
    {
      jfrom = nlohmann::json::parse( file );
    }
  catch ( const nlohmann::json::exception & err )
    {
      throw InvalidAssertionException( "failed to parse assertions file '"
                                         + path.string() + "'",
                                       extract_json_errmsg( err ) );
    }

  if ( ! jfrom.is_array() )
    {
      throw InvalidAssertionException( "expected assertions file '"
                                       + path.string()
                                       + "' to contain a list" );
    }

  Batch batch;
  for ( const auto & elem : jfrom ) { batch.add( elem.get<Assertion>() ); }
  return batch;
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::asserts


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
