/* ========================================================================== *
 *
 * @file resolver/acquire.cc
 *
 * @brief Look up the snap backing each requirement of a model.
 *
 *
 * -------------------------------------------------------------------------- */

#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "seedkit/core/util.hh"
#include "seedkit/resolver/acquire.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::resolver {

/* -------------------------------------------------------------------------- */

[[noreturn]] static void
throwLookupError( const Requirement & requirement, const std::string & caught )
{
  if ( requirement.essential ) { throw ObtainSnapInfoException( caught ); }
  throw ObtainNonEssentialSnapInfoException( caught );
}


/** @brief Call @a getInfo, tagging its errors with the kind of snap. */
static std::optional<SnapInfo>
lookup( const InfoGetter & getInfo, const Requirement & requirement )
{
  try
    {
      return getInfo( requirement.name );
    }
  catch ( const std::exception & err )
    {
      throwLookupError( requirement, err.what() );
    }
  catch ( ... )
    {
      throwLookupError( requirement, "unknown error" );
    }
}


/* -------------------------------------------------------------------------- */

std::vector<Candidate>
acquireSnaps( const InfoGetter &               getInfo,
              const std::vector<Requirement> & requirements )
{
  std::vector<Candidate> candidates;
  candidates.reserve( requirements.size() );

  for ( const auto & requirement : requirements )
    {
      std::optional<SnapInfo> info = lookup( getInfo, requirement );
      if ( info.has_value() )
        {
          traceLog( nix::fmt( "found snap '%s' revision %s",
                              requirement.name,
                              info->revision.toString() ) );
          candidates.emplace_back(
            Candidate { .requirement = requirement,
                        .info        = std::move( *info ) } );
          continue;
        }

      if ( requirement.essential )
        {
          throw EssentialSnapNotPresentException( "essential snap \""
                                                  + requirement.name
                                                  + "\" not present" );
        }
      if ( requirement.presence == PR_REQUIRED )
        {
          throw RequiredSnapNotPresentException(
            "non-essential but \"required\" snap \"" + requirement.name
            + "\" not present" );
        }
      debugLog( nix::fmt( "optional snap '%s' is not available, skipping",
                          requirement.name ) );
    }

  return candidates;
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::resolver


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
