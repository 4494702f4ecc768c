/* ========================================================================== *
 *
 * @file exceptions.cc
 *
 * @brief Definitions of various `std::exception` children used for throwing
 *        errors with nice messages and typed discrimination.
 *
 *
 * -------------------------------------------------------------------------- */

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "seedkit/core/exceptions.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

void
to_json( nlohmann::json & jto, const SeedkitException & err )
{
  jto = {
    { "exit_code", err.getErrorCode() },
    { "category_message", err.getCategoryMessage() },
    { "message", err.what() },
  };
  auto contextMsg = err.getContextMessage();
  auto caughtMsg  = err.getCaughtMessage();
  if ( contextMsg.has_value() ) { jto["context_message"] = *contextMsg; };
  if ( caughtMsg.has_value() ) { jto["caught_message"] = *caughtMsg; };
}


/* -------------------------------------------------------------------------- */

error_category
getErrorCode( const std::exception & err ) noexcept
{
  if ( const auto * ours = dynamic_cast<const SeedkitException *>( &err ) )
    {
      return ours->getErrorCode();
    }
  return EC_FAILURE;
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
