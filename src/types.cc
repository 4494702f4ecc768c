/* ========================================================================== *
 *
 * @file types.cc
 *
 * @brief Strict parsers for the small enumerations in `seedkit/core/types.hh`.
 *
 *
 * -------------------------------------------------------------------------- */

#include <string>
#include <string_view>

#include "seedkit/core/exceptions.hh"
#include "seedkit/core/types.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

snap_type
parseSnapType( std::string_view str )
{
  if ( ( str == "app" ) || str.empty() ) { return ST_APP; }
  if ( str == "snapd" ) { return ST_SNAPD; }
  if ( str == "kernel" ) { return ST_KERNEL; }
  if ( str == "base" ) { return ST_BASE; }
  if ( str == "gadget" ) { return ST_GADGET; }
  throw InvalidModelException( "unknown snap type '" + std::string( str )
                               + "'" );
}


/* -------------------------------------------------------------------------- */

presence_type
parsePresence( std::string_view str )
{
  if ( ( str == "required" ) || str.empty() ) { return PR_REQUIRED; }
  if ( str == "optional" ) { return PR_OPTIONAL; }
  throw InvalidModelException( "presence must be 'required' or 'optional', "
                               "got '"
                               + std::string( str ) + "'" );
}


/* -------------------------------------------------------------------------- */

model_grade
parseGrade( std::string_view str )
{
  if ( str.empty() ) { return MG_UNSET; }
  if ( str == "dangerous" ) { return MG_DANGEROUS; }
  if ( str == "signed" ) { return MG_SIGNED; }
  if ( str == "secured" ) { return MG_SECURED; }
  throw InvalidModelException( "unknown model grade '" + std::string( str )
                               + "'" );
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
