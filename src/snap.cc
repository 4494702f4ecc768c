/* ========================================================================== *
 *
 * @file snap.cc
 *
 * @brief Snap revisions.
 *
 *
 * -------------------------------------------------------------------------- */

#include <charconv>
#include <ostream>
#include <string>
#include <string_view>

#include "seedkit/core/exceptions.hh"
#include "seedkit/snap.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

Revision
Revision::parse( std::string_view str )
{
  std::string_view digits = str;
  bool local = ( ! digits.empty() ) && ( digits.front() == 'x' );
  if ( local ) { digits.remove_prefix( 1 ); }

  int        value = 0;
  const auto end   = digits.data() + digits.size();
  auto       rsl   = std::from_chars( digits.data(), end, value );
  if ( ( rsl.ec != std::errc() ) || ( rsl.ptr != end ) || ( value <= 0 ) )
    {
      throw SeedkitException( "invalid snap revision '" + std::string( str )
                              + "'" );
    }
  return Revision( local ? -value : value );
}


/* -------------------------------------------------------------------------- */

std::string
Revision::toString() const
{
  if ( this->local() ) { return "x" + std::to_string( -this->n ); }
  return std::to_string( this->n );
}


std::ostream &
operator<<( std::ostream & oss, const Revision & revision )
{
  return oss << revision.toString();
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
