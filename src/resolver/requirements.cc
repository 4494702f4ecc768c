/* ========================================================================== *
 *
 * @file resolver/requirements.cc
 *
 * @brief Turn a model's `snaps` list into the ordered, classified list of
 *        snaps a recovery system must ( or may ) contain.
 *
 *
 * -------------------------------------------------------------------------- */

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "seedkit/core/util.hh"
#include "seedkit/resolver/requirements.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::resolver {

/* -------------------------------------------------------------------------- */

void
checkRecoveryCapable( const Model & model )
{
  if ( ! model.isRecoveryCapable() )
    {
      throw NotRecoveryCapableException( "model '" + model.reference()
                                         + "' does not declare a grade" );
    }
}


/* -------------------------------------------------------------------------- */

ModelSnap
findBaseSnap( const Model & model )
{
  if ( model.base.empty() ) { throw MissingEssentialSnapException( "\"base\"" ); }

  if ( const ModelSnap * listed = model.findSnap( model.base ) )
    {
      if ( listed->type != ST_BASE )
        {
          throw InvalidModelException(
            nix::fmt( "model lists its base '%s' as a snap of type '%s'",
                      model.base,
                      std::string( to_string( listed->type ) ) ) );
        }
      return *listed;
    }

  debugLog( nix::fmt( "model '%s' does not list its base '%s', using the "
                      "'base' header",
                      model.reference(),
                      model.base ) );
  return ModelSnap { .name           = model.base,
                     .snapId         = "",
                     .type           = ST_BASE,
                     .presence       = PR_REQUIRED,
                     .defaultChannel = std::nullopt };
}


/* -------------------------------------------------------------------------- */

/** @brief Find the single entry of type @a type, excluding the base. */
static std::optional<ModelSnap>
findEssential( const Model & model, snap_type type )
{
  std::optional<ModelSnap> found;
  for ( const auto & snap : model.snaps )
    {
      if ( snap.type != type ) { continue; }
      if ( found.has_value() )
        {
          throw InvalidModelException(
            nix::fmt( "model declares more than one %s snap: '%s' and '%s'",
                      std::string( to_string( type ) ),
                      found->name,
                      snap.name ) );
        }
      found = snap;
    }
  return found;
}


static Requirement
toRequirement( const ModelSnap & snap, bool essential )
{
  return Requirement {
    .name      = snap.name,
    .snapId    = snap.snapId,
    .type      = snap.type,
    /* Essential snaps cannot be optional. */
    .presence  = essential ? PR_REQUIRED : snap.presence,
    .essential = essential,
    .channel   = snap.channel(),
  };
}


/* -------------------------------------------------------------------------- */

std::vector<Requirement>
resolveRequirements( const Model & model )
{
  checkRecoveryCapable( model );

  std::vector<Requirement> requirements;
  requirements.reserve( model.snaps.size() + 1 );

  static const std::array<snap_type, 4> essentialOrder
    = { ST_SNAPD, ST_KERNEL, ST_BASE, ST_GADGET };

  for ( snap_type type : essentialOrder )
    {
      if ( type == ST_BASE )
        {
          requirements.emplace_back( toRequirement( findBaseSnap( model ),
                                                    true ) );
          continue;
        }
      std::optional<ModelSnap> snap = findEssential( model, type );
      if ( ! snap.has_value() )
        {
          throw MissingEssentialSnapException(
            "\"" + std::string( to_string( type ) ) + "\"" );
        }
      requirements.emplace_back( toRequirement( *snap, true ) );
    }

  for ( const auto & snap : model.snaps )
    {
      bool isEssential
        = ( snap.type == ST_SNAPD ) || ( snap.type == ST_KERNEL )
          || ( snap.type == ST_GADGET )
          || ( snap.name == model.base );
      if ( ! isEssential )
        {
          requirements.emplace_back( toRequirement( snap, false ) );
        }
    }

  return requirements;
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::resolver


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
