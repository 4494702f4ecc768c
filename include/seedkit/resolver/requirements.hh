/* ========================================================================== *
 *
 * @file seedkit/resolver/requirements.hh
 *
 * @brief Turn a model's `snaps` list into the ordered, classified list of
 *        snaps a recovery system must ( or may ) contain.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <string>
#include <vector>

#include "seedkit/core/exceptions.hh"
#include "seedkit/core/types.hh"
#include "seedkit/model.hh"


/* -------------------------------------------------------------------------- */

/** @brief Interfaces for resolving model requirements. */
namespace seedkit::resolver {

/* -------------------------------------------------------------------------- */

/**
 * @class seedkit::resolver::NotRecoveryCapableException
 * @brief An exception thrown when a model has no grade.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( NotRecoveryCapableException,
                          EC_NOT_RECOVERY_CAPABLE,
                          "not a recovery-capable model" )
/** @} */


/**
 * @class seedkit::resolver::MissingEssentialSnapException
 * @brief An exception thrown when a model does not declare one of the
 *        `snapd`, `kernel`, `base`, or `gadget` snaps.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( MissingEssentialSnapException,
                          EC_MISSING_ESSENTIAL_SNAP,
                          "model does not declare an essential snap" )
/** @} */


/* -------------------------------------------------------------------------- */

/** @brief A snap the recovery system is built from. */
struct Requirement
{

  SnapName      name;
  SnapId        snapId;
  snap_type     type      = ST_APP; /**< Declared type of the snap. */
  presence_type presence  = PR_REQUIRED;
  bool          essential = false;
  Channel       channel;


  [[nodiscard]] bool
  operator==( const Requirement & other ) const
    = default;


}; /* End struct `Requirement' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Throw @a seedkit::resolver::NotRecoveryCapableException unless
 *        @a model declares a grade.
 */
void
checkRecoveryCapable( const Model & model );


/**
 * @brief Find the model entry for the boot base.
 *
 * The `base` header is matched by name against the `snaps` entries. Models
 * which do not list their base get an entry derived from the header, tracking
 * `latest/stable`.
 *
 * Throws @a seedkit::resolver::MissingEssentialSnapException if the model has
 * no `base` header, and @a seedkit::InvalidModelException if the entry named
 * by it is not of type `base`.
 */
[[nodiscard]] ModelSnap
findBaseSnap( const Model & model );


/**
 * @brief Classify and order the snaps of @a model.
 *
 * Essential snaps come first in the order `snapd`, `kernel`, `base`,
 * `gadget`, followed by every other snap in the order declared by the model.
 * No snap is looked up, so nothing here depends on availability.
 */
[[nodiscard]] std::vector<Requirement>
resolveRequirements( const Model & model );


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::resolver


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
