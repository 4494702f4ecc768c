/* ========================================================================== *
 *
 * @file seedkit/resolver/acquire.hh
 *
 * @brief Look up the snap backing each requirement of a model.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <vector>

#include "seedkit/core/exceptions.hh"
#include "seedkit/resolver/requirements.hh"
#include "seedkit/snap.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit::resolver {

/* -------------------------------------------------------------------------- */

/**
 * @class seedkit::resolver::ObtainSnapInfoException
 * @brief An exception thrown when looking up an essential snap fails.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( ObtainSnapInfoException,
                          EC_OBTAIN_SNAP_INFO,
                          "cannot obtain snap information" )
/** @} */


/**
 * @class seedkit::resolver::ObtainNonEssentialSnapInfoException
 * @brief An exception thrown when looking up a non-essential snap fails.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( ObtainNonEssentialSnapInfoException,
                          EC_OBTAIN_NON_ESSENTIAL_SNAP_INFO,
                          "cannot obtain non-essential snap information" )
/** @} */


/**
 * @class seedkit::resolver::EssentialSnapNotPresentException
 * @brief An exception thrown when an essential snap is not available.
 *
 * Callers are expected to have made every snap of the model available, so
 * this is reported as an internal error.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( EssentialSnapNotPresentException,
                          EC_ESSENTIAL_SNAP_NOT_PRESENT,
                          "internal error" )
/** @} */


/**
 * @class seedkit::resolver::RequiredSnapNotPresentException
 * @brief An exception thrown when a required, non-essential snap is not
 *        available.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( RequiredSnapNotPresentException,
                          EC_REQUIRED_SNAP_NOT_PRESENT,
                          "internal error" )
/** @} */


/* -------------------------------------------------------------------------- */

/** @brief A requirement and the snap which satisfies it. */
struct Candidate
{
  Requirement requirement;
  SnapInfo    info;
}; /* End struct `Candidate' */


/**
 * @brief Call @a getInfo once for each of @a requirements, in order.
 *
 * Optional snaps which are not available are dropped. Anything else which
 * is not available, or any error thrown by @a getInfo, stops the lookup.
 * Nothing is written.
 */
[[nodiscard]] std::vector<Candidate>
acquireSnaps( const InfoGetter &               getInfo,
              const std::vector<Requirement> & requirements );


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::resolver


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
