/* ========================================================================== *
 *
 * @file seedkit/asserts/assertion.hh
 *
 * @brief Decoded assertions: statements establishing trust in a model, a
 *        snap name, or a specific snap revision.
 *
 * Signatures are verified before assertions are decoded into this form, so
 * only the authority and headers are kept.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "seedkit/core/exceptions.hh"
#include "seedkit/core/types.hh"
#include "seedkit/model.hh"
#include "seedkit/snap.hh"


/* -------------------------------------------------------------------------- */

/** @brief Interfaces for assertions and the databases holding them. */
namespace seedkit::asserts {

/* -------------------------------------------------------------------------- */

/**
 * @class seedkit::asserts::InvalidAssertionException
 * @brief An exception thrown when an assertion is malformed.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( InvalidAssertionException,
                          EC_INVALID_ASSERTION,
                          "invalid assertion" )
/** @} */


/* -------------------------------------------------------------------------- */

/** @brief The kinds of assertion a recovery seed carries. */
enum assertion_type {
  AT_MODEL            = 0,
  AT_SNAP_DECLARATION = 1,
  AT_SNAP_REVISION    = 2
};

NLOHMANN_JSON_SERIALIZE_ENUM( assertion_type,
                              { { AT_MODEL, "model" },
                                { AT_SNAP_DECLARATION, "snap-declaration" },
                                { AT_SNAP_REVISION, "snap-revision" } } )

[[nodiscard]] constexpr std::string_view
to_string( assertion_type type )
{
  switch ( type )
    {
      case AT_MODEL: return "model";
      case AT_SNAP_DECLARATION: return "snap-declaration";
      case AT_SNAP_REVISION: return "snap-revision";
      default: return "unknown";
    }
}


/** @brief Identifies an assertion: its type and primary key headers. */
using AssertionRef = std::pair<assertion_type, std::vector<std::string>>;


/* -------------------------------------------------------------------------- */

/** @brief A decoded assertion. */
struct Assertion
{

  assertion_type type = AT_MODEL;
  std::string    authorityId;
  nlohmann::json headers = nlohmann::json::object();


  /** @brief Get a string header, throwing if it is missing. */
  [[nodiscard]] std::string
  header( const std::string & name ) const;

  /**
   * @brief The headers uniquely identifying this assertion.
   *
   * - `model`: `brand-id`, `model`.
   * - `snap-declaration`: `snap-id`.
   * - `snap-revision`: `snap-digest`.
   */
  [[nodiscard]] std::vector<std::string>
  primaryKey() const;

  [[nodiscard]] AssertionRef
  ref() const
  {
    return { this->type, this->primaryKey() };
  }

  /** @brief Assertions which must be known before this one is accepted. */
  [[nodiscard]] std::vector<AssertionRef>
  prerequisites() const;

  [[nodiscard]] bool
  operator==( const Assertion & other ) const
    = default;


}; /* End struct `Assertion' */


/** @brief Convert a JSON object to a @a seedkit::asserts::Assertion. */
void
from_json( const nlohmann::json & jfrom, Assertion & assertion );

/** @brief Convert a @a seedkit::asserts::Assertion to a JSON object. */
void
to_json( nlohmann::json & jto, const Assertion & assertion );

/** @brief Render an @a AssertionRef as `<type>/<key>/...`. */
[[nodiscard]] std::string
refToString( const AssertionRef & ref );


/* -------------------------------------------------------------------------- */

/** @brief Wrap a model as a `model` assertion issued by its brand. */
[[nodiscard]] Assertion
makeModelAssertion( const Model & model );

/** @brief Decode the model carried by a `model` assertion. */
[[nodiscard]] Model
modelFromAssertion( const Assertion & assertion );

/** @brief A `snap-declaration` binding @a snapName to @a snapId. */
[[nodiscard]] Assertion
makeSnapDeclaration( const SnapId &      snapId,
                     const SnapName &    snapName,
                     const std::string & publisherId,
                     const std::string & authorityId );

/**
 * @brief A `snap-revision` binding a content digest to @a snapId and
 *        @a revision.
 */
[[nodiscard]] Assertion
makeSnapRevision( const std::string & digest,
                  const SnapId &      snapId,
                  Revision            revision,
                  uint64_t            size,
                  const std::string & developerId,
                  const std::string & authorityId );


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::asserts


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
