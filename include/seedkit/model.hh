/* ========================================================================== *
 *
 * @file seedkit/model.hh
 *
 * @brief The device model: the signed description of the snaps, base, and
 *        grade a system is built from.
 *
 * The signature of a model is checked before it reaches `seedkit`; this is
 * only the decoded content.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "seedkit/core/types.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

/** @brief A single entry of the model's `snaps` list. */
struct ModelSnap
{

  SnapName      name;
  SnapId        snapId; /**< Empty for snaps which are not in the store. */
  snap_type     type     = ST_APP;
  presence_type presence = PR_REQUIRED;

  /** Channel the snap is tracked from, `latest/stable` when unset. */
  std::optional<Channel> defaultChannel;


  /** @brief The declared channel, or `latest/stable`. */
  [[nodiscard]] Channel
  channel() const
  {
    return this->defaultChannel.value_or( Channel( DEFAULT_CHANNEL ) );
  }

  [[nodiscard]] bool
  operator==( const ModelSnap & other ) const
    = default;


}; /* End struct `ModelSnap' */


/** @brief Convert a JSON object to a @a seedkit::ModelSnap. */
void
from_json( const nlohmann::json & jfrom, ModelSnap & snap );

/** @brief Convert a @a seedkit::ModelSnap to a JSON object. */
void
to_json( nlohmann::json & jto, const ModelSnap & snap );


/* -------------------------------------------------------------------------- */

/** @brief The decoded content of a model assertion. */
struct Model
{

  std::string brandId;
  std::string model;
  std::string architecture;

  /** Name of the boot base, e.g. `core20`. */
  std::string base;

  model_grade grade = MG_UNSET;

  /* Pre-grade models name their kernel and gadget in headers instead of
   * listing them under `snaps'. */
  std::optional<SnapName> kernel;
  std::optional<SnapName> gadget;

  std::vector<ModelSnap> snaps;


  /**
   * @brief Whether recovery systems can be created for this model.
   *
   * Only models with a grade list their snaps in full.
   */
  [[nodiscard]] bool
  isRecoveryCapable() const
  {
    return this->grade != MG_UNSET;
  }

  /** @brief `<brand-id>/<model>`, for messages and the seed manifest. */
  [[nodiscard]] std::string
  reference() const
  {
    return this->brandId + "/" + this->model;
  }

  /** @brief Find the entry named @a name in `snaps`, or `nullptr`. */
  [[nodiscard]] const ModelSnap *
  findSnap( const SnapName & name ) const;

  /**
   * @brief Check for duplicate names and missing identity headers.
   *
   * Throws @a seedkit::InvalidModelException.
   */
  void
  check() const;

  [[nodiscard]] bool
  operator==( const Model & other ) const
    = default;


}; /* End struct `Model' */


/** @brief Convert a JSON object to a @a seedkit::Model. */
void
from_json( const nlohmann::json & jfrom, Model & model );

/** @brief Convert a @a seedkit::Model to a JSON object. */
void
to_json( nlohmann::json & jto, const Model & model );


/** @brief Read a model from a `.json` or `.yaml` file. */
[[nodiscard]] Model
readModel( const std::filesystem::path & path );


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
