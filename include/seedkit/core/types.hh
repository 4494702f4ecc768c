/* ========================================================================== *
 *
 * @file seedkit/core/types.hh
 *
 * @brief Miscellaneous typedefs, aliases, and small enumerations shared by
 *        the model, the resolver, and the seed writer.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "seedkit/core/exceptions.hh"


/* -------------------------------------------------------------------------- */

/** @brief Interfaces for building recovery system seeds. */
namespace seedkit {

/* -------------------------------------------------------------------------- */

/** @brief A snap's name, e.g. `pc-kernel`. */
using SnapName = std::string;

/** @brief The store issued, 32 character identifier of a snap. */
using SnapId = std::string;

/**
 * @brief A channel such as `20`, `latest/stable`, or `20/edge`.
 *
 * Channels are recorded in the seed but never resolved here.
 */
using Channel = std::string;

/** @brief The channel used when a model entry declares none. */
static constexpr std::string_view DEFAULT_CHANNEL = "latest/stable";


/* -------------------------------------------------------------------------- */

/** @brief The role a snap plays in a system. */
enum snap_type {
  ST_APP    = 0,
  ST_SNAPD  = 1,
  ST_KERNEL = 2,
  ST_BASE   = 3,
  ST_GADGET = 4
};

/**
 * @fn void from_json( const nlohmann::json & j, snap_type & type )
 * @brief Convert a JSON string to a @a seedkit::snap_type.
 *
 * @fn void to_json( nlohmann::json & j, const snap_type & type )
 * @brief Convert a @a seedkit::snap_type to a JSON string.
 */
NLOHMANN_JSON_SERIALIZE_ENUM( snap_type,
                              { { ST_APP, "app" },
                                { ST_SNAPD, "snapd" },
                                { ST_KERNEL, "kernel" },
                                { ST_BASE, "base" },
                                { ST_GADGET, "gadget" } } )

/** @brief Convert a @a seedkit::snap_type to a string. */
[[nodiscard]] constexpr std::string_view
to_string( snap_type type )
{
  switch ( type )
    {
      case ST_SNAPD: return "snapd";
      case ST_KERNEL: return "kernel";
      case ST_BASE: return "base";
      case ST_GADGET: return "gadget";
      default: return "app";
    }
}

/**
 * @brief Parse a string into a @a seedkit::snap_type.
 *
 * Unlike the generated `from_json`, unknown strings are rejected.
 */
[[nodiscard]] snap_type
parseSnapType( std::string_view str );


/* -------------------------------------------------------------------------- */

/** @brief Whether a non-essential snap must be present in a system. */
enum presence_type { PR_REQUIRED = 0, PR_OPTIONAL = 1 };

NLOHMANN_JSON_SERIALIZE_ENUM( presence_type,
                              { { PR_REQUIRED, "required" },
                                { PR_OPTIONAL, "optional" } } )

[[nodiscard]] constexpr std::string_view
to_string( presence_type presence )
{
  return presence == PR_OPTIONAL ? "optional" : "required";
}

/** @brief Parse a string into a @a seedkit::presence_type. */
[[nodiscard]] presence_type
parsePresence( std::string_view str );


/* -------------------------------------------------------------------------- */

/**
 * @brief Model grades.
 *
 * Only models declaring a grade support recovery systems.
 */
enum model_grade {
  MG_UNSET     = 0,
  MG_DANGEROUS = 1,
  MG_SIGNED    = 2,
  MG_SECURED   = 3
};

NLOHMANN_JSON_SERIALIZE_ENUM( model_grade,
                              { { MG_UNSET, nullptr },
                                { MG_DANGEROUS, "dangerous" },
                                { MG_SIGNED, "signed" },
                                { MG_SECURED, "secured" } } )

[[nodiscard]] constexpr std::string_view
to_string( model_grade grade )
{
  switch ( grade )
    {
      case MG_DANGEROUS: return "dangerous";
      case MG_SIGNED: return "signed";
      case MG_SECURED: return "secured";
      default: return "unset";
    }
}

/** @brief Parse a string into a @a seedkit::model_grade. */
[[nodiscard]] model_grade
parseGrade( std::string_view str );


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
