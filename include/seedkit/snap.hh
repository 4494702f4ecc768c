/* ========================================================================== *
 *
 * @file seedkit/snap.hh
 *
 * @brief Snap revisions and the package metadata returned by an
 *        @a seedkit::InfoGetter.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include "seedkit/core/types.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

/**
 * @brief A snap revision.
 *
 * Positive values are revisions issued by the store, negative values are
 * local revisions of unasserted snaps ( rendered `x<N>` ), and zero is unset.
 */
struct Revision
{

  int n = 0;

  constexpr Revision() = default;

  constexpr explicit Revision( int n ) : n( n ) {}

  /** @brief Parse `x<N>` local revisions and plain store revisions. */
  [[nodiscard]] static Revision
  parse( std::string_view str );

  /** @brief Whether this revision was issued by the store. */
  [[nodiscard]] constexpr bool
  store() const
  {
    return 0 < this->n;
  }

  /** @brief Whether this is a local revision of an unasserted snap. */
  [[nodiscard]] constexpr bool
  local() const
  {
    return this->n < 0;
  }

  [[nodiscard]] constexpr bool
  unset() const
  {
    return this->n == 0;
  }

  [[nodiscard]] std::string
  toString() const;

  [[nodiscard]] constexpr bool
  operator==( const Revision & other ) const
    = default;


}; /* End struct `Revision' */

std::ostream &
operator<<( std::ostream & oss, const Revision & revision );


/* -------------------------------------------------------------------------- */

/**
 * @brief Kernel command line fragments shipped by a gadget in its
 *        `cmdline.extra` or `cmdline.full` files.
 */
struct GadgetCmdline
{
  /** Appended to the bootloader's static command line. */
  std::optional<std::string> extra;
  /** Replaces the bootloader's static command line. */
  std::optional<std::string> full;
}; /* End struct `GadgetCmdline' */


/* -------------------------------------------------------------------------- */

/** @brief Metadata about a snap available to be placed in a seed. */
struct SnapInfo
{

  SnapName  name;
  Revision  revision;
  SnapId    snapId; /**< Empty for unasserted snaps. */
  std::string version;
  snap_type type = ST_APP;

  /** Absolute path to the `.snap` file. */
  std::filesystem::path mountFile;

  /** Only meaningful for gadgets. */
  GadgetCmdline cmdline;


  /**
   * @brief Whether this snap must be matched with store assertions.
   *
   * Snaps with a store revision carry a snap id and are asserted.
   */
  [[nodiscard]] bool
  asserted() const
  {
    return this->revision.store();
  }


}; /* End struct `SnapInfo' */


/* -------------------------------------------------------------------------- */

/**
 * @brief Caller supplied lookup of snap metadata by name.
 *
 * Returns @a std::nullopt if the snap is not present, and throws if the lookup
 * itself failed.
 */
using InfoGetter
  = std::function<std::optional<SnapInfo>( const SnapName & name )>;


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
