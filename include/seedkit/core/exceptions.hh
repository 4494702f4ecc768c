/* ========================================================================== *
 *
 * @file seedkit/core/exceptions.hh
 *
 * @brief Definitions of various `std::exception` children used for throwing
 *        errors with nice messages and typed discrimination.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

enum error_category {
  /** Indicates success or _not an error_. */
  EC_OKAY = 0,
  /**
   * Returned for any exception that doesn't have `getErrorCode()`, i.e.
   * exceptions we haven't wrapped in a custom exception.
   */
  EC_FAILURE = 1,
  /** Generic exception emitted by `seedkit` routines. */
  EC_SEEDKIT_EXCEPTION = 100,
  /** A model description is malformed. */
  EC_INVALID_MODEL,
  /** The model does not declare a recovery capable grade. */
  EC_NOT_RECOVERY_CAPABLE,
  /** The model does not declare one of the essential snaps. */
  EC_MISSING_ESSENTIAL_SNAP,
  /** The info getter failed for an essential snap. */
  EC_OBTAIN_SNAP_INFO,
  /** The info getter failed for a non-essential snap. */
  EC_OBTAIN_NON_ESSENTIAL_SNAP_INFO,
  /** The info getter reported an essential snap as absent. */
  EC_ESSENTIAL_SNAP_NOT_PRESENT,
  /** The info getter reported a `required` non-essential snap as absent. */
  EC_REQUIRED_SNAP_NOT_PRESENT,
  /** A private seed destination already exists. */
  EC_DESTINATION_EXISTS,
  /** Copying a snap into the seed failed. */
  EC_SNAP_COPY,
  /** An asserted snap could not be matched with its assertions. */
  EC_SNAP_VERIFICATION,
  /** Exception parsing/processing an assertion. */
  EC_INVALID_ASSERTION,
  /** Exceptions thrown by the assertions database. */
  EC_ASSERTS_DB,
  /** Exceptions thrown by SQLite3. */
  EC_SQLITE3,
  /** Exception writing the seed metadata or assertions. */
  EC_SEED_WRITE,
  /** Exception opening or loading an existing seed. */
  EC_SEED_LOAD,
  /** Exception computing or setting the recovery boot environment. */
  EC_BOOT_ENVIRONMENT,
  /** Exception parsing/processing JSON. */
  EC_JSON,
  /** Exception converting YAML to JSON. */
  EC_YAML_TO_JSON,
  /** Exception converting JSON to YAML. */
  EC_JSON_TO_YAML,
}; /* End enum `error_category' */


/* -------------------------------------------------------------------------- */

/** Typed exception wrapper used for misc errors. */
class SeedkitException : public std::exception
{

private:

  /** Additional context added when the error is thrown. */
  std::optional<std::string> contextMsg;

  /**
   * If some other exception was caught before throwing this one, @a caughtMsg
   * contains what() of that exception.
   */
  std::optional<std::string> caughtMsg;

  /** The final what() message. */
  std::string whatMsg;


public:

  /**
   * @brief Create a generic exception with a custom message.
   *
   * This constructor is NOT suitable for use by _child classes_.
   */
  explicit SeedkitException( std::string_view contextMsg )
    : contextMsg( contextMsg )
    , whatMsg( "general error: " + std::string( contextMsg ) )
  {}

  /**
   * @brief Create a generic exception with a custom message and information
   *        from a child error.
   *
   * This constructor is NOT suitable for use by _child classes_.
   */
  explicit SeedkitException( std::string_view contextMsg,
                             std::string_view caughtMsg )
    : contextMsg( contextMsg )
    , caughtMsg( caughtMsg )
    , whatMsg( "general error: " + std::string( contextMsg ) + ": "
               + std::string( caughtMsg ) )
  {}

  /**
   * @brief Directly initialize a SeedkitException with a custom category
   *        message, (optional) _context_, and (optional) information from a
   *        child error.
   *
   * This form is recommended for use by _child classes_ which
   * extend @a seedkit::SeedkitException.
   *
   * @see SEEDKIT_DEFINE_EXCEPTION
   */
  explicit SeedkitException( std::string_view           categoryMsg,
                             std::optional<std::string> contextMsg,
                             std::optional<std::string> caughtMsg )
    : contextMsg( contextMsg ), caughtMsg( caughtMsg ), whatMsg( categoryMsg )
  {
    /* Finish initializing `categoryMsg` if we received `contextMsg` or
     * `caughtMsg` values. */
    if ( contextMsg.has_value() ) { this->whatMsg += ": " + ( *contextMsg ); }
    if ( caughtMsg.has_value() ) { this->whatMsg += ": " + ( *caughtMsg ); }
  }


  [[nodiscard]] virtual error_category
  getErrorCode() const noexcept
  {
    return EC_SEEDKIT_EXCEPTION;
  }

  [[nodiscard]] std::optional<std::string>
  getContextMessage() const noexcept
  {
    return this->contextMsg;
  }

  [[nodiscard]] std::optional<std::string>
  getCaughtMessage() const noexcept
  {
    return this->caughtMsg;
  }

  [[nodiscard]] virtual std::string_view
  getCategoryMessage() const noexcept
  {
    return "general error";
  }

  /** @brief Produces an explanatory string about an exception. */
  [[nodiscard]] const char *
  what() const noexcept override
  {
    return this->whatMsg.c_str();
  }


}; /* End class `SeedkitException' */


/* -------------------------------------------------------------------------- */

/** @brief Convert a @a seedkit::SeedkitException to a JSON object. */
void
to_json( nlohmann::json & jto, const SeedkitException & err );

/**
 * @brief Get the @a seedkit::error_category of any exception.
 *
 * Exceptions which are not @a seedkit::SeedkitException children are
 * reported as `EC_FAILURE`.
 */
[[nodiscard]] error_category
getErrorCode( const std::exception & err ) noexcept;


/* -------------------------------------------------------------------------- */

// NOLINTBEGIN(bugprone-macro-parentheses)
//  Disable macro parentheses lint so we can use `NAME' symbol directly.

/**
 * @brief Generate a class definition with an error code and
 *        _category message_.
 *
 * The resulting class will have `NAME()`, `NAME( contextMsg )`,
 * and `NAME( contextMsg, caughtMsg )` constructors available.
 */
#define SEEDKIT_DEFINE_EXCEPTION( NAME, ERROR_CODE, CATEGORY_MSG )           \
  class NAME : public SeedkitException                                       \
  {                                                                          \
  public:                                                                    \
                                                                             \
    NAME() : SeedkitException( CATEGORY_MSG, std::nullopt, std::nullopt ) {} \
                                                                             \
    explicit NAME( std::string_view contextMsg )                             \
      : SeedkitException( ( CATEGORY_MSG ),                                  \
                          std::string( contextMsg ),                         \
                          std::nullopt )                                     \
    {}                                                                       \
                                                                             \
    explicit NAME( std::string_view contextMsg, std::string_view caughtMsg ) \
      : SeedkitException( ( CATEGORY_MSG ),                                  \
                          std::string( contextMsg ),                         \
                          std::string( caughtMsg ) )                         \
    {}                                                                       \
                                                                             \
    [[nodiscard]] error_category                                             \
    getErrorCode() const noexcept override                                   \
    {                                                                        \
      return ( ERROR_CODE );                                                 \
    }                                                                        \
                                                                             \
    [[nodiscard]] std::string_view                                           \
    getCategoryMessage() const noexcept override                             \
    {                                                                        \
      return ( CATEGORY_MSG );                                               \
    }                                                                        \
  };
// NOLINTEND(bugprone-macro-parentheses)


/* -------------------------------------------------------------------------- */

/**
 * @class seedkit::InvalidModelException
 * @brief An exception thrown when a model description is malformed.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( InvalidModelException,
                          EC_INVALID_MODEL,
                          "invalid model" )
/** @} */


/* -------------------------------------------------------------------------- */

/**
 * @class seedkit::JSONToYAMLException
 * @brief An exception thrown when emitting a JSON value as YAML fails.
 * @{
 */
SEEDKIT_DEFINE_EXCEPTION( JSONToYAMLException,
                          EC_JSON_TO_YAML,
                          "error converting JSON to YAML" )
/** @} */


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
