/* ========================================================================== *
 *
 * @file test.hh
 *
 * @brief Minimal test harness shared by every test executable.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>


/* -------------------------------------------------------------------------- */

/* This shouldn't happen, but it's a sane fallback for running from the
 * project root. */
#ifndef TEST_DATA_DIR
#  define TEST_DATA_DIR "./tests/data"
#endif /* End `ifndef TEST_DATA_DIR' */


/* -------------------------------------------------------------------------- */

/** @brief Wrap a test function pretty printing its name on failure. */
template<typename F, typename... Args>
static int
runTest( std::string_view name, F f, Args &&... args )
{
  try
    {
      if ( ! f( std::forward<Args>( args )... ) )
        {
          std::cerr << "  fail: " << name << std::endl;
          return EXIT_FAILURE;
        }
    }
  catch ( const std::exception & e )
    {
      std::cerr << "  ERROR: " << name << ": " << e.what() << std::endl;
      return EXIT_FAILURE;
    }
  return EXIT_SUCCESS;
}


/* -------------------------------------------------------------------------- */

/**
 * @brief Wrap a test routine which returns an exit code, and set a provided
 *        variable to the resulting code on failure.
 *
 * This pattern allows early tests to still run later ones, while preserving
 * a "global" exit status.
 */
#define _RUN_TEST( _EXIT_CODE, _NAME, ... )                               \
  {                                                                       \
    int _exitCode                                                         \
      = runTest( ( #_NAME ), (test_##_NAME) __VA_OPT__(, ) __VA_ARGS__ ); \
    if ( _exitCode != EXIT_SUCCESS ) { _EXIT_CODE = _exitCode; }          \
  }


/* -------------------------------------------------------------------------- */

/**
 * @brief For use inside of a function which returns a boolean.
 *
 * Report a failure with a message and return `false'.
 */
#define EXPECT_FAIL( MSG )               \
  {                                      \
    std::cerr << "Expectation failed: "; \
    std::cerr << ( MSG );                \
    std::cerr << std::endl;              \
    return false;                        \
  }


/* -------------------------------------------------------------------------- */

/**
 * @brief For use inside of a function which returns a boolean.
 *
 * Assert that and expression is `true', otherwise print it and return `false'.
 */
#define EXPECT( EXPR ) \
  if ( ! ( EXPR ) ) { EXPECT_FAIL( #EXPR ) }


/**
 * @brief For use inside of a function which returns a boolean.
 *
 * Assert that two expressions produce equal results, otherwise print them and
 * return `false'.
 */
#define EXPECT_EQ( EXPR_A, EXPR_B )                                 \
  {                                                                 \
    auto valA = ( EXPR_A );                                         \
    auto valB = ( EXPR_B );                                         \
    if ( valA != valB )                                             \
      {                                                             \
        std::cerr << "Expectation failed: ( ";                      \
        std::cerr << ( #EXPR_A );                                   \
        std::cerr << " ) == ( ";                                    \
        std::cerr << ( #EXPR_B );                                   \
        std::cerr << " ). Got '" << valA << "' != '" << valB << "'" \
                  << std::endl;                                     \
        return false;                                               \
      }                                                             \
  }


/**
 * @brief For use inside of a function which returns a boolean.
 *
 * Assert that @a EXPR throws @a EXCEPTION, and that its `what()` is exactly
 * @a MSG.
 */
#define EXPECT_THROW_MSG( EXPR, EXCEPTION, MSG )                         \
  {                                                                      \
    bool _caught = false;                                                \
    try                                                                  \
      {                                                                  \
        (void) ( EXPR );                                                 \
      }                                                                  \
    catch ( const EXCEPTION & _err )                                     \
      {                                                                  \
        _caught = true;                                                  \
        EXPECT_EQ( std::string( _err.what() ), std::string( MSG ) );     \
      }                                                                  \
    if ( ! _caught ) { EXPECT_FAIL( #EXPR " did not throw " #EXCEPTION ) } \
  }


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
