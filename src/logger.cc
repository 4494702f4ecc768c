/* ========================================================================== *
 *
 * @file logger.cc
 *
 * @brief Custom `nix::Logger` implementation used for seed building messages.
 *
 *
 * -------------------------------------------------------------------------- */

#include <optional>
#include <sstream>
#include <string>
#include <unistd.h>

#include <nix/error.hh>
#include <nix/logging.hh>
#include <nix/util.hh>

#include "seedkit/core/logger.hh"


/* -------------------------------------------------------------------------- */

namespace seedkit {

/* -------------------------------------------------------------------------- */

/**
 * @brief determine if we should use ANSI escape sequences.
 *
 * Like `nix::shouldANSI` but also honoring the `NOCOLOR` environment variable.
 */
static bool
shouldANSI()
{
  return isatty( STDERR_FILENO )
         && ( nix::getEnv( "TERM" ).value_or( "dumb" ) != "dumb" )
         && ( ! ( nix::getEnv( "NO_COLOR" ).has_value()
                  || nix::getEnv( "NOCOLOR" ).has_value() ) );
}


/* -------------------------------------------------------------------------- */

/**
 * @brief Custom `nix::Logger` emitting one line per message on `stderr`.
 *
 * Messages are prefixed with `systemd` log levels when running as a unit,
 * which is how recovery systems are usually created.
 */
class FilteredLogger : public nix::Logger
{

public:

  bool systemd; /**< Whether we should emit `systemd` style logs. */
  bool color;   /**< Whether we should emit colors in logs. */

  FilteredLogger()
    : systemd( nix::getEnv( "IN_SYSTEMD" ) == "1" ), color( shouldANSI() )
  {}


  /** @brief Emit a log message with a colored "warning:" prefix. */
  void
  warn( const std::string & msg ) override
  {
    /* NOTE: The `nix' definitions of `ANSI_WARNING' and `ANSI_NORMAL'
     *       use `\e###` escapes, but `gcc' will gripe at you for not
     *       following ISO standard.
     *       We use equivalent `\033###' sequences instead.' */
    this->log( nix::lvlWarn,
               /* ANSI_WARNING */ "\033[35;1m"
                                  "warning:"
                                  /* ANSI_NORMAL */ "\033[0m"
                                  " "
                 + msg );
  }


  /**
   * @brief Emit a log line depending on verbosity setting.
   * @param lvl Minimum required verbosity level to emit the message.
   * @param str The message to emit.
   */
  void
  log( nix::Verbosity lvl, std::string_view str ) override
  {
    if ( nix::verbosity < lvl ) { return; }

    /* Handle `systemd' style log level prefixes. */
    std::string prefix;
    if ( systemd )
      {
        char levelChar;
        switch ( lvl )
          {
            case nix::lvlError: levelChar = '3'; break;

            case nix::lvlWarn: levelChar = '4'; break;

            case nix::lvlNotice:
            case nix::lvlInfo: levelChar = '5'; break;

            case nix::lvlTalkative:
            case nix::lvlChatty: levelChar = '6'; break;

            case nix::lvlDebug:
            case nix::lvlVomit: levelChar = '7'; break;

            default: levelChar = '7'; break;
          }
        prefix = std::string( "<" ) + levelChar + ">";
      }

    nix::writeToStderr( prefix + nix::filterANSIEscapes( str, ! this->color )
                        + "\n" );
  }


  /** @brief Emit error information. */
  void
  logEI( const nix::ErrorInfo & einfo ) override
  {
    std::stringstream oss;
    /* From `nix/error.hh' */
    showErrorInfo( oss, einfo, nix::loggerSettings.showTrace.get() );

    this->log( einfo.level, oss.str() );
  }


}; /* End class `FilteredLogger' */


/* -------------------------------------------------------------------------- */

nix::Logger *
makeFilteredLogger()
{
  return new FilteredLogger();
}


/* -------------------------------------------------------------------------- */

void
initLogger()
{
  static bool didLoggerInit = false;
  if ( didLoggerInit ) { return; }

  if ( nix::getEnv( "SEEDKIT_DEBUG" ).has_value() )
    {
      nix::verbosity = nix::lvlDebug;
    }

  delete nix::logger;
  nix::logger = makeFilteredLogger();

  didLoggerInit = true;
}


/* -------------------------------------------------------------------------- */

}  // namespace seedkit


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
