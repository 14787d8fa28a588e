/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for hostlogin.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef HOSTLOGIN_CLI_HPP
#define HOSTLOGIN_CLI_HPP

#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

namespace hostlogin {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Numeric process exit code.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// Subcommand selected on the command line.
enum class Command { Login, Logout };

/**
 * Parsed command line options supplied via the CLI.
 *
 * Optional members are unset when the flag was not given so configuration
 * values can fill them in.
 */
struct CliOptions {
  Command command{Command::Login};
  bool verbose = false;                 ///< Enables debug output
  std::string config_file;              ///< Optional path to configuration file
  std::optional<std::string> log_level; ///< Logging verbosity level
  std::string log_file;                 ///< Optional path to rotating log file
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI
  std::string hostname;         ///< Positional host; empty selects default
  std::string credentials_file; ///< --into-file / --from-file
  std::optional<std::string> timeout; ///< Authorization timeout duration
  bool no_browser = false;            ///< Print the URL instead of opening it
};

/**
 * Parse command line arguments and return the options structure.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Array of raw CLI argument strings.
 * @return Populated options structure describing the requested behaviour.
 * @throws CliParseExit On `--help`, `--version` and parse errors; the exit
 *         code is CLI11's.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace hostlogin

#endif // HOSTLOGIN_CLI_HPP
