/**
 * @file app.hpp
 * @brief Main application entry point for hostlogin.
 *
 * Declares the App class, which merges command line options with the
 * configuration file, sets up logging and runs the selected subcommand.
 */
#ifndef HOSTLOGIN_APP_HPP
#define HOSTLOGIN_APP_HPP

#include "cli.hpp"
#include "config.hpp"

#include <iostream>

namespace hostlogin {

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * @param in Stream used for interactive prompts.
   * @param out Stream receiving progress and result messages.
   * @param err Stream receiving diagnostics.
   */
  App(std::istream &in = std::cin, std::ostream &out = std::cout,
      std::ostream &err = std::cerr);

  /**
   * Run the application with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Array containing the raw CLI arguments.
   * @return Zero on success, 1 when an error diagnostic was reported, or
   *         CLI11's exit code for parse errors.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Loaded configuration with command line overrides applied.
  const Config &config() const { return config_; }

private:
  int configure(int argc, char **argv);
  void setup_logging();
  int run_login();
  int run_logout();
  std::string credentials_file() const;

  std::istream &in_;
  std::ostream &out_;
  std::ostream &err_;
  CliOptions options_;
  Config config_;
};

} // namespace hostlogin

#endif // HOSTLOGIN_APP_HPP
