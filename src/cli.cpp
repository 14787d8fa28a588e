#include "cli.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#ifndef HOSTLOGIN_VERSION
#define HOSTLOGIN_VERSION "0.0.0"
#endif

namespace hostlogin {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 9> categories = {
      "app",   "auth", "cli",  "config", "discovery",
      "http",  "login", "main", "store"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "discovery=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

std::string validate_timeout(std::string &value) {
  try {
    if (parse_duration(value).count() <= 0) {
      return "Duration must be positive: " + value;
    }
  } catch (const std::invalid_argument &e) {
    return e.what();
  }
  return {};
}
} // namespace

/**
 * Parse command line arguments with CLI11.
 *
 * Global logging options may appear before the subcommand. Each subcommand
 * accepts at most one positional hostname.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Fully populated CLI options.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"Obtain and store API credentials for a service host"};
  app.name("hostlogin");
  app.footer(log_category_help_text());
  app.require_subcommand(1);
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable debug output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "hostlogin " << HOSTLOGIN_VERSION << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_option_function<std::string>(
         "--log-level",
         [&options](const std::string &value) { options.log_level = value; },
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->check(CLI::IsMember(
          {"trace", "debug", "info", "warn", "error", "critical", "off"},
          CLI::ignore_case))
      ->group("Logging");
  app.add_option("--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<std::vector<std::string>>(
         "--log-category",
         [&options](const std::vector<std::string> &values) {
           for (const auto &value : values) {
             auto pos = value.find('=');
             std::string name =
                 pos == std::string::npos ? value : value.substr(0, pos);
             std::string level = pos == std::string::npos
                                     ? std::string{"debug"}
                                     : value.substr(pos + 1);
             if (name.empty()) {
               throw CLI::ValidationError("--log-category",
                                          "category name must not be empty");
             }
             if (level.empty()) {
               level = "debug";
             }
             options.log_categories[name] = level;
           }
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->allow_extra_args(false)
      ->group("Logging");

  CLI::App *login = app.add_subcommand(
      "login", "Obtain a token for a host and save it in the credentials file");
  login->add_option("--into-file", options.credentials_file,
                    "Credentials file to update instead of the default")
      ->type_name("FILE");
  login
      ->add_option_function<std::string>(
          "--timeout",
          [&options](const std::string &value) { options.timeout = value; },
          "Time allowed to complete authorization (e.g. 90s, 5m)")
      ->type_name("DURATION")
      ->check(validate_timeout, "DURATION");
  login->add_flag("--no-browser", options.no_browser,
                  "Print the authorization URL instead of opening a browser");
  login->add_option("hostname", options.hostname,
                    "Host to log in to (defaults to the configured host)");
  login->callback([&options] { options.command = Command::Login; });

  CLI::App *logout = app.add_subcommand(
      "logout", "Remove the stored token for a host");
  logout->add_option("--from-file", options.credentials_file,
                     "Credentials file to update instead of the default")
      ->type_name("FILE");
  logout->add_option("hostname", options.hostname,
                     "Host to log out from (defaults to the configured host)");
  logout->callback([&options] { options.command = Command::Logout; });

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  cli_log()->debug("Parsed command '{}' for host '{}'",
                   options.command == Command::Login ? "login" : "logout",
                   options.hostname);
  return options;
}

} // namespace hostlogin
