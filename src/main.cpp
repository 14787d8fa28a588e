#include "app.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    hostlogin::ensure_default_logger();
    return hostlogin::category_logger("main");
  }();
  return logger;
}
} // namespace

/**
 * Program entry point.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  hostlogin::App app;
  int status = 1;
  try {
    status = app.run(argc, argv);
  } catch (const std::exception &e) {
    main_log()->critical("Unexpected error: {}",
                         hostlogin::describe_error(e));
    std::cerr << "\nError: " << hostlogin::describe_error(e) << "\n";
  }
  spdlog::shutdown();
  return status;
}
