#include "app.hpp"
#include "credential_store.hpp"
#include "log.hpp"
#include "test_support.hpp"
#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace hostlogin;
using hostlogin::test::read_text;
using hostlogin::test::ScopedEnv;
using hostlogin::test::TempDir;
using hostlogin::test::write_text;

namespace {

struct AppRun {
  int status = -1;
  std::string out;
  std::string err;
};

AppRun run_app(std::vector<std::string> args) {
  args.insert(args.begin(), "hostlogin");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  std::istringstream in;
  std::ostringstream out;
  std::ostringstream err;
  App app(in, out, err);
  AppRun result;
  result.status = app.run(static_cast<int>(args.size()), argv.data());
  result.out = out.str();
  result.err = err.str();
  init_logger(spdlog::level::warn);
  return result;
}

} // namespace

TEST_CASE("app logout removes the stored token", "[app]") {
  TempDir dir;
  ScopedEnv config_dir("HOSTLOGIN_CONFIG_DIR", dir.path().string());
  std::string path = dir.file("creds.tfrc");
  write_text(path, "credentials \"tfe.example.com\" {\n"
                   "  token = \"t\"\n"
                   "}\n");

  auto result = run_app({"logout", "--from-file", path, "TFE.example.com"});
  CHECK(result.status == 0);
  CHECK(result.out.find("Removed the stored token for tfe.example.com") !=
        std::string::npos);
  CHECK(result.err.empty());
  CHECK(CredentialStore(path).load().empty());
}

TEST_CASE("app uses the configured credentials file", "[app]") {
  TempDir dir;
  ScopedEnv config_dir("HOSTLOGIN_CONFIG_DIR", dir.path().string());
  std::string path = dir.file("configured.tfrc");
  write_text(dir.file("config.json"),
             "{\"credentials_file\": \"" + path + "\"}");

  auto result = run_app({"logout", "tfe.example.com"});
  CHECK(result.status == 0);
  CHECK(result.err.find("Warning: No credentials for tfe.example.com") !=
        std::string::npos);
  CHECK(result.err.find(path) != std::string::npos);
}

TEST_CASE("app reports invalid hostnames", "[app]") {
  TempDir dir;
  ScopedEnv config_dir("HOSTLOGIN_CONFIG_DIR", dir.path().string());
  auto result = run_app(
      {"login", "--no-browser", "--into-file", dir.file("c.tfrc"), "bad host!"});
  CHECK(result.status == 1);
  CHECK(result.err.find("Error: Invalid hostname") != std::string::npos);
  CHECK(result.out.find("Success") == std::string::npos);
}

TEST_CASE("app reports invalid configuration", "[app]") {
  TempDir dir;
  ScopedEnv config_dir("HOSTLOGIN_CONFIG_DIR", dir.path().string());
  write_text(dir.file("bad.yaml"), "hosts: [1, 2]\n");
  auto result = run_app({"-C", dir.file("bad.yaml"), "logout", "x.example"});
  CHECK(result.status == 1);
  CHECK(result.err.find("Error: Invalid configuration") != std::string::npos);
}

TEST_CASE("app applies command line overrides", "[app]") {
  TempDir dir;
  ScopedEnv config_dir("HOSTLOGIN_CONFIG_DIR", dir.path().string());
  std::istringstream in;
  std::ostringstream out;
  std::ostringstream err;
  App app(in, out, err);
  std::vector<std::string> args = {"hostlogin", "--log-level", "error",
                                   "--log-category", "store=trace",
                                   "login", "--timeout", "2m",
                                   "--no-browser", "bad host!"};
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  CHECK(app.run(static_cast<int>(args.size()), argv.data()) == 1);
  CHECK(app.config().log_level() == "error");
  CHECK(app.config().log_categories().at("store") == "trace");
  CHECK(app.config().authorization_timeout() == std::chrono::minutes(2));
  CHECK_FALSE(app.config().open_browser());
  init_logger(spdlog::level::warn);
}
