#include "config_manager.hpp"
#include "test_support.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace hostlogin;
using hostlogin::test::ScopedEnv;
using hostlogin::test::TempDir;
using hostlogin::test::write_text;

TEST_CASE("test config manager", "[config]") {
  TempDir dir;
  ConfigManager mgr;

  write_text(dir.file("cfg.yaml"), "login:\n"
                                   "  default_hostname: tfe.example.com\n"
                                   "  authorization_timeout: 90s\n"
                                   "  open_browser: false\n"
                                   "network:\n"
                                   "  http_timeout: 12\n"
                                   "  https_proxy: http://proxy:3128\n"
                                   "logging:\n"
                                   "  log_level: debug\n"
                                   "  log_categories:\n"
                                   "    store: trace\n");
  Config yaml_cfg = mgr.load(dir.file("cfg.yaml"));
  CHECK(yaml_cfg.default_hostname() == "tfe.example.com");
  CHECK(yaml_cfg.authorization_timeout() == std::chrono::seconds(90));
  CHECK_FALSE(yaml_cfg.open_browser());
  CHECK(yaml_cfg.http_timeout() == 12);
  CHECK(yaml_cfg.https_proxy() == "http://proxy:3128");
  CHECK(yaml_cfg.log_level() == "debug");
  CHECK(yaml_cfg.log_categories().at("store") == "trace");

  {
    nlohmann::json doc;
    doc["login"] = {{"credentials_file", "/tmp/creds.json"},
                    {"authorization_timeout", 120}};
    doc["logging"] = {{"log_level", "error"}, {"log_rotate", 5}};
    std::ofstream f(dir.file("cfg.json"));
    f << doc.dump();
  }
  Config json_cfg = mgr.load(dir.file("cfg.json"));
  CHECK(json_cfg.credentials_file() == "/tmp/creds.json");
  CHECK(json_cfg.authorization_timeout() == std::chrono::seconds(120));
  CHECK(json_cfg.log_level() == "error");
  CHECK(json_cfg.log_rotate() == 5);

  write_text(dir.file("cfg.toml"),
             "[network]\n"
             "http_proxy = \"http://proxy:8080\"\n"
             "\n"
             "[hosts.\"tfe.example.com\".services]\n"
             "\"login.v1\" = { client = \"cli\", grant_types = "
             "[\"device_code\"] }\n");
  Config toml_cfg = mgr.load(dir.file("cfg.toml"));
  CHECK(toml_cfg.http_proxy() == "http://proxy:8080");
  REQUIRE(toml_cfg.host_services().count("tfe.example.com") == 1);
  const auto &services = toml_cfg.host_services().at("tfe.example.com");
  CHECK(services["login.v1"]["client"] == "cli");
  CHECK(services["login.v1"]["grant_types"][0] == "device_code");
}

TEST_CASE("unsupported or broken config files are rejected", "[config]") {
  TempDir dir;
  ConfigManager mgr;
  write_text(dir.file("cfg.ini"), "x=1\n");
  CHECK_THROWS_AS(mgr.load(dir.file("cfg.ini")), std::runtime_error);
  CHECK_THROWS(mgr.load(dir.file("missing.json")));
  write_text(dir.file("bad.yaml"), "login:\n  authorization_timeout: soon\n");
  CHECK_THROWS_AS(mgr.load(dir.file("bad.yaml")), std::invalid_argument);
}

TEST_CASE("default config is read from the config directory", "[config]") {
  TempDir dir;
  ScopedEnv env("HOSTLOGIN_CONFIG_DIR", dir.path().string());
  ConfigManager mgr;
  CHECK(mgr.load_default().default_hostname() == "app.terraform.io");

  write_text(dir.file("config.yaml"), "default_hostname: other.example\n");
  CHECK(mgr.load_default().default_hostname() == "other.example");
}
