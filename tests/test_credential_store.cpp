#include "credential_store.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace hostlogin;
using hostlogin::test::read_text;
using hostlogin::test::TempDir;
using hostlogin::test::write_text;

namespace fs = std::filesystem;

namespace {

Credential credential_for(const std::string &host, const std::string &token) {
  Credential c;
  c.token = token;
  c.host = normalize_hostname(host);
  return c;
}

ErrorKind kind_of(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const LoginError &e) {
    return e.kind();
  }
  FAIL("expected a LoginError");
  return ErrorKind::PersistFailed;
}

bool has_temp_files(const fs::path &dir) {
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (entry.path().filename().string().find(".tmp.") != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

TEST_CASE("credential store round trip", "[store]") {
  TempDir dir;
  CredentialStore store(dir.file("credentials.tfrc"));

  CHECK(store.load().empty());
  store.update([](CredentialDocument &doc) {
    doc.set("tfe.example.com", credential_for("tfe.example.com", "tok-1"));
  });

  std::string text = read_text(store.path());
  CHECK(text == "credentials \"tfe.example.com\" {\n"
                "  token = \"tok-1\"\n"
                "}\n");
  auto doc = store.load();
  REQUIRE(doc.entries().size() == 1);
  CHECK(CredentialStore::token_for(doc, "tfe.example.com") == "tok-1");
  CHECK_FALSE(CredentialStore::token_for(doc, "other.example.com"));

  auto perms = fs::status(store.path()).permissions();
  CHECK((perms & fs::perms::all) ==
        (fs::perms::owner_read | fs::perms::owner_write));
}

TEST_CASE("credential store creates private directories", "[store]") {
  TempDir dir;
  std::string path = (dir.path() / "a" / "b" / "credentials.tfrc").string();
  CredentialStore store(path);
  store.update([](CredentialDocument &doc) {
    doc.set("x.example", credential_for("x.example", "t"));
  });
  CHECK(fs::exists(path));
  auto perms = fs::status(dir.path() / "a" / "b").permissions();
  CHECK((perms & fs::perms::all) == fs::perms::owner_all);
}

TEST_CASE("credential store upsert is idempotent", "[store]") {
  TempDir dir;
  CredentialStore store(dir.file("credentials.tfrc"));
  auto cred = credential_for("x.example", "same");
  auto first = store.update(
      [&](CredentialDocument &doc) { doc.set("x.example", cred); });
  auto second = store.update(
      [&](CredentialDocument &doc) { doc.set("x.example", cred); });
  CHECK(first == second);
  CHECK(read_text(store.path()) == first.text());
  CHECK(second.entries().size() == 1);
}

TEST_CASE("credential store upserts for distinct hosts commute", "[store]") {
  CredentialDocument base = CredentialDocument::parse(
      "credentials \"keep.example\" {\n  token = \"k\"\n}\n",
      StoreFormat::Hcl);
  auto a = credential_for("a.example", "ta");
  auto b = credential_for("b.example", "tb");

  auto ab = CredentialStore::upsert(
      CredentialStore::upsert(base, "a.example", a), "b.example", b);
  auto ba = CredentialStore::upsert(
      CredentialStore::upsert(base, "b.example", b), "a.example", a);
  for (const auto &doc : {ab, ba}) {
    CHECK(CredentialStore::token_for(doc, "keep.example") == "k");
    CHECK(CredentialStore::token_for(doc, "a.example") == "ta");
    CHECK(CredentialStore::token_for(doc, "b.example") == "tb");
  }
}

TEST_CASE("credential store concurrent updates keep every host", "[store]") {
  TempDir dir;
  const std::string path = dir.file("credentials.tfrc");
  constexpr int kWriters = 16;

  std::atomic<int> failures{0};
  std::vector<std::thread> writers;
  for (int i = 0; i < kWriters; ++i) {
    writers.emplace_back([&path, &failures, i] {
      std::string host = "host" + std::to_string(i) + ".example";
      try {
        CredentialStore store(path);
        store.update([&](CredentialDocument &doc) {
          doc.set(host, credential_for(host, "t" + std::to_string(i)));
        });
      } catch (const std::exception &) {
        ++failures;
      }
    });
  }
  for (auto &writer : writers) {
    writer.join();
  }

  CHECK(failures == 0);
  auto doc = CredentialStore(path).load();
  CHECK(doc.entries().size() == static_cast<std::size_t>(kWriters));
  for (int i = 0; i < kWriters; ++i) {
    CHECK(CredentialStore::token_for(
              doc, "host" + std::to_string(i) + ".example") ==
          "t" + std::to_string(i));
  }
  CHECK_FALSE(has_temp_files(dir.path()));
}

TEST_CASE("credential store keeps other hosts and comments", "[store]") {
  TempDir dir;
  std::string path = dir.file("credentials.tfrc");
  write_text(path, "# managed by hand\n"
                   "credentials \"keep.example\" {\n"
                   "  token = \"keep\" # do not touch\n"
                   "}\n"
                   "\n"
                   "plugin_cache_dir = \"/tmp/cache\"\n");
  CredentialStore store(path);

  store.update([](CredentialDocument &doc) {
    doc.set("new.example", credential_for("new.example", "fresh"));
  });
  std::string text = read_text(path);
  CHECK(text.find("# managed by hand\n") == 0);
  CHECK(text.find("token = \"keep\" # do not touch") != std::string::npos);
  CHECK(text.find("plugin_cache_dir = \"/tmp/cache\"") != std::string::npos);

  auto doc = store.load();
  CHECK(CredentialStore::token_for(doc, "keep.example") == "keep");
  CHECK(CredentialStore::token_for(doc, "new.example") == "fresh");

  store.update([](CredentialDocument &doc) {
    doc.set("new.example", credential_for("new.example", "rotated"));
  });
  doc = store.load();
  CHECK(doc.entries().size() == 2);
  CHECK(CredentialStore::token_for(doc, "keep.example") == "keep");
  CHECK(CredentialStore::token_for(doc, "new.example") == "rotated");
}

TEST_CASE("credential store matches labels by comparison key", "[store]") {
  std::string text = "credentials \"TFE.Example.com:443\" {\n"
                     "  token = \"old\"\n"
                     "}\n"
                     "credentials \"tfe.example.com\" {\n"
                     "  token = \"dup\"\n"
                     "}\n";
  auto doc = CredentialDocument::parse(text, StoreFormat::Hcl);
  CHECK(doc.entries().size() == 2);
  CHECK(doc.find("tfe.example.com")->token == "old");

  doc.set("tfe.example.com", credential_for("tfe.example.com", "new"));
  REQUIRE(doc.entries().size() == 1);
  CHECK(doc.entries()[0].label == "tfe.example.com");
  CHECK(doc.entries()[0].token == "new");
  CHECK(doc.text().find("TFE.Example.com") == std::string::npos);
}

TEST_CASE("credential store skips unusable labels", "[store]") {
  auto doc = CredentialDocument::parse("credentials \"not a host!\" {\n"
                                       "  token = \"x\"\n"
                                       "}\n",
                                       StoreFormat::Hcl);
  REQUIRE(doc.entries().size() == 1);
  CHECK(doc.entries()[0].key.empty());
  CHECK_FALSE(doc.find(""));

  CHECK_THROWS_AS(CredentialDocument::parse("credentials \"a\" \"b\" {\n}\n",
                                            StoreFormat::Hcl),
                  std::runtime_error);
}

TEST_CASE("credential store refresh token", "[store]") {
  CredentialDocument doc(StoreFormat::Hcl);
  auto cred = credential_for("x.example", "access");
  cred.refresh_token = "refresh";
  doc.set("x.example", cred);
  CHECK(doc.text().find("  refresh_token = \"refresh\"\n") !=
        std::string::npos);
  CHECK(doc.find("x.example")->refresh_token == "refresh");
}

TEST_CASE("credential store remove restores text", "[store]") {
  std::string original = "# header\n"
                         "credentials \"keep.example\" {\n"
                         "  token = \"keep\"\n"
                         "}\n";
  auto doc = CredentialDocument::parse(original, StoreFormat::Hcl);
  doc = CredentialStore::upsert(doc, "gone.example",
                                credential_for("gone.example", "t"));
  CHECK(doc.entries().size() == 2);
  doc = CredentialStore::remove(doc, "gone.example");
  CHECK(doc.text() == original);
  CHECK_FALSE(doc.erase("gone.example"));

  CredentialDocument empty(StoreFormat::Hcl);
  empty.set("a.example", credential_for("a.example", "t"));
  CHECK(empty.erase("a.example"));
  CHECK(empty.text().empty());
}

TEST_CASE("credential store reports corrupt files", "[store]") {
  TempDir dir;
  std::string path = dir.file("credentials.tfrc");
  std::string broken = "credentials \"a.example\" {\n  token = \"abc\n";
  write_text(path, broken);
  CredentialStore store(path);

  CHECK(kind_of([&] { (void)store.load(); }) == ErrorKind::CorruptStore);
  CHECK(kind_of([&] {
          store.update([](CredentialDocument &doc) {
            doc.set("a.example", credential_for("a.example", "t"));
          });
        }) == ErrorKind::CorruptStore);
  CHECK(read_text(path) == broken);

  try {
    (void)store.load();
  } catch (const LoginError &e) {
    auto chain = error_chain(e);
    CHECK(chain.size() >= 2);
    CHECK(chain.front().find(path) != std::string::npos);
  }
}

TEST_CASE("credential store save failures leave no temporary files",
          "[store]") {
  TempDir dir;

  SECTION("parent is a regular file") {
    write_text(dir.file("blocker"), "x");
    CredentialStore store((dir.path() / "blocker" / "creds.tfrc").string());
    CHECK(kind_of([&] {
            store.update([](CredentialDocument &doc) {
              doc.set("a.example", credential_for("a.example", "t"));
            });
          }) == ErrorKind::PersistFailed);
    CHECK(read_text(dir.file("blocker")) == "x");
  }

  SECTION("target is a directory") {
    fs::create_directory(dir.path() / "target");
    CredentialStore store(dir.file("target"));
    CHECK(kind_of([&] { (void)store.load(); }) == ErrorKind::CorruptStore);
    CredentialDocument doc(StoreFormat::Hcl);
    doc.set("a.example", credential_for("a.example", "t"));
    CHECK(kind_of([&] { store.save(doc); }) == ErrorKind::PersistFailed);
    CHECK(fs::is_directory(dir.path() / "target"));
  }

  CHECK_FALSE(has_temp_files(dir.path()));
}

TEST_CASE("credential store no-op update does not create the file", "[store]") {
  TempDir dir;
  CredentialStore store(dir.file("credentials.tfrc"));
  auto doc = store.update([](CredentialDocument &doc) {
    CHECK_FALSE(doc.erase("missing.example"));
  });
  CHECK(doc.empty());
  CHECK_FALSE(fs::exists(store.path()));
}

TEST_CASE("credential store json format", "[store]") {
  TempDir dir;
  std::string path = dir.file("credentials.tfrc.json");
  CHECK(format_for_path(path) == StoreFormat::Json);
  CHECK(format_for_path(dir.file("credentials.tfrc")) == StoreFormat::Hcl);

  write_text(path, R"({"other": 1, "credentials": {"x.example": {"token": "a"}}})");
  CredentialStore store(path);
  store.update([](CredentialDocument &doc) {
    doc.set("y.example", credential_for("y.example", "b"));
  });

  auto json = nlohmann::json::parse(read_text(path));
  CHECK(json["other"] == 1);
  CHECK(json["credentials"]["x.example"]["token"] == "a");
  CHECK(json["credentials"]["y.example"]["token"] == "b");

  store.update(
      [](CredentialDocument &doc) { CHECK(doc.erase("y.example")); });
  json = nlohmann::json::parse(read_text(path));
  CHECK_FALSE(json["credentials"].contains("y.example"));
  CHECK(json["credentials"].contains("x.example"));

  CHECK_THROWS_AS(CredentialDocument::parse(R"({"credentials": []})",
                                            StoreFormat::Json),
                  std::runtime_error);
  CHECK(CredentialDocument::parse("  \n", StoreFormat::Json).empty());
}
