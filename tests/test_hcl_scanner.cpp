#include "hcl_scanner.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace hostlogin;

TEST_CASE("top-level blocks report labels, spans and string attributes",
          "[hcl]") {
  const std::string text = "# leading comment\n"
                           "credentials \"a.example.com\" {\n"
                           "  token = \"abc\\n\\u00e9\"\n"
                           "  refresh_token = \"r1\"\n"
                           "}\n"
                           "\n"
                           "provider_installation {\n"
                           "  direct {\n"
                           "    exclude = [\"x/y\", \"z/*\"]\n"
                           "  }\n"
                           "}\n";
  auto blocks = scan_hcl_blocks(text);
  REQUIRE(blocks.size() == 2);

  const HclBlock &creds = blocks[0];
  CHECK(creds.type == "credentials");
  REQUIRE(creds.labels.size() == 1);
  CHECK(creds.labels[0] == "a.example.com");
  CHECK(text.substr(creds.begin, 11) == "credentials");
  CHECK(text[creds.end - 1] == '}');
  CHECK(creds.string_attribute("token") == std::string("abc\n\xC3\xA9"));
  CHECK(creds.string_attribute("refresh_token") == std::string("r1"));
  CHECK_FALSE(creds.string_attribute("missing"));

  CHECK(blocks[1].type == "provider_installation");
  CHECK(blocks[1].labels.empty());
}

TEST_CASE("expressions are validated but not evaluated", "[hcl]") {
  const std::string text =
      "settings {\n"
      "  count   = 3 + var.base * 2\n"
      "  enabled = length(local.items) > 0 ? true : false\n"
      "  map     = {\n"
      "    a = 1\n"
      "    \"b\" : [1, 2, 3,]\n"
      "  }\n"
      "  text    = <<-EOT\n"
      "    hello\n"
      "    EOT\n"
      "  tmpl    = \"prefix-${var.name}\"\n"
      "  escaped = \"$${not_a_template}\"\n"
      "  /* inline */ other = \"x\" // trailing\n"
      "}\n";
  auto blocks = scan_hcl_blocks(text);
  REQUIRE(blocks.size() == 1);
  const HclBlock &b = blocks[0];
  CHECK(b.attributes.size() == 7);
  CHECK_FALSE(b.string_attribute("count"));
  CHECK(b.string_attribute("escaped") == std::string("${not_a_template}"));
  CHECK(b.string_attribute("other") == std::string("x"));
}

TEST_CASE("top-level attributes are accepted but not reported as blocks",
          "[hcl]") {
  auto blocks = scan_hcl_blocks("plugin_cache_dir = \"/tmp\"\n"
                                "disable_checkpoint = true\n");
  CHECK(blocks.empty());
  CHECK(scan_hcl_blocks("").empty());
  CHECK(scan_hcl_blocks("\n\n# only comments\n").empty());
}

TEST_CASE("syntax errors carry a position", "[hcl]") {
  try {
    scan_hcl_blocks("credentials \"a\" {\n  token = \"abc\n}\n");
    FAIL("expected a syntax error");
  } catch (const HclSyntaxError &e) {
    CHECK(e.line() == 2);
    CHECK(std::string(e.what()).find("unterminated string") !=
          std::string::npos);
  }
  CHECK_THROWS_AS(scan_hcl_blocks("credentials \"a\" {\n"), HclSyntaxError);
  CHECK_THROWS_AS(scan_hcl_blocks("token = \n"), HclSyntaxError);
  CHECK_THROWS_AS(scan_hcl_blocks("a = 1 b = 2\n"), HclSyntaxError);
  CHECK_THROWS_AS(scan_hcl_blocks("/* open\n"), HclSyntaxError);
  CHECK_THROWS_AS(scan_hcl_blocks("a = \"\\q\"\n"), HclSyntaxError);
  CHECK_THROWS_AS(scan_hcl_blocks("a = @\n"), HclSyntaxError);
}

TEST_CASE("hcl_quote escapes specials and template introducers", "[hcl]") {
  CHECK(hcl_quote("plain") == "\"plain\"");
  CHECK(hcl_quote("a\"b\\c") == "\"a\\\"b\\\\c\"");
  CHECK(hcl_quote("line\nbreak\t") == "\"line\\nbreak\\t\"");
  CHECK(hcl_quote("${x}%{y}") == "\"$${x}%%{y}\"");

  const std::string doc = "t = " + hcl_quote("we\"ird ${v}\n") + "\n";
  auto blocks = scan_hcl_blocks("b {\n  " + doc + "}\n");
  REQUIRE(blocks.size() == 1);
  CHECK(blocks[0].string_attribute("t") == std::string("we\"ird ${v}\n"));
}
