#include "hostname.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string_view>
#include <vector>

#include <idn2.h>

namespace hostlogin {

namespace {

constexpr std::size_t kMaxLabelLength = 63;
constexpr std::size_t kMaxHostLength = 253;
constexpr int kLookupFlags =
    IDN2_NFC_INPUT | IDN2_NONTRANSITIONAL | IDN2_USE_STD3_ASCII_RULES;

struct IdnFree {
  void operator()(char *p) const { idn2_free(p); }
};
using IdnString = std::unique_ptr<char, IdnFree>;

[[noreturn]] void fail(const std::string &raw, const std::string &reason) {
  throw LoginError(ErrorKind::InvalidHostname,
                   "The given hostname \"" + raw + "\" is not valid: " +
                       reason);
}

std::string trim(const std::string &value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

std::vector<std::string_view> split_labels(std::string_view host) {
  std::vector<std::string_view> labels;
  std::size_t start = 0;
  while (true) {
    auto dot = host.find('.', start);
    if (dot == std::string_view::npos) {
      labels.push_back(host.substr(start));
      break;
    }
    labels.push_back(host.substr(start, dot - start));
    start = dot + 1;
  }
  return labels;
}

bool is_ascii_host_char(unsigned char c) {
  return std::isalnum(c) || c == '-';
}

/// Syntactic checks that libidn2 would report less clearly.
void check_labels(const std::string &raw, std::string_view host) {
  for (auto label : split_labels(host)) {
    if (label.empty()) {
      fail(raw, "hostname contains an empty label");
    }
    for (unsigned char c : label) {
      if (c < 0x80 && !is_ascii_host_char(c)) {
        std::string shown(1, static_cast<char>(c));
        if (c == ' ') {
          shown = "space";
        }
        fail(raw, "hostname contains invalid character '" + shown + "'");
      }
    }
    bool ascii = std::all_of(label.begin(), label.end(),
                             [](unsigned char c) { return c < 0x80; });
    if (ascii && label.size() > kMaxLabelLength) {
      fail(raw, "label \"" + std::string(label.substr(0, 16)) +
                    "...\" is longer than 63 characters");
    }
    if (label.front() == '-' || label.back() == '-') {
      fail(raw, "label \"" + std::string(label) +
                    "\" must not start or end with a hyphen");
    }
  }
}

std::string to_unicode(const std::string &raw, const std::string &ascii) {
  char *out = nullptr;
  int rc = idn2_to_unicode_8z8z(ascii.c_str(), &out, 0);
  IdnString holder(out);
  if (rc != IDN2_OK || !out) {
    fail(raw, std::string("malformed internationalized label (") +
                  idn2_strerror(rc) + ")");
  }
  return std::string(out);
}

/// Punycode labels in the input must decode and re-encode to themselves.
void check_punycode(const std::string &raw, const std::string &ascii) {
  for (auto label : split_labels(ascii)) {
    if (label.size() < 4 || label.substr(0, 4) != "xn--") {
      continue;
    }
    std::string encoded(label);
    std::string decoded = to_unicode(raw, encoded);
    uint8_t *again = nullptr;
    int rc = idn2_lookup_u8(reinterpret_cast<const uint8_t *>(decoded.c_str()),
                            &again, kLookupFlags);
    IdnString holder(reinterpret_cast<char *>(again));
    if (rc != IDN2_OK || !again ||
        encoded != reinterpret_cast<const char *>(again)) {
      fail(raw, "label \"" + encoded + "\" is not valid punycode");
    }
  }
}

} // namespace

std::string Hostname::host() const {
  if (!port) {
    return comparison_key;
  }
  auto colon = comparison_key.rfind(':');
  return comparison_key.substr(0, colon);
}

Hostname normalize_hostname(const std::string &raw,
                            const std::string &default_host) {
  std::string given = trim(raw);
  if (given.empty()) {
    given = trim(default_host);
    if (given.empty()) {
      fail(raw, "no hostname given and no default is configured");
    }
  }
  if (given.find("://") != std::string::npos) {
    fail(given, "a hostname must not include a URL scheme");
  }
  if (given.find_first_of("/?#@[]") != std::string::npos) {
    fail(given, "a hostname must not include a path, user name or brackets");
  }

  std::string host = given;
  std::optional<int> port;
  auto colon = given.find(':');
  if (colon != std::string::npos) {
    if (given.find(':', colon + 1) != std::string::npos) {
      fail(given, "hostname contains more than one port separator");
    }
    host = given.substr(0, colon);
    std::string port_str = given.substr(colon + 1);
    if (port_str.empty() || port_str.size() > 5 ||
        !std::all_of(port_str.begin(), port_str.end(), [](unsigned char c) {
          return std::isdigit(c) != 0;
        })) {
      fail(given, "port \"" + port_str + "\" is not a decimal number");
    }
    int value = std::atoi(port_str.c_str());
    if (value < 1 || value > 65535) {
      fail(given, "port " + port_str + " is out of range");
    }
    if (value != kDefaultHttpsPort) {
      port = value;
    }
  }

  if (!host.empty() && host.back() == '.') {
    host.pop_back();
  }
  if (host.empty()) {
    fail(given, "hostname is empty");
  }
  if (host.size() > kMaxHostLength) {
    fail(given, "hostname is longer than 253 characters");
  }
  check_labels(given, host);

  uint8_t *lookup = nullptr;
  int rc = idn2_lookup_u8(reinterpret_cast<const uint8_t *>(host.c_str()),
                          &lookup, kLookupFlags);
  IdnString holder(reinterpret_cast<char *>(lookup));
  if (rc != IDN2_OK || !lookup) {
    fail(given, idn2_strerror(rc));
  }
  std::string ascii(reinterpret_cast<const char *>(lookup));
  std::transform(ascii.begin(), ascii.end(), ascii.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });

  if (ascii.size() > kMaxHostLength) {
    fail(given, "hostname is longer than 253 characters");
  }
  for (auto label : split_labels(ascii)) {
    if (label.empty()) {
      fail(given, "hostname contains an empty label");
    }
    if (label.size() > kMaxLabelLength) {
      fail(given, "label \"" + std::string(label.substr(0, 16)) +
                      "...\" is longer than 63 characters");
    }
  }
  check_punycode(given, ascii);

  Hostname result;
  result.port = port;
  result.comparison_key = ascii;
  result.display = to_unicode(given, ascii);
  if (port) {
    result.comparison_key += ":" + std::to_string(*port);
    result.display += ":" + std::to_string(*port);
  }
  return result;
}

std::string for_comparison(const std::string &raw) {
  return normalize_hostname(raw).comparison_key;
}

std::string for_display(const std::string &raw) {
  try {
    return normalize_hostname(raw).display;
  } catch (const LoginError &) {
    return trim(raw);
  }
}

} // namespace hostlogin
