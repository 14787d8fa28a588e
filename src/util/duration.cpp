#include "util/duration.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace hostlogin {

std::chrono::seconds parse_duration(const std::string &str) {
  std::size_t begin = 0;
  std::size_t end = str.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) {
    ++begin;
  }
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(str[end - 1]))) {
    --end;
  }
  if (begin == end) {
    return std::chrono::seconds{0};
  }

  constexpr long long kMax = std::numeric_limits<long long>::max() / 3600;
  long long total = 0;
  bool has_unit = false;
  std::size_t i = begin;
  while (i < end) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw std::invalid_argument("Invalid duration '" + str + "'");
    }
    long long value = 0;
    while (i < end && std::isdigit(static_cast<unsigned char>(str[i]))) {
      value = value * 10 + (str[i] - '0');
      if (value > kMax) {
        throw std::invalid_argument("Duration '" + str + "' is too large");
      }
      ++i;
    }
    if (i == end) {
      if (has_unit) {
        throw std::invalid_argument("Missing unit in duration '" + str + "'");
      }
      total += value;
      break;
    }
    switch (std::tolower(static_cast<unsigned char>(str[i]))) {
    case 's':
      total += value;
      break;
    case 'm':
      total += value * 60;
      break;
    case 'h':
      total += value * 3600;
      break;
    default:
      throw std::invalid_argument("Invalid duration unit in '" + str + "'");
    }
    if (total > kMax) {
      throw std::invalid_argument("Duration '" + str + "' is too large");
    }
    has_unit = true;
    ++i;
  }
  return std::chrono::seconds{total};
}

std::string format_duration(std::chrono::seconds value) {
  long long secs = value.count();
  if (secs <= 0) {
    return "0s";
  }
  std::string out;
  if (secs >= 3600) {
    out += std::to_string(secs / 3600) + "h";
    secs %= 3600;
  }
  if (secs >= 60) {
    out += std::to_string(secs / 60) + "m";
    secs %= 60;
  }
  if (secs > 0) {
    out += std::to_string(secs) + "s";
  }
  return out;
}

} // namespace hostlogin
