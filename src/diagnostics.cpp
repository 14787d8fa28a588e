#include "diagnostics.hpp"

#include <algorithm>
#include <sstream>

namespace hostlogin {

bool Diagnostics::has_errors() const {
  return std::any_of(items_.begin(), items_.end(), [](const Diagnostic &d) {
    return d.severity == Severity::Error;
  });
}

std::optional<ErrorKind> Diagnostics::first_error_kind() const {
  for (const auto &d : items_) {
    if (d.severity == Severity::Error && d.kind) {
      return d.kind;
    }
  }
  return std::nullopt;
}

void print_diagnostics(std::ostream &out, const Diagnostics &diags) {
  for (const auto &d : diags.items()) {
    out << '\n'
        << (d.severity == Severity::Error ? "Error: " : "Warning: ")
        << d.summary << "\n";
    if (d.detail.empty()) {
      continue;
    }
    out << '\n';
    std::istringstream lines(d.detail);
    std::string line;
    while (std::getline(lines, line)) {
      out << "  " << line << '\n';
    }
  }
}

} // namespace hostlogin
