/**
 * @file diagnostics.hpp
 * @brief User-facing diagnostic messages collected during a login attempt.
 */
#ifndef HOSTLOGIN_DIAGNOSTICS_HPP
#define HOSTLOGIN_DIAGNOSTICS_HPP

#include "errors.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace hostlogin {

/// Severity of a diagnostic.
enum class Severity { Warning, Error };

/// Single diagnostic with a short summary and a full-sentence detail.
struct Diagnostic {
  Severity severity{Severity::Error};
  std::string summary;
  std::string detail;
  std::optional<ErrorKind> kind; ///< Set for errors raised by a LoginError
};

/** Ordered list of diagnostics. */
class Diagnostics {
public:
  /// Append a diagnostic.
  void append(Diagnostic diag) { items_.push_back(std::move(diag)); }

  /// Append an error diagnostic.
  void error(std::string summary, std::string detail,
             std::optional<ErrorKind> kind = std::nullopt) {
    items_.push_back(
        {Severity::Error, std::move(summary), std::move(detail), kind});
  }

  /// Append a warning diagnostic.
  void warning(std::string summary, std::string detail) {
    items_.push_back(
        {Severity::Warning, std::move(summary), std::move(detail), {}});
  }

  /// Whether any error-level diagnostic was recorded.
  bool has_errors() const;

  /// Kind of the first error carrying one, if any.
  std::optional<ErrorKind> first_error_kind() const;

  bool empty() const { return items_.empty(); }
  std::size_t size() const { return items_.size(); }
  const std::vector<Diagnostic> &items() const { return items_; }

private:
  std::vector<Diagnostic> items_;
};

/**
 * Render diagnostics for a terminal.
 *
 * Each entry is printed as "Error: <summary>" followed by the indented detail.
 *
 * @param out Destination stream.
 * @param diags Diagnostics to print.
 */
void print_diagnostics(std::ostream &out, const Diagnostics &diags);

} // namespace hostlogin

#endif // HOSTLOGIN_DIAGNOSTICS_HPP
