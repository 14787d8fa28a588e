/**
 * @file hcl_scanner.hpp
 * @brief Structural scanner for HCL native syntax documents.
 *
 * The scanner validates a document and reports the byte span of every
 * top-level block together with the string-literal attributes of its body.
 * It does not evaluate expressions; it exists so callers can edit individual
 * blocks while leaving the rest of the file untouched.
 */
#ifndef HOSTLOGIN_HCL_SCANNER_HPP
#define HOSTLOGIN_HCL_SCANNER_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hostlogin {

/// Attribute directly inside a block body.
struct HclAttribute {
  std::string name;
  std::optional<std::string> string_value; ///< Set for plain string literals
};

/// Top-level block and its location in the source text.
struct HclBlock {
  std::string type;
  std::vector<std::string> labels;
  std::size_t begin = 0; ///< Offset of the block type identifier
  std::size_t end = 0;   ///< Offset one past the closing brace
  std::vector<HclAttribute> attributes;

  /// Value of a string attribute, empty when absent or not a literal.
  std::optional<std::string> string_attribute(const std::string &name) const;
};

/// Raised for text that is not valid HCL native syntax.
class HclSyntaxError : public std::runtime_error {
public:
  HclSyntaxError(std::size_t line, std::size_t column,
                 const std::string &message);

  std::size_t line() const noexcept { return line_; }
  std::size_t column() const noexcept { return column_; }

private:
  std::size_t line_;
  std::size_t column_;
};

/**
 * Scan @p text and return its top-level blocks in document order.
 *
 * @throws HclSyntaxError when the text cannot be parsed.
 */
std::vector<HclBlock> scan_hcl_blocks(const std::string &text);

/// Quote @p value as an HCL string literal, escaping template sequences.
std::string hcl_quote(const std::string &value);

} // namespace hostlogin

#endif // HOSTLOGIN_HCL_SCANNER_HPP
