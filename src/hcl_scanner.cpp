#include "hcl_scanner.hpp"

#include <cctype>
#include <cstdint>
#include <utility>

namespace hostlogin {

namespace {

enum class Tok {
  Ident,
  String,
  Number,
  Heredoc,
  LBrace,
  RBrace,
  LBracket,
  RBracket,
  LParen,
  RParen,
  Equals,
  Comma,
  Colon,
  Dot,
  Operator,
  Newline,
  End
};

struct Token {
  Tok kind;
  std::size_t begin;
  std::size_t end;
  std::string value;
};

std::pair<std::size_t, std::size_t> position_of(const std::string &text,
                                                std::size_t offset) {
  std::size_t line = 1;
  std::size_t column = 1;
  for (std::size_t i = 0; i < offset && i < text.size(); ++i) {
    if (text[i] == '\n') {
      ++line;
      column = 1;
    } else {
      ++column;
    }
  }
  return {line, column};
}

[[noreturn]] void syntax_error(const std::string &text, std::size_t offset,
                               const std::string &message) {
  auto [line, column] = position_of(text, offset);
  throw HclSyntaxError(line, column, message);
}

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool is_ident_start(unsigned char c) { return std::isalpha(c) || c == '_'; }

bool is_ident_char(unsigned char c) {
  return std::isalnum(c) || c == '_' || c == '-';
}

/// Splits HCL source into tokens; comments and blanks are dropped.
class Lexer {
public:
  explicit Lexer(const std::string &text) : text_(text) {}

  std::vector<Token> run() {
    std::vector<Token> tokens;
    while (i_ < text_.size()) {
      char c = text_[i_];
      if (c == ' ' || c == '\t' || c == '\r') {
        ++i_;
      } else if (c == '\n') {
        tokens.push_back({Tok::Newline, i_, i_ + 1, {}});
        ++i_;
      } else if (c == '#' || starts_with("//")) {
        skip_line_comment();
      } else if (starts_with("/*")) {
        skip_block_comment();
      } else if (c == '"') {
        tokens.push_back(read_string());
      } else if (starts_with("<<")) {
        tokens.push_back(read_heredoc());
      } else if (std::isdigit(static_cast<unsigned char>(c))) {
        tokens.push_back(read_number());
      } else if (is_ident_start(static_cast<unsigned char>(c))) {
        std::size_t start = i_;
        while (i_ < text_.size() &&
               is_ident_char(static_cast<unsigned char>(text_[i_]))) {
          ++i_;
        }
        tokens.push_back(
            {Tok::Ident, start, i_, text_.substr(start, i_ - start)});
      } else {
        tokens.push_back(read_punctuation());
      }
    }
    tokens.push_back({Tok::End, text_.size(), text_.size(), {}});
    return tokens;
  }

private:
  bool starts_with(const char *prefix) const {
    return text_.compare(i_, std::char_traits<char>::length(prefix), prefix) ==
           0;
  }

  void skip_line_comment() {
    while (i_ < text_.size() && text_[i_] != '\n') {
      ++i_;
    }
  }

  void skip_block_comment() {
    auto close = text_.find("*/", i_ + 2);
    if (close == std::string::npos) {
      syntax_error(text_, i_, "unterminated block comment");
    }
    i_ = close + 2;
  }

  Token read_string() {
    std::size_t start = i_++;
    std::string value;
    while (true) {
      if (i_ >= text_.size() || text_[i_] == '\n') {
        syntax_error(text_, start, "unterminated string");
      }
      char c = text_[i_];
      if (c == '"') {
        ++i_;
        break;
      }
      if (c == '\\') {
        value += read_escape();
        continue;
      }
      if ((c == '$' || c == '%') && i_ + 2 < text_.size() &&
          text_[i_ + 1] == c && text_[i_ + 2] == '{') {
        // "$${" and "%%{" are escaped template introducers.
        value.push_back(c);
        value.push_back('{');
        i_ += 3;
        continue;
      }
      if ((c == '$' || c == '%') && i_ + 1 < text_.size() &&
          text_[i_ + 1] == '{') {
        value += read_template(start);
        continue;
      }
      value.push_back(c);
      ++i_;
    }
    return {Tok::String, start, i_, value};
  }

  std::string read_escape() {
    std::size_t at = i_;
    if (i_ + 1 >= text_.size()) {
      syntax_error(text_, at, "unterminated escape sequence");
    }
    char e = text_[i_ + 1];
    i_ += 2;
    switch (e) {
    case 'n':
      return "\n";
    case 'r':
      return "\r";
    case 't':
      return "\t";
    case '"':
      return "\"";
    case '\\':
      return "\\";
    case 'u':
    case 'U': {
      std::size_t digits = e == 'u' ? 4 : 8;
      if (i_ + digits > text_.size()) {
        syntax_error(text_, at, "truncated unicode escape");
      }
      std::uint32_t cp = 0;
      for (std::size_t k = 0; k < digits; ++k) {
        char h = text_[i_ + k];
        if (!std::isxdigit(static_cast<unsigned char>(h))) {
          syntax_error(text_, at, "invalid unicode escape");
        }
        cp = cp * 16 +
             static_cast<std::uint32_t>(
                 std::isdigit(static_cast<unsigned char>(h))
                     ? h - '0'
                     : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
      }
      if (cp > 0x10FFFF) {
        syntax_error(text_, at, "unicode escape out of range");
      }
      i_ += digits;
      std::string out;
      append_utf8(out, cp);
      return out;
    }
    default:
      syntax_error(text_, at,
                   std::string("invalid escape sequence \\") + e);
    }
  }

  /// Copies an interpolation or directive sequence verbatim.
  std::string read_template(std::size_t string_start) {
    std::size_t start = i_;
    i_ += 2;
    int depth = 1;
    while (depth > 0) {
      if (i_ >= text_.size()) {
        syntax_error(text_, string_start, "unterminated template sequence");
      }
      char c = text_[i_++];
      if (c == '{') {
        ++depth;
      } else if (c == '}') {
        --depth;
      } else if (c == '"') {
        while (i_ < text_.size() && text_[i_] != '"') {
          if (text_[i_] == '\\') {
            ++i_;
          }
          ++i_;
        }
        ++i_;
      }
    }
    return text_.substr(start, i_ - start);
  }

  Token read_heredoc() {
    std::size_t start = i_;
    i_ += 2;
    bool indented = false;
    if (i_ < text_.size() && text_[i_] == '-') {
      indented = true;
      ++i_;
    }
    std::size_t marker_start = i_;
    while (i_ < text_.size() &&
           is_ident_char(static_cast<unsigned char>(text_[i_]))) {
      ++i_;
    }
    std::string marker = text_.substr(marker_start, i_ - marker_start);
    if (marker.empty()) {
      syntax_error(text_, start, "heredoc requires a delimiter");
    }
    while (i_ < text_.size() && text_[i_] == '\r') {
      ++i_;
    }
    if (i_ >= text_.size() || text_[i_] != '\n') {
      syntax_error(text_, start, "heredoc delimiter must end the line");
    }
    ++i_;
    std::string value;
    while (i_ < text_.size()) {
      auto eol = text_.find('\n', i_);
      std::size_t line_end = eol == std::string::npos ? text_.size() : eol;
      std::string line = text_.substr(i_, line_end - i_);
      std::string trimmed = line;
      while (!trimmed.empty() &&
             (trimmed.back() == '\r' || trimmed.back() == ' ' ||
              trimmed.back() == '\t')) {
        trimmed.pop_back();
      }
      auto first = trimmed.find_first_not_of(" \t");
      std::string bare =
          first == std::string::npos ? std::string() : trimmed.substr(first);
      if (bare == marker && (indented || first == 0)) {
        i_ = line_end;
        return {Tok::Heredoc, start, i_, value};
      }
      value += line;
      value.push_back('\n');
      i_ = eol == std::string::npos ? text_.size() : eol + 1;
    }
    syntax_error(text_, start, "unterminated heredoc \"" + marker + "\"");
  }

  Token read_number() {
    std::size_t start = i_;
    while (i_ < text_.size()) {
      char c = text_[i_];
      if (std::isdigit(static_cast<unsigned char>(c))) {
        ++i_;
      } else if (c == '.' && i_ + 1 < text_.size() &&
                 std::isdigit(static_cast<unsigned char>(text_[i_ + 1]))) {
        ++i_;
      } else if ((c == 'e' || c == 'E') && i_ + 1 < text_.size()) {
        ++i_;
        if (text_[i_] == '+' || text_[i_] == '-') {
          ++i_;
        }
      } else {
        break;
      }
    }
    return {Tok::Number, start, i_, text_.substr(start, i_ - start)};
  }

  Token read_punctuation() {
    std::size_t start = i_;
    static const char *const multi[] = {"...", "==", "!=", "<=", ">=",
                                        "&&",  "||", "=>"};
    for (const char *op : multi) {
      if (starts_with(op)) {
        i_ += std::char_traits<char>::length(op);
        return {Tok::Operator, start, i_, op};
      }
    }
    char c = text_[i_++];
    switch (c) {
    case '{':
      return {Tok::LBrace, start, i_, "{"};
    case '}':
      return {Tok::RBrace, start, i_, "}"};
    case '[':
      return {Tok::LBracket, start, i_, "["};
    case ']':
      return {Tok::RBracket, start, i_, "]"};
    case '(':
      return {Tok::LParen, start, i_, "("};
    case ')':
      return {Tok::RParen, start, i_, ")"};
    case '=':
      return {Tok::Equals, start, i_, "="};
    case ',':
      return {Tok::Comma, start, i_, ","};
    case ':':
      return {Tok::Colon, start, i_, ":"};
    case '.':
      return {Tok::Dot, start, i_, "."};
    case '+':
    case '-':
    case '*':
    case '/':
    case '%':
    case '<':
    case '>':
    case '!':
    case '?':
      return {Tok::Operator, start, i_, std::string(1, c)};
    default:
      syntax_error(text_, start,
                   std::string("unexpected character '") + c + "'");
    }
  }

  const std::string &text_;
  std::size_t i_ = 0;
};

/// Recursive-descent parser over the token stream.
class Parser {
public:
  Parser(const std::string &text, std::vector<Token> tokens)
      : text_(text), tokens_(std::move(tokens)) {}

  std::vector<HclBlock> parse_file() {
    std::vector<HclBlock> blocks;
    while (true) {
      skip_newlines();
      if (peek().kind == Tok::End) {
        break;
      }
      parse_item(nullptr, &blocks);
    }
    return blocks;
  }

private:
  const Token &peek() {
    if (nesting_ > 0) {
      while (tokens_[pos_].kind == Tok::Newline) {
        ++pos_;
      }
    }
    return tokens_[pos_];
  }

  const Token &next() {
    const Token &t = peek();
    if (t.kind != Tok::End) {
      ++pos_;
    }
    return t;
  }

  void skip_newlines() {
    while (tokens_[pos_].kind == Tok::Newline) {
      ++pos_;
    }
  }

  const Token &expect(Tok kind, const char *message) {
    const Token &t = peek();
    if (t.kind != kind) {
      syntax_error(text_, t.begin, message);
    }
    return next();
  }

  void end_of_item() {
    Tok kind = peek().kind;
    if (kind == Tok::Newline) {
      next();
    } else if (kind != Tok::End && kind != Tok::RBrace) {
      syntax_error(text_, peek().begin,
                   "expected a newline after the definition");
    }
  }

  void parse_item(std::vector<HclAttribute> *attributes,
                  std::vector<HclBlock> *blocks) {
    const Token &name = expect(Tok::Ident, "expected an attribute or block");
    if (peek().kind == Tok::Equals) {
      next();
      std::size_t before = pos_;
      parse_expression();
      HclAttribute attribute{name.value, std::nullopt};
      if (pos_ == before + 1 && tokens_[before].kind == Tok::String) {
        attribute.string_value = tokens_[before].value;
      }
      if (attributes) {
        attributes->push_back(std::move(attribute));
      }
      end_of_item();
      return;
    }
    HclBlock block;
    block.type = name.value;
    block.begin = name.begin;
    while (peek().kind == Tok::String || peek().kind == Tok::Ident) {
      block.labels.push_back(next().value);
    }
    expect(Tok::LBrace, "expected '=' or a block body");
    parse_body(&block.attributes);
    block.end = tokens_[pos_ - 1].end;
    end_of_item();
    if (blocks) {
      blocks->push_back(std::move(block));
    }
  }

  void parse_body(std::vector<HclAttribute> *attributes) {
    while (true) {
      skip_newlines();
      const Token &t = peek();
      if (t.kind == Tok::RBrace) {
        next();
        return;
      }
      if (t.kind == Tok::End) {
        syntax_error(text_, t.begin, "unclosed block");
      }
      parse_item(attributes, nullptr);
    }
  }

  void parse_expression() {
    parse_operand();
    while (peek().kind == Tok::Operator && peek().value != "...") {
      std::string op = next().value;
      if (op == "?") {
        parse_expression();
        expect(Tok::Colon, "expected ':' in conditional expression");
        parse_expression();
        return;
      }
      parse_operand();
    }
  }

  void parse_operand() {
    const Token &t = next();
    switch (t.kind) {
    case Tok::String:
    case Tok::Number:
    case Tok::Heredoc:
      break;
    case Tok::Ident:
      if (peek().kind == Tok::LParen) {
        next();
        ++nesting_;
        parse_sequence(Tok::RParen, "expected ')' to close the call");
        --nesting_;
      }
      break;
    case Tok::Operator:
      if (t.value == "-" || t.value == "!") {
        parse_operand();
        return;
      }
      syntax_error(text_, t.begin, "expected an expression");
    case Tok::LParen:
      ++nesting_;
      parse_expression();
      expect(Tok::RParen, "expected ')'");
      --nesting_;
      break;
    case Tok::LBracket:
      ++nesting_;
      parse_sequence(Tok::RBracket, "expected ']' to close the list");
      --nesting_;
      break;
    case Tok::LBrace:
      ++nesting_;
      parse_object();
      --nesting_;
      break;
    default:
      syntax_error(text_, t.begin, "expected an expression");
    }
    parse_traversals();
  }

  void parse_traversals() {
    while (true) {
      if (peek().kind == Tok::Dot) {
        next();
        const Token &step = next();
        bool splat = step.kind == Tok::Operator && step.value == "*";
        if (step.kind != Tok::Ident && step.kind != Tok::Number && !splat) {
          syntax_error(text_, step.begin, "expected an attribute name");
        }
      } else if (peek().kind == Tok::LBracket) {
        next();
        ++nesting_;
        if (peek().kind == Tok::Operator && peek().value == "*") {
          next();
        } else {
          parse_expression();
        }
        expect(Tok::RBracket, "expected ']' after the index");
        --nesting_;
      } else {
        return;
      }
    }
  }

  void parse_sequence(Tok close, const char *message) {
    if (peek().kind == close) {
      next();
      return;
    }
    while (true) {
      parse_expression();
      if (peek().kind == Tok::Comma) {
        next();
        if (peek().kind == close) {
          next();
          return;
        }
        continue;
      }
      if (peek().kind == Tok::Operator && peek().value == "...") {
        next();
      }
      expect(close, message);
      return;
    }
  }

  void parse_object() {
    while (true) {
      const Token &t = peek();
      if (t.kind == Tok::RBrace) {
        next();
        return;
      }
      if (t.kind == Tok::End) {
        syntax_error(text_, t.begin, "unclosed object");
      }
      parse_expression();
      if (peek().kind != Tok::Equals && peek().kind != Tok::Colon) {
        syntax_error(text_, peek().begin, "expected '=' or ':' in object");
      }
      next();
      parse_expression();
      if (peek().kind == Tok::Comma) {
        next();
      }
    }
  }

  const std::string &text_;
  std::vector<Token> tokens_;
  std::size_t pos_ = 0;
  int nesting_ = 0;
};

} // namespace

HclSyntaxError::HclSyntaxError(std::size_t line, std::size_t column,
                               const std::string &message)
    : std::runtime_error("line " + std::to_string(line) + ", column " +
                         std::to_string(column) + ": " + message),
      line_(line), column_(column) {}

std::optional<std::string>
HclBlock::string_attribute(const std::string &name) const {
  for (const auto &attribute : attributes) {
    if (attribute.name == name) {
      return attribute.string_value;
    }
  }
  return std::nullopt;
}

std::vector<HclBlock> scan_hcl_blocks(const std::string &text) {
  Parser parser(text, Lexer(text).run());
  return parser.parse_file();
}

std::string hcl_quote(const std::string &value) {
  std::string out = "\"";
  for (std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '$':
    case '%':
      out.push_back(c);
      if (i + 1 < value.size() && value[i + 1] == '{') {
        out.push_back(c);
      }
      break;
    default:
      out.push_back(c);
    }
  }
  out += "\"";
  return out;
}

} // namespace hostlogin
