// typescan/syntax/type_expr.cpp - Recursive-descent type expression parser
//
#include "typescan/syntax/type_expr.hpp"

#include <cctype>

namespace typescan::syntax
{

namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_' || c >= 0x80; }
bool is_ident_continue(unsigned char c)
{
  return (std::isalnum(c) != 0) || c == '_' || c >= 0x80;
}

constexpr std::string_view k_global_prefix = "global::";

class TypeExprParser
{
public:
  explicit TypeExprParser(std::string_view src) : src_(src) {}

  TypeExprParseResult parse()
  {
    TypeExprParseResult result;

    skip_whitespace();
    if (eof()) {
      fail("T004", "empty type expression");
      result.error = error_;
      return result;
    }

    auto expr = parse_type(/*allow_open=*/true);
    if (expr) {
      skip_whitespace();
      if (!eof()) {
        fail("T003", "unexpected '" + std::string(1, peek()) + "' after type expression");
      } else {
        result.expr = std::move(*expr);
        return result;
      }
    }

    result.error = error_;
    return result;
  }

private:
  std::optional<TypeExpr> parse_type(bool allow_open)
  {
    TypeExpr expr;

    skip_whitespace();
    if (src_.substr(pos_, k_global_prefix.size()) == k_global_prefix) {
      pos_ += k_global_prefix.size();
      expr.is_global = true;
    }

    if (!parse_qualified_name(expr.name)) return std::nullopt;

    skip_whitespace();
    if (eof() || peek() != '<') return expr;

    const size_t open_pos = pos_;
    ++pos_;
    skip_whitespace();

    // Open generic definition: only commas (and whitespace) up to '>'
    if (!eof() && (peek() == '>' || peek() == ',')) {
      uint32_t arity = 1;
      while (!eof() && peek() != '>') {
        if (peek() == ',') {
          ++arity;
        } else if (!is_space(peek())) {
          fail("T001", "open generic definition cannot mix omitted and explicit arguments");
          return std::nullopt;
        }
        ++pos_;
      }
      if (eof()) {
        fail("T002", "unterminated type argument list", open_pos);
        return std::nullopt;
      }
      if (!allow_open) {
        fail("T005", "open generic definition cannot be used as a type argument", open_pos);
        return std::nullopt;
      }
      ++pos_;
      expr.open_arity = arity;
      return expr;
    }

    while (true) {
      auto arg = parse_type(/*allow_open=*/false);
      if (!arg) return std::nullopt;
      expr.args.push_back(std::move(*arg));

      skip_whitespace();
      if (eof()) {
        fail("T002", "unterminated type argument list", open_pos);
        return std::nullopt;
      }
      if (peek() == ',') {
        ++pos_;
        continue;
      }
      if (peek() == '>') {
        ++pos_;
        return expr;
      }
      fail("T001", "expected ',' or '>' in type argument list, found '" +
                     std::string(1, peek()) + "'");
      return std::nullopt;
    }
  }

  bool parse_qualified_name(std::string & out)
  {
    while (true) {
      skip_whitespace();
      if (eof() || !is_ident_start(static_cast<unsigned char>(peek()))) {
        fail(
          "T001", eof() ? "expected type name, found end of input"
                        : "expected type name, found '" + std::string(1, peek()) + "'");
        return false;
      }

      const size_t start = pos_;
      while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
        ++pos_;
      }
      out.append(src_.substr(start, pos_ - start));

      if (!eof() && (peek() == '.' || peek() == '+')) {
        out += '.';
        ++pos_;
        continue;
      }
      return true;
    }
  }

  void skip_whitespace()
  {
    while (!eof() && is_space(peek())) {
      ++pos_;
    }
  }

  static bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek() const noexcept { return src_[pos_]; }

  void fail(std::string code, std::string message) { fail(std::move(code), std::move(message), pos_); }
  void fail(std::string code, std::string message, size_t offset)
  {
    error_.code = std::move(code);
    error_.message = std::move(message);
    error_.offset = offset;
  }

  std::string_view src_;
  size_t pos_ = 0;
  TypeExprError error_;
};

}  // namespace

std::string TypeExpr::to_string() const
{
  std::string out = name;
  if (is_open()) {
    out += '<';
    out += std::string(open_arity - 1, ',');
    out += '>';
  } else if (!args.empty()) {
    out += '<';
    for (size_t i = 0; i < args.size(); ++i) {
      if (i > 0) out += ", ";
      out += args[i].to_string();
    }
    out += '>';
  }
  return out;
}

TypeExprParseResult parse_type_expr(std::string_view text) { return TypeExprParser(text).parse(); }

}  // namespace typescan::syntax
