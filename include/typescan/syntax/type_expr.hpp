// typescan/syntax/type_expr.hpp - Textual type expressions
//
// Type references in graph files and query configurations are written as
// C#-style type expressions:
//
//   string
//   App.Handlers.ICommandHandler<TCommand>
//   System.Collections.Generic.Dictionary<string, App.Model.Entity>
//   ICommandHandler<>          (open generic definition, arity 1)
//   IDictionary<,>             (open generic definition, arity 2)
//   global::App.Outer+Inner    ('+' is accepted as nested-type separator)
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace typescan::syntax
{

// ============================================================================
// AST
// ============================================================================

struct TypeExpr
{
  /// Dotted name as written, '+' normalized to '.', without `global::`
  std::string name;

  /// Type arguments (closed form)
  std::vector<TypeExpr> args;

  /// Arity of an open generic definition (`Foo<>` = 1, `Foo<,>` = 2), 0 otherwise
  uint32_t open_arity = 0;

  /// Written with the `global::` prefix
  bool is_global = false;

  [[nodiscard]] bool is_open() const noexcept { return open_arity > 0; }

  /// Generic arity implied by the expression
  [[nodiscard]] size_t arity() const noexcept { return is_open() ? open_arity : args.size(); }

  /// Name has no namespace or container qualification
  [[nodiscard]] bool is_simple_name() const noexcept
  {
    return !is_global && name.find('.') == std::string::npos;
  }

  /// Canonical spelling (`A.B<C, D>`, `A.B<,>`)
  [[nodiscard]] std::string to_string() const;
};

// ============================================================================
// Parsing
// ============================================================================

struct TypeExprError
{
  /// T001..T005
  std::string code;
  std::string message;

  /// Byte offset of the offending character in the input
  size_t offset = 0;
};

struct TypeExprParseResult
{
  std::optional<TypeExpr> expr;
  std::optional<TypeExprError> error;

  [[nodiscard]] bool ok() const noexcept { return expr.has_value(); }
};

/**
 * Parse a complete type expression.
 *
 * Leading and trailing whitespace is ignored. Open generic definitions are
 * only accepted at the top level (`List<List<>>` is rejected).
 */
[[nodiscard]] TypeExprParseResult parse_type_expr(std::string_view text);

}  // namespace typescan::syntax
