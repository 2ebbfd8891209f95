// typescan/graph/type_resolver.hpp - Resolve type expressions to TypeRefs
//
// Name lookup mirrors C# scoping closely enough for graph files and query
// configurations: type parameters first, then the containing declarations and
// namespaces from the innermost outwards, then imported namespaces, then
// global names and keyword aliases.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "typescan/graph/type.hpp"
#include "typescan/graph/type_table.hpp"
#include "typescan/syntax/type_expr.hpp"

namespace typescan
{

/**
 * Lookup context for one type expression.
 */
struct ResolveScope
{
  /// Declaration the expression appears on (its type parameters and those of
  /// its containers are in scope)
  const TypeDecl * context = nullptr;

  /// Qualified name of the enclosing namespace (empty = global)
  std::string namespace_name;

  /// Additional namespaces searched after the enclosing chain (`using` directives)
  std::vector<std::string> imports;

  /// Handler generic parameter names, resolved to handler parameters
  const std::vector<std::string> * handler_parameters = nullptr;
};

struct TypeResolution
{
  std::optional<TypeRef> type;

  /// Diagnostic code and message when resolution failed
  std::string code;
  std::string error;
  std::optional<std::string> help;

  [[nodiscard]] bool ok() const noexcept { return type.has_value(); }

  static TypeResolution resolved(TypeRef t)
  {
    TypeResolution r;
    r.type = std::move(t);
    return r;
  }

  static TypeResolution failed(
    std::string code, std::string error, std::optional<std::string> help = std::nullopt)
  {
    TypeResolution r;
    r.code = std::move(code);
    r.error = std::move(error);
    r.help = std::move(help);
    return r;
  }
};

class TypeResolver
{
public:
  explicit TypeResolver(const TypeTable & table) : table_(table) {}

  /**
   * Resolve a parsed type expression.
   *
   * @return The reference, or a failure carrying a `T0xx`/`G004` code
   */
  [[nodiscard]] TypeResolution resolve(const syntax::TypeExpr & expr, const ResolveScope & scope) const;

  /**
   * Parse and resolve a textual type expression.
   */
  [[nodiscard]] TypeResolution resolve(std::string_view text, const ResolveScope & scope) const;

private:
  [[nodiscard]] std::optional<TypeRef> resolve_parameter(
    const syntax::TypeExpr & expr, const ResolveScope & scope) const;

  [[nodiscard]] const TypeDecl * lookup(
    const syntax::TypeExpr & expr, const ResolveScope & scope, size_t arity) const;

  [[nodiscard]] std::vector<std::string> search_prefixes(
    const syntax::TypeExpr & expr, const ResolveScope & scope) const;

  const TypeTable & table_;
};

}  // namespace typescan
