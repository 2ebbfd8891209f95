// typescan/graph/type_resolver.cpp - Type expression resolution
//
#include "typescan/graph/type_resolver.hpp"

namespace typescan
{

namespace
{

std::string join_name(const std::string & prefix, const std::string & name)
{
  return prefix.empty() ? name : prefix + "." + name;
}

/// `Foo<>`, `Foo<,>`; plain `Foo` for arity 0
std::string spelled_with_arity(const std::string & name, size_t arity)
{
  if (arity == 0) return name;
  return name + "<" + std::string(arity - 1, ',') + ">";
}

}  // namespace

TypeResolution TypeResolver::resolve(std::string_view text, const ResolveScope & scope) const
{
  auto parsed = syntax::parse_type_expr(text);
  if (!parsed.ok()) {
    return TypeResolution::failed(
      parsed.error->code, "invalid type expression '" + std::string(text) +
                            "': " + parsed.error->message);
  }
  return resolve(*parsed.expr, scope);
}

TypeResolution TypeResolver::resolve(const syntax::TypeExpr & expr, const ResolveScope & scope) const
{
  if (auto param = resolve_parameter(expr, scope)) {
    return TypeResolution::resolved(std::move(*param));
  }

  const TypeDecl * decl = lookup(expr, scope, expr.arity());
  if (!decl) {
    // Same name with a different arity gives a useful hint
    for (size_t arity = 0; arity <= 8; ++arity) {
      if (arity == expr.arity()) continue;
      if (const TypeDecl * other = lookup(expr, scope, arity)) {
        return TypeResolution::failed(
          "G004",
          "type '" + expr.to_string() + "' expects " + std::to_string(other->arity()) +
            " type argument(s), found " + std::to_string(expr.arity()),
          "did you mean '" + spelled_with_arity(other->qualified_name, other->arity()) + "'?");
      }
    }
    return TypeResolution::failed("G004", "cannot resolve type '" + expr.to_string() + "'");
  }

  if (expr.is_open()) {
    return TypeResolution::resolved(TypeRef::named(decl));
  }

  std::vector<TypeRef> args;
  args.reserve(expr.args.size());
  for (const auto & arg_expr : expr.args) {
    auto arg = resolve(arg_expr, scope);
    if (!arg.ok()) return arg;
    args.push_back(std::move(*arg.type));
  }
  return TypeResolution::resolved(TypeRef::named(decl, std::move(args)));
}

std::optional<TypeRef> TypeResolver::resolve_parameter(
  const syntax::TypeExpr & expr, const ResolveScope & scope) const
{
  if (!expr.is_simple_name() || expr.arity() != 0) return std::nullopt;

  if (scope.handler_parameters) {
    const auto & names = *scope.handler_parameters;
    for (size_t i = 0; i < names.size(); ++i) {
      if (names[i] == expr.name) return TypeRef::handler_parameter(static_cast<uint32_t>(i));
    }
  }

  for (const TypeDecl * d = scope.context; d != nullptr; d = d->containing) {
    for (size_t i = 0; i < d->type_parameters.size(); ++i) {
      if (d->type_parameters[i] == expr.name) {
        return TypeRef::type_parameter(d, static_cast<uint32_t>(i));
      }
    }
  }
  return std::nullopt;
}

const TypeDecl * TypeResolver::lookup(
  const syntax::TypeExpr & expr, const ResolveScope & scope, size_t arity) const
{
  for (const auto & prefix : search_prefixes(expr, scope)) {
    if (const TypeDecl * decl = table_.lookup(join_name(prefix, expr.name), arity)) {
      return decl;
    }
  }
  return nullptr;
}

std::vector<std::string> TypeResolver::search_prefixes(
  const syntax::TypeExpr & expr, const ResolveScope & scope) const
{
  std::vector<std::string> prefixes;
  if (expr.is_global) {
    prefixes.emplace_back();
    return prefixes;
  }

  for (const TypeDecl * d = scope.context; d != nullptr; d = d->containing) {
    prefixes.push_back(d->qualified_name);
  }

  std::string ns = scope.namespace_name;
  while (!ns.empty()) {
    prefixes.push_back(ns);
    const auto dot = ns.rfind('.');
    ns = dot == std::string::npos ? std::string() : ns.substr(0, dot);
  }

  // Imports only apply to simple names
  if (expr.is_simple_name()) {
    for (const auto & import : scope.imports) {
      prefixes.push_back(import);
    }
  }

  // Global names, then keyword aliases (the table resolves aliases)
  prefixes.emplace_back();
  return prefixes;
}

}  // namespace typescan
