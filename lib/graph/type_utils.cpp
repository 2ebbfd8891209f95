// typescan/graph/type_utils.cpp - Shared TypeRef helpers implementation
//
#include "typescan/graph/type_utils.hpp"

#include <algorithm>

namespace typescan
{

// ============================================================================
// Substitution
// ============================================================================

TypeRef substitute(const TypeRef & type, const TypeDecl * owner, const std::vector<TypeRef> & args)
{
  if (args.empty()) return type;

  switch (type.kind) {
    case TypeRefKind::TypeParameter:
      if (same_declaration(type.decl, owner) && type.ordinal < args.size()) {
        return args[type.ordinal];
      }
      return type;
    case TypeRefKind::HandlerParameter:
      return type;
    case TypeRefKind::Named:
      break;
  }

  if (type.args.empty()) return type;

  std::vector<TypeRef> new_args;
  new_args.reserve(type.args.size());
  for (const auto & arg : type.args) {
    new_args.push_back(substitute(arg, owner, args));
  }
  return TypeRef::named(type.decl, std::move(new_args));
}

TypeRef instantiate_edge(const TypeRef & edge, const TypeRef & instance)
{
  if (!instance.is_named() || instance.args.empty()) return edge;
  return substitute(edge, instance.decl, instance.args);
}

// ============================================================================
// Classification
// ============================================================================

bool is_value_type(const TypeRef & type) noexcept
{
  return type.is_named() && type.decl && type.decl->is_value_type();
}

bool is_unmanaged(const TypeRef & type) noexcept
{
  if (!is_value_type(type)) return false;
  if (type.decl->kind == TypeKind::Enum) return true;
  if (!type.decl->is_unmanaged) return false;
  return std::all_of(
    type.args.begin(), type.args.end(), [](const TypeRef & a) { return is_unmanaged(a); });
}

bool has_public_parameterless_constructor(const TypeRef & type) noexcept
{
  if (!type.is_named() || !type.decl) return false;
  const auto & ctors = type.decl->constructors;
  return std::any_of(ctors.begin(), ctors.end(), [](const Constructor & c) {
    return c.accessibility == Accessibility::Public && c.parameter_count == 0 && !c.is_static;
  });
}

// ============================================================================
// Collections
// ============================================================================

bool append_unique(std::vector<TypeRef> & list, TypeRef type)
{
  if (contains_type(list, type)) return false;
  list.push_back(std::move(type));
  return true;
}

bool contains_type(const std::vector<TypeRef> & list, const TypeRef & type)
{
  return std::find(list.begin(), list.end(), type) != list.end();
}

// ============================================================================
// Display
// ============================================================================

std::string to_string(const TypeRef & type, const std::vector<std::string> * handler_parameter_names)
{
  switch (type.kind) {
    case TypeRefKind::HandlerParameter:
      if (handler_parameter_names && type.ordinal < handler_parameter_names->size()) {
        return (*handler_parameter_names)[type.ordinal];
      }
      return "!!" + std::to_string(type.ordinal);
    case TypeRefKind::TypeParameter:
      if (type.decl && type.ordinal < type.decl->type_parameters.size()) {
        return type.decl->type_parameters[type.ordinal];
      }
      return "!" + std::to_string(type.ordinal);
    case TypeRefKind::Named:
      break;
  }

  if (!type.decl) return "<error>";

  std::string out = type.decl->qualified_name;
  if (!type.decl->is_generic()) return out;

  out += '<';
  if (type.args.empty()) {
    out += std::string(type.decl->arity() - 1, ',');
  } else {
    for (size_t i = 0; i < type.args.size(); ++i) {
      if (i > 0) out += ", ";
      out += to_string(type.args[i], handler_parameter_names);
    }
  }
  out += '>';
  return out;
}

std::string to_string(const std::vector<TypeRef> & types)
{
  std::string out;
  for (size_t i = 0; i < types.size(); ++i) {
    if (i > 0) out += ", ";
    out += to_string(types[i]);
  }
  return out;
}

}  // namespace typescan
