// typescan/graph/type.cpp - TypeRef / TypeDecl implementation
//
#include "typescan/graph/type.hpp"

#include <algorithm>
#include <cctype>

namespace typescan
{

// ============================================================================
// TypeRef
// ============================================================================

TypeRef TypeRef::named(const TypeDecl * decl, std::vector<TypeRef> args)
{
  TypeRef ref;
  ref.kind = TypeRefKind::Named;
  ref.decl = decl;
  ref.args = std::move(args);
  return ref;
}

TypeRef TypeRef::type_parameter(const TypeDecl * owner, uint32_t ordinal)
{
  TypeRef ref;
  ref.kind = TypeRefKind::TypeParameter;
  ref.decl = owner;
  ref.ordinal = ordinal;
  return ref;
}

TypeRef TypeRef::handler_parameter(uint32_t ordinal)
{
  TypeRef ref;
  ref.kind = TypeRefKind::HandlerParameter;
  ref.ordinal = ordinal;
  return ref;
}

bool TypeRef::is_generic() const noexcept { return is_named() && decl && decl->is_generic(); }

bool TypeRef::is_open_definition() const noexcept { return is_generic() && args.empty(); }

bool TypeRef::is_self_type() const noexcept
{
  if (!is_generic() || args.size() != decl->arity()) return false;
  for (size_t i = 0; i < args.size(); ++i) {
    const TypeRef & arg = args[i];
    if (!arg.is_type_parameter() || arg.ordinal != i || !same_declaration(arg.decl, decl)) {
      return false;
    }
  }
  return true;
}

bool TypeRef::contains_handler_parameters() const noexcept
{
  if (is_handler_parameter()) return true;
  return std::any_of(
    args.begin(), args.end(), [](const TypeRef & a) { return a.contains_handler_parameters(); });
}

bool TypeRef::contains_type_parameters() const noexcept
{
  if (is_type_parameter()) return true;
  return std::any_of(
    args.begin(), args.end(), [](const TypeRef & a) { return a.contains_type_parameters(); });
}

TypeRef TypeRef::definition() const { return TypeRef::named(decl); }

bool operator==(const TypeRef & lhs, const TypeRef & rhs)
{
  if (lhs.kind != rhs.kind) return false;

  switch (lhs.kind) {
    case TypeRefKind::HandlerParameter:
      return lhs.ordinal == rhs.ordinal;
    case TypeRefKind::TypeParameter:
      return lhs.ordinal == rhs.ordinal && same_declaration(lhs.decl, rhs.decl);
    case TypeRefKind::Named:
      break;
  }

  if (!same_declaration(lhs.decl, rhs.decl)) return false;
  if (lhs.args.size() != rhs.args.size()) return false;
  for (size_t i = 0; i < lhs.args.size(); ++i) {
    if (lhs.args[i] != rhs.args[i]) return false;
  }
  return true;
}

bool same_definition(const TypeRef & lhs, const TypeRef & rhs) noexcept
{
  return lhs.is_named() && rhs.is_named() && same_declaration(lhs.decl, rhs.decl);
}

// ============================================================================
// TypeDecl
// ============================================================================

bool TypeDecl::has_unbound_type_parameters() const noexcept
{
  for (const TypeDecl * d = this; d != nullptr; d = d->containing) {
    if (d->is_generic()) return true;
  }
  return false;
}

bool TypeDecl::can_be_referenced_by_name() const noexcept
{
  if (name.empty()) return false;

  const auto first = static_cast<unsigned char>(name.front());
  if (!std::isalpha(first) && first != '_' && first < 0x80) return false;

  return std::all_of(name.begin(), name.end(), [](char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || uc == '_' || uc >= 0x80;
  });
}

TypeRef TypeDecl::self_type() const
{
  std::vector<TypeRef> args;
  args.reserve(type_parameters.size());
  for (size_t i = 0; i < type_parameters.size(); ++i) {
    args.push_back(TypeRef::type_parameter(this, static_cast<uint32_t>(i)));
  }
  return TypeRef::named(this, std::move(args));
}

std::string TypeDecl::display_name() const
{
  if (!is_generic()) return qualified_name;

  std::string out = qualified_name;
  out += '<';
  for (size_t i = 0; i < type_parameters.size(); ++i) {
    if (i > 0) out += ", ";
    out += type_parameters[i];
  }
  out += '>';
  return out;
}

std::string TypeDecl::namespace_name() const
{
  const TypeDecl * top = this;
  while (top->containing) top = top->containing;
  const auto & q = top->qualified_name;
  if (q.size() <= top->name.size()) return {};
  return q.substr(0, q.size() - top->name.size() - 1);
}

bool same_declaration(const TypeDecl * lhs, const TypeDecl * rhs) noexcept
{
  if (lhs == rhs) return true;
  if (!lhs || !rhs) return false;
  return lhs->arity() == rhs->arity() && lhs->qualified_name == rhs->qualified_name;
}

std::string_view to_string(TypeKind kind) noexcept
{
  switch (kind) {
    case TypeKind::Class:
      return "class";
    case TypeKind::Interface:
      return "interface";
    case TypeKind::Struct:
      return "struct";
    case TypeKind::Enum:
      return "enum";
    case TypeKind::Delegate:
      return "delegate";
  }
  return "class";
}

std::string_view to_string(Accessibility accessibility) noexcept
{
  switch (accessibility) {
    case Accessibility::Private:
      return "private";
    case Accessibility::PrivateProtected:
      return "private protected";
    case Accessibility::Protected:
      return "protected";
    case Accessibility::Internal:
      return "internal";
    case Accessibility::ProtectedInternal:
      return "protected internal";
    case Accessibility::Public:
      return "public";
  }
  return "public";
}

}  // namespace typescan
