// typescan/graph/type.hpp - Type declarations and structural type references
//
// A TypeDecl is one declaration of the scanned type graph. A TypeRef is a
// value that names a declaration, possibly instantiated with type arguments,
// or one of the type parameters in scope. TypeRefs compare structurally:
// two references are equal when they name the same qualified declaration
// with equal argument lists, regardless of where they were materialized.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace typescan
{

struct Module;
struct TypeDecl;

// ============================================================================
// Declaration Kinds
// ============================================================================

enum class TypeKind : uint8_t {
  Class,
  Interface,
  Struct,
  Enum,
  Delegate,
};

/// Declared accessibility, ordered from most to least restrictive.
enum class Accessibility : uint8_t {
  Private,
  PrivateProtected,
  Protected,
  Internal,
  ProtectedInternal,
  Public,
};

struct Constructor
{
  Accessibility accessibility = Accessibility::Public;
  uint32_t parameter_count = 0;
  bool is_static = false;

  /// Synthesized by the graph builder (default constructor of a class or struct)
  bool is_implicit = false;
};

// ============================================================================
// Type Reference
// ============================================================================

enum class TypeRefKind : uint8_t {
  Named,             ///< A declaration, optionally with type arguments
  TypeParameter,     ///< Type parameter of a declaration (T in `class Repo<T>`)
  HandlerParameter,  ///< Generic parameter of a query's handler signature
};

struct TypeRef
{
  TypeRefKind kind = TypeRefKind::Named;

  /// Named: the declaration. TypeParameter: the declaration owning the parameter.
  const TypeDecl * decl = nullptr;

  /// TypeParameter / HandlerParameter: position in the owner's parameter list
  uint32_t ordinal = 0;

  /// Named: type arguments. Empty for non-generic declarations and open definitions.
  std::vector<TypeRef> args;

  [[nodiscard]] static TypeRef named(const TypeDecl * decl, std::vector<TypeRef> args = {});
  [[nodiscard]] static TypeRef type_parameter(const TypeDecl * owner, uint32_t ordinal);
  [[nodiscard]] static TypeRef handler_parameter(uint32_t ordinal);

  [[nodiscard]] bool is_named() const noexcept { return kind == TypeRefKind::Named; }
  [[nodiscard]] bool is_type_parameter() const noexcept
  {
    return kind == TypeRefKind::TypeParameter;
  }
  [[nodiscard]] bool is_handler_parameter() const noexcept
  {
    return kind == TypeRefKind::HandlerParameter;
  }

  /// Named reference to a generic declaration (open or closed)
  [[nodiscard]] bool is_generic() const noexcept;

  /// Generic declaration without arguments, e.g. `IHandler<>`
  [[nodiscard]] bool is_open_definition() const noexcept;

  /// Generic declaration instantiated with its own type parameters (`Repo<T>` inside Repo)
  [[nodiscard]] bool is_self_type() const noexcept;

  [[nodiscard]] bool contains_handler_parameters() const noexcept;
  [[nodiscard]] bool contains_type_parameters() const noexcept;

  /// Open definition of a named reference (`IHandler<string>` -> `IHandler<>`)
  [[nodiscard]] TypeRef definition() const;
};

/// Structural identity (qualified name + arity + arguments)
[[nodiscard]] bool operator==(const TypeRef & lhs, const TypeRef & rhs);
[[nodiscard]] inline bool operator!=(const TypeRef & lhs, const TypeRef & rhs)
{
  return !(lhs == rhs);
}

/// Both references are named and share a generic definition
[[nodiscard]] bool same_definition(const TypeRef & lhs, const TypeRef & rhs) noexcept;

// ============================================================================
// Type Declaration
// ============================================================================

struct TypeDecl
{
  /// Simple name as declared (`Handler`)
  std::string name;

  /// Namespace and containing types joined by '.' (`App.Outer.Handler`)
  std::string qualified_name;

  TypeKind kind = TypeKind::Class;
  Accessibility accessibility = Accessibility::Public;

  bool is_abstract = false;
  bool is_static = false;
  bool is_sealed = false;

  /// Value kinds only: no managed references anywhere in the layout
  bool is_unmanaged = false;

  /// Declared type parameter names, in order
  std::vector<std::string> type_parameters;

  /// Direct base type (classes, structs and enums after building)
  std::optional<TypeRef> base;

  /// Interfaces listed on the declaration, in declaration order
  std::vector<TypeRef> interfaces;

  /// Flattened interface set, inherited interfaces included, deduplicated
  std::vector<TypeRef> all_interfaces;

  /// Marker tags (attribute types) applied to the declaration
  std::vector<TypeRef> attributes;

  std::vector<Constructor> constructors;

  /// Nested declarations, in declaration order
  std::vector<const TypeDecl *> nested;

  const TypeDecl * containing = nullptr;
  const Module * module = nullptr;

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] size_t arity() const noexcept { return type_parameters.size(); }
  [[nodiscard]] bool is_generic() const noexcept { return !type_parameters.empty(); }

  /// Generic itself or nested inside a generic declaration
  [[nodiscard]] bool has_unbound_type_parameters() const noexcept;

  [[nodiscard]] bool is_class() const noexcept { return kind == TypeKind::Class; }
  [[nodiscard]] bool is_interface() const noexcept { return kind == TypeKind::Interface; }
  [[nodiscard]] bool is_value_type() const noexcept
  {
    return kind == TypeKind::Struct || kind == TypeKind::Enum;
  }

  /// False for compiler-generated names (`<>c`, `<Main>$`, anonymous types)
  [[nodiscard]] bool can_be_referenced_by_name() const noexcept;

  /// Reference to this declaration instantiated with its own type parameters
  [[nodiscard]] TypeRef self_type() const;

  /// Qualified name with type parameter list (`App.Repo<T>`)
  [[nodiscard]] std::string display_name() const;

  /// Namespace of the outermost containing declaration (empty = global)
  [[nodiscard]] std::string namespace_name() const;
};

/// Declarations are identified by qualified name and arity
[[nodiscard]] bool same_declaration(const TypeDecl * lhs, const TypeDecl * rhs) noexcept;

[[nodiscard]] std::string_view to_string(TypeKind kind) noexcept;
[[nodiscard]] std::string_view to_string(Accessibility accessibility) noexcept;

}  // namespace typescan
