// typescan/match/query.hpp - Query values and match records
//
// A Query is an immutable filter specification built once by the query
// builder; the engine never modifies it. Bindings and match records are the
// engine's output.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "typescan/graph/type.hpp"

namespace typescan
{

// ============================================================================
// Handler Signature
// ============================================================================

enum class HandlerKind : uint8_t {
  /// Generic method invoked once per match; the matched type is the first type argument
  GenericMethod,
  /// Static method declared on each matched type
  TypeMethod,
};

struct GenericParameter
{
  uint32_t ordinal = 0;
  std::string name;

  bool reference_type = false;       ///< `class`
  bool value_type = false;           ///< `struct`
  bool unmanaged = false;            ///< `unmanaged`
  bool default_constructor = false;  ///< `new()`

  /// Constraint types; may embed handler parameters at any depth
  std::vector<TypeRef> constraint_types;
};

struct HandlerSignature
{
  std::string name;
  HandlerKind kind = HandlerKind::GenericMethod;
  std::vector<GenericParameter> parameters;

  [[nodiscard]] std::vector<std::string> parameter_names() const
  {
    std::vector<std::string> names;
    names.reserve(parameters.size());
    for (const auto & p : parameters) {
      names.push_back(p.name);
    }
    return names;
  }
};

// ============================================================================
// Query
// ============================================================================

struct Query
{
  std::string name;

  /// Declaration the query is attached to: visibility origin and default module
  const TypeDecl * declared_in = nullptr;

  /// Module selection: the module owning this marker type...
  std::optional<TypeRef> assembly_of_type;
  /// ...or every referenced module whose name matches
  std::optional<std::string> assembly_name_filter;

  std::optional<TypeRef> assignable_to;
  std::optional<TypeRef> exclude_assignable_to;

  std::optional<TypeRef> attribute_filter;
  std::optional<TypeRef> exclude_by_attribute;

  std::optional<std::string> type_name_filter;
  std::optional<std::string> exclude_by_type_name;

  std::optional<HandlerSignature> handler;

  [[nodiscard]] bool allows_static_types() const noexcept
  {
    return handler && handler->kind == HandlerKind::TypeMethod;
  }
};

// ============================================================================
// Results
// ============================================================================

/**
 * Types assigned to every handler parameter, indexed by ordinal.
 */
struct Binding
{
  std::vector<TypeRef> arguments;

  [[nodiscard]] size_t size() const noexcept { return arguments.size(); }
  [[nodiscard]] const TypeRef & operator[](size_t ordinal) const { return arguments[ordinal]; }
};

[[nodiscard]] inline bool operator==(const Binding & lhs, const Binding & rhs)
{
  return lhs.arguments == rhs.arguments;
}
[[nodiscard]] inline bool operator!=(const Binding & lhs, const Binding & rhs)
{
  return !(lhs == rhs);
}

struct MatchRecord
{
  const TypeDecl * type = nullptr;

  /// Set when the query has a handler signature
  std::optional<Binding> binding;

  /// Generalizations that justified the match: the seed of this binding for
  /// handler queries, every generalization of the assignable-to target otherwise
  std::vector<TypeRef> generalizations;
};

}  // namespace typescan
