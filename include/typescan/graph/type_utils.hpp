// typescan/graph/type_utils.hpp - Shared helpers over TypeRef values
//
// Substitution, structural classification and display helpers used by the
// graph builder and by the matching engine.
//
#pragma once

#include <string>
#include <vector>

#include "typescan/graph/type.hpp"

namespace typescan
{

// ============================================================================
// Substitution
// ============================================================================

/**
 * Replace the type parameters of `owner` inside `type` with `args`.
 *
 * Used to instantiate declared edges: the base `Base<T>` declared on
 * `Derived<T>` becomes `Base<string>` for `Derived<string>`. References to
 * other declarations' parameters are left untouched. An empty `args` list
 * (open definition) returns `type` unchanged.
 *
 * @param type The reference to rewrite
 * @param owner Declaration whose type parameters are being bound
 * @param args Arguments, indexed by the owner's parameter ordinal
 * @return The substituted reference
 */
[[nodiscard]] TypeRef substitute(
  const TypeRef & type, const TypeDecl * owner, const std::vector<TypeRef> & args);

/**
 * Instantiate an edge declared on `instance`'s declaration.
 *
 * The arguments of `instance` bind the parameters of its declaration.
 */
[[nodiscard]] TypeRef instantiate_edge(const TypeRef & edge, const TypeRef & instance);

// ============================================================================
// Classification
// ============================================================================

/// Named reference to a struct or enum
[[nodiscard]] bool is_value_type(const TypeRef & type) noexcept;

/**
 * Check if a reference denotes an unmanaged value type.
 *
 * Enums are always unmanaged; structs are unmanaged when declared so and when
 * every type argument is unmanaged.
 */
[[nodiscard]] bool is_unmanaged(const TypeRef & type) noexcept;

/**
 * Check for a declared public, non-static, zero-parameter constructor.
 */
[[nodiscard]] bool has_public_parameterless_constructor(const TypeRef & type) noexcept;

// ============================================================================
// Collections
// ============================================================================

/**
 * Append `type` unless a structurally equal reference is already present.
 *
 * @return true if appended
 */
bool append_unique(std::vector<TypeRef> & list, TypeRef type);

/// Structural membership test
[[nodiscard]] bool contains_type(const std::vector<TypeRef> & list, const TypeRef & type);

// ============================================================================
// Display
// ============================================================================

/**
 * Convert a TypeRef to its display string.
 *
 * Named references print as `Ns.Name<Arg, ...>`, open definitions as
 * `Ns.Name<>` (`Ns.Name<,>` for arity 2), declaration type parameters by
 * name, and handler parameters as `!!N` unless names are supplied.
 *
 * @param type The reference to print
 * @param handler_parameter_names Optional names indexed by handler ordinal
 */
[[nodiscard]] std::string to_string(
  const TypeRef & type, const std::vector<std::string> * handler_parameter_names = nullptr);

/// Join a list of references with ", "
[[nodiscard]] std::string to_string(const std::vector<TypeRef> & types);

}  // namespace typescan
