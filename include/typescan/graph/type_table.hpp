// typescan/graph/type_table.hpp - Qualified-name lookup for declarations
//
// Maps qualified names to declarations (one entry per arity) and resolves the
// built-in keyword aliases (`string`, `int`, ...) to their core library names.
//
#pragma once

#include <string_view>
#include <unordered_map>
#include <vector>

#include "typescan/graph/type.hpp"

namespace typescan
{

/// Transparent hash functor for string_view heterogeneous lookup
struct TypeTableHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct TypeTableEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/**
 * Declaration lookup table.
 *
 * Manages:
 * - Declarations keyed by qualified name, one per generic arity
 * - Built-in keyword aliases (object -> System.Object, int -> System.Int32, ...)
 */
class TypeTable
{
public:
  TypeTable() = default;

  // ===========================================================================
  // Alias Registration
  // ===========================================================================

  /**
   * Register the C#-style keyword aliases for the core library types.
   *
   * Aliases only resolve once the aliased declaration has been defined.
   */
  void register_builtin_aliases()
  {
    register_alias("object", "System.Object");
    register_alias("string", "System.String");
    register_alias("bool", "System.Boolean");
    register_alias("byte", "System.Byte");
    register_alias("sbyte", "System.SByte");
    register_alias("char", "System.Char");
    register_alias("short", "System.Int16");
    register_alias("ushort", "System.UInt16");
    register_alias("int", "System.Int32");
    register_alias("uint", "System.UInt32");
    register_alias("long", "System.Int64");
    register_alias("ulong", "System.UInt64");
    register_alias("float", "System.Single");
    register_alias("double", "System.Double");
    register_alias("decimal", "System.Decimal");
  }

  // ===========================================================================
  // Symbol Definition
  // ===========================================================================

  /**
   * Define a declaration.
   *
   * @return true if defined, false if a declaration with the same qualified
   *         name and arity already exists
   */
  bool define(const TypeDecl * decl)
  {
    auto & overloads = symbols_[decl->qualified_name];
    for (const TypeDecl * existing : overloads) {
      if (existing->arity() == decl->arity()) return false;
    }
    overloads.push_back(decl);
    return true;
  }

  // ===========================================================================
  // Symbol Lookup
  // ===========================================================================

  /**
   * Look up a declaration by qualified name (or alias) and arity.
   *
   * @return Declaration if found, nullptr otherwise
   */
  [[nodiscard]] const TypeDecl * lookup(std::string_view name, size_t arity) const
  {
    auto it = symbols_.find(canonical_name(name));
    if (it == symbols_.end()) return nullptr;
    for (const TypeDecl * decl : it->second) {
      if (decl->arity() == arity) return decl;
    }
    return nullptr;
  }

  /**
   * All declarations sharing a qualified name, regardless of arity.
   */
  [[nodiscard]] std::vector<const TypeDecl *> lookup_all(std::string_view name) const
  {
    auto it = symbols_.find(canonical_name(name));
    return it != symbols_.end() ? it->second : std::vector<const TypeDecl *>{};
  }

  [[nodiscard]] bool contains(std::string_view name) const
  {
    return symbols_.find(canonical_name(name)) != symbols_.end();
  }

  /**
   * Number of distinct qualified names (excluding aliases).
   */
  [[nodiscard]] size_t size() const noexcept { return symbols_.size(); }

  /**
   * Get the canonical name for a type (resolves aliases).
   */
  [[nodiscard]] std::string_view canonical_name(std::string_view name) const
  {
    auto alias_it = aliases_.find(name);
    return alias_it != aliases_.end() ? alias_it->second : name;
  }

  [[nodiscard]] bool is_alias(std::string_view name) const
  {
    return aliases_.find(name) != aliases_.end();
  }

private:
  void register_alias(std::string_view alias_name, std::string_view canonical)
  {
    aliases_.emplace(alias_name, canonical);
  }

  // Keys view TypeDecl::qualified_name, which outlives the table (owned by the graph)
  std::unordered_map<std::string_view, std::vector<const TypeDecl *>, TypeTableHash, TypeTableEqual>
    symbols_;
  std::unordered_map<std::string_view, std::string_view, TypeTableHash, TypeTableEqual> aliases_;
};

}  // namespace typescan
