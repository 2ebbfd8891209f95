// typescan/graph/type_graph.hpp - Immutable type graph (modules, namespaces, declarations)
//
// The graph is materialized once by GraphBuilder and is read-only afterwards.
// It is the provider the matching engine queries for base edges, flattened
// interface sets, and visibility.
//
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "typescan/graph/type.hpp"
#include "typescan/graph/type_table.hpp"

namespace typescan
{

struct Namespace;

/// A namespace member: a nested namespace or a top-level declaration
using NamespaceMember = std::variant<const Namespace *, const TypeDecl *>;

// ============================================================================
// Namespace
// ============================================================================

struct Namespace
{
  /// Simple name (empty for the global namespace)
  std::string name;

  /// Dotted name (`App.Handlers`), empty for the global namespace
  std::string qualified_name;

  /// Members in declaration order
  std::vector<NamespaceMember> members;

  [[nodiscard]] bool is_global() const noexcept { return qualified_name.empty(); }
};

// ============================================================================
// Module Info
// ============================================================================

/**
 * A module (assembly) of the graph.
 *
 * Each module owns a namespace tree; references point at other modules of the
 * same graph, in declaration order.
 */
struct Module
{
  std::string name;

  /// Root of the namespace tree (owned by the graph)
  Namespace * global_namespace = nullptr;

  /// Direct references (resolved Module pointers)
  std::vector<const Module *> references;

  /// Registered by the builder rather than loaded from input
  bool is_core_library = false;
};

// ============================================================================
// Type Graph
// ============================================================================

/**
 * Immutable graph of all modules and declarations.
 *
 * Owns every Module, Namespace and TypeDecl; the pointers handed out stay
 * valid for the lifetime of the graph (including across moves).
 */
class TypeGraph
{
public:
  TypeGraph() = default;

  // Non-copyable (owns declarations), movable
  TypeGraph(const TypeGraph &) = delete;
  TypeGraph & operator=(const TypeGraph &) = delete;
  TypeGraph(TypeGraph &&) = default;
  TypeGraph & operator=(TypeGraph &&) = default;

  // ===========================================================================
  // Modules
  // ===========================================================================

  /**
   * Get all modules in declaration order.
   */
  [[nodiscard]] std::vector<const Module *> modules() const
  {
    std::vector<const Module *> result;
    result.reserve(modules_.size());
    for (const auto & m : modules_) {
      result.push_back(m.get());
    }
    return result;
  }

  [[nodiscard]] const Module * find_module(std::string_view name) const;

  /**
   * Module followed by every module reachable through references.
   *
   * Breadth-first, each module once, references visited in declaration order.
   */
  [[nodiscard]] std::vector<const Module *> reference_closure(const Module & root) const;

  [[nodiscard]] size_t module_count() const noexcept { return modules_.size(); }

  // ===========================================================================
  // Declarations
  // ===========================================================================

  [[nodiscard]] const TypeTable & types() const noexcept { return table_; }

  /**
   * Look up a declaration by qualified name (or alias) and arity.
   */
  [[nodiscard]] const TypeDecl * find_type(std::string_view qualified_name, size_t arity = 0) const
  {
    return table_.lookup(qualified_name, arity);
  }

  [[nodiscard]] size_t type_count() const noexcept { return decls_.size(); }

  // ===========================================================================
  // Provider Queries
  // ===========================================================================

  /**
   * Base type of a (possibly instantiated) type, with the instantiation's
   * arguments substituted into the declared base edge.
   */
  [[nodiscard]] std::optional<TypeRef> base_of(const TypeRef & type) const;

  /**
   * Flattened interface set of a (possibly instantiated) type.
   */
  [[nodiscard]] std::vector<TypeRef> all_interfaces_of(const TypeRef & type) const;

  /**
   * Check whether `type` can be referenced from code declared inside `origin`.
   *
   * Accessibility is checked for the declaration and every containing
   * declaration.
   */
  [[nodiscard]] bool is_visible_from(const TypeDecl & origin, const TypeDecl & type) const;

private:
  friend class GraphBuilder;

  std::vector<std::unique_ptr<Module>> modules_;
  std::vector<std::unique_ptr<Namespace>> namespaces_;
  std::vector<std::unique_ptr<TypeDecl>> decls_;
  TypeTable table_;
};

}  // namespace typescan
