// typescan/graph/graph_builder.hpp - Two-phase construction of a TypeGraph
//
// Declarations are registered first with their edges still in textual form.
// finish() then resolves every edge against the complete declaration table,
// applies the implicit defaults (core library, default bases, implicit
// constructors), flattens interface sets and hands out the immutable graph.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "typescan/basic/diagnostic.hpp"
#include "typescan/graph/type_graph.hpp"

namespace typescan
{

/// Name of the implicitly registered core library module
inline constexpr const char * k_core_library_name = "System.Runtime";

struct GraphOptions
{
  /// Register the System.Runtime core library unless the input declares it
  bool core_library = true;

  /// Synthesize default constructors for classes and value types
  bool implicit_constructors = true;
};

/**
 * Textual description of one declaration, as read from an input file.
 */
struct TypeSpec
{
  std::string name;
  TypeKind kind = TypeKind::Class;
  Accessibility accessibility = Accessibility::Public;

  bool is_abstract = false;
  bool is_static = false;
  bool is_sealed = false;
  bool is_unmanaged = false;

  std::vector<std::string> type_parameters;

  /// Type expressions, resolved in finish()
  std::optional<std::string> base;
  std::vector<std::string> interfaces;
  std::vector<std::string> attributes;

  std::vector<Constructor> constructors;

  /// Where the declaration came from (for diagnostics)
  SourceLocation location;
};

class GraphBuilder
{
public:
  explicit GraphBuilder(DiagnosticBag & diags, GraphOptions options = {});

  GraphBuilder(const GraphBuilder &) = delete;
  GraphBuilder & operator=(const GraphBuilder &) = delete;

  // ===========================================================================
  // Declaration Phase
  // ===========================================================================

  /**
   * Register a module.
   *
   * @return The module, or nullptr if a module with the same name exists
   */
  Module * add_module(std::string name, SourceLocation location = {});

  /**
   * Record a reference from `from` to the module named `target`.
   *
   * References are resolved in finish(); unknown names are reported there.
   */
  void add_reference(Module * from, std::string target, SourceLocation location = {});

  /**
   * Get or create a child namespace.
   *
   * @param parent Parent namespace (nullptr = the module's global namespace)
   */
  Namespace * add_namespace(Module * module, Namespace * parent, const std::string & name);

  /**
   * Declare a top-level type in a namespace.
   *
   * @return The declaration, or nullptr on a duplicate name/arity
   */
  TypeDecl * declare_type(Module * module, Namespace * ns, TypeSpec spec);

  /**
   * Declare a type nested inside `container`.
   */
  TypeDecl * declare_nested(TypeDecl * container, TypeSpec spec);

  // ===========================================================================
  // Resolution Phase
  // ===========================================================================

  /**
   * Resolve every edge and produce the graph.
   *
   * @return The graph, or nullopt if any error was reported (diagnostics are
   *         in the bag passed to the constructor)
   */
  [[nodiscard]] std::optional<TypeGraph> finish();

private:
  struct PendingType
  {
    TypeDecl * decl = nullptr;
    std::string namespace_name;
    TypeSpec spec;
  };

  struct PendingReference
  {
    Module * from = nullptr;
    std::string target;
    SourceLocation location;
  };

  TypeDecl * declare(
    const Module * module, const std::string & namespace_name, TypeDecl * container,
    TypeSpec spec);

  void add_core_library();
  void resolve_references();
  void resolve_edges(PendingType & pending);
  void apply_default_base(TypeDecl & decl);
  void check_base_cycles();
  void flatten_interfaces();
  void add_implicit_constructors(TypeDecl & decl) const;

  DiagnosticBag & diags_;
  GraphOptions options_;
  TypeGraph graph_;

  std::vector<PendingType> pending_types_;
  std::vector<PendingReference> pending_references_;
  bool finished_ = false;
};

}  // namespace typescan
