// typescan/match/type_scanner.hpp - Candidate enumeration over selected modules
//
#pragma once

#include <cstddef>
#include <vector>

#include "typescan/graph/type_graph.hpp"
#include "typescan/match/query.hpp"

namespace typescan
{

/**
 * Modules a query scans, first rule that applies wins:
 *
 * 1. `assembly_of_type` set: the module declaring that type.
 * 2. `assembly_name_filter` set: the declaring module and its reference
 *    closure, filtered by the pattern (closure order).
 * 3. Otherwise the module declaring the query.
 */
[[nodiscard]] std::vector<const Module *> select_modules(const TypeGraph & graph, const Query & query);

/**
 * Lazy depth-first walk over the declarations of a list of modules.
 *
 * Namespaces and types are visited in declaration order; every type is
 * yielded before the types nested in it. Forward-only.
 */
class ModuleTypeCursor
{
public:
  explicit ModuleTypeCursor(std::vector<const Module *> modules);

  /// Next declaration, nullptr when exhausted
  const TypeDecl * next();

private:
  struct Level
  {
    const Namespace * ns = nullptr;
    const TypeDecl * type = nullptr;
    size_t index = 0;
  };

  std::vector<const Module *> modules_;
  size_t module_index_ = 0;
  std::vector<Level> stack_;
};

/// Every declaration of a module in scanner order
[[nodiscard]] std::vector<const TypeDecl *> types_of(const Module & module);

}  // namespace typescan
