// typescan/match/query_engine.hpp - Query evaluation
//
// The engine runs every candidate produced by the scanner through a fixed
// sequence of filters:
//
//   1. class kind, not abstract, nameable; static only for type-method handlers
//   2. no unbound type parameters when a handler signature is present
//   3. required marker attribute      4. excluded marker attribute
//   5. name include pattern           6. name exclude pattern
//   7. exclude-assignable-to target   8. assignable-to target (generalizations)
//   9. handler constraints (one solve per generalization)
//  10. visibility from the query's declaring type
//
// and yields one record per distinct binding (or one record per candidate
// without a handler signature), in scanner order.
//
#pragma once

#include <deque>
#include <optional>
#include <vector>

#include "typescan/graph/type_graph.hpp"
#include "typescan/match/constraint_solver.hpp"
#include "typescan/match/query.hpp"
#include "typescan/match/type_scanner.hpp"
#include "typescan/match/wildcard.hpp"

namespace typescan
{

/**
 * Lazy, forward-only sequence of match records for one query.
 *
 * Holds a copy of the query. The graph reference, the type cursor and the
 * constraint solver all borrow from the graph, which must outlive the stream.
 */
class MatchStream
{
public:
  /// Next record, nullopt once the candidates are exhausted
  std::optional<MatchRecord> next();

private:
  friend class QueryEngine;

  MatchStream(const TypeGraph & graph, Query query);

  /// Filters 1-10 for one candidate; appends its records to pending_
  void evaluate_candidate(const TypeDecl & decl);

  [[nodiscard]] bool passes_structure(const TypeDecl & decl) const;
  [[nodiscard]] bool passes_attributes(const TypeDecl & decl) const;
  [[nodiscard]] bool passes_names(const TypeDecl & decl) const;

  const TypeGraph & graph_;
  Query query_;
  ModuleTypeCursor cursor_;
  ConstraintSolver solver_;

  std::optional<WildcardPattern> name_filter_;
  std::optional<WildcardPattern> exclude_name_filter_;

  std::deque<MatchRecord> pending_;
};

class QueryEngine
{
public:
  explicit QueryEngine(const TypeGraph & graph) : graph_(graph) {}

  /**
   * Start evaluating a query.
   *
   * Nothing is computed until the stream is pulled.
   */
  [[nodiscard]] MatchStream evaluate(const Query & query) const;

private:
  const TypeGraph & graph_;
};

/// Drain a stream into a vector
[[nodiscard]] std::vector<MatchRecord> collect(MatchStream & stream);

}  // namespace typescan
