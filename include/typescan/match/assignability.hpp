// typescan/match/assignability.hpp - Assignability and generalizations
//
#pragma once

#include <vector>

#include "typescan/graph/type.hpp"
#include "typescan/graph/type_graph.hpp"

namespace typescan
{

struct AssignabilityResult
{
  bool assignable = false;

  /// Closed instantiations of the target found in the candidate's ancestry,
  /// deduplicated, in first-seen order
  std::vector<TypeRef> generalizations;

  explicit operator bool() const noexcept { return assignable; }
};

/**
 * Decide whether `candidate` is assignable to `target`.
 *
 * - Identity: equal references, or a generic type against its own open
 *   definition; the candidate is the single generalization.
 * - Open interface definition: every interface of the flattened set with the
 *   same definition is a generalization.
 * - Open class definition: the first ancestor with the same definition.
 * - Closed interface: present in the flattened set; the target itself.
 * - Closed class: some ancestor is equal to the target.
 *
 * Neither reference is required to be closed; type-parameter and handler
 * parameter references are never assignable.
 */
[[nodiscard]] AssignabilityResult is_assignable(
  const TypeGraph & graph, const TypeRef & candidate, const TypeRef & target);

}  // namespace typescan
