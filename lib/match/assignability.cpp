// typescan/match/assignability.cpp - Assignability resolver
//
#include "typescan/match/assignability.hpp"

#include "typescan/graph/type_utils.hpp"

namespace typescan
{

namespace
{

AssignabilityResult matched(std::vector<TypeRef> generalizations)
{
  AssignabilityResult result;
  result.assignable = !generalizations.empty();
  result.generalizations = std::move(generalizations);
  return result;
}

}  // namespace

AssignabilityResult is_assignable(
  const TypeGraph & graph, const TypeRef & candidate, const TypeRef & target)
{
  if (!candidate.is_named() || !target.is_named() || !candidate.decl || !target.decl) {
    return {};
  }

  // Identity; only the declaration's own type stands for its open definition
  if (
    candidate == target ||
    (target.is_open_definition() && candidate.is_self_type() && same_definition(candidate, target))) {
    return matched({candidate});
  }

  const bool open = target.is_open_definition();

  if (target.decl->is_interface()) {
    std::vector<TypeRef> generalizations;
    for (auto & iface : graph.all_interfaces_of(candidate)) {
      if (open ? same_definition(iface, target) : iface == target) {
        append_unique(generalizations, std::move(iface));
      }
    }
    return matched(std::move(generalizations));
  }

  // Class-kind target: walk the base chain (the candidate itself is not an ancestor)
  for (auto base = graph.base_of(candidate); base; base = graph.base_of(*base)) {
    if (open ? same_definition(*base, target) : *base == target) {
      return matched({*base});
    }
  }
  return {};
}

}  // namespace typescan
