// typescan/match/constraint_solver.cpp - Constraint solver implementation
//
#include "typescan/match/constraint_solver.hpp"

#include <algorithm>

#include "typescan/graph/type_utils.hpp"
#include "typescan/match/assignability.hpp"

namespace typescan
{

std::vector<Binding> ConstraintSolver::solve(
  const TypeRef & candidate, const HandlerSignature & signature,
  const std::optional<TypeRef> & seed) const
{
  std::vector<Binding> bindings;
  const size_t count = signature.parameters.size();
  if (count == 0) {
    bindings.emplace_back();
    return bindings;
  }

  Frame initial;
  initial.bound.resize(count);
  initial.visited.resize(count, false);

  const Context ctx{signature, seed ? &*seed : nullptr};

  for (auto & frame : satisfies(candidate, 0, std::move(initial), ctx)) {
    // Every parameter must have been derived
    if (std::any_of(frame.bound.begin(), frame.bound.end(), [](const auto & b) { return !b; })) {
      continue;
    }

    const bool deferred_ok =
      std::all_of(frame.deferred.begin(), frame.deferred.end(), [&](const auto & d) {
        return is_assignable(graph_, d.first, *frame.bound[d.second]).assignable;
      });
    if (!deferred_ok) continue;

    Binding binding;
    binding.arguments.reserve(count);
    for (auto & b : frame.bound) {
      binding.arguments.push_back(std::move(*b));
    }
    if (std::find(bindings.begin(), bindings.end(), binding) == bindings.end()) {
      bindings.push_back(std::move(binding));
    }
  }
  return bindings;
}

ConstraintSolver::Frames ConstraintSolver::satisfies(
  const TypeRef & type, uint32_t ordinal, Frame frame, const Context & ctx) const
{
  if (ordinal >= frame.bound.size()) return {};

  // Already in progress or done: satisfied, first binding wins
  if (frame.visited[ordinal]) return {std::move(frame)};

  const GenericParameter & param = ctx.signature.parameters[ordinal];
  if (!passes_flags(type, param)) return {};

  frame.visited[ordinal] = true;
  frame.bound[ordinal] = type;

  Frames frames;
  frames.push_back(std::move(frame));

  for (const auto & constraint : param.constraint_types) {
    Frames next;
    for (auto & f : frames) {
      for (auto & extended : satisfies_constraint(type, ordinal, constraint, std::move(f), ctx)) {
        next.push_back(std::move(extended));
      }
    }
    frames = std::move(next);
    if (frames.empty()) break;
  }
  return frames;
}

ConstraintSolver::Frames ConstraintSolver::satisfies_constraint(
  const TypeRef & type, uint32_t ordinal, const TypeRef & constraint, Frame frame,
  const Context & ctx) const
{
  if (!constraint.contains_handler_parameters()) {
    if (is_assignable(graph_, type, constraint).assignable) return {std::move(frame)};
    return {};
  }

  // `where T : U`
  if (constraint.is_handler_parameter()) {
    const uint32_t other = constraint.ordinal;
    if (other >= frame.bound.size()) return {};
    if (frame.bound[other]) {
      if (is_assignable(graph_, type, *frame.bound[other]).assignable) return {std::move(frame)};
      return {};
    }
    frame.deferred.emplace_back(type, other);
    return {std::move(frame)};
  }

  auto assignable = is_assignable(graph_, type, constraint.definition());
  if (!assignable) return {};

  std::vector<TypeRef> generalizations = std::move(assignable.generalizations);
  if (ordinal == 0 && ctx.seed && same_definition(*ctx.seed, constraint)) {
    if (!contains_type(generalizations, *ctx.seed)) return {};
    generalizations = {*ctx.seed};
  }

  // Each generalization is an independent alternative
  Frames frames;
  for (const auto & generalization : generalizations) {
    for (auto & aligned : align(constraint, generalization, frame, ctx)) {
      frames.push_back(std::move(aligned));
    }
  }
  return frames;
}

ConstraintSolver::Frames ConstraintSolver::align(
  const TypeRef & pattern, const TypeRef & actual, Frame frame, const Context & ctx) const
{
  if (!actual.is_named()) return {};

  if (pattern.is_handler_parameter()) {
    return satisfies(actual, pattern.ordinal, std::move(frame), ctx);
  }

  if (!pattern.contains_handler_parameters()) {
    if (pattern == actual) return {std::move(frame)};
    return {};
  }

  if (!same_definition(pattern, actual) || pattern.args.size() != actual.args.size()) return {};

  Frames frames;
  frames.push_back(std::move(frame));
  for (size_t i = 0; i < pattern.args.size(); ++i) {
    Frames next;
    for (auto & f : frames) {
      for (auto & aligned : align(pattern.args[i], actual.args[i], std::move(f), ctx)) {
        next.push_back(std::move(aligned));
      }
    }
    frames = std::move(next);
    if (frames.empty()) break;
  }
  return frames;
}

bool ConstraintSolver::passes_flags(const TypeRef & type, const GenericParameter & param) const
{
  if (param.reference_type && is_value_type(type)) return false;
  if (param.value_type && !is_value_type(type)) return false;
  if (param.unmanaged && !is_unmanaged(type)) return false;
  if (param.default_constructor && !has_public_parameterless_constructor(type)) return false;
  return true;
}

}  // namespace typescan
