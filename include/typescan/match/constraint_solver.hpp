// typescan/match/constraint_solver.hpp - Handler generic constraint solving
//
// Given a candidate type and a handler signature, the solver binds the first
// handler parameter to the candidate and derives every other parameter by
// aligning constraint types against the candidate's generalizations:
//
//   void Register<THandler, TCommand>()
//     where THandler : class, ICommandHandler<TCommand>
//     where TCommand : ICommand
//
// For `CreateUserHandler : ICommandHandler<CreateUser>` this yields
// {THandler = CreateUserHandler, TCommand = CreateUser}, provided CreateUser
// implements ICommand. A candidate implementing the constraint interface
// several times yields one binding per consistent alternative.
//
#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "typescan/graph/type_graph.hpp"
#include "typescan/match/query.hpp"

namespace typescan
{

class ConstraintSolver
{
public:
  explicit ConstraintSolver(const TypeGraph & graph) : graph_(graph) {}

  /**
   * Enumerate the bindings of `signature` admitted by `candidate`.
   *
   * @param candidate Type bound to the first handler parameter
   * @param signature Handler parameters and their constraints
   * @param seed Generalization the first parameter's constraint on the same
   *        generic definition is aligned against (all generalizations if
   *        absent)
   * @return Distinct, fully bound bindings in generalization order; empty if
   *         the constraints cannot be satisfied
   */
  [[nodiscard]] std::vector<Binding> solve(
    const TypeRef & candidate, const HandlerSignature & signature,
    const std::optional<TypeRef> & seed = std::nullopt) const;

private:
  /// One partial solution
  struct Frame
  {
    std::vector<std::optional<TypeRef>> bound;
    /// Parameters already entered; a revisit succeeds without re-validation
    std::vector<bool> visited;

    /// Naked parameter constraints (`where T : U`) checked once U is bound
    std::vector<std::pair<TypeRef, uint32_t>> deferred;
  };
  using Frames = std::vector<Frame>;

  struct Context
  {
    const HandlerSignature & signature;
    const TypeRef * seed;
  };

  Frames satisfies(const TypeRef & type, uint32_t ordinal, Frame frame, const Context & ctx) const;

  Frames satisfies_constraint(
    const TypeRef & type, uint32_t ordinal, const TypeRef & constraint, Frame frame,
    const Context & ctx) const;

  Frames align(const TypeRef & pattern, const TypeRef & actual, Frame frame, const Context & ctx) const;

  [[nodiscard]] bool passes_flags(const TypeRef & type, const GenericParameter & param) const;

  const TypeGraph & graph_;
};

}  // namespace typescan
