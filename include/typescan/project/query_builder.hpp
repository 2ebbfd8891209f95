// typescan/project/query_builder.hpp - Build Query values from configuration
//
// Resolves every type name of a QueryConfig against the loaded graph. Names
// are looked up from the declaring type outwards (its type parameters, its
// containers, its namespace chain), then in the configured `usings`, then
// globally. A query whose names cannot all be resolved is not built.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "typescan/basic/diagnostic.hpp"
#include "typescan/graph/type_graph.hpp"
#include "typescan/graph/type_resolver.hpp"
#include "typescan/match/query.hpp"
#include "typescan/project/scan_config.hpp"

namespace typescan
{

class QueryBuilder
{
public:
  QueryBuilder(const TypeGraph & graph, DiagnosticBag & diags, std::vector<std::string> usings = {});

  /**
   * Build one query.
   *
   * @return The query, or nullopt after reporting `Q0xx`/`T0xx` diagnostics
   */
  [[nodiscard]] std::optional<Query> build(const QueryConfig & config) const;

  /**
   * Build every query of a configuration, skipping the ones that fail.
   */
  [[nodiscard]] std::vector<Query> build_all(const std::vector<QueryConfig> & configs) const;

private:
  [[nodiscard]] std::optional<TypeRef> resolve_type(
    const std::string & text, const ResolveScope & scope, const SourceLocation & location) const;

  [[nodiscard]] std::optional<TypeRef> resolve_target(
    const std::string & text, const std::optional<std::vector<std::string>> & generic_arguments,
    const ResolveScope & scope, const SourceLocation & location) const;

  [[nodiscard]] std::optional<HandlerSignature> build_handler(
    const HandlerConfig & config, const ResolveScope & scope) const;

  void report_resolution(const TypeResolution & resolution, const SourceLocation & location) const;

  DiagnosticBag & diags_;
  std::vector<std::string> usings_;
  TypeResolver resolver_;
};

}  // namespace typescan
