// typescan/test_support/graph_helpers.hpp - helpers for unit/integration tests
//
// Load a graph from an inline JSON document, build queries from inline YAML
// and evaluate them, keeping diagnostics around for assertions.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "typescan/basic/diagnostic.hpp"
#include "typescan/graph/graph_loader.hpp"
#include "typescan/graph/type_graph.hpp"
#include "typescan/graph/type_utils.hpp"
#include "typescan/match/query_engine.hpp"
#include "typescan/project/query_builder.hpp"
#include "typescan/project/scan_config.hpp"

namespace typescan::test_support
{

[[nodiscard]] inline GraphLoadResult load_graph(
  std::string_view json, const GraphOptions & options = {})
{
  return load_graph_string(json, "<test>.json", options);
}

/// Named reference to `qualified_name` with `args` (open definition if args is empty)
[[nodiscard]] inline TypeRef named(
  const TypeGraph & graph, std::string_view qualified_name, std::vector<TypeRef> args = {})
{
  return TypeRef::named(graph.find_type(qualified_name, args.size()), std::move(args));
}

[[nodiscard]] inline TypeRef open_definition(
  const TypeGraph & graph, std::string_view qualified_name, size_t arity)
{
  return TypeRef::named(graph.find_type(qualified_name, arity));
}

struct TestQueries
{
  ScanConfig config;
  std::vector<Query> queries;
  DiagnosticBag diags;
  bool config_loaded = false;

  [[nodiscard]] const Query * find(std::string_view name) const
  {
    for (const auto & q : queries) {
      if (q.name == name) return &q;
    }
    return nullptr;
  }
};

/// Parse a typescan.yaml document and build its queries against `graph`
[[nodiscard]] inline TestQueries build_queries(const TypeGraph & graph, std::string_view yaml)
{
  TestQueries out;
  auto loaded = load_scan_config_string(yaml, "<test>.yaml");
  out.diags.merge(std::move(loaded.diagnostics));
  if (!loaded.success) return out;

  out.config_loaded = true;
  out.config = std::move(loaded.config);

  QueryBuilder builder(graph, out.diags, out.config.usings);
  out.queries = builder.build_all(out.config.queries);
  return out;
}

[[nodiscard]] inline std::vector<MatchRecord> run(const TypeGraph & graph, const Query & query)
{
  const QueryEngine engine(graph);
  MatchStream stream = engine.evaluate(query);
  return collect(stream);
}

/// Display names of the matched types, in record order
[[nodiscard]] inline std::vector<std::string> type_names(const std::vector<MatchRecord> & records)
{
  std::vector<std::string> names;
  names.reserve(records.size());
  for (const auto & r : records) {
    names.push_back(r.type->display_name());
  }
  return names;
}

/// Bindings rendered as "A, B" per record (empty string without a binding)
[[nodiscard]] inline std::vector<std::string> binding_strings(
  const std::vector<MatchRecord> & records)
{
  std::vector<std::string> out;
  out.reserve(records.size());
  for (const auto & r : records) {
    out.push_back(r.binding ? to_string(r.binding->arguments) : std::string());
  }
  return out;
}

/// Directory removed with its contents at scope exit
struct TempDir
{
  std::filesystem::path path;

  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace typescan::test_support
