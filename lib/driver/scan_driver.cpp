// typescan/driver/scan_driver.cpp - Scan driver implementation
//
#include "typescan/driver/scan_driver.hpp"

#include <fstream>
#include <iostream>

#include "typescan/graph/graph_loader.hpp"
#include "typescan/match/query_engine.hpp"
#include "typescan/project/query_builder.hpp"

namespace typescan
{

ScanResult ScanDriver::run(const ScanConfig & config, const ScanOptions & options)
{
  ScanResult result;

  namespace fs = std::filesystem;

  // Determine graph file
  std::optional<fs::path> graph_path = options.graph_path;
  if (!graph_path) graph_path = config.graph_path();
  if (!graph_path) {
    result.diagnostics
      .report_error(
        SourceLocation::in_file((config.project_root / k_scan_config_file_name).string()),
        "no type graph configured")
      .with_code("C006")
      .with_help("set 'graph' in the configuration or pass --graph <file>");
    return result;
  }

  if (options.verbose) {
    std::cerr << "Loading graph: " << graph_path->string() << "\n";
  }

  auto loaded = load_graph_file(*graph_path);
  result.diagnostics.merge(std::move(loaded.diagnostics));
  if (!loaded.graph) {
    return result;
  }
  result.graph = std::move(loaded.graph);
  const TypeGraph & graph = *result.graph;

  if (options.verbose) {
    std::cerr << "Loaded " << graph.module_count() << " module(s), " << graph.type_count()
              << " type(s)\n";
  }

  // Build queries; failing ones are reported and skipped
  QueryBuilder builder(graph, result.diagnostics, config.usings);
  std::vector<Query> queries = builder.build_all(config.queries);

  if (options.mode == ScanMode::Check) {
    if (options.verbose) {
      std::cerr << "Checked " << config.queries.size() << " query(ies)\n";
    }
    result.success = !result.diagnostics.has_errors();
    return result;
  }

  // Evaluate
  const QueryEngine engine(graph);
  for (const auto & query : queries) {
    QueryResult query_result;
    query_result.name = query.name;
    if (query.handler) {
      query_result.parameter_names = query.handler->parameter_names();
    }

    MatchStream stream = engine.evaluate(query);
    query_result.matches = collect(stream);

    if (options.verbose) {
      std::cerr << "Evaluating query '" << query.name << "': " << query_result.matches.size()
                << " match(es)\n";
    }
    result.results.push_back(std::move(query_result));
  }

  // Render
  const OutputFormat format = options.format.value_or(config.output.format);
  result.output = format_results(result.results, format);

  std::optional<fs::path> output_path = options.output_path;
  if (!output_path && config.output.path) {
    output_path = config.output.path->is_absolute() ? *config.output.path
                                                    : config.project_root / *config.output.path;
  }
  if (output_path) {
    if (write_output(*output_path, result.output, result.diagnostics)) {
      result.written_file = *output_path;
      if (options.verbose) {
        std::cerr << "Wrote " << output_path->string() << "\n";
      }
    }
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

bool ScanDriver::write_output(
  const std::filesystem::path & path, const std::string & text, DiagnosticBag & diags)
{
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      diags.report_error(
        SourceLocation::in_file(path.string()),
        "failed to create output directory: " + path.parent_path().string() + " (" +
          ec.message() + ")");
      return false;
    }
  }

  std::ofstream out(path);
  if (!out.is_open()) {
    diags.report_error(SourceLocation::in_file(path.string()), "failed to open output file: " + path.string());
    return false;
  }

  out << text;
  return true;
}

}  // namespace typescan
