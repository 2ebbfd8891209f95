// typescan/driver/scan_driver.hpp - Scan driver
//
// Single entry point for the scan pipeline: load graph, build queries,
// evaluate, render. Used by the CLI and by the integration tests.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "typescan/basic/diagnostic.hpp"
#include "typescan/driver/match_output.hpp"
#include "typescan/graph/type_graph.hpp"
#include "typescan/project/scan_config.hpp"

namespace typescan
{

// ============================================================================
// Scan Mode
// ============================================================================

enum class ScanMode {
  Check,  ///< Load the graph and build the queries only
  Scan,   ///< Evaluate every query and render the matches
};

// ============================================================================
// Scan Options
// ============================================================================

struct ScanOptions
{
  ScanMode mode = ScanMode::Scan;

  /// Graph file (overrides the configuration)
  std::optional<std::filesystem::path> graph_path;

  /// Output format (overrides the configuration)
  std::optional<OutputFormat> format;

  /// Output file (overrides the configuration)
  std::optional<std::filesystem::path> output_path;

  /// Progress messages on stderr
  bool verbose = false;
};

// ============================================================================
// Scan Result
// ============================================================================

struct ScanResult
{
  /// Whether every step succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Loaded graph (match records point into it)
  std::optional<TypeGraph> graph;

  /// One entry per evaluated query, in configuration order
  std::vector<QueryResult> results;

  /// Rendered output (Scan mode)
  std::string output;

  /// File the output was written to, if any
  std::optional<std::filesystem::path> written_file;
};

// ============================================================================
// Scan Driver
// ============================================================================

class ScanDriver
{
public:
  /**
   * Run the pipeline for a loaded configuration.
   *
   * 1. Load the graph
   * 2. Build every query (queries with errors are skipped)
   * 3. Evaluate the queries (Scan mode only)
   * 4. Render and optionally write the output (Scan mode only)
   */
  [[nodiscard]] static ScanResult run(const ScanConfig & config, const ScanOptions & options);

private:
  static bool write_output(
    const std::filesystem::path & path, const std::string & text, DiagnosticBag & diags);
};

}  // namespace typescan
