// typescan/project/scan_config.hpp - Scan configuration (typescan.yaml)
//
// Parses and validates typescan.yaml files. Type names are kept as written;
// they are resolved against the loaded graph by the QueryBuilder.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "typescan/basic/diagnostic.hpp"
#include "typescan/match/query.hpp"

namespace typescan
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * One generic parameter of a handler signature.
 */
struct HandlerParameterConfig
{
  std::string name;

  /// `class`, `struct`, `unmanaged`, `new()` or a type expression
  std::vector<std::string> constraints;

  SourceLocation location;
};

struct HandlerConfig
{
  std::string name;
  HandlerKind kind = HandlerKind::GenericMethod;
  std::vector<HandlerParameterConfig> type_parameters;
  SourceLocation location;
};

/**
 * One query, as written in the configuration.
 */
struct QueryConfig
{
  std::string name;

  /// Type the query is declared on
  std::string declared_in;

  std::optional<std::string> assembly_of_type;
  std::optional<std::string> assembly_name_filter;

  std::optional<std::string> assignable_to;
  std::optional<std::vector<std::string>> assignable_to_generic_arguments;

  std::optional<std::string> exclude_assignable_to;
  std::optional<std::vector<std::string>> exclude_assignable_to_generic_arguments;

  std::optional<std::string> attribute_filter;
  std::optional<std::string> exclude_by_attribute;

  std::optional<std::string> type_name_filter;
  std::optional<std::string> exclude_by_type_name;

  std::optional<HandlerConfig> handler;

  /// Location of the query entry; fields are addressed with child()
  SourceLocation location;
};

enum class OutputFormat : uint8_t {
  Text,
  Json,
};

struct OutputConfig
{
  OutputFormat format = OutputFormat::Text;

  /// Output file (stdout when absent)
  std::optional<std::filesystem::path> path;
};

/**
 * Complete scan configuration (typescan.yaml).
 */
struct ScanConfig
{
  std::string project_name;

  /// Graph file (relative paths resolved against project_root)
  std::optional<std::filesystem::path> graph;

  OutputConfig output;

  /// Namespaces searched for simple type names in every query
  std::vector<std::string> usings;

  std::vector<QueryConfig> queries;

  /// Directory containing typescan.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Absolute graph path, if configured
  [[nodiscard]] std::optional<std::filesystem::path> graph_path() const
  {
    if (!graph) return std::nullopt;
    return graph->is_absolute() ? *graph : project_root / *graph;
  }
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ScanConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Errors and warnings found while loading
  DiagnosticBag diagnostics;

  static ConfigLoadResult ok(ScanConfig cfg, DiagnosticBag diags = {})
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    r.diagnostics = std::move(diags);
    return r;
  }

  static ConfigLoadResult fail(DiagnosticBag diags)
  {
    ConfigLoadResult r;
    r.diagnostics = std::move(diags);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a scan configuration from a typescan.yaml file.
 */
[[nodiscard]] ConfigLoadResult load_scan_config(const std::filesystem::path & config_path);

/**
 * Load a scan configuration from YAML text.
 *
 * @param yaml YAML document
 * @param file_label Name used in diagnostics
 * @param project_root Directory relative paths are resolved against
 */
[[nodiscard]] ConfigLoadResult load_scan_config_string(
  std::string_view yaml, std::string file_label = "<input>",
  std::filesystem::path project_root = {});

/**
 * Find a scan configuration file by searching upward from a directory.
 *
 * @return Path to typescan.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_scan_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the scan configuration file.
 */
inline constexpr const char * k_scan_config_file_name = "typescan.yaml";

}  // namespace typescan
