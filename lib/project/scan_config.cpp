// typescan/project/scan_config.cpp - Scan configuration implementation
//
#include "typescan/project/scan_config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <set>
#include <sstream>

namespace typescan
{

namespace
{

constexpr std::array<const char *, 14> k_query_keys = {
  "name",
  "declared_in",
  "assembly_of_type",
  "assembly_name_filter",
  "assignable_to",
  "assignable_to_generic_arguments",
  "exclude_assignable_to",
  "exclude_assignable_to_generic_arguments",
  "attribute_filter",
  "exclude_by_attribute",
  "type_name_filter",
  "exclude_by_type_name",
  "handler",
  "description",
};

class ConfigReader
{
public:
  ConfigReader(DiagnosticBag & diags, std::string file) : diags_(diags), file_(std::move(file)) {}

  void read(const YAML::Node & root, ScanConfig & config)
  {
    if (!root || root.IsNull()) {
      error(location(root, ""), "C003", "configuration is empty");
      return;
    }
    if (!root.IsMap()) {
      error(location(root, ""), "C003", "configuration must be a map");
      return;
    }

    // Parse 'project' section
    if (const auto project = root["project"]) {
      if (auto name = optional_string(project, "name", "/project")) {
        config.project_name = *name;
      }
    }

    if (auto graph = optional_string(root, "graph", "")) {
      config.graph = *graph;
    }

    // Parse 'output' section
    if (const auto output = root["output"]) {
      if (auto format = optional_string(output, "format", "/output")) {
        if (*format == "text") {
          config.output.format = OutputFormat::Text;
        } else if (*format == "json") {
          config.output.format = OutputFormat::Json;
        } else {
          diags_
            .report_error(
              location(output["format"], "/output/format"),
              "invalid output.format: '" + *format + "'")
            .with_code("C005")
            .with_help("must be 'text' or 'json'");
        }
      }
      if (auto path = optional_string(output, "path", "/output")) {
        config.output.path = *path;
      }
    }

    if (auto usings = optional_string_list(root, "usings", "")) {
      config.usings = std::move(*usings);
    }

    // Parse 'queries' section
    const auto queries = root["queries"];
    if (!queries) {
      diags_.report_warning(location(root, ""), "configuration declares no queries").with_code("C009");
      return;
    }
    if (!queries.IsSequence()) {
      error(location(queries, "/queries"), "C003", "queries must be a list");
      return;
    }

    std::set<std::string> names;
    for (size_t i = 0; i < queries.size(); ++i) {
      auto query = read_query(queries[i], "/queries/" + std::to_string(i));
      if (!query) continue;
      if (!names.insert(query->name).second) {
        error(query->location.child("name"), "C007", "duplicate query name '" + query->name + "'");
        continue;
      }
      config.queries.push_back(std::move(*query));
    }
  }

private:
  std::optional<QueryConfig> read_query(const YAML::Node & node, const std::string & pointer)
  {
    const SourceLocation loc = location(node, pointer);
    if (!node.IsMap()) {
      error(loc, "C003", "query entry must be a map");
      return std::nullopt;
    }

    for (const auto & entry : node) {
      const std::string key = entry.first.Scalar();
      if (std::find_if(k_query_keys.begin(), k_query_keys.end(), [&](const char * k) {
            return key == k;
          }) == k_query_keys.end()) {
        diags_.report_warning(location(entry.first, pointer + "/" + key), "unknown query key '" + key + "'")
          .with_code("C008");
      }
    }

    QueryConfig query;
    query.location = loc;

    auto name = required_string(node, "name", pointer);
    auto declared_in = required_string(node, "declared_in", pointer);
    if (!name || !declared_in) return std::nullopt;
    query.name = *name;
    query.declared_in = *declared_in;

    query.assembly_of_type = optional_string(node, "assembly_of_type", pointer);
    query.assembly_name_filter = optional_string(node, "assembly_name_filter", pointer);
    query.assignable_to = optional_string(node, "assignable_to", pointer);
    query.assignable_to_generic_arguments =
      optional_string_list(node, "assignable_to_generic_arguments", pointer);
    query.exclude_assignable_to = optional_string(node, "exclude_assignable_to", pointer);
    query.exclude_assignable_to_generic_arguments =
      optional_string_list(node, "exclude_assignable_to_generic_arguments", pointer);
    query.attribute_filter = optional_string(node, "attribute_filter", pointer);
    query.exclude_by_attribute = optional_string(node, "exclude_by_attribute", pointer);
    query.type_name_filter = optional_string(node, "type_name_filter", pointer);
    query.exclude_by_type_name = optional_string(node, "exclude_by_type_name", pointer);

    if (const auto handler = node["handler"]) {
      query.handler = read_handler(handler, pointer + "/handler");
      if (!query.handler) return std::nullopt;
    }

    return query;
  }

  std::optional<HandlerConfig> read_handler(const YAML::Node & node, const std::string & pointer)
  {
    HandlerConfig handler;
    handler.location = location(node, pointer);

    // `handler: Register` is shorthand for a parameterless generic method
    if (node.IsScalar()) {
      handler.name = node.Scalar();
      return handler;
    }
    if (!node.IsMap()) {
      error(handler.location, "C003", "handler must be a name or a map");
      return std::nullopt;
    }

    if (auto name = optional_string(node, "name", pointer)) {
      handler.name = *name;
    }

    if (auto kind = optional_string(node, "kind", pointer)) {
      if (*kind == "generic_method") {
        handler.kind = HandlerKind::GenericMethod;
      } else if (*kind == "type_method") {
        handler.kind = HandlerKind::TypeMethod;
      } else {
        diags_
          .report_error(location(node["kind"], pointer + "/kind"), "invalid handler kind '" + *kind + "'")
          .with_code("C005")
          .with_help("must be 'generic_method' or 'type_method'");
        return std::nullopt;
      }
    }

    const auto params = node["type_parameters"];
    if (!params) return handler;
    if (!params.IsSequence()) {
      error(location(params, pointer + "/type_parameters"), "C003", "type_parameters must be a list");
      return std::nullopt;
    }

    for (size_t i = 0; i < params.size(); ++i) {
      const auto param = params[i];
      const std::string param_pointer = pointer + "/type_parameters/" + std::to_string(i);

      HandlerParameterConfig cfg;
      cfg.location = location(param, param_pointer);

      // `- THandler` is a parameter without constraints
      if (param.IsScalar()) {
        cfg.name = param.Scalar();
        handler.type_parameters.push_back(std::move(cfg));
        continue;
      }
      if (!param.IsMap()) {
        error(cfg.location, "C003", "type parameter must be a name or a map");
        return std::nullopt;
      }

      auto name = required_string(param, "name", param_pointer);
      if (!name) return std::nullopt;
      cfg.name = *name;

      if (auto constraints = optional_string_list(param, "constraints", param_pointer)) {
        cfg.constraints = std::move(*constraints);
      }
      handler.type_parameters.push_back(std::move(cfg));
    }

    return handler;
  }

  // ===========================================================================
  // Field helpers
  // ===========================================================================

  std::optional<std::string> required_string(
    const YAML::Node & node, const char * key, const std::string & pointer)
  {
    if (!node[key]) {
      error(location(node, pointer), "C004", std::string("missing required field '") + key + "'");
      return std::nullopt;
    }
    auto value = optional_string(node, key, pointer);
    if (value && value->empty()) {
      error(location(node[key], pointer + "/" + key), "C004", std::string("'") + key + "' must not be empty");
      return std::nullopt;
    }
    return value;
  }

  std::optional<std::string> optional_string(
    const YAML::Node & node, const char * key, const std::string & pointer)
  {
    if (!node.IsMap()) return std::nullopt;
    const auto value = node[key];
    if (!value || value.IsNull()) return std::nullopt;
    if (!value.IsScalar()) {
      error(location(value, pointer + "/" + key), "C002", std::string("'") + key + "' must be a string");
      return std::nullopt;
    }
    return value.Scalar();
  }

  std::optional<std::vector<std::string>> optional_string_list(
    const YAML::Node & node, const char * key, const std::string & pointer)
  {
    if (!node.IsMap()) return std::nullopt;
    const auto value = node[key];
    if (!value || value.IsNull()) return std::nullopt;

    const std::string list_pointer = pointer + "/" + key;
    std::vector<std::string> out;

    // A single scalar is accepted as a one-element list
    if (value.IsScalar()) {
      out.push_back(value.Scalar());
      return out;
    }
    if (!value.IsSequence()) {
      error(location(value, list_pointer), "C002", std::string("'") + key + "' must be a list of strings");
      return std::nullopt;
    }
    for (size_t i = 0; i < value.size(); ++i) {
      if (!value[i].IsScalar()) {
        error(
          location(value[i], list_pointer + "/" + std::to_string(i)), "C002",
          std::string("'") + key + "' entries must be strings");
        continue;
      }
      out.push_back(value[i].Scalar());
    }
    return out;
  }

  SourceLocation location(const YAML::Node & node, const std::string & pointer) const
  {
    SourceLocation loc = SourceLocation::at(file_, pointer);
    if (node) {
      const YAML::Mark mark = node.Mark();
      if (!mark.is_null()) {
        loc.line = static_cast<uint32_t>(mark.line + 1);
        loc.column = static_cast<uint32_t>(mark.column + 1);
      }
    }
    return loc;
  }

  void error(const SourceLocation & loc, const char * code, std::string message)
  {
    diags_.report_error(loc, std::move(message)).with_code(code);
  }

  DiagnosticBag & diags_;
  std::string file_;
};

}  // namespace

ConfigLoadResult load_scan_config_string(
  std::string_view yaml, std::string file_label, std::filesystem::path project_root)
{
  DiagnosticBag diags;

  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml));
  } catch (const YAML::Exception & e) {
    SourceLocation loc = SourceLocation::in_file(file_label);
    if (!e.mark.is_null()) {
      loc.line = static_cast<uint32_t>(e.mark.line + 1);
      loc.column = static_cast<uint32_t>(e.mark.column + 1);
    }
    diags.report_error(loc, "failed to parse YAML: " + e.msg).with_code("C001");
    return ConfigLoadResult::fail(std::move(diags));
  }

  ScanConfig config;
  config.project_root = std::move(project_root);

  ConfigReader reader(diags, std::move(file_label));
  reader.read(root, config);

  if (diags.has_errors()) {
    return ConfigLoadResult::fail(std::move(diags));
  }
  return ConfigLoadResult::ok(std::move(config), std::move(diags));
}

ConfigLoadResult load_scan_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    DiagnosticBag diags;
    diags
      .report_error(
        SourceLocation::in_file(config_path.string()),
        "configuration file not found: " + config_path.string())
      .with_code("C000");
    return ConfigLoadResult::fail(std::move(diags));
  }

  std::ifstream in(config_path);
  if (!in) {
    DiagnosticBag diags;
    diags
      .report_error(
        SourceLocation::in_file(config_path.string()),
        "cannot read configuration file: " + config_path.string())
      .with_code("C000");
    return ConfigLoadResult::fail(std::move(diags));
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  return load_scan_config_string(
    buffer.str(), config_path.string(), fs::absolute(config_path).parent_path());
}

std::optional<std::filesystem::path> find_scan_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_scan_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace typescan
