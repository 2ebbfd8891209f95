// typescan/graph/graph_loader.hpp - Load a TypeGraph from its JSON description
//
// Example:
//
//   {
//     "modules": [
//       {
//         "name": "App",
//         "references": ["App.Contracts"],
//         "namespaces": [
//           {
//             "name": "App.Handlers",
//             "types": [
//               { "name": "CreateUserHandler", "kind": "class",
//                 "interfaces": ["ICommandHandler<CreateUser>"] }
//             ]
//           }
//         ]
//       }
//     ]
//   }
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "typescan/basic/diagnostic.hpp"
#include "typescan/graph/graph_builder.hpp"
#include "typescan/graph/type_graph.hpp"

namespace typescan
{

/**
 * Result of loading a type graph.
 */
struct GraphLoadResult
{
  /// Loaded graph (only set if loading succeeded)
  std::optional<TypeGraph> graph;

  /// Everything reported while reading and building the graph
  DiagnosticBag diagnostics;

  [[nodiscard]] bool success() const noexcept { return graph.has_value(); }
};

/**
 * Load a graph from a JSON file.
 */
[[nodiscard]] GraphLoadResult load_graph_file(
  const std::filesystem::path & path, GraphOptions options = {});

/**
 * Load a graph from JSON text.
 *
 * @param json JSON document
 * @param file_label Name used in diagnostics
 */
[[nodiscard]] GraphLoadResult load_graph_string(
  std::string_view json, std::string file_label = "<input>", GraphOptions options = {});

/// Parse a `kind` value ("class", "interface", "struct", "enum", "delegate")
[[nodiscard]] std::optional<TypeKind> parse_type_kind(std::string_view text);

/// Parse an `accessibility` value ("public", "protected internal", ...)
[[nodiscard]] std::optional<Accessibility> parse_accessibility(std::string_view text);

}  // namespace typescan
