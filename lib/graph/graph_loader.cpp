// typescan/graph/graph_loader.cpp - JSON type graph reader
//
#include "typescan/graph/graph_loader.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace typescan
{

namespace
{

using nlohmann::json;

class GraphReader
{
public:
  GraphReader(DiagnosticBag & diags, std::string file, GraphOptions options)
  : diags_(diags), file_(std::move(file)), builder_(diags, options)
  {
  }

  std::optional<TypeGraph> read(const json & root)
  {
    const SourceLocation root_loc = SourceLocation::at(file_, "");
    if (!root.is_object()) {
      schema_error(root_loc, "graph document must be an object");
      return std::nullopt;
    }

    const auto modules = root.find("modules");
    if (modules == root.end() || !modules->is_array()) {
      schema_error(root_loc, "graph document needs a 'modules' array");
      return std::nullopt;
    }

    for (size_t i = 0; i < modules->size(); ++i) {
      read_module((*modules)[i], root_loc.child("modules").child(i));
    }

    // Still resolve after schema errors so unresolved names are reported too
    auto graph = builder_.finish();
    if (diags_.has_errors()) return std::nullopt;
    return graph;
  }

private:
  void read_module(const json & node, const SourceLocation & loc)
  {
    if (!node.is_object()) {
      schema_error(loc, "module entry must be an object");
      return;
    }

    auto name = required_string(node, "name", loc);
    if (!name) return;

    Module * module = builder_.add_module(*name, loc.child("name"));
    if (!module) return;

    for (const auto & ref : string_list(node, "references", loc)) {
      builder_.add_reference(module, ref.first, ref.second);
    }

    if (auto it = node.find("namespaces"); it != node.end()) {
      if (!it->is_array()) {
        schema_error(loc.child("namespaces"), "'namespaces' must be an array");
      } else {
        for (size_t i = 0; i < it->size(); ++i) {
          read_namespace(module, nullptr, (*it)[i], loc.child("namespaces").child(i));
        }
      }
    }

    read_types(module, module->global_namespace, nullptr, node, loc);
  }

  void read_namespace(Module * module, Namespace * parent, const json & node, const SourceLocation & loc)
  {
    if (!node.is_object()) {
      schema_error(loc, "namespace entry must be an object");
      return;
    }

    auto name = required_string(node, "name", loc);
    if (!name) return;

    Namespace * ns = builder_.add_namespace(module, parent, *name);

    if (auto it = node.find("namespaces"); it != node.end()) {
      if (!it->is_array()) {
        schema_error(loc.child("namespaces"), "'namespaces' must be an array");
      } else {
        for (size_t i = 0; i < it->size(); ++i) {
          read_namespace(module, ns, (*it)[i], loc.child("namespaces").child(i));
        }
      }
    }

    read_types(module, ns, nullptr, node, loc);
  }

  /// Read the "types" (or "nested") array of `owner`
  void read_types(
    Module * module, Namespace * ns, TypeDecl * container, const json & owner,
    const SourceLocation & owner_loc)
  {
    const char * key = container ? "nested" : "types";
    const auto it = owner.find(key);
    if (it == owner.end()) return;

    const SourceLocation list_loc = owner_loc.child(key);
    if (!it->is_array()) {
      schema_error(list_loc, std::string("'") + key + "' must be an array");
      return;
    }

    for (size_t i = 0; i < it->size(); ++i) {
      const json & node = (*it)[i];
      const SourceLocation loc = list_loc.child(i);

      auto spec = read_type_spec(node, loc, container != nullptr);
      if (!spec) continue;

      TypeDecl * decl = container ? builder_.declare_nested(container, std::move(*spec))
                                  : builder_.declare_type(module, ns, std::move(*spec));
      if (decl) read_types(module, ns, decl, node, loc);
    }
  }

  std::optional<TypeSpec> read_type_spec(const json & node, const SourceLocation & loc, bool nested)
  {
    if (!node.is_object()) {
      schema_error(loc, "type entry must be an object");
      return std::nullopt;
    }

    TypeSpec spec;
    spec.location = loc;

    auto name = required_string(node, "name", loc);
    if (!name) return std::nullopt;
    spec.name = *name;

    if (auto kind = optional_string(node, "kind", loc)) {
      auto parsed = parse_type_kind(*kind);
      if (!parsed) {
        diags_.report_error(loc.child("kind"), "unknown type kind '" + *kind + "'")
          .with_code("G010")
          .with_help("expected one of: class, interface, struct, enum, delegate");
        return std::nullopt;
      }
      spec.kind = *parsed;
    }

    spec.accessibility = nested ? Accessibility::Private : Accessibility::Public;
    if (auto access = optional_string(node, "accessibility", loc)) {
      auto parsed = parse_accessibility(*access);
      if (!parsed) {
        diags_.report_error(loc.child("accessibility"), "unknown accessibility '" + *access + "'")
          .with_code("G010");
        return std::nullopt;
      }
      spec.accessibility = *parsed;
    }

    spec.is_abstract = optional_bool(node, "abstract", loc);
    spec.is_static = optional_bool(node, "static", loc);
    spec.is_sealed = optional_bool(node, "sealed", loc);
    spec.is_unmanaged = optional_bool(node, "unmanaged", loc);

    for (auto & param : string_list(node, "type_parameters", loc)) {
      spec.type_parameters.push_back(std::move(param.first));
    }

    spec.base = optional_string(node, "base", loc);

    for (auto & iface : string_list(node, "interfaces", loc)) {
      spec.interfaces.push_back(std::move(iface.first));
    }
    for (auto & attr : string_list(node, "attributes", loc)) {
      spec.attributes.push_back(std::move(attr.first));
    }

    read_constructors(node, loc, spec);
    return spec;
  }

  void read_constructors(const json & node, const SourceLocation & loc, TypeSpec & spec)
  {
    const auto it = node.find("constructors");
    if (it == node.end()) return;

    const SourceLocation list_loc = loc.child("constructors");
    if (!it->is_array()) {
      schema_error(list_loc, "'constructors' must be an array");
      return;
    }

    for (size_t i = 0; i < it->size(); ++i) {
      const json & c = (*it)[i];
      const SourceLocation ctor_loc = list_loc.child(i);
      if (!c.is_object()) {
        schema_error(ctor_loc, "constructor entry must be an object");
        continue;
      }

      Constructor ctor;
      if (auto access = optional_string(c, "accessibility", ctor_loc)) {
        auto parsed = parse_accessibility(*access);
        if (!parsed) {
          diags_
            .report_error(ctor_loc.child("accessibility"), "unknown accessibility '" + *access + "'")
            .with_code("G010");
          continue;
        }
        ctor.accessibility = *parsed;
      }

      if (auto p = c.find("parameters"); p != c.end()) {
        if (!p->is_number_unsigned()) {
          schema_error(ctor_loc.child("parameters"), "'parameters' must be a non-negative integer");
          continue;
        }
        ctor.parameter_count = p->get<uint32_t>();
      }

      ctor.is_static = optional_bool(c, "static", ctor_loc);
      spec.constructors.push_back(ctor);
    }
  }

  // ===========================================================================
  // Field helpers
  // ===========================================================================

  std::optional<std::string> required_string(
    const json & node, const char * key, const SourceLocation & loc)
  {
    const auto it = node.find(key);
    if (it == node.end()) {
      schema_error(loc, std::string("missing required field '") + key + "'");
      return std::nullopt;
    }
    if (!it->is_string() || it->get_ref<const std::string &>().empty()) {
      schema_error(loc.child(key), std::string("'") + key + "' must be a non-empty string");
      return std::nullopt;
    }
    return it->get<std::string>();
  }

  std::optional<std::string> optional_string(
    const json & node, const char * key, const SourceLocation & loc)
  {
    const auto it = node.find(key);
    if (it == node.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
      schema_error(loc.child(key), std::string("'") + key + "' must be a string");
      return std::nullopt;
    }
    return it->get<std::string>();
  }

  bool optional_bool(const json & node, const char * key, const SourceLocation & loc)
  {
    const auto it = node.find(key);
    if (it == node.end()) return false;
    if (!it->is_boolean()) {
      schema_error(loc.child(key), std::string("'") + key + "' must be a boolean");
      return false;
    }
    return it->get<bool>();
  }

  /// String array entries with their locations
  std::vector<std::pair<std::string, SourceLocation>> string_list(
    const json & node, const char * key, const SourceLocation & loc)
  {
    std::vector<std::pair<std::string, SourceLocation>> out;
    const auto it = node.find(key);
    if (it == node.end()) return out;

    const SourceLocation list_loc = loc.child(key);
    if (!it->is_array()) {
      schema_error(list_loc, std::string("'") + key + "' must be an array of strings");
      return out;
    }
    for (size_t i = 0; i < it->size(); ++i) {
      const json & entry = (*it)[i];
      if (!entry.is_string()) {
        schema_error(list_loc.child(i), std::string("'") + key + "' entries must be strings");
        continue;
      }
      out.emplace_back(entry.get<std::string>(), list_loc.child(i));
    }
    return out;
  }

  void schema_error(const SourceLocation & loc, std::string message)
  {
    diags_.report_error(loc, std::move(message)).with_code("G010");
  }

  DiagnosticBag & diags_;
  std::string file_;
  GraphBuilder builder_;
};

}  // namespace

GraphLoadResult load_graph_string(std::string_view text, std::string file_label, GraphOptions options)
{
  GraphLoadResult result;

  json root;
  try {
    root = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    result.diagnostics
      .report_error(SourceLocation::in_file(file_label), "failed to parse JSON: " + std::string(e.what()))
      .with_code("G000");
    return result;
  }

  GraphReader reader(result.diagnostics, std::move(file_label), options);
  result.graph = reader.read(root);
  return result;
}

GraphLoadResult load_graph_file(const std::filesystem::path & path, GraphOptions options)
{
  std::ifstream in(path);
  if (!in) {
    GraphLoadResult result;
    result.diagnostics
      .report_error(SourceLocation::in_file(path.string()), "cannot open graph file: " + path.string())
      .with_code("G000");
    return result;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return load_graph_string(buffer.str(), path.string(), options);
}

std::optional<TypeKind> parse_type_kind(std::string_view text)
{
  if (text == "class") return TypeKind::Class;
  if (text == "interface") return TypeKind::Interface;
  if (text == "struct") return TypeKind::Struct;
  if (text == "enum") return TypeKind::Enum;
  if (text == "delegate") return TypeKind::Delegate;
  return std::nullopt;
}

std::optional<Accessibility> parse_accessibility(std::string_view text)
{
  if (text == "public") return Accessibility::Public;
  if (text == "internal") return Accessibility::Internal;
  if (text == "protected") return Accessibility::Protected;
  if (text == "protected internal") return Accessibility::ProtectedInternal;
  if (text == "private protected") return Accessibility::PrivateProtected;
  if (text == "private") return Accessibility::Private;
  return std::nullopt;
}

}  // namespace typescan
