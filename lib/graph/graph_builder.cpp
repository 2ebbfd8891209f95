// typescan/graph/graph_builder.cpp - TypeGraph construction
//
#include "typescan/graph/graph_builder.hpp"

#include <algorithm>
#include <functional>
#include <unordered_map>
#include <unordered_set>

#include "typescan/graph/type_resolver.hpp"
#include "typescan/graph/type_utils.hpp"

namespace typescan
{

namespace
{

std::string join_name(const std::string & prefix, const std::string & name)
{
  return prefix.empty() ? name : prefix + "." + name;
}

TypeSpec core_type(std::string name, TypeKind kind)
{
  TypeSpec spec;
  spec.name = std::move(name);
  spec.kind = kind;
  return spec;
}

TypeSpec core_primitive(std::string name)
{
  TypeSpec spec = core_type(std::move(name), TypeKind::Struct);
  spec.is_sealed = true;
  spec.is_unmanaged = true;
  return spec;
}

}  // namespace

GraphBuilder::GraphBuilder(DiagnosticBag & diags, GraphOptions options)
: diags_(diags), options_(options)
{
}

// ============================================================================
// Declaration Phase
// ============================================================================

Module * GraphBuilder::add_module(std::string name, SourceLocation location)
{
  if (graph_.find_module(name)) {
    diags_.report_error(location, "duplicate module '" + name + "'", "declared again here")
      .with_code("G001");
    return nullptr;
  }

  auto global = std::make_unique<Namespace>();
  auto module = std::make_unique<Module>();
  module->name = std::move(name);
  module->global_namespace = global.get();

  graph_.namespaces_.push_back(std::move(global));
  graph_.modules_.push_back(std::move(module));
  return graph_.modules_.back().get();
}

void GraphBuilder::add_reference(Module * from, std::string target, SourceLocation location)
{
  if (!from) return;
  pending_references_.push_back(PendingReference{from, std::move(target), std::move(location)});
}

Namespace * GraphBuilder::add_namespace(Module * module, Namespace * parent, const std::string & name)
{
  if (!module) return nullptr;
  Namespace * current = parent ? parent : module->global_namespace;

  // "App.Handlers" declares the chain App -> Handlers
  size_t start = 0;
  while (start <= name.size()) {
    const size_t dot = name.find('.', start);
    const std::string segment =
      name.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
    start = dot == std::string::npos ? name.size() + 1 : dot + 1;
    if (segment.empty()) continue;

    Namespace * child = nullptr;
    for (const auto & member : current->members) {
      const auto * const * ns = std::get_if<const Namespace *>(&member);
      if (ns && (*ns)->name == segment) {
        for (const auto & owned : graph_.namespaces_) {
          if (owned.get() == *ns) child = owned.get();
        }
        break;
      }
    }

    if (!child) {
      auto created = std::make_unique<Namespace>();
      created->name = segment;
      created->qualified_name = join_name(current->qualified_name, segment);
      child = created.get();
      current->members.emplace_back(static_cast<const Namespace *>(child));
      graph_.namespaces_.push_back(std::move(created));
    }
    current = child;
  }
  return current;
}

TypeDecl * GraphBuilder::declare_type(Module * module, Namespace * ns, TypeSpec spec)
{
  if (!module) return nullptr;
  if (!ns) ns = module->global_namespace;

  TypeDecl * decl = declare(module, ns->qualified_name, nullptr, std::move(spec));
  if (decl) ns->members.emplace_back(static_cast<const TypeDecl *>(decl));
  return decl;
}

TypeDecl * GraphBuilder::declare_nested(TypeDecl * container, TypeSpec spec)
{
  if (!container) return nullptr;

  TypeDecl * decl =
    declare(container->module, container->namespace_name(), container, std::move(spec));
  if (decl) container->nested.push_back(decl);
  return decl;
}

TypeDecl * GraphBuilder::declare(
  const Module * module, const std::string & namespace_name, TypeDecl * container, TypeSpec spec)
{
  auto decl = std::make_unique<TypeDecl>();
  decl->name = spec.name;
  decl->qualified_name =
    container ? join_name(container->qualified_name, spec.name) : join_name(namespace_name, spec.name);
  decl->kind = spec.kind;
  decl->accessibility = spec.accessibility;
  decl->is_abstract = spec.is_abstract || spec.kind == TypeKind::Interface;
  decl->is_static = spec.is_static;
  decl->is_sealed = spec.is_sealed || spec.kind == TypeKind::Struct || spec.kind == TypeKind::Enum;
  decl->is_unmanaged = spec.is_unmanaged;
  decl->type_parameters = spec.type_parameters;
  decl->constructors = spec.constructors;
  decl->containing = container;
  decl->module = module;

  if (const TypeDecl * existing = graph_.table_.lookup(decl->qualified_name, decl->arity());
      existing && existing->qualified_name == decl->qualified_name) {
    diags_
      .report_error(
        spec.location, "duplicate type '" + decl->display_name() + "'", "declared again here")
      .with_code("G002")
      .with_note("first declared in module '" + existing->module->name + "'");
    return nullptr;
  }

  TypeDecl * raw = decl.get();
  graph_.decls_.push_back(std::move(decl));
  graph_.table_.define(raw);

  PendingType pending;
  pending.decl = raw;
  pending.namespace_name = namespace_name;
  pending.spec = std::move(spec);
  pending_types_.push_back(std::move(pending));
  return raw;
}

// ============================================================================
// Resolution Phase
// ============================================================================

std::optional<TypeGraph> GraphBuilder::finish()
{
  if (finished_) return std::nullopt;
  finished_ = true;

  if (options_.core_library && !graph_.find_module(k_core_library_name)) {
    add_core_library();
  }
  graph_.table_.register_builtin_aliases();

  resolve_references();
  for (auto & pending : pending_types_) {
    resolve_edges(pending);
  }
  if (diags_.has_errors()) return std::nullopt;

  for (auto & pending : pending_types_) {
    apply_default_base(*pending.decl);
  }

  check_base_cycles();
  if (diags_.has_errors()) return std::nullopt;

  flatten_interfaces();
  if (diags_.has_errors()) return std::nullopt;

  for (auto & pending : pending_types_) {
    add_implicit_constructors(*pending.decl);
  }

  pending_types_.clear();
  pending_references_.clear();
  return std::optional<TypeGraph>(std::move(graph_));
}

void GraphBuilder::add_core_library()
{
  Module * core = add_module(k_core_library_name);
  if (!core) return;
  core->is_core_library = true;
  Namespace * system = add_namespace(core, nullptr, "System");

  declare_type(core, system, core_type("Object", TypeKind::Class));

  TypeSpec value_type = core_type("ValueType", TypeKind::Class);
  value_type.is_abstract = true;
  declare_type(core, system, std::move(value_type));

  TypeSpec enum_type = core_type("Enum", TypeKind::Class);
  enum_type.is_abstract = true;
  enum_type.base = "System.ValueType";
  declare_type(core, system, std::move(enum_type));

  TypeSpec attribute = core_type("Attribute", TypeKind::Class);
  attribute.is_abstract = true;
  declare_type(core, system, std::move(attribute));

  TypeSpec string_type = core_type("String", TypeKind::Class);
  string_type.is_sealed = true;
  string_type.constructors.push_back(Constructor{Accessibility::Public, 1, false, false});
  declare_type(core, system, std::move(string_type));

  for (const char * name :
       {"Boolean", "Byte", "SByte", "Char", "Int16", "UInt16", "Int32", "UInt32", "Int64",
        "UInt64", "Single", "Double", "Decimal", "IntPtr", "UIntPtr", "Guid", "DateTime",
        "TimeSpan"}) {
    declare_type(core, system, core_primitive(name));
  }

  TypeSpec nullable = core_primitive("Nullable");
  nullable.type_parameters = {"T"};
  nullable.constructors.push_back(Constructor{Accessibility::Public, 1, false, false});
  declare_type(core, system, std::move(nullable));

  declare_type(core, system, core_type("IDisposable", TypeKind::Interface));

  TypeSpec equatable = core_type("IEquatable", TypeKind::Interface);
  equatable.type_parameters = {"T"};
  declare_type(core, system, std::move(equatable));

  TypeSpec comparable = core_type("IComparable", TypeKind::Interface);
  comparable.type_parameters = {"T"};
  declare_type(core, system, std::move(comparable));
}

void GraphBuilder::resolve_references()
{
  for (const auto & ref : pending_references_) {
    const Module * target = graph_.find_module(ref.target);
    if (!target) {
      diags_
        .report_error(
          ref.location, "module '" + ref.from->name + "' references unknown module '" +
                          ref.target + "'")
        .with_code("G003");
      continue;
    }
    auto & refs = ref.from->references;
    if (target != ref.from && std::find(refs.begin(), refs.end(), target) == refs.end()) {
      refs.push_back(target);
    }
  }

  // Every module implicitly references the core library
  const Module * core = graph_.find_module(k_core_library_name);
  if (!core) return;
  for (auto & module : graph_.modules_) {
    if (module.get() == core) continue;
    auto & refs = module->references;
    if (std::find(refs.begin(), refs.end(), core) == refs.end()) {
      refs.push_back(core);
    }
  }
}

void GraphBuilder::resolve_edges(PendingType & pending)
{
  TypeDecl & decl = *pending.decl;
  const TypeSpec & spec = pending.spec;
  const TypeResolver resolver(graph_.table_);

  ResolveScope scope;
  scope.context = &decl;
  scope.namespace_name = pending.namespace_name;

  // Resolve one edge; nullopt after reporting
  auto resolve_edge = [&](const std::string & text,
                          const SourceLocation & loc) -> std::optional<TypeRef> {
    auto res = resolver.resolve(text, scope);
    if (!res.ok()) {
      auto builder = diags_.report_error(loc, res.error, "on '" + decl.display_name() + "'");
      builder.with_code(res.code);
      if (res.help) builder.with_help(*res.help);
      return std::nullopt;
    }
    if (!res.type->is_named()) {
      diags_
        .report_error(
          loc, "type parameter '" + text + "' cannot be used as a base type or attribute",
          "on '" + decl.display_name() + "'")
        .with_code("G005");
      return std::nullopt;
    }
    if (res.type->is_open_definition()) {
      diags_
        .report_error(
          loc, "open generic definition '" + text + "' cannot be used here",
          "on '" + decl.display_name() + "'")
        .with_code("G005")
        .with_help("supply type arguments, e.g. '" + res.type->decl->display_name() + "'");
      return std::nullopt;
    }
    return res.type;
  };

  if (spec.base) {
    const SourceLocation loc = spec.location.child("base");
    if (auto base = resolve_edge(*spec.base, loc)) {
      const TypeDecl * target = base->decl;
      if (decl.kind != TypeKind::Class) {
        diags_
          .report_error(
            loc, std::string("only classes can declare a base type, '") + decl.display_name() +
                   "' is " + std::string(to_string(decl.kind)))
          .with_code("G006")
          .with_help("list interfaces under 'interfaces'");
      } else if (target->kind != TypeKind::Class) {
        auto builder = diags_.report_error(
          loc, "base type '" + *spec.base + "' of '" + decl.display_name() +
                 "' must be a class, found " + std::string(to_string(target->kind)));
        builder.with_code("G006");
        if (target->is_interface()) builder.with_help("list interfaces under 'interfaces'");
      } else if (target->is_sealed || target->is_static) {
        diags_
          .report_error(
            loc, "'" + decl.display_name() + "' cannot derive from " +
                   (target->is_static ? "static" : "sealed") + " type '" + target->display_name() +
                   "'")
          .with_code("G006");
      } else {
        decl.base = std::move(*base);
      }
    }
  }

  for (size_t i = 0; i < spec.interfaces.size(); ++i) {
    const SourceLocation loc = spec.location.child("interfaces").child(i);
    auto iface = resolve_edge(spec.interfaces[i], loc);
    if (!iface) continue;
    if (!iface->decl->is_interface()) {
      diags_
        .report_error(
          loc, "'" + spec.interfaces[i] + "' is not an interface",
          "listed on '" + decl.display_name() + "'")
        .with_code("G007");
      continue;
    }
    append_unique(decl.interfaces, std::move(*iface));
  }

  for (size_t i = 0; i < spec.attributes.size(); ++i) {
    const SourceLocation loc = spec.location.child("attributes").child(i);
    auto attr = resolve_edge(spec.attributes[i], loc);
    if (!attr) continue;
    if (!attr->decl->is_class()) {
      diags_
        .report_error(
          loc, "attribute '" + spec.attributes[i] + "' must be a class",
          "applied to '" + decl.display_name() + "'")
        .with_code("G008");
      continue;
    }
    append_unique(decl.attributes, std::move(*attr));
  }
}

void GraphBuilder::apply_default_base(TypeDecl & decl)
{
  if (decl.base) return;

  const char * default_base = nullptr;
  switch (decl.kind) {
    case TypeKind::Class:
      if (decl.qualified_name != "System.Object") default_base = "System.Object";
      break;
    case TypeKind::Struct:
      default_base = "System.ValueType";
      break;
    case TypeKind::Enum:
      default_base = "System.Enum";
      break;
    case TypeKind::Interface:
    case TypeKind::Delegate:
      break;
  }
  if (!default_base) return;

  if (const TypeDecl * base = graph_.table_.lookup(default_base, 0)) {
    decl.base = TypeRef::named(base);
  }
}

void GraphBuilder::check_base_cycles()
{
  for (const auto & pending : pending_types_) {
    const TypeDecl * start = pending.decl;
    std::unordered_set<const TypeDecl *> seen;

    for (const TypeDecl * d = start; d && d->base; d = d->base->decl) {
      if (!seen.insert(d).second) break;
      if (same_declaration(d->base->decl, start)) {
        diags_
          .report_error(
            pending.spec.location.child("base"),
            "circular base type dependency involving '" + start->display_name() + "'")
          .with_code("G009");
        break;
      }
    }
  }
}

void GraphBuilder::flatten_interfaces()
{
  std::unordered_map<const TypeDecl *, std::vector<TypeRef>> done;
  std::unordered_set<const TypeDecl *> in_progress;
  std::unordered_map<const TypeDecl *, const SourceLocation *> locations;
  for (const auto & pending : pending_types_) {
    locations[pending.decl] = &pending.spec.location;
  }

  // Declared interfaces, each followed by its inherited set, then the base's set
  std::function<const std::vector<TypeRef> &(const TypeDecl *)> flatten =
    [&](const TypeDecl * decl) -> const std::vector<TypeRef> & {
    static const std::vector<TypeRef> k_empty;

    if (auto it = done.find(decl); it != done.end()) return it->second;
    if (!in_progress.insert(decl).second) {
      auto loc = locations.find(decl);
      diags_
        .report_error(
          loc != locations.end() ? loc->second->child("interfaces") : SourceLocation{},
          "circular interface inheritance involving '" + decl->display_name() + "'")
        .with_code("G009");
      return k_empty;
    }

    std::vector<TypeRef> result;
    for (const auto & iface : decl->interfaces) {
      append_unique(result, iface);
      for (const auto & inherited : flatten(iface.decl)) {
        append_unique(result, instantiate_edge(inherited, iface));
      }
    }
    if (decl->base) {
      for (const auto & inherited : flatten(decl->base->decl)) {
        append_unique(result, instantiate_edge(inherited, *decl->base));
      }
    }

    in_progress.erase(decl);
    return done.emplace(decl, std::move(result)).first->second;
  };

  for (auto & pending : pending_types_) {
    pending.decl->all_interfaces = flatten(pending.decl);
  }
}

void GraphBuilder::add_implicit_constructors(TypeDecl & decl) const
{
  if (!options_.implicit_constructors) return;

  auto & ctors = decl.constructors;
  const bool has_instance_ctor =
    std::any_of(ctors.begin(), ctors.end(), [](const Constructor & c) { return !c.is_static; });
  const bool has_parameterless =
    std::any_of(ctors.begin(), ctors.end(), [](const Constructor & c) {
      return !c.is_static && c.parameter_count == 0;
    });

  switch (decl.kind) {
    case TypeKind::Class:
      if (decl.is_static || has_instance_ctor) return;
      ctors.push_back(Constructor{
        decl.is_abstract ? Accessibility::Protected : Accessibility::Public, 0, false, true});
      break;
    case TypeKind::Struct:
    case TypeKind::Enum:
      if (has_parameterless) return;
      ctors.push_back(Constructor{Accessibility::Public, 0, false, true});
      break;
    case TypeKind::Interface:
    case TypeKind::Delegate:
      break;
  }
}

}  // namespace typescan
