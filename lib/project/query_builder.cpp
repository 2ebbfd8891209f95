// typescan/project/query_builder.cpp - Query construction implementation
//
#include "typescan/project/query_builder.hpp"

#include <algorithm>

#include "typescan/graph/type_utils.hpp"
#include "typescan/syntax/type_expr.hpp"

namespace typescan
{

QueryBuilder::QueryBuilder(const TypeGraph & graph, DiagnosticBag & diags, std::vector<std::string> usings)
: diags_(diags), usings_(std::move(usings)), resolver_(graph.types())
{
}

std::optional<Query> QueryBuilder::build(const QueryConfig & config) const
{
  const SourceLocation & loc = config.location;

  ResolveScope global_scope;
  global_scope.imports = usings_;

  auto declared_in = resolver_.resolve(config.declared_in, global_scope);
  if (!declared_in.ok() || !declared_in.type->is_named()) {
    auto builder = diags_.report_error(
      loc.child("declared_in"),
      "query '" + config.name + "' is declared in an unknown type '" + config.declared_in + "'",
      declared_in.error);
    builder.with_code("Q001");
    if (declared_in.help) builder.with_help(*declared_in.help);
    return std::nullopt;
  }

  Query query;
  query.name = config.name;
  query.declared_in = declared_in.type->decl;

  ResolveScope scope;
  scope.context = query.declared_in;
  scope.namespace_name = query.declared_in->namespace_name();
  scope.imports = usings_;

  bool ok = true;

  // Resolve an optional field; failures are reported and remembered
  auto resolve_field = [&](const std::optional<std::string> & text, const char * key,
                           std::optional<TypeRef> & out) {
    if (!text) return;
    out = resolve_type(*text, scope, loc.child(key));
    if (!out) ok = false;
  };

  resolve_field(config.assembly_of_type, "assembly_of_type", query.assembly_of_type);
  resolve_field(config.attribute_filter, "attribute_filter", query.attribute_filter);
  resolve_field(config.exclude_by_attribute, "exclude_by_attribute", query.exclude_by_attribute);

  if (config.assignable_to) {
    query.assignable_to = resolve_target(
      *config.assignable_to, config.assignable_to_generic_arguments, scope,
      loc.child("assignable_to"));
    if (!query.assignable_to) ok = false;
  }
  if (config.exclude_assignable_to) {
    query.exclude_assignable_to = resolve_target(
      *config.exclude_assignable_to, config.exclude_assignable_to_generic_arguments, scope,
      loc.child("exclude_assignable_to"));
    if (!query.exclude_assignable_to) ok = false;
  }

  query.assembly_name_filter = config.assembly_name_filter;
  query.type_name_filter = config.type_name_filter;
  query.exclude_by_type_name = config.exclude_by_type_name;

  if (config.handler) {
    query.handler = build_handler(*config.handler, scope);
    if (!query.handler) ok = false;
  }

  if (!ok) return std::nullopt;
  return query;
}

std::vector<Query> QueryBuilder::build_all(const std::vector<QueryConfig> & configs) const
{
  std::vector<Query> queries;
  for (const auto & config : configs) {
    if (auto query = build(config)) {
      queries.push_back(std::move(*query));
    }
  }
  return queries;
}

std::optional<TypeRef> QueryBuilder::resolve_type(
  const std::string & text, const ResolveScope & scope, const SourceLocation & location) const
{
  auto resolution = resolver_.resolve(text, scope);
  if (!resolution.ok()) {
    report_resolution(resolution, location);
    return std::nullopt;
  }
  return resolution.type;
}

std::optional<TypeRef> QueryBuilder::resolve_target(
  const std::string & text, const std::optional<std::vector<std::string>> & generic_arguments,
  const ResolveScope & scope, const SourceLocation & location) const
{
  if (!generic_arguments || generic_arguments->empty()) {
    return resolve_type(text, scope, location);
  }

  auto parsed = syntax::parse_type_expr(text);
  if (!parsed.ok()) {
    report_resolution(
      TypeResolution::failed(
        parsed.error->code, "invalid type expression '" + text + "': " + parsed.error->message),
      location);
    return std::nullopt;
  }

  syntax::TypeExpr definition = std::move(*parsed.expr);
  const auto arity = static_cast<uint32_t>(generic_arguments->size());

  if (!definition.args.empty() || (definition.is_open() && definition.open_arity != arity)) {
    diags_
      .report_error(
        location, "'" + text + "' cannot be combined with " + std::to_string(arity) +
                    " generic argument(s)")
      .with_code("Q003")
      .with_help(
        "name the open definition, e.g. '" + definition.name + "<" +
        std::string(arity - 1, ',') + ">'");
    return std::nullopt;
  }
  definition.open_arity = arity;

  auto def = resolver_.resolve(definition, scope);
  if (!def.ok()) {
    report_resolution(def, location);
    return std::nullopt;
  }

  std::vector<TypeRef> args;
  for (size_t i = 0; i < generic_arguments->size(); ++i) {
    const SourceLocation arg_loc = location.child(std::string("generic_arguments")).child(i);
    auto arg = resolve_type((*generic_arguments)[i], scope, arg_loc);
    if (!arg) return std::nullopt;
    if (arg->is_open_definition()) {
      diags_
        .report_error(arg_loc, "open generic definition '" + (*generic_arguments)[i] +
                                 "' cannot be a generic argument")
        .with_code("Q004");
      return std::nullopt;
    }
    args.push_back(std::move(*arg));
  }

  return TypeRef::named(def.type->decl, std::move(args));
}

std::optional<HandlerSignature> QueryBuilder::build_handler(
  const HandlerConfig & config, const ResolveScope & scope) const
{
  HandlerSignature signature;
  signature.name = config.name;
  signature.kind = config.kind;

  std::vector<std::string> names;
  for (const auto & param : config.type_parameters) {
    if (std::find(names.begin(), names.end(), param.name) != names.end()) {
      diags_
        .report_error(param.location, "duplicate handler type parameter '" + param.name + "'")
        .with_code("Q006");
      return std::nullopt;
    }
    names.push_back(param.name);
  }

  ResolveScope handler_scope = scope;
  handler_scope.handler_parameters = &names;

  bool ok = true;
  for (size_t i = 0; i < config.type_parameters.size(); ++i) {
    const auto & param_config = config.type_parameters[i];

    GenericParameter param;
    param.ordinal = static_cast<uint32_t>(i);
    param.name = param_config.name;

    for (size_t j = 0; j < param_config.constraints.size(); ++j) {
      const std::string & constraint = param_config.constraints[j];
      const SourceLocation loc = param_config.location.child("constraints").child(j);

      if (constraint == "class") {
        param.reference_type = true;
      } else if (constraint == "struct") {
        param.value_type = true;
      } else if (constraint == "unmanaged") {
        param.unmanaged = true;
      } else if (constraint == "new()") {
        param.default_constructor = true;
      } else {
        auto type = resolve_type(constraint, handler_scope, loc);
        if (!type) {
          ok = false;
          continue;
        }
        if (type->is_open_definition()) {
          diags_
            .report_error(loc, "open generic definition '" + constraint + "' cannot be a constraint")
            .with_code("Q004")
            .with_help("use a handler type parameter as argument, e.g. '" +
                       type->decl->display_name() + "'");
          ok = false;
          continue;
        }
        append_unique(param.constraint_types, std::move(*type));
      }
    }

    if (param.reference_type && (param.value_type || param.unmanaged)) {
      diags_
        .report_error(
          param_config.location, "type parameter '" + param.name +
                                   "' cannot be constrained to both 'class' and '" +
                                   (param.value_type ? "struct" : "unmanaged") + "'")
        .with_code("Q005");
      ok = false;
    }

    signature.parameters.push_back(std::move(param));
  }

  if (!ok) return std::nullopt;
  return signature;
}

void QueryBuilder::report_resolution(const TypeResolution & resolution, const SourceLocation & location) const
{
  // Syntax errors keep their T0xx code; lookup failures are query errors
  const bool syntax_error = !resolution.code.empty() && resolution.code.front() == 'T';
  auto builder = diags_.report_error(location, resolution.error);
  builder.with_code(syntax_error ? resolution.code : "Q002");
  if (resolution.help) builder.with_help(*resolution.help);
}

}  // namespace typescan
