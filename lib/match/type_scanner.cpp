// typescan/match/type_scanner.cpp - Module selection and type traversal
//
#include "typescan/match/type_scanner.hpp"

#include "typescan/match/wildcard.hpp"

namespace typescan
{

std::vector<const Module *> select_modules(const TypeGraph & graph, const Query & query)
{
  if (query.assembly_of_type && query.assembly_of_type->decl) {
    return {query.assembly_of_type->decl->module};
  }

  if (!query.declared_in || !query.declared_in->module) return {};
  const Module & declaring = *query.declared_in->module;

  if (auto pattern = compile_wildcard(query.assembly_name_filter)) {
    std::vector<const Module *> selected;
    for (const Module * module : graph.reference_closure(declaring)) {
      if (pattern->matches(module->name)) selected.push_back(module);
    }
    return selected;
  }

  return {&declaring};
}

ModuleTypeCursor::ModuleTypeCursor(std::vector<const Module *> modules)
: modules_(std::move(modules))
{
}

const TypeDecl * ModuleTypeCursor::next()
{
  while (true) {
    if (stack_.empty()) {
      if (module_index_ >= modules_.size()) return nullptr;
      const Module * module = modules_[module_index_++];
      if (module && module->global_namespace) {
        stack_.push_back(Level{module->global_namespace, nullptr, 0});
      }
      continue;
    }

    Level & top = stack_.back();

    if (top.ns) {
      if (top.index >= top.ns->members.size()) {
        stack_.pop_back();
        continue;
      }
      const NamespaceMember member = top.ns->members[top.index++];
      if (const auto * const * ns = std::get_if<const Namespace *>(&member)) {
        stack_.push_back(Level{*ns, nullptr, 0});
        continue;
      }
      const TypeDecl * decl = std::get<const TypeDecl *>(member);
      stack_.push_back(Level{nullptr, decl, 0});
      return decl;
    }

    if (top.index >= top.type->nested.size()) {
      stack_.pop_back();
      continue;
    }
    const TypeDecl * nested = top.type->nested[top.index++];
    stack_.push_back(Level{nullptr, nested, 0});
    return nested;
  }
}

std::vector<const TypeDecl *> types_of(const Module & module)
{
  std::vector<const TypeDecl *> result;
  ModuleTypeCursor cursor({&module});
  while (const TypeDecl * decl = cursor.next()) {
    result.push_back(decl);
  }
  return result;
}

}  // namespace typescan
