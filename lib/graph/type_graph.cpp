// typescan/graph/type_graph.cpp - TypeGraph provider queries
//
#include "typescan/graph/type_graph.hpp"

#include <deque>
#include <unordered_set>

#include "typescan/graph/type_utils.hpp"

namespace typescan
{

namespace
{

/// `inner` is `outer` or declared (transitively) inside it
bool is_within(const TypeDecl * inner, const TypeDecl * outer)
{
  for (const TypeDecl * d = inner; d != nullptr; d = d->containing) {
    if (same_declaration(d, outer)) return true;
  }
  return false;
}

/// Some declaration enclosing `origin` derives from `base`
bool derives_from(const TypeGraph & graph, const TypeDecl * origin, const TypeDecl * base)
{
  for (const TypeDecl * d = origin; d != nullptr; d = d->containing) {
    std::optional<TypeRef> current = graph.base_of(d->self_type());
    while (current) {
      if (same_declaration(current->decl, base)) return true;
      current = graph.base_of(*current);
    }
  }
  return false;
}

}  // namespace

// ============================================================================
// Modules
// ============================================================================

const Module * TypeGraph::find_module(std::string_view name) const
{
  for (const auto & m : modules_) {
    if (m->name == name) return m.get();
  }
  return nullptr;
}

std::vector<const Module *> TypeGraph::reference_closure(const Module & root) const
{
  std::vector<const Module *> result;
  std::unordered_set<const Module *> visited;
  std::deque<const Module *> queue;

  queue.push_back(&root);
  visited.insert(&root);

  while (!queue.empty()) {
    const Module * current = queue.front();
    queue.pop_front();
    result.push_back(current);

    for (const Module * ref : current->references) {
      if (visited.insert(ref).second) {
        queue.push_back(ref);
      }
    }
  }

  return result;
}

// ============================================================================
// Provider Queries
// ============================================================================

std::optional<TypeRef> TypeGraph::base_of(const TypeRef & type) const
{
  if (!type.is_named() || !type.decl || !type.decl->base) {
    return std::nullopt;
  }
  return instantiate_edge(*type.decl->base, type);
}

std::vector<TypeRef> TypeGraph::all_interfaces_of(const TypeRef & type) const
{
  if (!type.is_named() || !type.decl) return {};

  std::vector<TypeRef> result;
  result.reserve(type.decl->all_interfaces.size());
  for (const auto & iface : type.decl->all_interfaces) {
    append_unique(result, instantiate_edge(iface, type));
  }
  return result;
}

bool TypeGraph::is_visible_from(const TypeDecl & origin, const TypeDecl & type) const
{
  for (const TypeDecl * d = &type; d != nullptr; d = d->containing) {
    const bool same_module = d->module == origin.module;
    const TypeDecl * container = d->containing;

    // Top-level declarations only distinguish public from internal
    if (container == nullptr) {
      if (d->accessibility != Accessibility::Public && !same_module) return false;
      continue;
    }

    switch (d->accessibility) {
      case Accessibility::Public:
        break;
      case Accessibility::Internal:
        if (!same_module) return false;
        break;
      case Accessibility::ProtectedInternal:
        if (!same_module && !is_within(&origin, container) &&
            !derives_from(*this, &origin, container)) {
          return false;
        }
        break;
      case Accessibility::Protected:
        if (!is_within(&origin, container) && !derives_from(*this, &origin, container)) {
          return false;
        }
        break;
      case Accessibility::PrivateProtected:
        if (!same_module) return false;
        if (!is_within(&origin, container) && !derives_from(*this, &origin, container)) {
          return false;
        }
        break;
      case Accessibility::Private:
        if (!is_within(&origin, container)) return false;
        break;
    }
  }
  return true;
}

}  // namespace typescan
