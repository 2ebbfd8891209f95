// typescan/match/query_engine.cpp - Query evaluation implementation
//
#include "typescan/match/query_engine.hpp"

#include <algorithm>

#include "typescan/graph/type_utils.hpp"
#include "typescan/match/assignability.hpp"

namespace typescan
{

MatchStream::MatchStream(const TypeGraph & graph, Query query)
: graph_(graph),
  query_(std::move(query)),
  cursor_(select_modules(graph, query_)),
  solver_(graph),
  name_filter_(compile_wildcard(query_.type_name_filter)),
  exclude_name_filter_(compile_wildcard(query_.exclude_by_type_name))
{
}

std::optional<MatchRecord> MatchStream::next()
{
  while (pending_.empty()) {
    const TypeDecl * decl = cursor_.next();
    if (!decl) return std::nullopt;
    evaluate_candidate(*decl);
  }

  MatchRecord record = std::move(pending_.front());
  pending_.pop_front();
  return record;
}

void MatchStream::evaluate_candidate(const TypeDecl & decl)
{
  if (!passes_structure(decl)) return;
  if (!passes_attributes(decl)) return;
  if (!passes_names(decl)) return;

  const TypeRef candidate = decl.self_type();

  if (query_.exclude_assignable_to &&
      is_assignable(graph_, candidate, *query_.exclude_assignable_to).assignable) {
    return;
  }

  std::vector<TypeRef> generalizations;
  if (query_.assignable_to) {
    auto result = is_assignable(graph_, candidate, *query_.assignable_to);
    if (!result) return;
    generalizations = std::move(result.generalizations);
  }

  std::vector<MatchRecord> records;
  if (query_.handler) {
    std::vector<std::optional<TypeRef>> seeds;
    if (query_.assignable_to) {
      seeds.assign(generalizations.begin(), generalizations.end());
    } else {
      seeds.emplace_back();
    }

    for (const auto & seed : seeds) {
      for (auto & binding : solver_.solve(candidate, *query_.handler, seed)) {
        const bool duplicate = std::any_of(records.begin(), records.end(), [&](const MatchRecord & r) {
          return *r.binding == binding;
        });
        if (duplicate) continue;

        MatchRecord record;
        record.type = &decl;
        record.binding = std::move(binding);
        if (seed) record.generalizations.push_back(*seed);
        records.push_back(std::move(record));
      }
    }
    if (records.empty()) return;
  } else {
    MatchRecord record;
    record.type = &decl;
    record.generalizations = std::move(generalizations);
    records.push_back(std::move(record));
  }

  if (query_.declared_in && !graph_.is_visible_from(*query_.declared_in, decl)) return;

  for (auto & record : records) {
    pending_.push_back(std::move(record));
  }
}

bool MatchStream::passes_structure(const TypeDecl & decl) const
{
  if (!decl.is_class() || decl.is_abstract || !decl.can_be_referenced_by_name()) return false;
  if (decl.is_static && !query_.allows_static_types()) return false;

  // Open generics cannot be handler type arguments
  if (query_.handler && decl.has_unbound_type_parameters()) return false;
  return true;
}

bool MatchStream::passes_attributes(const TypeDecl & decl) const
{
  if (query_.attribute_filter && !contains_type(decl.attributes, *query_.attribute_filter)) {
    return false;
  }
  if (query_.exclude_by_attribute && contains_type(decl.attributes, *query_.exclude_by_attribute)) {
    return false;
  }
  return true;
}

bool MatchStream::passes_names(const TypeDecl & decl) const
{
  const std::string name = decl.display_name();
  if (name_filter_ && !name_filter_->matches(name)) return false;
  if (exclude_name_filter_ && exclude_name_filter_->matches(name)) return false;
  return true;
}

MatchStream QueryEngine::evaluate(const Query & query) const { return MatchStream(graph_, query); }

std::vector<MatchRecord> collect(MatchStream & stream)
{
  std::vector<MatchRecord> records;
  while (auto record = stream.next()) {
    records.push_back(std::move(*record));
  }
  return records;
}

}  // namespace typescan
