// typescan/driver/match_output.cpp - Text and JSON match output
//
#include "typescan/driver/match_output.hpp"

#include <nlohmann/json.hpp>

#include "typescan/graph/type_graph.hpp"
#include "typescan/graph/type_utils.hpp"

namespace typescan
{

namespace
{

using nlohmann::json;

json j_binding(const QueryResult & result, const Binding & binding)
{
  json arr = json::array();
  for (size_t i = 0; i < binding.size(); ++i) {
    json parameter = i < result.parameter_names.size() ? json(result.parameter_names[i]) : json(i);
    arr.push_back(json{{"parameter", parameter}, {"type", to_string(binding[i])}});
  }
  return arr;
}

json j_match(const QueryResult & result, const MatchRecord & record)
{
  json generalizations = json::array();
  for (const auto & g : record.generalizations) {
    generalizations.push_back(to_string(g));
  }

  return json{
    {"type", record.type->display_name()},
    {"module", record.type->module ? json(record.type->module->name) : json(nullptr)},
    {"binding", record.binding ? j_binding(result, *record.binding) : json(nullptr)},
    {"generalizations", generalizations}};
}

}  // namespace

std::string format_text(const std::vector<QueryResult> & results)
{
  std::string out;
  for (const auto & result : results) {
    for (const auto & record : result.matches) {
      out += result.name;
      out += ": ";
      out += record.type->display_name();

      if (record.binding && record.binding->size() > 0) {
        out += " <";
        for (size_t i = 0; i < record.binding->size(); ++i) {
          if (i > 0) out += ", ";
          if (i < result.parameter_names.size()) {
            out += result.parameter_names[i];
            out += '=';
          }
          out += to_string((*record.binding)[i]);
        }
        out += '>';
      } else if (!record.generalizations.empty()) {
        out += " : ";
        out += to_string(record.generalizations);
      }
      out += '\n';
    }
  }
  return out;
}

std::string format_json(const std::vector<QueryResult> & results)
{
  json queries = json::array();
  for (const auto & result : results) {
    json matches = json::array();
    for (const auto & record : result.matches) {
      matches.push_back(j_match(result, record));
    }
    queries.push_back(json{{"name", result.name}, {"matches", matches}});
  }
  return json{{"queries", queries}}.dump(2) + "\n";
}

std::string format_results(const std::vector<QueryResult> & results, OutputFormat format)
{
  switch (format) {
    case OutputFormat::Json:
      return format_json(results);
    case OutputFormat::Text:
      break;
  }
  return format_text(results);
}

}  // namespace typescan
