// typescan/driver/match_output.hpp - Rendering of match records
//
#pragma once

#include <string>
#include <vector>

#include "typescan/match/query.hpp"
#include "typescan/project/scan_config.hpp"

namespace typescan
{

/**
 * Matches of one evaluated query.
 */
struct QueryResult
{
  std::string name;

  /// Handler parameter names, indexed by ordinal (empty without a handler)
  std::vector<std::string> parameter_names;

  std::vector<MatchRecord> matches;
};

/**
 * One line per match:
 *
 *   register: App.CreateUserHandler <THandler=App.CreateUserHandler, TCommand=App.CreateUser>
 *   services: App.UserService : App.IService
 *
 * Bindings without parameters (type-method handlers) print like plain matches.
 */
[[nodiscard]] std::string format_text(const std::vector<QueryResult> & results);

/**
 * JSON document:
 *
 *   {"queries": [{"name": ..., "matches": [{"type": ..., "module": ...,
 *     "binding": [{"parameter": ..., "type": ...}] | null,
 *     "generalizations": [...]}]}]}
 */
[[nodiscard]] std::string format_json(const std::vector<QueryResult> & results);

[[nodiscard]] std::string format_results(
  const std::vector<QueryResult> & results, OutputFormat format);

}  // namespace typescan
