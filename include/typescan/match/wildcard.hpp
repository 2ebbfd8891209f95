// typescan/match/wildcard.hpp - Wildcard name filters
//
// A filter is a comma-separated list of alternatives; each alternative is a
// literal in which `*` stands for any run of characters. A name passes when
// it matches one alternative completely. Matching is case-sensitive and every
// character other than `*` and `,` is literal.
//
//   "App.Handlers.*"              every type in App.Handlers (and below)
//   "*Handler,*Processor"         names ending in Handler or Processor
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace typescan
{

class WildcardPattern
{
public:
  explicit WildcardPattern(std::string_view pattern);

  /// Full-string match against at least one alternative
  [[nodiscard]] bool matches(std::string_view text) const;

  [[nodiscard]] const std::string & source() const noexcept { return source_; }
  [[nodiscard]] const std::vector<std::string> & alternatives() const noexcept
  {
    return alternatives_;
  }

private:
  std::string source_;
  std::vector<std::string> alternatives_;
};

/**
 * Compile an optional filter string.
 *
 * @return nullopt when no pattern was given (the filter is absent)
 */
[[nodiscard]] std::optional<WildcardPattern> compile_wildcard(
  const std::optional<std::string> & pattern);

/// Match one alternative (no comma handling)
[[nodiscard]] bool wildcard_match(std::string_view pattern, std::string_view text) noexcept;

}  // namespace typescan
