// typescan/match/wildcard.cpp - Wildcard matcher implementation
//
#include "typescan/match/wildcard.hpp"

#include <algorithm>

namespace typescan
{

WildcardPattern::WildcardPattern(std::string_view pattern) : source_(pattern)
{
  size_t start = 0;
  while (true) {
    const size_t comma = pattern.find(',', start);
    if (comma == std::string_view::npos) {
      alternatives_.emplace_back(pattern.substr(start));
      break;
    }
    alternatives_.emplace_back(pattern.substr(start, comma - start));
    start = comma + 1;
  }
}

bool WildcardPattern::matches(std::string_view text) const
{
  return std::any_of(alternatives_.begin(), alternatives_.end(), [&](const std::string & alt) {
    return wildcard_match(alt, text);
  });
}

std::optional<WildcardPattern> compile_wildcard(const std::optional<std::string> & pattern)
{
  if (!pattern) return std::nullopt;
  return WildcardPattern(*pattern);
}

bool wildcard_match(std::string_view pattern, std::string_view text) noexcept
{
  size_t p = 0;
  size_t t = 0;

  // Last '*' seen and the text position it currently absorbs up to
  size_t star = std::string_view::npos;
  size_t star_text = 0;

  while (t < text.size()) {
    if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      star_text = t;
    } else if (p < pattern.size() && pattern[p] == text[t]) {
      ++p;
      ++t;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      t = ++star_text;
    } else {
      return false;
    }
  }

  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

}  // namespace typescan
