// typescan/basic/source_location.hpp - Locations inside graph and query inputs
//
// Graph files are JSON and carry no line information once parsed, so a
// location may be a JSON pointer instead of a line/column pair. YAML inputs
// carry both.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace typescan
{

struct SourceLocation
{
  /// File the location refers to (empty when the input did not come from a file)
  std::string file;

  /// 1-based line and column, 0 when unknown
  uint32_t line = 0;
  uint32_t column = 0;

  /// JSON pointer or YAML key path of the offending element
  std::string pointer;

  [[nodiscard]] bool is_valid() const noexcept { return !file.empty() || !pointer.empty(); }
  [[nodiscard]] bool has_line() const noexcept { return line != 0; }

  [[nodiscard]] static SourceLocation in_file(std::string file)
  {
    SourceLocation loc;
    loc.file = std::move(file);
    return loc;
  }

  [[nodiscard]] static SourceLocation at(std::string file, std::string pointer)
  {
    SourceLocation loc;
    loc.file = std::move(file);
    loc.pointer = std::move(pointer);
    return loc;
  }

  /// Location of a child element ("/modules" + "0" -> "/modules/0")
  [[nodiscard]] SourceLocation child(std::string_view key) const
  {
    SourceLocation loc = *this;
    loc.pointer += '/';
    loc.pointer += key;
    loc.line = 0;
    loc.column = 0;
    return loc;
  }

  [[nodiscard]] SourceLocation child(size_t index) const { return child(std::to_string(index)); }

  /// "file:line:col", "file#/pointer", or just the file
  [[nodiscard]] std::string to_string() const
  {
    std::string out = file.empty() ? std::string("<input>") : file;
    if (has_line()) {
      out += ':' + std::to_string(line) + ':' + std::to_string(column);
    } else if (!pointer.empty()) {
      out += '#' + pointer;
    }
    return out;
  }
};

}  // namespace typescan
