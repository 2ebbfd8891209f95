// typescan/basic/diagnostic.hpp - Problems found in graph, configuration and query inputs
//
// Every input error is collected rather than thrown, so one run can report
// all broken modules, types and queries at once. Codes are grouped by the
// input they concern: G (graph), C (configuration), Q (query), T (type
// expression syntax).
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "typescan/basic/source_location.hpp"

namespace typescan
{

enum class Severity : uint8_t {
  Error,
  Warning,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g. "G004", empty for I/O failures
  std::string message;

  /// Offending element; `label` annotates it when non-empty
  SourceLocation location;
  std::string label;

  std::vector<std::string> notes;
  std::optional<std::string> help;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent handle returned by DiagnosticBag::report_*.
 *
 * The diagnostic is committed to the bag when the builder goes out of scope,
 * so `diags.report_error(...).with_code("Q002")` is a complete statement.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_note(std::string note);
  DiagnosticBuilder & with_help(std::string help);

private:
  DiagnosticBag * bag_;
  Diagnostic diagnostic_;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(
    SourceLocation location, std::string message, std::string label = "");
  DiagnosticBuilder report_warning(
    SourceLocation location, std::string message, std::string label = "");

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) > 0; }
  [[nodiscard]] bool has_warnings() const { return count(Severity::Warning) > 0; }

  /// First diagnostic carrying `code`, or nullptr
  [[nodiscard]] const Diagnostic * find(std::string_view code) const;
  [[nodiscard]] bool has_code(std::string_view code) const { return find(code) != nullptr; }

  /// Append everything from `other`, keeping report order
  void merge(DiagnosticBag && other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  friend class DiagnosticBuilder;

  DiagnosticBuilder report(
    Severity severity, SourceLocation location, std::string message, std::string label);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace typescan
