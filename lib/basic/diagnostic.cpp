// typescan/basic/diagnostic.cpp - Diagnostic collection
#include "typescan/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace typescan
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(&bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_))
{
  other.bag_ = nullptr;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (bag_ != nullptr) {
    bag_->diagnostics_.push_back(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_note(std::string note)
{
  diagnostic_.notes.push_back(std::move(note));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help)
{
  diagnostic_.help = std::move(help);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, SourceLocation location, std::string message, std::string label)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.location = std::move(location);
  d.label = std::move(label);
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(
  SourceLocation location, std::string message, std::string label)
{
  return report(Severity::Error, std::move(location), std::move(message), std::move(label));
}

DiagnosticBuilder DiagnosticBag::report_warning(
  SourceLocation location, std::string message, std::string label)
{
  return report(Severity::Warning, std::move(location), std::move(message), std::move(label));
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

const Diagnostic * DiagnosticBag::find(std::string_view code) const
{
  auto it = std::find_if(
    diagnostics_.begin(), diagnostics_.end(), [code](const Diagnostic & d) { return d.code == code; });
  return it == diagnostics_.end() ? nullptr : &*it;
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

}  // namespace typescan
