// typescan/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
//
#pragma once

#include <iosfwd>
#include <string_view>

#include "typescan/basic/diagnostic.hpp"

namespace typescan
{

/**
 * Renders diagnostics for a terminal in Rust-style format:
 *
 *   error[Q002]: cannot resolve type 'App.ICommandHandlr<>'
 *     --> typescan.yaml:12:20
 *      |
 *      = help: did you mean 'App.ICommandHandler<>'?
 *
 * Colors come from rang and are disabled for plain streams.
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag);

  /// Errors before warnings, report order otherwise
  void print_all(const DiagnosticBag & diags);

private:
  void print_header(const Diagnostic & diag);
  void print_footer(std::string_view kind, std::string_view message);
  void print_gutter();

  std::ostream & os_;
  bool use_color_;
};

}  // namespace typescan
