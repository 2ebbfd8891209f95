// typescan/basic/diagnostic_printer.cpp - Terminal rendering of diagnostics
//
#include "typescan/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>

namespace typescan
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  print_header(diag);

  if (diag.location.is_valid()) {
    if (use_color_) {
      os_ << rang::fg::cyan << rang::style::bold << "  -->" << rang::style::reset
          << rang::fg::reset;
      fmt::print(os_, " {}\n", diag.location.to_string());
    } else {
      fmt::print(os_, "  --> {}\n", diag.location.to_string());
    }
  }

  if (!diag.label.empty()) {
    print_gutter();
    os_ << '\n';
    print_gutter();
    fmt::print(os_, " {}\n", diag.label);
  }

  for (const auto & note : diag.notes) {
    print_footer("note", note);
  }
  if (diag.help) {
    print_footer("help", *diag.help);
  }

  os_ << '\n';
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  for (Severity severity : {Severity::Error, Severity::Warning}) {
    for (const auto & d : diags) {
      if (d.severity == severity) print(d);
    }
  }
}

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const std::string heading = diag.code.empty()
                                ? std::string(to_string(diag.severity))
                                : fmt::format("{}[{}]", to_string(diag.severity), diag.code);
  if (!use_color_) {
    fmt::print(os_, "{}: {}\n", heading, diag.message);
    return;
  }

  os_ << rang::style::bold;
  os_ << (diag.severity == Severity::Error ? rang::fg::red : rang::fg::yellow) << heading;
  os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << '\n';
}

// "      = help: ..." below a gutter line
void DiagnosticPrinter::print_footer(std::string_view kind, std::string_view message)
{
  print_gutter();
  os_ << '\n';
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      =" << rang::style::reset
        << rang::fg::reset;
  } else {
    os_ << "      =";
  }
  fmt::print(os_, " {}: {}\n", kind, message);
}

void DiagnosticPrinter::print_gutter()
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      |" << rang::style::reset
        << rang::fg::reset;
  } else {
    os_ << "      |";
  }
}

}  // namespace typescan
