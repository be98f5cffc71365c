// owncheck/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "owncheck/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <rang.hpp>

#include <ostream>
#include <string>

namespace owncheck
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  // Configure rang based on use_color setting
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> Type.member ===
  print_location(diag);

  fmt::print(os_, "{}\n", gutter_pipe());

  if (diag.related_type) {
    print_note(fmt::format("related type '{}'", *diag.related_type));
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  // === Trailing empty line for separation ===
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const std::vector<Diagnostic> & diags)
{
  for (const auto & d : diags) {
    print(d);
  }
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags) { print_all(diags.all()); }

void DiagnosticPrinter::print_summary(size_t errors, size_t warnings)
{
  const std::string text = fmt::format(
    "{} error{}, {} warning{}", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s");

  if (use_color_) {
    os_ << rang::style::bold << (errors > 0 ? rang::fg::red : rang::fg::green) << text
        << rang::fg::reset << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", text);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red << "error";
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow << "warning";
        break;
    }
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    const std::string_view severity_str = to_string(diag.severity);
    if (!diag.code.empty()) {
      fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
    } else {
      fmt::print(os_, "{}: {}\n", severity_str, diag.message);
    }
  }
}

void DiagnosticPrinter::print_location(const Diagnostic & diag)
{
  if (diag.member) {
    fmt::print(os_, "{} {}.{}\n", gutter_arrow(), diag.subject_type, *diag.member);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), diag.subject_type);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace owncheck
