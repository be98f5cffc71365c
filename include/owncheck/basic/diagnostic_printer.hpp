// owncheck/basic/diagnostic_printer.hpp
//
// Prints diagnostics in Rust-style format. The validator carries no source
// locations, so the location line names the declaration (and member).
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "owncheck/basic/diagnostic.hpp"

namespace owncheck
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[OWN006]: 'A' stores 'C' but no ownership relation connects them
 *     --> A.c
 *      |
 *      = note: related type 'C'
 *      = help: add 'C' to the owns-list of 'A'
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag);

  void print_all(const std::vector<Diagnostic> & diags);
  void print_all(const DiagnosticBag & diags);

  /// "N error(s), M warning(s)" trailer.
  void print_summary(size_t errors, size_t warnings);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_location(const Diagnostic & diag);
  void print_note(std::string_view message);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace owncheck
