// jlint/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "jlint/basic/diagnostic.hpp"
#include "jlint/basic/source_manager.hpp"

namespace jlint
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[FinalLocalVariable]: Variable 'x' should be declared final.
 *     --> src/Main.java:5:13
 *      |
 *    5 |         int x = compute();
 *      |             ^
 *      |
 *      = help: fix available (run with --fix)
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cout)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic against the file it was reported in.
   */
  void print(const Diagnostic & diag, const SourceFile & source);

  /**
   * Print all diagnostics of one file, ordered by start offset.
   */
  void print_all(const std::vector<Diagnostic> & diags, const SourceFile & source);

  /// One-line totals, e.g. "3 errors, 1 warning in 12 files"
  void print_summary(size_t errors, size_t warnings, size_t files);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col);

  void print_help(std::string_view message);

  [[nodiscard]] std::string display_path(const SourceFile & source) const;

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace jlint
