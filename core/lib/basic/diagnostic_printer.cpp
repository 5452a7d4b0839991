// jlint/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "jlint/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace jlint
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile & source)
{
  const FullSourceRange fr = source.get_full_range(diag.range);

  // === Header line: severity[Rule]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  const std::string filename = display_path(source);
  if (fr.is_valid()) {
    fmt::print(
      os_, "{} {}\n", gutter_arrow(),
      fmt::format("{}:{}:{}", filename, fr.start_line, fr.start_column));
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  // === Source snippet ===
  if (fr.is_valid()) {
    const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                               ? fr.end_column
                               : (fr.start_column + 1);
    print_source_line(source, fr.start_line - 1, fr.start_column, end_col);
  }

  if (diag.fix && !diag.fix->edits.empty()) {
    print_help("fix available (run with --fix)");
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const std::vector<Diagnostic> & diags, const SourceFile & source)
{
  std::vector<const Diagnostic *> sorted;
  sorted.reserve(diags.size());
  for (const auto & d : diags) {
    sorted.push_back(&d);
  }

  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->range.get_begin() < b->range.get_begin();
  });

  for (const Diagnostic * d : sorted) {
    print(*d, source);
  }
}

void DiagnosticPrinter::print_summary(size_t errors, size_t warnings, size_t files)
{
  const std::string text = fmt::format(
    "{} error{}, {} warning{} in {} file{}", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s", files, files == 1 ? "" : "s");

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
  const std::string_view severity_str = to_string(diag.severity);

  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << severity_str;
    if (!diag.rule.empty()) {
      os_ << "[" << diag.rule << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message() << rang::style::reset << "\n";
  } else if (!diag.rule.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.rule, diag.message());
  } else {
    fmt::print(os_, "{}: {}\n", severity_str, diag.message());
  }
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col)
{
  const std::string_view line = source.get_line(line_index);
  if (line.empty()) {
    return;
  }

  const uint32_t line_num = line_index + 1;

  // Tabs are expanded to 4 spaces
  std::string cleaned_line;
  cleaned_line.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned_line += "    ";
    } else if (c != '\r' && c != '\n') {
      cleaned_line += c;
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "      {} ", gutter_pipe_only());

  std::string marker_prefix;
  uint32_t visual_col = 1;
  for (size_t i = 0; visual_col < start_col && i < line.size(); ++i, ++visual_col) {
    marker_prefix += line[i] == '\t' ? "    " : " ";
  }
  fmt::print(os_, "{}", marker_prefix);

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
    fmt::print(os_, "{}", std::string(marker_len, '^'));
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{}", std::string(marker_len, '^'));
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

std::string DiagnosticPrinter::display_path(const SourceFile & source) const
{
  if (!source.has_path()) {
    return "<stdin>";
  }
  std::error_code ec;
  auto rel_path = std::filesystem::relative(source.path(), std::filesystem::current_path(), ec);
  return (ec || rel_path.empty()) ? source.path().string() : rel_path.string();
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

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace jlint
