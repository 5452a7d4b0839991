// jlint/driver/lint_driver.hpp - Lint driver
//
// Single entry point for the lint pipeline (read -> parse -> dispatch -> fix).
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "jlint/basic/diagnostic.hpp"
#include "jlint/basic/source_manager.hpp"
#include "jlint/lint/rule_registry.hpp"

namespace jlint
{

namespace ts_ll
{
class Parser;
}  // namespace ts_ll

// ============================================================================
// Lint Options
// ============================================================================

struct LintOptions
{
  /// Worker threads; 0 selects the hardware concurrency
  size_t jobs = 0;

  /// Apply fixes and write the files back
  bool fix = false;

  /// Enable verbose output (progress on stderr)
  bool verbose = false;
};

// ============================================================================
// Lint Result
// ============================================================================

enum class FileStatus {
  Ok,            ///< Analyzed (possibly with recovered syntax errors)
  Unreadable,    ///< Could not be read from disk
  Unanalyzable,  ///< No tree could be produced
};

[[nodiscard]] std::string_view to_string(FileStatus status) noexcept;

struct FileResult
{
  std::filesystem::path path;
  FileStatus status = FileStatus::Ok;

  /// Reason for a non-Ok status, or a failed write-back in fix mode
  std::string error;

  /// Text as analyzed (before fixes); empty when Unreadable
  SourceFile source;

  std::vector<Diagnostic> diagnostics;

  /// ERROR / MISSING recovery points of the tree
  std::vector<SourceRange> syntax_errors;

  /// Diagnostics whose fix was written back (fix mode)
  size_t fixes_applied = 0;

  [[nodiscard]] bool has_syntax_errors() const noexcept { return !syntax_errors.empty(); }
  [[nodiscard]] size_t count(Severity severity) const;
};

struct LintResult
{
  /// One entry per input, in input order
  std::vector<FileResult> files;

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) > 0; }
};

// ============================================================================
// LintDriver
// ============================================================================

/**
 * Lints batches of Java files against a shared RuleSet.
 *
 * Files are distributed over worker threads; each worker owns its parser.
 * Results are stored by input index, so output order never depends on
 * scheduling. One bad file never prevents analysis of the others.
 */
class LintDriver
{
public:
  LintDriver(const RuleSet & rules, LintOptions options) : rules_(rules), options_(options) {}

  /**
   * Lint in-memory source text (no disk access, fixes are not written).
   *
   * @param text Java source
   * @param path Path reported in diagnostics (may be empty)
   */
  [[nodiscard]] FileResult lint_source(std::string text, std::filesystem::path path = {}) const;

  /**
   * Lint files from disk.
   *
   * @param files Paths to .java files
   * @return LintResult with one FileResult per input, in input order
   */
  [[nodiscard]] LintResult lint_files(const std::vector<std::filesystem::path> & files) const;

  /**
   * Expand inputs: files are kept as-is, directories are walked recursively for
   * `*.java`. The result is sorted and free of duplicates.
   *
   * @param inputs Files and directories from the command line
   * @param errors Receives one message per input that does not exist
   */
  [[nodiscard]] static std::vector<std::filesystem::path> collect_java_files(
    const std::vector<std::filesystem::path> & inputs, std::vector<std::string> & errors);

  [[nodiscard]] const LintOptions & options() const noexcept { return options_; }

private:
  void lint_text(const ts_ll::Parser & parser, FileResult & result, std::string text) const;
  void lint_file(const ts_ll::Parser & parser, FileResult & result) const;

  const RuleSet & rules_;
  LintOptions options_;
};

}  // namespace jlint
