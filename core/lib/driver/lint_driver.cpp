// jlint/driver/lint_driver.cpp - Lint driver implementation
//
#include "jlint/driver/lint_driver.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "jlint/basic/fix_applier.hpp"
#include "jlint/lint/linter.hpp"
#include "jlint/syntax/frontend.hpp"
#include "jlint/syntax/ts_ll.hpp"

namespace jlint
{

namespace
{

size_t count_severity(const std::vector<Diagnostic> & diags, Severity severity)
{
  return static_cast<size_t>(std::count_if(
    diags.begin(), diags.end(), [&](const Diagnostic & d) { return d.severity == severity; }));
}

std::optional<std::string> read_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

bool write_file(const std::filesystem::path & path, const std::string & text)
{
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out << text;
  return static_cast<bool>(out);
}

}  // namespace

std::string_view to_string(FileStatus status) noexcept
{
  switch (status) {
    case FileStatus::Ok:
      return "ok";
    case FileStatus::Unreadable:
      return "unreadable";
    case FileStatus::Unanalyzable:
      return "unanalyzable";
  }
  return "ok";
}

size_t FileResult::count(Severity severity) const
{
  return count_severity(diagnostics, severity);
}

size_t LintResult::count(Severity severity) const
{
  size_t n = 0;
  for (const auto & f : files) {
    n += f.count(severity);
  }
  return n;
}

// ============================================================================
// LintDriver
// ============================================================================

void LintDriver::lint_text(
  const ts_ll::Parser & parser, FileResult & result, std::string text) const
{
  auto parsed = parse_source(parser, result.path, std::move(text));
  if (!parsed->is_analyzable()) {
    result.status = FileStatus::Unanalyzable;
    result.error = "parser produced no tree";
    result.source = std::move(parsed->source);
    return;
  }

  const Linter linter(rules_);
  result.diagnostics = linter.lint(*parsed);
  result.syntax_errors = parsed->syntax_errors;
  result.source = std::move(parsed->source);

  if (options_.verbose && result.has_syntax_errors()) {
    fmt::print(
      stderr, "jlint: {}: {} syntax error(s) recovered\n", result.path.string(),
      result.syntax_errors.size());
  }
}

void LintDriver::lint_file(const ts_ll::Parser & parser, FileResult & result) const
{
  if (options_.verbose) {
    fmt::print(stderr, "jlint: linting {}\n", result.path.string());
  }

  auto text = read_file(result.path);
  if (!text) {
    result.status = FileStatus::Unreadable;
    result.error = "cannot read file";
    return;
  }

  lint_text(parser, result, std::move(*text));
  if (!options_.fix || result.status != FileStatus::Ok) {
    return;
  }

  const FixResult fixed = apply_fixes(result.source.content(), result.diagnostics);
  if (fixed.applied == 0) {
    return;
  }
  if (!write_file(result.path, fixed.text)) {
    result.error = "cannot write fixed file";
    return;
  }
  result.fixes_applied = fixed.applied;
  if (options_.verbose) {
    fmt::print(
      stderr, "jlint: {}: applied {} fix(es), skipped {}\n", result.path.string(), fixed.applied,
      fixed.skipped);
  }
}

FileResult LintDriver::lint_source(std::string text, std::filesystem::path path) const
{
  FileResult result;
  result.path = std::move(path);
  const ts_ll::Parser parser;
  lint_text(parser, result, std::move(text));
  return result;
}

LintResult LintDriver::lint_files(const std::vector<std::filesystem::path> & files) const
{
  LintResult result;
  result.files.resize(files.size());
  for (size_t i = 0; i < files.size(); ++i) {
    result.files[i].path = files[i];
  }
  if (files.empty()) {
    return result;
  }

  size_t jobs = options_.jobs;
  if (jobs == 0) {
    jobs = std::max<size_t>(1, std::thread::hardware_concurrency());
  }
  jobs = std::min(jobs, files.size());

  std::atomic<size_t> next{0};
  auto worker = [&]() {
    std::unique_ptr<ts_ll::Parser> parser;
    std::string parser_error;
    try {
      parser = std::make_unique<ts_ll::Parser>();
    } catch (const std::runtime_error & e) {
      parser_error = e.what();
    }

    for (size_t i = next++; i < files.size(); i = next++) {
      FileResult & file = result.files[i];
      if (!parser) {
        file.status = FileStatus::Unanalyzable;
        file.error = parser_error;
        continue;
      }
      try {
        lint_file(*parser, file);
      } catch (const std::exception & e) {
        file.status = FileStatus::Unanalyzable;
        file.error = e.what();
        file.diagnostics.clear();
      }
    }
  };

  if (jobs == 1) {
    worker();
    return result;
  }

  std::vector<std::thread> threads;
  threads.reserve(jobs);
  for (size_t t = 0; t < jobs; ++t) {
    threads.emplace_back(worker);
  }
  for (auto & th : threads) {
    th.join();
  }
  return result;
}

std::vector<std::filesystem::path> LintDriver::collect_java_files(
  const std::vector<std::filesystem::path> & inputs, std::vector<std::string> & errors)
{
  namespace fs = std::filesystem;

  std::vector<fs::path> out;
  for (const auto & input : inputs) {
    std::error_code ec;
    if (fs::is_directory(input, ec)) {
      for (fs::recursive_directory_iterator it(input, ec), end; !ec && it != end;
           it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && it->path().extension() == ".java") {
          out.push_back(it->path());
        }
      }
      if (ec) {
        errors.push_back(fmt::format("{}: {}", input.string(), ec.message()));
      }
    } else if (fs::exists(input, ec)) {
      out.push_back(input);
    } else {
      errors.push_back(fmt::format("{}: no such file or directory", input.string()));
    }
  }

  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

}  // namespace jlint
