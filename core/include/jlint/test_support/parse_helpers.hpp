// jlint/test_support/parse_helpers.hpp - helpers for unit tests
//
// A lightweight single-file pipeline for tests: parse inline Java, run one
// rule (or a rule set) over the tree, and read back messages and positions.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "jlint/basic/diagnostic.hpp"
#include "jlint/basic/source_manager.hpp"
#include "jlint/lint/linter.hpp"
#include "jlint/lint/rule_registry.hpp"
#include "jlint/syntax/frontend.hpp"

namespace jlint::test_support
{

struct TestParseUnit
{
  std::unique_ptr<ParsedFile> file;

  [[nodiscard]] const SourceFile & source() const noexcept { return file->source; }
  [[nodiscard]] ts_ll::Node root() const noexcept { return file->root(); }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return file->source.get_slice(r);
  }

  [[nodiscard]] LineColumn position(const Diagnostic & d) const noexcept
  {
    return file->source.get_line_column(d.range.get_begin());
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "Test.java")
{
  TestParseUnit out;
  out.file = parse_source(std::move(src), virtual_path);
  return out;
}

/// Run a single rule over `src` through the dispatcher
template <typename R>
[[nodiscard]] std::vector<Diagnostic> run_rule(const std::string & src, std::unique_ptr<R> rule)
{
  const TestParseUnit unit = parse(src);
  RuleSet rules;
  rules.add(std::move(rule));
  return Linter(rules).lint(*unit.file);
}

template <typename R>
[[nodiscard]] std::vector<Diagnostic> run_rule(const std::string & src)
{
  return run_rule(src, std::make_unique<R>());
}

[[nodiscard]] inline std::vector<std::string> messages(const std::vector<Diagnostic> & diags)
{
  std::vector<std::string> out;
  out.reserve(diags.size());
  for (const auto & d : diags) {
    out.push_back(d.message());
  }
  return out;
}

}  // namespace jlint::test_support
