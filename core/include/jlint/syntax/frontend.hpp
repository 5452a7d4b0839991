// jlint/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "jlint/basic/source_manager.hpp"
#include "jlint/syntax/ts_ll.hpp"

namespace jlint
{

/**
 * A parsed Java source: owns the text and the CST built over it.
 *
 * The tree borrows nothing from the caller; nodes obtained from `root()` stay
 * valid as long as this object lives.
 */
struct ParsedFile
{
  SourceFile source;
  ts_ll::Tree tree;

  /// ERROR / MISSING nodes found during recovery (capped)
  std::vector<SourceRange> syntax_errors;

  /// False when tree-sitter could not produce a tree at all
  [[nodiscard]] bool is_analyzable() const noexcept { return !tree.is_null(); }
  [[nodiscard]] bool has_syntax_errors() const noexcept { return !syntax_errors.empty(); }

  [[nodiscard]] ts_ll::Node root() const noexcept { return tree.root_node(); }
};

// Parse pipeline:
// source text -> tree-sitter-java (CST) -> recovery diagnostics
[[nodiscard]] std::unique_ptr<ParsedFile> parse_source(
  const ts_ll::Parser & parser, std::filesystem::path path, std::string source_text);

/// Convenience overload that creates a parser for a single use
[[nodiscard]] std::unique_ptr<ParsedFile> parse_source(
  std::string source_text, std::filesystem::path path = {});

}  // namespace jlint
