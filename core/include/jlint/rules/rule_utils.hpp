// jlint/rules/rule_utils.hpp - CST helpers shared by the built-in rules
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jlint/basic/diagnostic.hpp"
#include "jlint/basic/source_manager.hpp"
#include "jlint/syntax/ts_ll.hpp"

namespace jlint::rules
{

/// True when a declaration carries the given modifier keyword (in `modifiers` or directly)
[[nodiscard]] bool has_modifier(ts_ll::Node declaration, std::string_view modifier);

/// Named children of `node` that are not comments, in source order
[[nodiscard]] std::vector<ts_ll::Node> statement_children(ts_ll::Node node);

/// All `variable_declarator` children of a local variable or field declaration
[[nodiscard]] std::vector<ts_ll::Node> declarators_of(ts_ll::Node declaration);

/**
 * Edit that moves the code starting at `offset` to a new line.
 *
 * The horizontal whitespace right before `offset` is replaced by a newline
 * followed by the indentation of the line containing `indent_from`.
 */
[[nodiscard]] Edit line_break_before(const SourceFile & sf, uint32_t offset, uint32_t indent_from);

// ============================================================================
// Imports
// ============================================================================

/**
 * One parsed `import` declaration.
 */
struct ImportInfo
{
  /// Full path, e.g. "java.util.List" or "java.util.*"
  std::string path;
  /// Simple name for non-wildcard imports, e.g. "List"
  std::optional<std::string> simple_name;
  bool is_static = false;
  bool is_wildcard = false;
  SourceRange range;

  /// Package part of the path ("java.util" for both "java.util.List" and "java.util.*")
  [[nodiscard]] std::optional<std::string_view> package() const;
};

/// Collect the top-level import declarations of a `program` node
[[nodiscard]] std::vector<ImportInfo> collect_imports(ts_ll::Node program, const SourceFile & sf);

/// Package name declared by the file, if any
[[nodiscard]] std::optional<std::string> get_package_name(
  ts_ll::Node program, const SourceFile & sf);

}  // namespace jlint::rules
