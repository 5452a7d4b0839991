// jlint/lint/linter.hpp - Tree dispatcher running a rule set over one file
#pragma once

#include <vector>

#include "jlint/basic/diagnostic.hpp"
#include "jlint/basic/source_manager.hpp"
#include "jlint/lint/rule_registry.hpp"
#include "jlint/syntax/ts_ll.hpp"

namespace jlint
{

struct ParsedFile;

/**
 * Walks a CST once in pre-order and invokes every interested rule on every node.
 *
 * Each diagnostic is tagged with the producing rule's name and its configured
 * severity. The result is ordered by start offset; ties keep rule order, then
 * emission order.
 */
class Linter
{
public:
  explicit Linter(const RuleSet & rules) : rules_(rules) {}

  [[nodiscard]] std::vector<Diagnostic> lint(const SourceFile & source, ts_ll::Node root) const;

  /// Empty when the file could not be parsed at all
  [[nodiscard]] std::vector<Diagnostic> lint(const ParsedFile & file) const;

  [[nodiscard]] const RuleSet & rules() const noexcept { return rules_; }

private:
  const RuleSet & rules_;
};

}  // namespace jlint
