// jlint/lint/linter.cpp - Tree dispatcher running a rule set over one file
#include "jlint/lint/linter.hpp"

#include <algorithm>
#include <utility>

#include "jlint/syntax/frontend.hpp"

namespace jlint
{

namespace
{

bool wants(const Rule & rule, std::string_view kind)
{
  const auto kinds = rule.relevant_kinds();
  if (!kinds) {
    return true;
  }
  return std::find(kinds->begin(), kinds->end(), kind) != kinds->end();
}

struct Tagged
{
  size_t rule_index;
  Diagnostic diagnostic;
};

}  // namespace

std::vector<Diagnostic> Linter::lint(const SourceFile & source, ts_ll::Node root) const
{
  if (root.is_null() || rules_.empty()) {
    return {};
  }

  const CheckContext ctx(source, root);
  std::vector<Tagged> collected;

  ts_ll::Cursor cursor(root);
  for (;;) {
    const ts_ll::Node node = cursor.current_node();
    const std::string_view kind = node.kind();

    for (size_t i = 0; i < rules_.size(); ++i) {
      const Rule & rule = rules_.rule(i);
      if (!wants(rule, kind)) continue;
      for (Diagnostic & d : rule.check(ctx, node)) {
        d.rule = std::string(rule.name());
        d.severity = rules_.severity(i);
        collected.push_back(Tagged{i, std::move(d)});
      }
    }

    if (cursor.goto_first_child()) continue;
    bool advanced = false;
    while (!(advanced = cursor.goto_next_sibling())) {
      if (!cursor.goto_parent()) break;
    }
    if (!advanced) break;
  }

  std::stable_sort(collected.begin(), collected.end(), [](const Tagged & a, const Tagged & b) {
    const uint32_t sa = a.diagnostic.range.get_begin().get_offset();
    const uint32_t sb = b.diagnostic.range.get_begin().get_offset();
    if (sa != sb) return sa < sb;
    return a.rule_index < b.rule_index;
  });

  std::vector<Diagnostic> out;
  out.reserve(collected.size());
  for (Tagged & t : collected) {
    out.push_back(std::move(t.diagnostic));
  }
  return out;
}

std::vector<Diagnostic> Linter::lint(const ParsedFile & file) const
{
  if (!file.is_analyzable()) {
    return {};
  }
  return lint(file.source, file.root());
}

}  // namespace jlint
