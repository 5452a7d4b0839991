// jlint/basic/fix_applier.cpp - Apply diagnostic fixes to source text
#include "jlint/basic/fix_applier.hpp"

#include <algorithm>

namespace jlint
{

namespace
{

bool in_bounds(const Edit & edit, size_t size)
{
  if (!edit.range.is_valid()) return false;
  const uint32_t begin = edit.range.get_begin().get_offset();
  const uint32_t end = edit.range.get_end().get_offset();
  return begin <= end && end <= size;
}

bool conflicts(const Edit & edit, const std::vector<const Edit *> & accepted)
{
  return std::any_of(accepted.begin(), accepted.end(), [&](const Edit * other) {
    return edit.range.overlaps(other->range);
  });
}

}  // namespace

FixResult apply_fixes(std::string_view source, const std::vector<Diagnostic> & diagnostics)
{
  FixResult result;
  std::vector<const Edit *> accepted;

  for (const Diagnostic & d : diagnostics) {
    if (!d.fix || d.fix->edits.empty()) continue;

    std::vector<const Edit *> candidate;
    bool ok = true;
    for (const Edit & e : d.fix->edits) {
      if (!in_bounds(e, source.size()) || conflicts(e, accepted) || conflicts(e, candidate)) {
        ok = false;
        break;
      }
      candidate.push_back(&e);
    }

    if (!ok) {
      ++result.skipped;
      continue;
    }
    accepted.insert(accepted.end(), candidate.begin(), candidate.end());
    ++result.applied;
  }

  std::stable_sort(accepted.begin(), accepted.end(), [](const Edit * a, const Edit * b) {
    return a->range.get_begin() < b->range.get_begin();
  });

  result.text.reserve(source.size());
  uint32_t cursor = 0;
  for (const Edit * e : accepted) {
    const uint32_t begin = e->range.get_begin().get_offset();
    result.text.append(source.substr(cursor, begin - cursor));
    result.text += e->replacement_text;
    cursor = e->range.get_end().get_offset();
  }
  result.text.append(source.substr(cursor));
  return result;
}

}  // namespace jlint
