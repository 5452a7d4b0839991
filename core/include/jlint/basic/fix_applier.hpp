// jlint/basic/fix_applier.hpp - Apply diagnostic fixes to source text
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "jlint/basic/diagnostic.hpp"

namespace jlint
{

struct FixResult
{
  std::string text;
  size_t applied = 0;  ///< Diagnostics whose fix was applied
  size_t skipped = 0;  ///< Fixes rejected because they overlap an accepted one or are out of range
};

/**
 * Apply the fixes of `diagnostics` to `source` in a single pass.
 *
 * Diagnostics are considered in order; a fix is accepted only when none of its
 * edits overlaps an edit accepted before it. Fixes are all-or-nothing.
 */
[[nodiscard]] FixResult apply_fixes(
  std::string_view source, const std::vector<Diagnostic> & diagnostics);

}  // namespace jlint
