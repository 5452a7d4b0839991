// jlint/basic/json_report.hpp - JSON serialization for diagnostics
//
// Produces the machine-readable diagnostic contract:
//   { rule_name, message, severity, line, column, end_line, end_column,
//     fix: { edits: [ { range: { start, end }, replacement_text } ] } | null }
// Lines and columns are 1-indexed; edit ranges are byte offsets.
//
#pragma once

#include <nlohmann/json.hpp>

#include <vector>

#include "jlint/basic/diagnostic.hpp"
#include "jlint/basic/source_manager.hpp"

namespace jlint
{

/**
 * Serialize one diagnostic.
 *
 * @param diag The diagnostic to serialize
 * @param source File the diagnostic was reported in (resolves line/column)
 */
[[nodiscard]] nlohmann::json to_json(const Diagnostic & diag, const SourceFile & source);

/// Serialize diagnostics of one file as a JSON array, preserving order
[[nodiscard]] nlohmann::json to_json(
  const std::vector<Diagnostic> & diags, const SourceFile & source);

}  // namespace jlint
