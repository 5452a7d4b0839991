// jlint/basic/json_report.cpp - JSON serialization for diagnostics
#include "jlint/basic/json_report.hpp"

namespace jlint
{
namespace
{

using nlohmann::json;

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

json j_fix(const std::optional<Fix> & fix)
{
  if (!fix) return nullptr;

  json edits = json::array();
  for (const auto & e : fix->edits) {
    edits.push_back(json{{"range", j_range(e.range)}, {"replacement_text", e.replacement_text}});
  }
  return json{{"edits", std::move(edits)}};
}

}  // namespace

nlohmann::json to_json(const Diagnostic & diag, const SourceFile & source)
{
  const FullSourceRange fr = source.get_full_range(diag.range);
  return json{
    {"rule_name", diag.rule},
    {"message", diag.message()},
    {"severity", std::string(to_string(diag.severity))},
    {"line", fr.start_line},
    {"column", fr.start_column},
    {"end_line", fr.end_line},
    {"end_column", fr.end_column},
    {"fix", j_fix(diag.fix)}};
}

nlohmann::json to_json(const std::vector<Diagnostic> & diags, const SourceFile & source)
{
  json out = json::array();
  for (const auto & d : diags) {
    out.push_back(to_json(d, source));
  }
  return out;
}

}  // namespace jlint
