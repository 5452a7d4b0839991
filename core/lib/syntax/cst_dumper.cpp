// jlint/syntax/cst_dumper.cpp - Debug CST tree output
#include "jlint/syntax/cst_dumper.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <string>

namespace jlint
{

namespace
{

constexpr size_t k_preview_bytes = 40;

std::string preview(std::string_view text)
{
  std::string out;
  for (size_t i = 0; i < text.size() && i < k_preview_bytes; ++i) {
    const char c = text[i];
    if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c == '"') {
      out += "\\\"";
    } else {
      out += c;
    }
  }
  return out;
}

}  // namespace

void CstDumper::dump(ts_ll::Node root)
{
  if (root.is_null()) {
    fmt::print(os_, "<no tree>\n");
    return;
  }
  dump_node(root, {}, 0);
}

void CstDumper::dump_node(ts_ll::Node node, std::string_view field, size_t depth)
{
  const LineColumn start = source_.get_line_column(node.start_byte());
  const LineColumn end = source_.get_line_column(node.end_byte());

  std::string line(depth * 2, ' ');
  if (!field.empty()) {
    line += fmt::format("{}: ", field);
  }
  line += fmt::format(
    "{} [{}:{}-{}:{}]", node.is_missing() ? fmt::format("MISSING {}", node.kind())
                                          : std::string(node.kind()),
    start.line, start.column, end.line, end.column);
  if (node.child_count() == 0) {
    line += fmt::format(" \"{}\"", preview(node.text(source_)));
  }
  fmt::print(os_, "{}\n", line);

  for (uint32_t i = 0; i < node.child_count(); ++i) {
    const ts_ll::Node c = node.child(i);
    if (named_only_ && !c.is_named()) continue;
    dump_node(c, node.field_name_for_child(i), depth + 1);
  }
}

}  // namespace jlint
