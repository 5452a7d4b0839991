// jlint/syntax/frontend.cpp - High-level parse pipeline
#include "jlint/syntax/frontend.hpp"

namespace jlint
{

namespace
{

void collect_syntax_errors(const ts_ll::Node n, std::vector<SourceRange> & out)
{
  constexpr size_t max_syntax_errors = 64;
  if (out.size() >= max_syntax_errors) return;
  if (n.is_null()) return;

  if (n.is_error() || n.is_missing()) {
    out.push_back(n.range());
    if (n.is_missing()) return;
  }

  for (uint32_t i = 0; i < n.child_count(); ++i) {
    const ts_ll::Node c = n.child(i);
    if (!c.has_error() && !c.is_missing()) continue;
    collect_syntax_errors(c, out);
    if (out.size() >= max_syntax_errors) return;
  }
}

}  // namespace

std::unique_ptr<ParsedFile> parse_source(
  const ts_ll::Parser & parser, std::filesystem::path path, std::string source_text)
{
  auto file = std::make_unique<ParsedFile>();
  file->source = SourceFile(std::move(path), std::move(source_text));
  file->tree.reset(parser.parse_string(file->source.content()));

  if (file->tree.is_null()) {
    return file;
  }

  // Tree-sitter recovers from syntax errors and still returns a tree; rules run
  // over the recovered tree, and the recovery points are kept for reporting.
  const ts_ll::Node root = file->root();
  if (root.has_error()) {
    collect_syntax_errors(root, file->syntax_errors);
  }
  return file;
}

std::unique_ptr<ParsedFile> parse_source(std::string source_text, std::filesystem::path path)
{
  const ts_ll::Parser parser;
  return parse_source(parser, std::move(path), std::move(source_text));
}

}  // namespace jlint
