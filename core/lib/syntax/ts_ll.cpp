// jlint/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "jlint/syntax/ts_ll.hpp"

#include <stdexcept>

namespace jlint::ts_ll
{

Parser::Parser()
{
  parser_ = ts_parser_new();
  if (parser_ == nullptr) {
    throw std::runtime_error("ts_parser_new() failed");
  }

  const TSLanguage * lang = tree_sitter_java();
  // ts_parser_set_language() rejects grammars built for an incompatible ABI.
  if (lang == nullptr || !ts_parser_set_language(parser_, lang)) {
    ts_parser_delete(parser_);
    parser_ = nullptr;
    throw std::runtime_error(
      "tree-sitter-java grammar is incompatible with the tree-sitter runtime");
  }
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

TSTree * Parser::parse_string(std::string_view source) const
{
  // Tree-sitter consumes bytes; the grammar expects UTF-8.
  return ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size()));
}

}  // namespace jlint::ts_ll
