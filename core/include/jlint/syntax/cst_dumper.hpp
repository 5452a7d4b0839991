// jlint/syntax/cst_dumper.hpp - Debug CST tree output
//
// Dumps a tree-sitter-java tree in a human-readable indented format, useful
// for rule authors looking up node kinds and field layouts.
//
#pragma once

#include <ostream>

#include "jlint/basic/source_manager.hpp"
#include "jlint/syntax/ts_ll.hpp"

namespace jlint
{

/**
 * Dumps CST nodes, one per line.
 *
 * @code
 *   program [1:1-3:2]
 *     class_declaration [1:1-3:2]
 *       class [1:1-1:6] "class"
 *       name: identifier [1:7-1:8] "A"
 * @endcode
 *
 * Lines and columns are 1-indexed. Leaves show a text preview (at most 40
 * bytes, newlines rendered as "\n").
 */
class CstDumper
{
public:
  CstDumper(std::ostream & os, const SourceFile & source) : os_(os), source_(source) {}

  /// Skip anonymous tokens (keywords, punctuation)
  void set_named_only(bool named_only) noexcept { named_only_ = named_only; }

  void dump(ts_ll::Node root);

private:
  void dump_node(ts_ll::Node node, std::string_view field, size_t depth);

  std::ostream & os_;
  const SourceFile & source_;
  bool named_only_ = false;
};

}  // namespace jlint
