// jlint/rules/rule_utils.cpp - CST helpers shared by the built-in rules
#include "jlint/rules/rule_utils.hpp"

#include "jlint/syntax/node_kinds.hpp"

namespace jlint::rules
{

namespace kind = syntax::kind;

bool has_modifier(ts_ll::Node declaration, std::string_view modifier)
{
  for (uint32_t i = 0; i < declaration.child_count(); ++i) {
    const ts_ll::Node c = declaration.child(i);
    if (c.kind() == kind::k_modifiers) {
      if (c.has_child_of_kind(modifier)) return true;
    } else if (c.kind() == modifier) {
      // Some grammar versions attach the keyword directly to the declaration.
      return true;
    }
  }
  return false;
}

std::vector<ts_ll::Node> statement_children(ts_ll::Node node)
{
  std::vector<ts_ll::Node> out;
  for (uint32_t i = 0; i < node.named_child_count(); ++i) {
    const ts_ll::Node c = node.named_child(i);
    if (c.kind() == kind::k_line_comment || c.kind() == kind::k_block_comment) continue;
    out.push_back(c);
  }
  return out;
}

std::vector<ts_ll::Node> declarators_of(ts_ll::Node declaration)
{
  std::vector<ts_ll::Node> out;
  for (uint32_t i = 0; i < declaration.named_child_count(); ++i) {
    const ts_ll::Node c = declaration.named_child(i);
    if (c.kind() == kind::k_variable_declarator) {
      out.push_back(c);
    }
  }
  return out;
}

Edit line_break_before(const SourceFile & sf, uint32_t offset, uint32_t indent_from)
{
  const std::string_view content = sf.content();
  uint32_t begin = offset;
  while (begin > 0 && (content[begin - 1] == ' ' || content[begin - 1] == '\t')) {
    --begin;
  }
  std::string text = "\n";
  text += sf.get_indentation(indent_from);
  return Edit::replacement(SourceRange(begin, offset), std::move(text));
}

// ============================================================================
// Imports
// ============================================================================

std::optional<std::string_view> ImportInfo::package() const
{
  const std::string_view p = path;
  if (is_wildcard) {
    return p.substr(0, p.size() - 2);
  }
  const auto dot = p.rfind('.');
  if (dot == std::string_view::npos) {
    return std::nullopt;
  }
  return p.substr(0, dot);
}

namespace
{

std::optional<ImportInfo> parse_import_declaration(ts_ll::Node node, const SourceFile & sf)
{
  ImportInfo info;
  info.range = node.range();

  std::string_view name;
  for (uint32_t i = 0; i < node.child_count(); ++i) {
    const ts_ll::Node c = node.child(i);
    const std::string_view k = c.kind();
    if (k == kind::k_static) {
      info.is_static = true;
    } else if (k == kind::k_asterisk) {
      info.is_wildcard = true;
    } else if (k == kind::k_identifier || k == kind::k_scoped_identifier) {
      name = c.text(sf);
    }
  }

  if (name.empty()) {
    return std::nullopt;
  }

  info.path = std::string(name);
  if (info.is_wildcard) {
    info.path += ".*";
  } else {
    const auto dot = name.rfind('.');
    info.simple_name = std::string(dot == std::string_view::npos ? name : name.substr(dot + 1));
  }
  return info;
}

}  // namespace

std::vector<ImportInfo> collect_imports(ts_ll::Node program, const SourceFile & sf)
{
  std::vector<ImportInfo> imports;
  for (uint32_t i = 0; i < program.named_child_count(); ++i) {
    const ts_ll::Node c = program.named_child(i);
    if (c.kind() != kind::k_import_declaration) continue;
    if (auto info = parse_import_declaration(c, sf)) {
      imports.push_back(std::move(*info));
    }
  }
  return imports;
}

std::optional<std::string> get_package_name(ts_ll::Node program, const SourceFile & sf)
{
  for (uint32_t i = 0; i < program.named_child_count(); ++i) {
    const ts_ll::Node c = program.named_child(i);
    if (c.kind() != kind::k_package_declaration) continue;
    for (uint32_t j = 0; j < c.named_child_count(); ++j) {
      const ts_ll::Node n = c.named_child(j);
      if (n.kind() == kind::k_scoped_identifier || n.kind() == kind::k_identifier) {
        return std::string(n.text(sf));
      }
    }
  }
  return std::nullopt;
}

}  // namespace jlint::rules
