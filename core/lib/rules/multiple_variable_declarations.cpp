// jlint/rules/multiple_variable_declarations.cpp - One variable per statement and per line
#include "jlint/rules/multiple_variable_declarations.hpp"

#include <array>

#include "jlint/rules/rule_utils.hpp"
#include "jlint/syntax/node_kinds.hpp"

namespace jlint::rules
{

namespace
{

namespace kind = syntax::kind;

constexpr std::array<std::string_view, 2> k_relevant_kinds = {
  kind::k_local_variable_declaration,
  kind::k_field_declaration,
};

bool is_variable_declaration(ts_ll::Node node)
{
  return node.kind() == kind::k_local_variable_declaration ||
         node.kind() == kind::k_field_declaration;
}

/// Next sibling that is not a comment
ts_ll::Node next_statement(ts_ll::Node node)
{
  ts_ll::Node n = node.next_named_sibling();
  while (!n.is_null() &&
         (n.kind() == kind::k_line_comment || n.kind() == kind::k_block_comment)) {
    n = n.next_named_sibling();
  }
  return n;
}

/// Rewrite `mods T a = 1, b;` as `mods T a = 1;` + newline + `mods T b;`
Fix split_declaration(
  const CheckContext & ctx, ts_ll::Node decl, const std::vector<ts_ll::Node> & declarators)
{
  const SourceFile & sf = ctx.source();
  const std::string_view prefix =
    sf.get_slice(SourceRange(decl.start_byte(), declarators.front().start_byte()));
  const std::string_view indent = sf.get_indentation(decl.start_byte());

  std::string text;
  for (size_t i = 0; i < declarators.size(); ++i) {
    if (i > 0) {
      text += '\n';
      text += indent;
    }
    text += prefix;
    text += ctx.text(declarators[i]);
    text += ';';
  }
  return Fix{{Edit::replacement(decl.range(), std::move(text))}};
}

}  // namespace

std::unique_ptr<MultipleVariableDeclarations> MultipleVariableDeclarations::from_config(
  const Properties & /*properties*/)
{
  return std::make_unique<MultipleVariableDeclarations>();
}

std::optional<gsl::span<const std::string_view>> MultipleVariableDeclarations::relevant_kinds()
  const noexcept
{
  return gsl::span<const std::string_view>(k_relevant_kinds.data(), k_relevant_kinds.size());
}

std::vector<Diagnostic> MultipleVariableDeclarations::check(
  const CheckContext & ctx, ts_ll::Node node) const
{
  if (node.parent().kind() == kind::k_for_statement) {
    return {};
  }

  DiagnosticBag diags;

  const std::vector<ts_ll::Node> declarators = declarators_of(node);
  if (declarators.size() > 1) {
    diags
      .report(
        node.range(),
        ViolationKind{
          std::string(k_in_statement_id),
          "Each variable declaration must be in its own statement.",
          FixAvailability::Always,
        })
      .with_fix(split_declaration(ctx, node, declarators));
  }

  const ts_ll::Node next = next_statement(node);
  if (
    !next.is_null() && is_variable_declaration(next) &&
    ctx.same_line(node.end_byte(), next.start_byte())) {
    diags
      .report(
        node.range(),
        ViolationKind{
          std::string(k_on_line_id),
          "Only one variable definition per line allowed.",
          FixAvailability::Always,
        })
      .with_edit(line_break_before(ctx.source(), next.start_byte(), node.start_byte()));
  }

  return diags.take();
}

}  // namespace jlint::rules
