// jlint/rules/one_statement_per_line.cpp - At most one statement per source line
#include "jlint/rules/one_statement_per_line.hpp"

#include <array>

#include "jlint/rules/rule_utils.hpp"
#include "jlint/syntax/node_kinds.hpp"

namespace jlint::rules
{

namespace
{

namespace kind = syntax::kind;

constexpr std::array<std::string_view, 6> k_relevant_kinds = {
  kind::k_block,        kind::k_constructor_body, kind::k_switch_block_statement_group,
  kind::k_class_body,   kind::k_program,          kind::k_resource_specification,
};

/// Declarations that count as statements at class-body and file level
constexpr std::array<std::string_view, 3> k_member_statement_kinds = {
  kind::k_field_declaration,
  kind::k_import_declaration,
  kind::k_package_declaration,
};

bool counts_as_statement(std::string_view container, ts_ll::Node child)
{
  if (container == kind::k_class_body || container == kind::k_program) {
    return syntax::is_one_of(child.kind(), k_member_statement_kinds);
  }
  return child.kind() != kind::k_switch_label;
}

}  // namespace

std::unique_ptr<OneStatementPerLine> OneStatementPerLine::from_config(
  const Properties & properties)
{
  return std::make_unique<OneStatementPerLine>(
    props::get_bool(properties, k_treat_try_resources, false));
}

std::optional<gsl::span<const std::string_view>> OneStatementPerLine::relevant_kinds()
  const noexcept
{
  return gsl::span<const std::string_view>(k_relevant_kinds.data(), k_relevant_kinds.size());
}

std::vector<Diagnostic> OneStatementPerLine::check(const CheckContext & ctx, ts_ll::Node node) const
{
  const std::string_view container = node.kind();
  if (container == kind::k_resource_specification && !treat_try_resources_as_statement_) {
    return {};
  }

  const std::vector<ts_ll::Node> children = statement_children(node);

  // A statement "joins" its predecessor when it starts on the line the predecessor ends on.
  auto joins_previous = [&](size_t i) {
    return counts_as_statement(container, children[i - 1]) &&
           counts_as_statement(container, children[i]) &&
           ctx.same_line(children[i - 1].end_byte(), children[i].start_byte());
  };

  DiagnosticBag diags;
  size_t i = 1;
  while (i < children.size()) {
    if (!joins_previous(i)) {
      ++i;
      continue;
    }

    // Report the first offender of the line; the fix also splits off the ones after it.
    const ts_ll::Node first = children[i];
    const uint32_t line = ctx.line_of(first.start_byte());
    const uint32_t indent_from = children[i - 1].start_byte();
    Fix fix;
    while (i < children.size() && joins_previous(i) &&
           ctx.line_of(children[i].start_byte()) == line) {
      fix.edits.push_back(line_break_before(ctx.source(), children[i].start_byte(), indent_from));
      ++i;
    }

    diags
      .report(
        first.range(),
        ViolationKind{
          std::string(k_violation_id),
          "Only one statement per line allowed.",
          FixAvailability::Always,
        })
      .with_fix(std::move(fix));
  }

  return diags.take();
}

}  // namespace jlint::rules
