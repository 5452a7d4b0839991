// jlint/syntax/node_kinds.hpp - tree-sitter-java node kind and field names
#pragma once

#include <array>
#include <string_view>

namespace jlint::syntax
{

// NOTE: These mirror tree-sitter-java's grammar.js. Keep them aligned when
// upgrading the grammar.

namespace kind
{
inline constexpr std::string_view k_program = "program";
inline constexpr std::string_view k_package_declaration = "package_declaration";
inline constexpr std::string_view k_import_declaration = "import_declaration";

inline constexpr std::string_view k_class_body = "class_body";
inline constexpr std::string_view k_enum_body = "enum_body";
inline constexpr std::string_view k_enum_body_declarations = "enum_body_declarations";
inline constexpr std::string_view k_interface_body = "interface_body";
inline constexpr std::string_view k_annotation_type_body = "annotation_type_body";
inline constexpr std::string_view k_field_declaration = "field_declaration";
inline constexpr std::string_view k_method_declaration = "method_declaration";
inline constexpr std::string_view k_constructor_declaration = "constructor_declaration";
inline constexpr std::string_view k_compact_constructor_declaration =
  "compact_constructor_declaration";
inline constexpr std::string_view k_constructor_body = "constructor_body";
inline constexpr std::string_view k_static_initializer = "static_initializer";
inline constexpr std::string_view k_formal_parameter = "formal_parameter";
inline constexpr std::string_view k_spread_parameter = "spread_parameter";

inline constexpr std::string_view k_block = "block";
inline constexpr std::string_view k_local_variable_declaration = "local_variable_declaration";
inline constexpr std::string_view k_variable_declarator = "variable_declarator";
inline constexpr std::string_view k_modifiers = "modifiers";
inline constexpr std::string_view k_final = "final";

inline constexpr std::string_view k_if_statement = "if_statement";
inline constexpr std::string_view k_while_statement = "while_statement";
inline constexpr std::string_view k_do_statement = "do_statement";
inline constexpr std::string_view k_for_statement = "for_statement";
inline constexpr std::string_view k_enhanced_for_statement = "enhanced_for_statement";
inline constexpr std::string_view k_switch_expression = "switch_expression";
inline constexpr std::string_view k_switch_statement = "switch_statement";
inline constexpr std::string_view k_switch_block = "switch_block";
inline constexpr std::string_view k_switch_block_statement_group = "switch_block_statement_group";
inline constexpr std::string_view k_switch_rule = "switch_rule";
inline constexpr std::string_view k_switch_label = "switch_label";
inline constexpr std::string_view k_try_statement = "try_statement";
inline constexpr std::string_view k_try_with_resources_statement = "try_with_resources_statement";
inline constexpr std::string_view k_resource_specification = "resource_specification";
inline constexpr std::string_view k_resource = "resource";
inline constexpr std::string_view k_catch_clause = "catch_clause";
inline constexpr std::string_view k_catch_formal_parameter = "catch_formal_parameter";
inline constexpr std::string_view k_finally_clause = "finally_clause";
inline constexpr std::string_view k_return_statement = "return_statement";
inline constexpr std::string_view k_throw_statement = "throw_statement";
inline constexpr std::string_view k_labeled_statement = "labeled_statement";
inline constexpr std::string_view k_break_statement = "break_statement";
inline constexpr std::string_view k_continue_statement = "continue_statement";
inline constexpr std::string_view k_yield_statement = "yield_statement";
inline constexpr std::string_view k_expression_statement = "expression_statement";
inline constexpr std::string_view k_default = "default";

inline constexpr std::string_view k_assignment_expression = "assignment_expression";
inline constexpr std::string_view k_update_expression = "update_expression";
inline constexpr std::string_view k_ternary_expression = "ternary_expression";
inline constexpr std::string_view k_lambda_expression = "lambda_expression";
inline constexpr std::string_view k_inferred_parameters = "inferred_parameters";
inline constexpr std::string_view k_formal_parameters = "formal_parameters";
inline constexpr std::string_view k_object_creation_expression = "object_creation_expression";
inline constexpr std::string_view k_parenthesized_expression = "parenthesized_expression";

inline constexpr std::string_view k_identifier = "identifier";
inline constexpr std::string_view k_type_identifier = "type_identifier";
inline constexpr std::string_view k_scoped_identifier = "scoped_identifier";
inline constexpr std::string_view k_asterisk = "asterisk";
inline constexpr std::string_view k_static = "static";
inline constexpr std::string_view k_underscore_pattern = "underscore_pattern";

inline constexpr std::string_view k_line_comment = "line_comment";
inline constexpr std::string_view k_block_comment = "block_comment";
}  // namespace kind

namespace field
{
inline constexpr std::string_view k_name = "name";
inline constexpr std::string_view k_body = "body";
inline constexpr std::string_view k_type = "type";
inline constexpr std::string_view k_value = "value";
inline constexpr std::string_view k_declarator = "declarator";
inline constexpr std::string_view k_left = "left";
inline constexpr std::string_view k_right = "right";
inline constexpr std::string_view k_argument = "argument";
inline constexpr std::string_view k_condition = "condition";
inline constexpr std::string_view k_consequence = "consequence";
inline constexpr std::string_view k_alternative = "alternative";
inline constexpr std::string_view k_init = "init";
inline constexpr std::string_view k_update = "update";
inline constexpr std::string_view k_parameters = "parameters";
inline constexpr std::string_view k_resources = "resources";
}  // namespace field

/// Bodies of class-like declarations (members are analyzed as independent units)
inline constexpr std::array<std::string_view, 5> k_type_body_kinds = {
  kind::k_class_body,     kind::k_enum_body,           kind::k_enum_body_declarations,
  kind::k_interface_body, kind::k_annotation_type_body,
};

/// Statements after which control never reaches the next switch group
inline constexpr std::array<std::string_view, 5> k_jump_kinds = {
  kind::k_break_statement,  kind::k_continue_statement, kind::k_return_statement,
  kind::k_throw_statement,  kind::k_yield_statement,
};

/// Statements that transfer control out of the enclosing method
inline constexpr std::array<std::string_view, 2> k_abrupt_exit_kinds = {
  kind::k_return_statement,
  kind::k_throw_statement,
};

template <size_t N>
[[nodiscard]] constexpr bool is_one_of(
  std::string_view k, const std::array<std::string_view, N> & kinds) noexcept
{
  for (const auto & candidate : kinds) {
    if (candidate == k) return true;
  }
  return false;
}

}  // namespace jlint::syntax
