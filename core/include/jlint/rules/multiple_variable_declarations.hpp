// jlint/rules/multiple_variable_declarations.hpp - One variable per statement and per line
#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "jlint/lint/rule.hpp"

namespace jlint::rules
{

/**
 * Reports `int i, j;` (several declarators in one statement) and
 * `int i; int j;` (several declarations on one line). Both carry a fix.
 * Declarations in a `for` initializer are exempt.
 */
class MultipleVariableDeclarations final : public Rule
{
public:
  static constexpr std::string_view k_name = "MultipleVariableDeclarations";
  static constexpr std::string_view k_in_statement_id = "MultipleInStatement";
  static constexpr std::string_view k_on_line_id = "MultipleOnLine";

  [[nodiscard]] static std::unique_ptr<MultipleVariableDeclarations> from_config(
    const Properties & properties);

  [[nodiscard]] std::string_view name() const noexcept override { return k_name; }

  [[nodiscard]] std::optional<gsl::span<const std::string_view>> relevant_kinds()
    const noexcept override;

  [[nodiscard]] std::vector<Diagnostic> check(
    const CheckContext & ctx, ts_ll::Node node) const override;
};

}  // namespace jlint::rules
