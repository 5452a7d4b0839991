// jlint/rules/one_statement_per_line.hpp - At most one statement per source line
#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "jlint/lint/rule.hpp"

namespace jlint::rules
{

class OneStatementPerLine final : public Rule
{
public:
  static constexpr std::string_view k_name = "OneStatementPerLine";
  static constexpr std::string_view k_violation_id = "OneStatementPerLine";

  static constexpr std::string_view k_treat_try_resources = "treatTryResourcesAsStatement";
  static constexpr std::array<std::string_view, 1> k_boolean_properties = {k_treat_try_resources};

  OneStatementPerLine() = default;
  explicit OneStatementPerLine(bool treat_try_resources_as_statement)
  : treat_try_resources_as_statement_(treat_try_resources_as_statement)
  {
  }

  /// Build from `treatTryResourcesAsStatement`
  [[nodiscard]] static std::unique_ptr<OneStatementPerLine> from_config(
    const Properties & properties);

  [[nodiscard]] std::string_view name() const noexcept override { return k_name; }

  [[nodiscard]] std::optional<gsl::span<const std::string_view>> relevant_kinds()
    const noexcept override;

  /// Inspects the direct children of a statement container
  [[nodiscard]] std::vector<Diagnostic> check(
    const CheckContext & ctx, ts_ll::Node node) const override;

  [[nodiscard]] bool treat_try_resources_as_statement() const noexcept
  {
    return treat_try_resources_as_statement_;
  }

private:
  bool treat_try_resources_as_statement_ = false;
};

}  // namespace jlint::rules
