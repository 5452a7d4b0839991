// jlint/rules/final_local_variable.hpp - Local variables that could be declared final
//
// For every executable body (method, constructor, initializer, top-level
// lambda) a flow analysis counts, per local variable, how many value-giving
// actions (initializer plus assignments) can happen on any single path. A
// variable that receives a value exactly once on every path, and never from a
// repeating region (loop or closure) other than the one it lives in, is
// reported at its declaring identifier.
//
#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "jlint/lint/rule.hpp"

namespace jlint::rules
{

class FinalLocalVariable final : public Rule
{
public:
  static constexpr std::string_view k_name = "FinalLocalVariable";
  static constexpr std::string_view k_violation_id = "VariableShouldBeFinal";

  static constexpr std::string_view k_validate_enhanced_for = "validateEnhancedForLoopVariable";
  static constexpr std::string_view k_validate_unnamed = "validateUnnamedVariables";
  static constexpr std::array<std::string_view, 2> k_boolean_properties = {
    k_validate_enhanced_for, k_validate_unnamed};

  struct Options
  {
    /// Treat the variable of an enhanced for loop as a candidate
    bool validate_enhanced_for_loop_variable = false;
    /// Treat variables named `_` as candidates
    bool validate_unnamed_variables = false;
  };

  FinalLocalVariable() = default;
  explicit FinalLocalVariable(Options options) : options_(options) {}

  /// Build from the boolean properties above; malformed values keep the defaults
  [[nodiscard]] static std::unique_ptr<FinalLocalVariable> from_config(
    const Properties & properties);

  [[nodiscard]] std::string_view name() const noexcept override { return k_name; }

  [[nodiscard]] std::optional<gsl::span<const std::string_view>> relevant_kinds()
    const noexcept override;

  [[nodiscard]] std::vector<Diagnostic> check(
    const CheckContext & ctx, ts_ll::Node node) const override;

  [[nodiscard]] const Options & options() const noexcept { return options_; }

private:
  Options options_;
};

}  // namespace jlint::rules
