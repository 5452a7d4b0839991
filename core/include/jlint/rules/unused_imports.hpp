// jlint/rules/unused_imports.hpp - Imports that are never referenced
#pragma once

#include <array>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "jlint/lint/rule.hpp"

namespace jlint::rules
{

/**
 * Reports single-type and static imports whose simple name is never used,
 * and redundant imports (`java.lang` types, types from the file's own
 * package). Wildcard imports are never reported.
 *
 * With `processJavadoc` (the default) type names referenced from Javadoc
 * tags such as `{@link X}` or `@throws X` count as uses.
 */
class UnusedImports final : public Rule
{
public:
  static constexpr std::string_view k_name = "UnusedImports";
  static constexpr std::string_view k_violation_id = "UnusedImport";

  static constexpr std::string_view k_process_javadoc = "processJavadoc";
  static constexpr std::array<std::string_view, 1> k_boolean_properties = {k_process_javadoc};

  UnusedImports() = default;
  explicit UnusedImports(bool process_javadoc) : process_javadoc_(process_javadoc) {}

  [[nodiscard]] static std::unique_ptr<UnusedImports> from_config(const Properties & properties);

  [[nodiscard]] std::string_view name() const noexcept override { return k_name; }

  [[nodiscard]] std::optional<gsl::span<const std::string_view>> relevant_kinds()
    const noexcept override;

  [[nodiscard]] std::vector<Diagnostic> check(
    const CheckContext & ctx, ts_ll::Node node) const override;

  [[nodiscard]] bool process_javadoc() const noexcept { return process_javadoc_; }

private:
  /// Identifiers referenced outside import/package declarations
  [[nodiscard]] std::set<std::string, std::less<>> collect_references(
    const CheckContext & ctx, ts_ll::Node program) const;

  bool process_javadoc_ = true;
};

}  // namespace jlint::rules
