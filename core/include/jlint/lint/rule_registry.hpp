// jlint/lint/rule_registry.hpp - Built-in rules and configured rule sets
#pragma once

#include <gsl/span>

#include <memory>
#include <string_view>
#include <vector>

#include "jlint/basic/diagnostic.hpp"
#include "jlint/lint/rule.hpp"

namespace jlint
{

// ============================================================================
// Registry
// ============================================================================

using RuleCreateFn = std::unique_ptr<Rule> (*)(const Properties & properties);

struct RuleFactory
{
  std::string_view name;
  std::string_view description;
  RuleCreateFn create;
  /// Property keys the rule reads as booleans
  gsl::span<const std::string_view> boolean_properties;
};

/// Built-in rules in registration order (this order is also the dispatch order)
[[nodiscard]] gsl::span<const RuleFactory> builtin_rules() noexcept;

/// Lookup by configuration module name; nullptr when unknown
[[nodiscard]] const RuleFactory * find_rule_factory(std::string_view name) noexcept;

// ============================================================================
// RuleSet
// ============================================================================

/**
 * Ordered, immutable-after-construction list of rules with their severities.
 *
 * Shared read-only between worker threads.
 */
class RuleSet
{
public:
  struct Entry
  {
    std::unique_ptr<Rule> rule;
    Severity severity = Severity::Error;
  };

  RuleSet() = default;
  RuleSet(const RuleSet &) = delete;
  RuleSet & operator=(const RuleSet &) = delete;
  RuleSet(RuleSet &&) = default;
  RuleSet & operator=(RuleSet &&) = default;

  /// Every built-in rule with default properties
  [[nodiscard]] static RuleSet all_builtin(Severity severity = Severity::Error);

  void add(std::unique_ptr<Rule> rule, Severity severity = Severity::Error);

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  [[nodiscard]] const Rule & rule(size_t index) const { return *entries_.at(index).rule; }
  [[nodiscard]] Severity severity(size_t index) const { return entries_.at(index).severity; }

  [[nodiscard]] auto begin() const noexcept { return entries_.begin(); }
  [[nodiscard]] auto end() const noexcept { return entries_.end(); }

private:
  std::vector<Entry> entries_;
};

}  // namespace jlint
