// jlint/lint/rule_registry.cpp - Built-in rules and configured rule sets
#include "jlint/lint/rule_registry.hpp"

#include <array>

#include "jlint/rules/final_local_variable.hpp"
#include "jlint/rules/multiple_variable_declarations.hpp"
#include "jlint/rules/one_statement_per_line.hpp"
#include "jlint/rules/unused_imports.hpp"

namespace jlint
{

namespace
{

template <typename R>
std::unique_ptr<Rule> create_rule(const Properties & properties)
{
  return R::from_config(properties);
}

template <typename R>
gsl::span<const std::string_view> boolean_properties_of()
{
  return gsl::span<const std::string_view>(
    R::k_boolean_properties.data(), R::k_boolean_properties.size());
}

const std::array<RuleFactory, 4> k_builtin_rules = {{
  {rules::FinalLocalVariable::k_name, "Local variables that are never reassigned should be final",
   &create_rule<rules::FinalLocalVariable>, boolean_properties_of<rules::FinalLocalVariable>()},
  {rules::MultipleVariableDeclarations::k_name,
   "Each variable is declared in its own statement and on its own line",
   &create_rule<rules::MultipleVariableDeclarations>, {}},
  {rules::OneStatementPerLine::k_name, "At most one statement per line",
   &create_rule<rules::OneStatementPerLine>, boolean_properties_of<rules::OneStatementPerLine>()},
  {rules::UnusedImports::k_name, "Imports that are never referenced",
   &create_rule<rules::UnusedImports>, boolean_properties_of<rules::UnusedImports>()},
}};

}  // namespace

gsl::span<const RuleFactory> builtin_rules() noexcept
{
  return gsl::span<const RuleFactory>(k_builtin_rules.data(), k_builtin_rules.size());
}

const RuleFactory * find_rule_factory(std::string_view name) noexcept
{
  for (const auto & factory : k_builtin_rules) {
    if (factory.name == name) return &factory;
  }
  return nullptr;
}

RuleSet RuleSet::all_builtin(Severity severity)
{
  RuleSet set;
  const Properties defaults;
  for (const auto & factory : k_builtin_rules) {
    set.add(factory.create(defaults), severity);
  }
  return set;
}

void RuleSet::add(std::unique_ptr<Rule> rule, Severity severity)
{
  entries_.push_back(Entry{std::move(rule), severity});
}

}  // namespace jlint
