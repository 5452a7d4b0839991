// tests/lint/test_properties.cpp - Unit tests for rule properties and the rule registry

#include <gtest/gtest.h>

#include <string>

#include "jlint/lint/rule.hpp"
#include "jlint/lint/rule_registry.hpp"

using namespace jlint;

// ============================================================================
// Property parsing
// ============================================================================

TEST(PropertiesTest, Booleans)
{
  const Properties p{{"a", "true"}, {"b", " False "}, {"c", "1"}};
  EXPECT_TRUE(props::get_bool(p, "a", false));
  EXPECT_FALSE(props::get_bool(p, "b", true));
  EXPECT_TRUE(props::get_bool(p, "c", true));
  EXPECT_FALSE(props::get_bool(p, "c", false));
  EXPECT_TRUE(props::get_bool(p, "missing", true));

  EXPECT_FALSE(props::is_malformed_bool(p, "a"));
  EXPECT_TRUE(props::is_malformed_bool(p, "c"));
  EXPECT_FALSE(props::is_malformed_bool(p, "missing"));
}

// ============================================================================
// Registry
// ============================================================================

TEST(RuleRegistryTest, BuiltinRulesInRegistrationOrder)
{
  const auto rules = builtin_rules();
  ASSERT_EQ(rules.size(), 4U);
  EXPECT_EQ(rules[0].name, "FinalLocalVariable");
  EXPECT_EQ(rules[1].name, "MultipleVariableDeclarations");
  EXPECT_EQ(rules[2].name, "OneStatementPerLine");
  EXPECT_EQ(rules[3].name, "UnusedImports");
  for (const auto & factory : rules) {
    EXPECT_FALSE(factory.description.empty());
  }
}

TEST(RuleRegistryTest, BooleanPropertiesPerRule)
{
  const auto rules = builtin_rules();
  ASSERT_EQ(rules[0].boolean_properties.size(), 2U);
  EXPECT_EQ(rules[0].boolean_properties[0], "validateEnhancedForLoopVariable");
  EXPECT_EQ(rules[0].boolean_properties[1], "validateUnnamedVariables");
  EXPECT_TRUE(rules[1].boolean_properties.empty());
  ASSERT_EQ(rules[2].boolean_properties.size(), 1U);
  EXPECT_EQ(rules[2].boolean_properties[0], "treatTryResourcesAsStatement");
  ASSERT_EQ(rules[3].boolean_properties.size(), 1U);
  EXPECT_EQ(rules[3].boolean_properties[0], "processJavadoc");
}

TEST(RuleRegistryTest, FindByName)
{
  const RuleFactory * factory = find_rule_factory("UnusedImports");
  ASSERT_NE(factory, nullptr);
  auto rule = factory->create({});
  EXPECT_EQ(rule->name(), "UnusedImports");

  EXPECT_EQ(find_rule_factory("unusedimports"), nullptr);
  EXPECT_EQ(find_rule_factory("NoSuchRule"), nullptr);
}

TEST(RuleRegistryTest, AllBuiltinUsesGivenSeverity)
{
  const RuleSet set = RuleSet::all_builtin(Severity::Warning);
  ASSERT_EQ(set.size(), 4U);
  for (size_t i = 0; i < set.size(); ++i) {
    EXPECT_EQ(set.severity(i), Severity::Warning);
    EXPECT_EQ(set.rule(i).name(), builtin_rules()[i].name);
  }
}
