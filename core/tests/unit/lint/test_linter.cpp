// tests/lint/test_linter.cpp - Unit tests for the tree dispatcher

#include <gtest/gtest.h>

#include <array>
#include <memory>
#include <string>
#include <vector>

#include "jlint/lint/linter.hpp"
#include "jlint/lint/rule_registry.hpp"
#include "jlint/syntax/frontend.hpp"
#include "jlint/test_support/parse_helpers.hpp"

using namespace jlint;

// ============================================================================
// Test Rules
// ============================================================================

namespace
{

constexpr std::array<std::string_view, 1> k_identifier_kinds = {"identifier"};

/// Reports every identifier, limited to the kinds it declares
class IdentifierRule final : public Rule
{
public:
  explicit IdentifierRule(std::string name) : name_(std::move(name)) {}

  [[nodiscard]] std::string_view name() const noexcept override { return name_; }

  [[nodiscard]] std::optional<gsl::span<const std::string_view>> relevant_kinds()
    const noexcept override
  {
    return gsl::span<const std::string_view>(k_identifier_kinds.data(), k_identifier_kinds.size());
  }

  [[nodiscard]] std::vector<Diagnostic> check(
    const CheckContext & ctx, ts_ll::Node node) const override
  {
    DiagnosticBag bag;
    bag.report(node.range(), ViolationKind{"Identifier", std::string(ctx.text(node))});
    return bag.take();
  }

private:
  std::string name_;
};

/// Sees every node and reports the `program` node only, from its end
class ProgramRule final : public Rule
{
public:
  [[nodiscard]] std::string_view name() const noexcept override { return "ProgramRule"; }

  [[nodiscard]] std::vector<Diagnostic> check(
    const CheckContext & /*ctx*/, ts_ll::Node node) const override
  {
    if (node.kind() != "program") return {};
    DiagnosticBag bag;
    bag.report(SourceRange::at(node.end_byte()), ViolationKind{"End", "end"});
    bag.report(SourceRange::at(0), ViolationKind{"Start", "start"});
    return bag.take();
  }
};

}  // namespace

// ============================================================================
// Tests
// ============================================================================

TEST(LinterTest, EmptyRuleSetProducesNothing)
{
  const auto unit = test_support::parse("class A {}");
  const RuleSet rules;
  EXPECT_TRUE(Linter(rules).lint(*unit.file).empty());
}

TEST(LinterTest, DispatchesByKindAndTagsDiagnostics)
{
  const auto unit = test_support::parse("class A {\n  void run(int count) {}\n}\n");
  RuleSet rules;
  rules.add(std::make_unique<IdentifierRule>("Ids"), Severity::Hint);

  const auto diags = Linter(rules).lint(*unit.file);
  EXPECT_EQ(test_support::messages(diags), (std::vector<std::string>{"A", "run", "count"}));
  for (const auto & d : diags) {
    EXPECT_EQ(d.rule, "Ids");
    EXPECT_EQ(d.severity, Severity::Hint);
  }
}

TEST(LinterTest, ResultsAreSortedByOffsetThenRuleOrder)
{
  const auto unit = test_support::parse("class A { int f; }");
  RuleSet rules;
  rules.add(std::make_unique<ProgramRule>());
  rules.add(std::make_unique<IdentifierRule>("First"));
  rules.add(std::make_unique<IdentifierRule>("Second"));

  const auto diags = Linter(rules).lint(*unit.file);
  ASSERT_EQ(diags.size(), 6U);
  EXPECT_EQ(diags[0].message(), "start");
  EXPECT_EQ(diags[1].rule, "First");
  EXPECT_EQ(diags[1].message(), "A");
  EXPECT_EQ(diags[2].rule, "Second");
  EXPECT_EQ(diags[2].message(), "A");
  EXPECT_EQ(diags[3].rule, "First");
  EXPECT_EQ(diags[3].message(), "f");
  EXPECT_EQ(diags[4].rule, "Second");
  EXPECT_EQ(diags[5].message(), "end");
}

TEST(LinterTest, BuiltinRuleSetIsDeterministic)
{
  const std::string src =
    "import java.util.List;\n"
    "class A {\n"
    "  void m() {\n"
    "    int a = 1, b = 2; int c = 3;\n"
    "  }\n"
    "}\n";
  const auto unit = test_support::parse(src);
  const RuleSet rules = RuleSet::all_builtin();
  const Linter linter(rules);

  const auto first = linter.lint(*unit.file);
  const auto second = linter.lint(*unit.file);
  ASSERT_FALSE(first.empty());
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].rule, second[i].rule);
    EXPECT_EQ(first[i].range, second[i].range);
    EXPECT_EQ(first[i].message(), second[i].message());
  }
  for (size_t i = 1; i < first.size(); ++i) {
    EXPECT_LE(first[i - 1].range.get_begin(), first[i].range.get_begin());
  }
}

TEST(LinterTest, RecoveredTreeIsStillLinted)
{
  const auto unit =
    test_support::parse("class A {\n  void m() {\n    int x = 1;\n    foo(;\n  }\n}\n");
  ASSERT_TRUE(unit.file->has_syntax_errors());
  RuleSet rules;
  rules.add(std::make_unique<IdentifierRule>("Ids"));
  EXPECT_FALSE(Linter(rules).lint(*unit.file).empty());
}
