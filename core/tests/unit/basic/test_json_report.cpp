// tests/basic/test_json_report.cpp - Unit tests for the JSON diagnostic report

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "jlint/basic/json_report.hpp"

using namespace jlint;
using nlohmann::json;

// ============================================================================
// Helper Functions
// ============================================================================

static Diagnostic make_diagnostic(SourceRange range)
{
  Diagnostic d;
  d.rule = "FinalLocalVariable";
  d.kind = ViolationKind{"VariableShouldBeFinal", "Variable 'x' should be declared final."};
  d.range = range;
  d.severity = Severity::Warning;
  return d;
}

// ============================================================================
// Tests
// ============================================================================

TEST(JsonReportTest, FieldNamesAndPositions)
{
  const SourceFile sf("class A {\n  int x = 1;\n}\n");
  const json j = to_json(make_diagnostic(SourceRange(16, 17)), sf);

  EXPECT_EQ(j.at("rule_name"), "FinalLocalVariable");
  EXPECT_EQ(j.at("message"), "Variable 'x' should be declared final.");
  EXPECT_EQ(j.at("severity"), "warning");
  EXPECT_EQ(j.at("line"), 2);
  EXPECT_EQ(j.at("column"), 7);
  EXPECT_EQ(j.at("end_line"), 2);
  EXPECT_EQ(j.at("end_column"), 8);
  EXPECT_TRUE(j.at("fix").is_null());
}

TEST(JsonReportTest, FixEditsUseByteOffsets)
{
  const SourceFile sf("int x = 1;");
  Diagnostic d = make_diagnostic(SourceRange(4, 5));
  d.fix = Fix{{Edit::insertion(0, "final ")}};

  const json j = to_json(d, sf);
  const json & edits = j.at("fix").at("edits");
  ASSERT_EQ(edits.size(), 1U);
  EXPECT_EQ(edits[0].at("range").at("start"), 0);
  EXPECT_EQ(edits[0].at("range").at("end"), 0);
  EXPECT_EQ(edits[0].at("replacement_text"), "final ");
}

TEST(JsonReportTest, ArrayPreservesOrder)
{
  const SourceFile sf("abcdef");
  std::vector<Diagnostic> diags{
    make_diagnostic(SourceRange(3, 4)),
    make_diagnostic(SourceRange(0, 1)),
  };
  diags[1].rule = "UnusedImports";

  const json j = to_json(diags, sf);
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 2U);
  EXPECT_EQ(j[0].at("column"), 4);
  EXPECT_EQ(j[1].at("rule_name"), "UnusedImports");
}

TEST(JsonReportTest, EmptyListIsEmptyArray)
{
  const json j = to_json(std::vector<Diagnostic>{}, SourceFile("x"));
  EXPECT_TRUE(j.is_array());
  EXPECT_TRUE(j.empty());
}
