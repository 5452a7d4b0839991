// tests/rules/test_unused_imports.cpp - Unit tests for UnusedImports

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "jlint/basic/fix_applier.hpp"
#include "jlint/rules/unused_imports.hpp"
#include "jlint/test_support/parse_helpers.hpp"

using namespace jlint;
using jlint::rules::UnusedImports;

// ============================================================================
// Helper Functions
// ============================================================================

static std::vector<std::string> check(const std::string & src)
{
  return test_support::messages(test_support::run_rule<UnusedImports>(src));
}

static std::vector<std::string> check_without_javadoc(const std::string & src)
{
  return test_support::messages(
    test_support::run_rule(src, std::make_unique<UnusedImports>(false)));
}

using Messages = std::vector<std::string>;

// ============================================================================
// Basic Tests
// ============================================================================

TEST(UnusedImportsTest, UnreferencedImportIsReported)
{
  const std::string src =
    "import java.util.List;\n"
    "import java.util.Map;\n"
    "\n"
    "class A {\n"
    "  List<String> items;\n"
    "}\n";
  EXPECT_EQ(check(src), Messages{"Unused import - java.util.Map."});
}

TEST(UnusedImportsTest, UsesInExpressionsAndAnnotationsCount)
{
  const std::string src =
    "import java.util.Collections;\n"
    "import javax.annotation.Nullable;\n"
    "import java.io.IOException;\n"
    "\n"
    "class A {\n"
    "  @Nullable Object f() throws IOException {\n"
    "    return Collections.emptyList();\n"
    "  }\n"
    "}\n";
  EXPECT_TRUE(check(src).empty());
}

TEST(UnusedImportsTest, NoImportsNoDiagnostics)
{
  EXPECT_TRUE(check("class A {\n}\n").empty());
}

TEST(UnusedImportsTest, WildcardImportsAreNeverReported)
{
  const std::string src = "import java.util.*;\nimport static java.lang.Math.*;\nclass A {\n}\n";
  EXPECT_TRUE(check(src).empty());
}

TEST(UnusedImportsTest, NameOnlyInPlainCommentIsUnused)
{
  const std::string src =
    "import java.util.List;\n"
    "\n"
    "class A {\n"
    "  // List of things\n"
    "}\n";
  EXPECT_EQ(check(src), Messages{"Unused import - java.util.List."});
}

// ============================================================================
// Static imports
// ============================================================================

TEST(UnusedImportsTest, StaticImportUsedAsCall)
{
  const std::string src =
    "import static java.lang.Math.max;\n"
    "\n"
    "class A {\n"
    "  int f() {\n"
    "    return max(1, 2);\n"
    "  }\n"
    "}\n";
  EXPECT_TRUE(check(src).empty());
}

TEST(UnusedImportsTest, UnusedStaticImport)
{
  const std::string src = "import static java.lang.Math.max;\n\nclass A {\n}\n";
  EXPECT_EQ(check(src), Messages{"Unused import - java.lang.Math.max."});
}

// ============================================================================
// Redundant imports
// ============================================================================

TEST(UnusedImportsTest, JavaLangImportIsRedundantEvenWhenUsed)
{
  const std::string src =
    "import java.lang.String;\n"
    "\n"
    "class A {\n"
    "  String s;\n"
    "}\n";
  EXPECT_EQ(check(src), Messages{"Unused import - java.lang.String."});
}

TEST(UnusedImportsTest, JavaLangSubpackageIsNotRedundant)
{
  const std::string src =
    "import java.lang.reflect.Method;\n"
    "\n"
    "class A {\n"
    "  Method m;\n"
    "}\n";
  EXPECT_TRUE(check(src).empty());
}

TEST(UnusedImportsTest, SamePackageImportIsRedundant)
{
  const std::string src =
    "package com.example;\n"
    "\n"
    "import com.example.Helper;\n"
    "import com.example.util.Tool;\n"
    "\n"
    "class A {\n"
    "  Helper h;\n"
    "  Tool t;\n"
    "}\n";
  EXPECT_EQ(check(src), Messages{"Unused import - com.example.Helper."});
}

// ============================================================================
// Javadoc references
// ============================================================================

TEST(UnusedImportsTest, JavadocReferencesCountAsUses)
{
  const std::string src =
    "import java.util.Map;\n"
    "import java.util.List;\n"
    "import java.io.IOException;\n"
    "import java.util.Set;\n"
    "\n"
    "/**\n"
    " * See {@link Map#get(Object)} and {@linkplain List the list}.\n"
    " *\n"
    " * @throws IOException when reading fails\n"
    " * @see Set\n"
    " */\n"
    "class A {\n"
    "}\n";
  EXPECT_TRUE(check(src).empty());
}

TEST(UnusedImportsTest, JavadocMethodParameterTypesCountAsUses)
{
  const std::string src =
    "import java.util.Map;\n"
    "import java.util.List;\n"
    "\n"
    "/** Delegates to {@link Map#putAll(List)}. */\n"
    "class A {\n"
    "}\n";
  EXPECT_TRUE(check(src).empty());
}

TEST(UnusedImportsTest, JavadocIgnoredWhenDisabled)
{
  const std::string src =
    "import java.util.Map;\n"
    "\n"
    "/** See {@link Map}. */\n"
    "class A {\n"
    "}\n";
  EXPECT_EQ(check_without_javadoc(src), Messages{"Unused import - java.util.Map."});
}

TEST(UnusedImportsTest, NonJavadocBlockCommentDoesNotCount)
{
  const std::string src =
    "import java.util.Map;\n"
    "\n"
    "/* See {@link Map}. */\n"
    "class A {\n"
    "}\n";
  EXPECT_EQ(check(src), Messages{"Unused import - java.util.Map."});
}

TEST(UnusedImportsTest, OptionFromConfig)
{
  EXPECT_TRUE(UnusedImports::from_config({})->process_javadoc());
  EXPECT_FALSE(UnusedImports::from_config({{"processJavadoc", "false"}})->process_javadoc());
}

// ============================================================================
// Fixes
// ============================================================================

TEST(UnusedImportsTest, FixDeletesTheWholeLine)
{
  const std::string src =
    "import java.util.List;\n"
    "import java.util.Map;\n"
    "\n"
    "class A {\n"
    "  List<String> items;\n"
    "}\n";
  auto diags = test_support::run_rule<UnusedImports>(src);
  ASSERT_EQ(diags.size(), 1U);
  ASSERT_TRUE(diags[0].fix.has_value());
  EXPECT_EQ(diags[0].kind.fix_availability, FixAvailability::Always);
  EXPECT_EQ(
    apply_fixes(src, diags).text,
    "import java.util.List;\n"
    "\n"
    "class A {\n"
    "  List<String> items;\n"
    "}\n");
}

TEST(UnusedImportsTest, FixKeepsOtherCodeOnTheSameLine)
{
  const std::string src = "import java.util.List; import java.util.Map;\nclass A {\n  Map m;\n}\n";
  auto diags = test_support::run_rule<UnusedImports>(src);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(apply_fixes(src, diags).text, " import java.util.Map;\nclass A {\n  Map m;\n}\n");
}

TEST(UnusedImportsTest, DiagnosticCoversTheImportDeclaration)
{
  const std::string src = "import java.util.Map;\nclass A {\n}\n";
  const auto unit = test_support::parse(src);
  auto diags = test_support::run_rule<UnusedImports>(src);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(unit.slice(diags[0].range), "import java.util.Map;");
  EXPECT_EQ(unit.position(diags[0]).line, 1U);
  EXPECT_EQ(unit.position(diags[0]).column, 1U);
}
