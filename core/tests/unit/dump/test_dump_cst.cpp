// tests/dump/test_dump_cst.cpp - Unit tests for the CST dumper

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "jlint/syntax/cst_dumper.hpp"
#include "jlint/syntax/frontend.hpp"

using namespace jlint;

// ============================================================================
// Helper Functions
// ============================================================================

static std::string dump(const std::string & src, bool named_only)
{
  auto file = parse_source(src);
  std::ostringstream os;
  CstDumper dumper(os, file->source);
  dumper.set_named_only(named_only);
  dumper.dump(file->root());
  return os.str();
}

static bool has_line(const std::string & out, const std::string & line)
{
  std::istringstream in(out);
  std::string l;
  while (std::getline(in, l)) {
    if (l == line) return true;
  }
  return false;
}

// ============================================================================
// Tests
// ============================================================================

TEST(DumpCstTest, FieldsPositionsAndPreviews)
{
  const std::string out = dump("class A {}\n", false);
  EXPECT_EQ(out.rfind("program [1:1-", 0), 0U) << out;
  EXPECT_TRUE(has_line(out, "  class_declaration [1:1-1:11]")) << out;
  EXPECT_TRUE(has_line(out, "    class [1:1-1:6] \"class\"")) << out;
  EXPECT_TRUE(has_line(out, "    name: identifier [1:7-1:8] \"A\"")) << out;
  EXPECT_TRUE(has_line(out, "    body: class_body [1:9-1:11]")) << out;
  EXPECT_TRUE(has_line(out, "      { [1:9-1:10] \"{\"")) << out;
}

TEST(DumpCstTest, NamedOnlySkipsTokens)
{
  const std::string out = dump("class A {}\n", true);
  EXPECT_TRUE(has_line(out, "    name: identifier [1:7-1:8] \"A\"")) << out;
  EXPECT_FALSE(has_line(out, "    class [1:1-1:6] \"class\"")) << out;
  EXPECT_EQ(out.find("\"{\""), std::string::npos) << out;
}

TEST(DumpCstTest, PreviewEscapesQuotesAndNewlines)
{
  const std::string out = dump("class A { String s = \"hi\"; }\n", false);
  EXPECT_NE(out.find("\\\""), std::string::npos) << out;

  const std::string comment = dump("/* a\nb */\nclass A {}\n", true);
  EXPECT_NE(comment.find("block_comment [1:1-2:5] \"/* a\\nb */\""), std::string::npos) << comment;
}

TEST(DumpCstTest, NullTree)
{
  const SourceFile sf("");
  std::ostringstream os;
  CstDumper dumper(os, sf);
  dumper.dump(ts_ll::Node());
  EXPECT_EQ(os.str(), "<no tree>\n");
}
