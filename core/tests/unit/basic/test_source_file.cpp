// tests/basic/test_source_file.cpp - Unit tests for SourceFile and source locations

#include <gtest/gtest.h>

#include <string>

#include "jlint/basic/source_manager.hpp"

using namespace jlint;

// ============================================================================
// Line index
// ============================================================================

TEST(SourceFileTest, LineColumnIsOneIndexed)
{
  const SourceFile sf("ab\ncd\n");
  EXPECT_EQ(sf.line_count(), 3U);

  LineColumn lc = sf.get_line_column(0U);
  EXPECT_EQ(lc.line, 1U);
  EXPECT_EQ(lc.column, 1U);

  lc = sf.get_line_column(4U);
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 2U);

  // The newline belongs to the line it terminates
  lc = sf.get_line_column(2U);
  EXPECT_EQ(lc.line, 1U);
  EXPECT_EQ(lc.column, 3U);
}

TEST(SourceFileTest, OffsetPastEndIsClamped)
{
  const SourceFile sf("abc");
  const LineColumn lc = sf.get_line_column(100U);
  EXPECT_EQ(lc.line, 1U);
  EXPECT_EQ(lc.column, 4U);
}

TEST(SourceFileTest, InvalidLocationHasNoPosition)
{
  const SourceFile sf("abc");
  EXPECT_FALSE(sf.get_line_column(SourceLocation()).is_valid());
}

TEST(SourceFileTest, ColumnsCountBytes)
{
  // "é" is two bytes in UTF-8
  const SourceFile sf("\xC3\xA9x");
  EXPECT_EQ(sf.get_line_column(2U).column, 3U);
}

TEST(SourceFileTest, GetLineStripsTerminator)
{
  const SourceFile sf("first\r\nsecond\nthird");
  EXPECT_EQ(sf.get_line(0), "first");
  EXPECT_EQ(sf.get_line(1), "second");
  EXPECT_EQ(sf.get_line(2), "third");
  EXPECT_EQ(sf.get_line(3), "");
}

TEST(SourceFileTest, LineOffsets)
{
  const SourceFile sf("a\nbb\nccc");
  EXPECT_EQ(sf.get_line_offset(0), 0U);
  EXPECT_EQ(sf.get_line_offset(1), 2U);
  EXPECT_EQ(sf.get_line_offset(2), 5U);
  EXPECT_EQ(sf.get_line_offset(3), 8U);
}

TEST(SourceFileTest, Indentation)
{
  const SourceFile sf("class A {\n  \tint x;\n}\n");
  EXPECT_EQ(sf.get_indentation(0), "");
  EXPECT_EQ(sf.get_indentation(15), "  \t");
}

TEST(SourceFileTest, SetContentRebuildsLineTable)
{
  SourceFile sf("one line");
  EXPECT_EQ(sf.line_count(), 1U);
  sf.set_content("a\nb\nc");
  EXPECT_EQ(sf.line_count(), 3U);
  EXPECT_EQ(sf.get_line(2), "c");
}

// ============================================================================
// Slices and ranges
// ============================================================================

TEST(SourceFileTest, SliceByRange)
{
  const SourceFile sf("int x = 1;");
  EXPECT_EQ(sf.get_slice(SourceRange(4, 5)), "x");
  EXPECT_EQ(sf.get_slice(SourceRange(8, 100)), "1;");
  EXPECT_EQ(sf.get_slice(SourceRange()), "");
}

TEST(SourceFileTest, FullRange)
{
  const SourceFile sf("ab\ncdef\n");
  const FullSourceRange fr = sf.get_full_range(SourceRange(1, 6));
  EXPECT_TRUE(fr.is_valid());
  EXPECT_EQ(fr.start_line, 1U);
  EXPECT_EQ(fr.start_column, 2U);
  EXPECT_EQ(fr.end_line, 2U);
  EXPECT_EQ(fr.end_column, 4U);
  EXPECT_EQ(fr.start_byte, 1U);
  EXPECT_EQ(fr.end_byte, 6U);
}

TEST(SourceFileTest, PathIsOptional)
{
  const SourceFile anonymous("x");
  EXPECT_FALSE(anonymous.has_path());

  const SourceFile named("src/A.java", "class A {}");
  EXPECT_TRUE(named.has_path());
  EXPECT_EQ(named.path().filename().string(), "A.java");
}

TEST(SourceRangeTest, Overlaps)
{
  EXPECT_TRUE(SourceRange(0, 5).overlaps(SourceRange(4, 8)));
  EXPECT_FALSE(SourceRange(0, 5).overlaps(SourceRange(5, 8)));

  // Insertions conflict with edits that strictly contain their point, or another insertion there
  EXPECT_TRUE(SourceRange::at(3).overlaps(SourceRange(0, 5)));
  EXPECT_TRUE(SourceRange::at(3).overlaps(SourceRange::at(3)));
  EXPECT_FALSE(SourceRange::at(5).overlaps(SourceRange(0, 5)));
}

TEST(SourceRangeTest, Size)
{
  const SourceRange r(2, 6);
  EXPECT_TRUE(r.is_valid());
  EXPECT_EQ(r.size(), 4U);
  EXPECT_EQ(SourceRange().size(), 0U);
}
