// jlint/basic/source_manager.hpp - Source location, range and line index
//
// This header provides types for tracking source code locations and ranges,
// and the per-file line index used to turn byte offsets into line/column.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace jlint
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A compact representation of a source location.
 *
 * Internally stores a byte offset into the source file. Line and column
 * information can be computed on demand via SourceFile.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  /// Create an invalid location
  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}

  /// Create a location from byte offset
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }

  /// Get the byte offset
  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * A range of source code defined by start and end locations.
 *
 * The range is inclusive of the start and exclusive of the end,
 * following the half-open interval convention [start, end).
 */
class SourceRange
{
public:
  /// Create an invalid range
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  /// Empty range at a single location (used for insertions)
  [[nodiscard]] static constexpr SourceRange at(uint32_t offset) noexcept
  {
    return {offset, offset};
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr bool is_invalid() const noexcept
  {
    return !is_valid();
  }

  /// True when the ranges share a byte, or are insertions at the same point
  [[nodiscard]] constexpr bool overlaps(SourceRange other) const noexcept
  {
    const uint32_t a0 = start_.get_offset();
    const uint32_t a1 = end_.get_offset();
    const uint32_t b0 = other.start_.get_offset();
    const uint32_t b1 = other.end_.get_offset();
    if (a0 == a1 || b0 == b1) {
      return a0 == b0 || (a0 < b0 && b0 < a1) || (b0 < a0 && a0 < b1);
    }
    return a0 < b1 && b0 < a1;
  }

  /// Get the size in bytes
  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.get_offset() - start_.get_offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 *
 * Columns count bytes, not characters.
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

// ============================================================================
// FullSourceRange - Complete range with line/column info
// ============================================================================

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile - One source text plus its line index
// ============================================================================

/**
 * Owns a source file's content and provides location services.
 *
 * Features:
 * - Stores the file path (may be empty for in-memory sources)
 * - Pre-computes line start offsets for O(log n) offset -> line lookup
 * - Slices the content by byte range
 */
class SourceFile
{
public:
  SourceFile() = default;

  explicit SourceFile(std::string content) : content_(std::move(content)) { build_line_table(); }

  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] bool has_path() const noexcept { return !path_.empty(); }

  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }

  void set_content(std::string new_content);

  /// Number of lines (a trailing newline opens one more, empty, line)
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Convert byte offset to line/column (1-indexed); offsets past the end clamp to EOF
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept
  {
    return loc.is_valid() ? get_line_column(loc.get_offset()) : LineColumn{};
  }

  /// Byte offset of a line start (0-indexed line number)
  [[nodiscard]] uint32_t get_line_offset(uint32_t line_index) const noexcept
  {
    if (line_index >= line_offsets_.size()) {
      return static_cast<uint32_t>(content_.size());
    }
    return line_offsets_[line_index];
  }

  /// Content of a specific line (0-indexed), without the line terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Leading whitespace of the line containing `offset`
  [[nodiscard]] std::string_view get_indentation(uint32_t offset) const noexcept;

  /// Slice of content by range (clamped to the content)
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  /// Expand a SourceRange to include full line/column info
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace jlint
