// frugal_ls/basic/source_manager.hpp - Source text, byte ranges and positions
//
// Byte offsets are what tree-sitter hands out; editors speak in 0-based
// (line, character) positions. This header owns the conversion between the
// two. Characters are UTF-8 byte columns, matching tree-sitter points.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace frugal_ls
{

// ============================================================================
// SourceRange - half-open byte span
// ============================================================================

/**
 * A range of source bytes following the half-open convention [begin, end).
 */
class SourceRange
{
public:
  /// Invalid/unknown offset sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(uint32_t begin, uint32_t end) noexcept : begin_(begin), end_(end) {}

  [[nodiscard]] constexpr uint32_t begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr uint32_t end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_ != k_invalid_offset && end_ != k_invalid_offset && begin_ <= end_;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_ - begin_ : 0;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  uint32_t begin_ = k_invalid_offset;
  uint32_t end_ = k_invalid_offset;
};

// ============================================================================
// Position / Range - editor coordinates (0-indexed)
// ============================================================================

struct Position
{
  uint32_t line = 0;
  uint32_t character = 0;

  [[nodiscard]] bool operator==(const Position & o) const noexcept
  {
    return line == o.line && character == o.character;
  }
  [[nodiscard]] bool operator!=(const Position & o) const noexcept { return !(*this == o); }
  [[nodiscard]] bool operator<(const Position & o) const noexcept
  {
    return std::tie(line, character) < std::tie(o.line, o.character);
  }
};

struct Range
{
  Position start;
  Position end;

  [[nodiscard]] bool operator==(const Range & o) const noexcept
  {
    return start == o.start && end == o.end;
  }
  [[nodiscard]] bool operator!=(const Range & o) const noexcept { return !(*this == o); }
  [[nodiscard]] bool operator<(const Range & o) const noexcept
  {
    return std::tie(start, end) < std::tie(o.start, o.end);
  }
};

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

/**
 * Human-readable line and column position (1-indexed), used for terminal
 * output only.
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

// ============================================================================
// SourceManager - Source content and location services
// ============================================================================

/**
 * Owns one document's source bytes and a table of line start offsets.
 *
 * Lines are split on '\n' only; a preceding '\r' stays part of the line
 * content, as it does in tree-sitter's column counting.
 */
class SourceManager
{
public:
  SourceManager() { build_line_table(); }

  explicit SourceManager(std::string source) : source_(std::move(source)) { build_line_table(); }

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }
  [[nodiscard]] size_t size() const noexcept { return source_.size(); }
  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  // ===========================================================================
  // Location Conversion
  // ===========================================================================

  /**
   * Convert an editor position to a byte offset.
   *
   * Returns std::nullopt when the line does not exist or the character lies
   * past the end of that line. A character equal to the line length (cursor
   * at end of line) is accepted.
   */
  [[nodiscard]] std::optional<uint32_t> offset_at(Position pos) const noexcept;

  /// Convert a byte offset to an editor position. Offsets past the end clamp.
  [[nodiscard]] Position position_at(uint32_t offset) const noexcept;

  /// Convert a byte span to an editor range.
  [[nodiscard]] Range to_range(SourceRange range) const noexcept;

  /// Convert byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Get the byte offset of a line start (0-indexed line number)
  [[nodiscard]] uint32_t get_line_offset(uint32_t line_index) const noexcept
  {
    if (line_index >= line_offsets_.size()) {
      return static_cast<uint32_t>(source_.size());
    }
    return line_offsets_[line_index];
  }

  /// Content of a line (0-indexed) without its terminating newline
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Slice of the source covered by `range`, clamped to the source size
  [[nodiscard]] std::string_view get_source_slice(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::string source_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace frugal_ls
