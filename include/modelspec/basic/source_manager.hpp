// modelspec/basic/source_manager.hpp - Offsets, ranges and line lookup
//
// AST nodes and errors store plain byte offsets into the model text. Lines
// and columns are only computed when a diagnostic is printed.
//
#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modelspec
{

/// Byte offset into a model text; default-constructed locations are invalid.
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = std::numeric_limits<uint32_t>::max();

  constexpr SourceLocation() noexcept = default;
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  friend constexpr bool operator==(SourceLocation a, SourceLocation b) noexcept
  {
    return a.offset_ == b.offset_;
  }
  friend constexpr bool operator!=(SourceLocation a, SourceLocation b) noexcept
  {
    return !(a == b);
  }
  friend constexpr bool operator<(SourceLocation a, SourceLocation b) noexcept
  {
    return a.offset_ < b.offset_;
  }
  friend constexpr bool operator>(SourceLocation a, SourceLocation b) noexcept { return b < a; }
  friend constexpr bool operator<=(SourceLocation a, SourceLocation b) noexcept { return !(b < a); }
  friend constexpr bool operator>=(SourceLocation a, SourceLocation b) noexcept { return !(a < b); }

private:
  uint32_t offset_ = k_invalid_offset;
};

/// Half-open byte range [begin, end).
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept
  : begin_(begin), end_(end)
  {
  }
  constexpr SourceRange(uint32_t begin, uint32_t end) noexcept
  : SourceRange(SourceLocation(begin), SourceLocation(end))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr bool contains(SourceLocation loc) const noexcept
  {
    return begin_ <= loc && loc < end_;
  }

  /// Length in bytes, 0 for an invalid range.
  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_.get_offset() - begin_.get_offset() : 0;
  }

  friend constexpr bool operator==(SourceRange a, SourceRange b) noexcept
  {
    return a.begin_ == b.begin_ && a.end_ == b.end_;
  }
  friend constexpr bool operator!=(SourceRange a, SourceRange b) noexcept { return !(a == b); }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/// From the start of `a` to the end of `b`; an invalid side yields the other.
[[nodiscard]] constexpr SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  return {a.get_begin(), b.get_end()};
}

struct LineColumn
{
  uint32_t line = 0;    // 1-based, 0 when unknown
  uint32_t column = 0;  // 1-based byte column

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line != 0 && column != 0; }
};

/// A range with both ends resolved to line/column.
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] SourceRange to_source_range() const noexcept { return {start_byte, end_byte}; }
  [[nodiscard]] bool is_valid() const noexcept { return start_line != 0; }
};

/**
 * Owns the text of one model specification.
 *
 * Most specifications fit on one line; files handed to msc may not, so the
 * start offset of every line is recorded once at construction.
 */
class SourceManager
{
public:
  explicit SourceManager(std::string text = {}, std::string name = "<spec>");

  /// File path or "<spec>", shown after `-->` in diagnostics.
  [[nodiscard]] const std::string & get_name() const noexcept { return name_; }
  void set_name(std::string name) { name_ = std::move(name); }

  [[nodiscard]] std::string_view get_source() const noexcept { return text_; }
  [[nodiscard]] size_t size() const noexcept { return text_.size(); }
  [[nodiscard]] size_t get_line_count() const noexcept { return line_starts_.size(); }

  /// Offsets past the end clamp to the end-of-input position.
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;
  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept
  {
    return loc.is_valid() ? get_line_column(loc.get_offset()) : LineColumn{};
  }

  /// Text of line `index` (0-based) without its terminator; empty when out of range.
  [[nodiscard]] std::string_view get_line(uint32_t index) const noexcept;

  /// Text covered by `range`, clipped to the input.
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  std::string name_;
  std::string text_;
  std::vector<uint32_t> line_starts_;
};

}  // namespace modelspec
