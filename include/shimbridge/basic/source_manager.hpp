// shimbridge/basic/source_manager.hpp - Byte offsets, ranges and line tables
//
// Host and shim texts are both addressed by byte offsets. Line/column
// information is computed on demand from a SourceFile line table.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace shimbridge
{

// ============================================================================
// SourceLocation / SourceRange
// ============================================================================

/// A byte offset into a host or shim text; default-constructed means unknown.
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }
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
  : begin_(SourceLocation(begin)), end_(SourceLocation(end))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  friend constexpr bool operator==(SourceRange a, SourceRange b) noexcept
  {
    return a.begin_ == b.begin_ && a.end_ == b.end_;
  }
  friend constexpr bool operator!=(SourceRange a, SourceRange b) noexcept { return !(a == b); }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/// 1-indexed line and column; {0, 0} when unknown.
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * A named text (a host unit or the rendered shim buffer) with a line table.
 */
class SourceFile
{
public:
  SourceFile() : line_starts_{0} {}

  explicit SourceFile(std::string content);

  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string file_name() const { return path_.filename().string(); }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }

  [[nodiscard]] size_t line_count() const noexcept { return line_starts_.size(); }

  /// Offset of the start of a 0-indexed line; past the last line, the end of text.
  [[nodiscard]] uint32_t line_offset(uint32_t line_index) const noexcept;

  /// Offsets past the end of text map to the end of text.
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// A 0-indexed line without its line terminator (LF or CRLF).
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// The text covered by `range`, clipped to the file; empty for invalid ranges.
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  void index_lines();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_starts_;
};

}  // namespace shimbridge
