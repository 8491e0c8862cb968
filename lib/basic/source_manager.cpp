// shimbridge/basic/source_manager.cpp - SourceFile line table
#include "shimbridge/basic/source_manager.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace shimbridge
{

SourceFile::SourceFile(std::string content) : content_(std::move(content)) { index_lines(); }

SourceFile::SourceFile(std::filesystem::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  index_lines();
}

void SourceFile::index_lines()
{
  line_starts_.assign(1, 0);
  for (uint32_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_starts_.push_back(i + 1);
    }
  }
}

uint32_t SourceFile::line_offset(uint32_t line_index) const noexcept
{
  return line_index < line_starts_.size() ? line_starts_[line_index]
                                          : static_cast<uint32_t>(content_.size());
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));

  // line_starts_ always begins with 0, so the predecessor exists.
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line_index = static_cast<uint32_t>(std::distance(line_starts_.begin(), next) - 1);
  return {line_index + 1, offset - line_starts_[line_index] + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_starts_.size()) {
    return {};
  }

  std::string_view line = std::string_view(content_).substr(line_starts_[line_index]);
  line = line.substr(0, line.find('\n'));
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (range.is_invalid()) {
    return {};
  }

  const uint32_t size = static_cast<uint32_t>(content_.size());
  const uint32_t begin = range.get_begin().offset();
  const uint32_t end = std::min(range.get_end().offset(), size);
  if (begin >= size || end < begin) {
    return {};
  }
  return std::string_view(content_).substr(begin, end - begin);
}

}  // namespace shimbridge
