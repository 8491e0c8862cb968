// shimbridge/lsp/position_encoding.cpp - LSP position conversion
#include "shimbridge/lsp/position_encoding.hpp"

#include <algorithm>

namespace shimbridge::lsp
{

namespace
{

uint32_t utf16_column_to_bytes(std::string_view line, uint32_t character) noexcept
{
  uint32_t utf16_units = 0;
  uint32_t byte_index = 0;

  while (byte_index < line.size() && utf16_units < character) {
    const auto c0 = static_cast<unsigned char>(line[byte_index]);

    // Decode a single UTF-8 code point.
    uint32_t cp = c0;
    uint32_t nbytes = 1;
    if (c0 >= 0x80 && (c0 & 0xE0) == 0xC0 && byte_index + 1 < line.size()) {
      cp = ((c0 & 0x1F) << 6) | (static_cast<unsigned char>(line[byte_index + 1]) & 0x3F);
      nbytes = 2;
    } else if (c0 >= 0x80 && (c0 & 0xF0) == 0xE0 && byte_index + 2 < line.size()) {
      cp = ((c0 & 0x0F) << 12) | ((static_cast<unsigned char>(line[byte_index + 1]) & 0x3F) << 6) |
           (static_cast<unsigned char>(line[byte_index + 2]) & 0x3F);
      nbytes = 3;
    } else if (c0 >= 0x80 && (c0 & 0xF8) == 0xF0 && byte_index + 3 < line.size()) {
      cp = ((c0 & 0x07) << 18) | ((static_cast<unsigned char>(line[byte_index + 1]) & 0x3F) << 12) |
           ((static_cast<unsigned char>(line[byte_index + 2]) & 0x3F) << 6) |
           (static_cast<unsigned char>(line[byte_index + 3]) & 0x3F);
      nbytes = 4;
    }

    const uint32_t units = (cp <= 0xFFFF) ? 1U : 2U;
    if (utf16_units + units > character) {
      // Target is inside this code point; clamp to its start.
      break;
    }
    utf16_units += units;
    byte_index += nbytes;
  }

  return std::min<uint32_t>(byte_index, static_cast<uint32_t>(line.size()));
}

}  // namespace

PositionEncoding parse_position_encoding(std::string_view name) noexcept
{
  return name == "utf-8" ? PositionEncoding::Utf8 : PositionEncoding::Utf16;
}

uint32_t lsp_position_to_offset(
  const SourceFile & text, uint32_t line, uint32_t character, PositionEncoding encoding) noexcept
{
  if (line >= text.line_count()) {
    return static_cast<uint32_t>(text.content().size());
  }

  const uint32_t line_start = text.line_offset(line);
  const std::string_view content = text.get_line(line);

  if (encoding == PositionEncoding::Utf8) {
    return line_start + std::min<uint32_t>(character, static_cast<uint32_t>(content.size()));
  }
  return line_start + utf16_column_to_bytes(content, character);
}

}  // namespace shimbridge::lsp
