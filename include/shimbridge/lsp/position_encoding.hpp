// shimbridge/lsp/position_encoding.hpp - LSP position <-> byte offset conversion
#pragma once

#include <cstdint>
#include <string_view>

#include "shimbridge/basic/source_manager.hpp"

namespace shimbridge::lsp
{

/// Unit of the LSP "character" field negotiated during initialize.
enum class PositionEncoding {
  Utf8,
  Utf16,
};

/// Parse the negotiated encoding; anything but "utf-8" falls back to UTF-16.
[[nodiscard]] PositionEncoding parse_position_encoding(std::string_view name) noexcept;

/**
 * Convert an LSP (line, character) pair to a byte offset in `text`.
 *
 * Lines past the end clamp to the end of text; characters past the end of a
 * line clamp to the line end.
 */
[[nodiscard]] uint32_t lsp_position_to_offset(
  const SourceFile & text, uint32_t line, uint32_t character, PositionEncoding encoding) noexcept;

}  // namespace shimbridge::lsp
