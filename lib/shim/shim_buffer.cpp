// shimbridge/shim/shim_buffer.cpp - Shim buffer implementation
#include "shimbridge/shim/shim_buffer.hpp"

#include <utility>

namespace shimbridge
{

void ShimBuffer::push_command(std::string_view rendered_text, SourceRange origin)
{
  if (rendered_text.empty()) {
    return;
  }

  ShimCommand cmd;
  cmd.text = std::string(rendered_text);
  if (cmd.text.back() != '\n') {
    cmd.text.push_back('\n');
  }
  cmd.origin = origin.is_valid() ? origin
                                 : SourceRange(PositionMap::k_sentinel, PositionMap::k_sentinel);
  cmd.shim_start = current_end_offset();

  const auto shim_end = static_cast<uint32_t>(cmd.shim_start + cmd.text.size());

  // Record first: if the map rejects the span nothing has been appended yet.
  positions_.record(cmd.shim_start, shim_end, cmd.origin);
  text_ += cmd.text;
  commands_.push_back(std::move(cmd));
}

}  // namespace shimbridge
