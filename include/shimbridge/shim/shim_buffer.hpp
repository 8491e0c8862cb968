// shimbridge/shim/shim_buffer.hpp - Accumulated shim source for one environment
//
// The buffer only grows: each pushed command is appended to the rendered
// text and recorded in the position map.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "shimbridge/basic/source_manager.hpp"
#include "shimbridge/shim/position_map.hpp"

namespace shimbridge
{

/**
 * One top-level shim command as pushed by the translator.
 */
struct ShimCommand
{
  std::string text;     ///< Rendered text, newline terminated
  SourceRange origin;   ///< Host range the command came from
  uint32_t shim_start = 0;
};

class ShimBuffer
{
public:
  ShimBuffer() = default;

  /**
   * Append one rendered command.
   *
   * A missing trailing newline is added so commands never share a line.
   * Empty text is a no-op. The host range must be the command's origin;
   * invalid ranges are recorded as the sentinel position.
   */
  void push_command(std::string_view rendered_text, SourceRange origin);

  [[nodiscard]] uint32_t current_end_offset() const noexcept
  {
    return static_cast<uint32_t>(text_.size());
  }

  [[nodiscard]] const std::string & source_text() const noexcept { return text_; }

  [[nodiscard]] const PositionMap & position_map() const noexcept { return positions_; }

  [[nodiscard]] const std::vector<ShimCommand> & commands() const noexcept { return commands_; }

  [[nodiscard]] bool empty() const noexcept { return commands_.empty(); }

private:
  std::string text_;
  PositionMap positions_;
  std::vector<ShimCommand> commands_;
};

}  // namespace shimbridge
