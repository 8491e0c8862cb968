// shimbridge/shim/position_map.cpp - Position map implementation
#include "shimbridge/shim/position_map.hpp"

#include <algorithm>

namespace shimbridge
{

void PositionMap::record(uint32_t shim_start, uint32_t shim_end, SourceRange host)
{
  if (!spans_.empty() && shim_start < spans_.back().shim_end) {
    throw OrderingViolation(
      "shim span at offset " + std::to_string(shim_start) + " overlaps the span ending at " +
      std::to_string(spans_.back().shim_end));
  }
  if (shim_end < shim_start) {
    throw OrderingViolation(
      "shim span end " + std::to_string(shim_end) + " precedes its start " +
      std::to_string(shim_start));
  }
  spans_.push_back(ShimSpan{shim_start, shim_end, host});
}

std::optional<size_t> PositionMap::find_span(uint32_t offset) const noexcept
{
  auto it = std::upper_bound(
    spans_.begin(), spans_.end(), offset,
    [](uint32_t off, const ShimSpan & span) { return off < span.shim_start; });
  if (it == spans_.begin()) {
    return std::nullopt;
  }
  --it;
  return static_cast<size_t>(it - spans_.begin());
}

SourceLocation PositionMap::shim_to_host(uint32_t offset) const noexcept
{
  const auto idx = find_span(offset);
  if (!idx) {
    return k_sentinel;
  }
  const SourceLocation pos = spans_[*idx].host_position();
  return pos.is_valid() ? pos : k_sentinel;
}

SourceRange PositionMap::shim_range_to_host(uint32_t start) const noexcept
{
  const auto idx = find_span(start);
  if (!idx) {
    return {k_sentinel, k_sentinel};
  }

  const ShimSpan & span = spans_[*idx];
  if (span.host.is_invalid()) {
    return {k_sentinel, k_sentinel};
  }

  // A range straddling a span boundary stays attributed to the earliest span.
  const uint32_t host_begin = span.host.get_begin().offset();
  const uint32_t host_end = std::max(host_begin, span.host.get_end().offset());
  return {host_begin, host_end};
}

std::optional<uint32_t> PositionMap::host_to_shim(SourceLocation position) const noexcept
{
  for (const auto & span : spans_) {
    if (span.host_position().is_valid() && span.host_position() >= position) {
      return span.shim_start;
    }
  }
  return std::nullopt;
}

}  // namespace shimbridge
