// shimbridge/shim/position_map.hpp - Shim offset <-> host position mapping
//
// Every command pushed into the shim buffer records one span. Lookups are
// best-effort: a shim offset that precedes every span maps to the sentinel
// host position (offset 0), so diagnostics are never silently dropped.
//
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "shimbridge/basic/source_manager.hpp"

namespace shimbridge
{

/// Thrown when spans are recorded out of shim order (internal invariant break).
class OrderingViolation : public std::logic_error
{
public:
  explicit OrderingViolation(const std::string & what) : std::logic_error(what) {}
};

/**
 * A contiguous shim byte range and the host range it was produced from.
 */
struct ShimSpan
{
  uint32_t shim_start = 0;
  uint32_t shim_end = 0;
  SourceRange host;  ///< host.get_begin() is the span's HostPosition

  [[nodiscard]] SourceLocation host_position() const noexcept { return host.get_begin(); }
};

class PositionMap
{
public:
  /// Sentinel returned when no span matches.
  static constexpr SourceLocation k_sentinel = SourceLocation(0);

  /**
   * Append a span starting at `shim_start`.
   *
   * @throws OrderingViolation if shim_start lies before the end of the last
   *         recorded span, or shim_end before shim_start
   */
  void record(uint32_t shim_start, uint32_t shim_end, SourceRange host);

  /// Host position of the greatest span whose start is <= offset, or the sentinel.
  [[nodiscard]] SourceLocation shim_to_host(uint32_t offset) const noexcept;

  /**
   * Host range of the span containing `start`.
   *
   * A shim range is attributed as a whole to the span holding its start, so the
   * host range reported for it is that span's full host range.
   */
  [[nodiscard]] SourceRange shim_range_to_host(uint32_t start) const noexcept;

  /**
   * Shim start of the first span whose host position is >= `position`.
   *
   * Everything before it was produced by earlier host constructs; the
   * remapper uses it to cut a batch's records from those of earlier batches.
   */
  [[nodiscard]] std::optional<uint32_t> host_to_shim(SourceLocation position) const noexcept;

  [[nodiscard]] const std::vector<ShimSpan> & spans() const noexcept { return spans_; }
  [[nodiscard]] bool empty() const noexcept { return spans_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return spans_.size(); }

private:
  /// Index of the greatest span with start <= offset.
  [[nodiscard]] std::optional<size_t> find_span(uint32_t offset) const noexcept;

  std::vector<ShimSpan> spans_;
};

}  // namespace shimbridge
