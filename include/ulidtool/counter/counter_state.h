#pragma once

#include "ulidtool/core/uint128.h"

#include <optional>
#include <string_view>

namespace ulidtool::counter {

// CounterState is a monotonic counter of a fixed bit width (1..128).
// next() hands out the current value and advances it modulo 2^width, so the
// sequence is 0, 1, ..., 2^width - 1, 0, ... from a zero start. Wrapping is
// silent and never an error.
//
// Not synchronized: concurrent next() calls from several threads race on the
// increment and may hand out duplicates. Give each thread its own instance or
// serialize access externally.
class CounterState {
 public:
  // Throws std::invalid_argument if width is 0 or above 128, or if initial
  // does not fit in width bits.
  explicit CounterState(unsigned width, core::Uint128 initial = {});

  // Returns the current value, then advances.
  core::Uint128 next();

  // The value the next call to next() will return.
  [[nodiscard]] core::Uint128 peek() const { return value_; }

  // The most recent value handed out (or restored from storage), if any.
  [[nodiscard]] std::optional<core::Uint128> last() const { return last_; }

  [[nodiscard]] unsigned width() const { return width_; }
  [[nodiscard]] core::Uint128 max() const { return core::Uint128::low_mask(width_); }

  // Seeds last() without handing the value out; used when restoring persisted state.
  void restore_last(core::Uint128 last);

 private:
  unsigned width_;
  core::Uint128 value_;
  std::optional<core::Uint128> last_;
};

// Throws std::invalid_argument naming owner unless counter is exactly width bits wide.
void require_width(const CounterState& counter, unsigned width, std::string_view owner);

}  // namespace ulidtool::counter
