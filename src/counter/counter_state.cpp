#include "ulidtool/counter/counter_state.h"

#include <stdexcept>
#include <string>

namespace ulidtool::counter {

CounterState::CounterState(const unsigned width, const core::Uint128 initial)
    : width_(width), value_(initial) {
  if (width_ == 0u || width_ > 128u) {
    throw std::invalid_argument("CounterState width must be in 1..128, got " +
                                std::to_string(width_));
  }
  if (!initial.fits_in(width_)) {
    throw std::invalid_argument("CounterState initial value " + core::to_string(initial) +
                                " exceeds " + std::to_string(width_) + " bits");
  }
}

core::Uint128 CounterState::next() {
  const core::Uint128 current = value_;
  value_ = (value_ + 1u) & max();
  last_ = current;
  return current;
}

void CounterState::restore_last(const core::Uint128 last) {
  last_ = last & max();
  value_ = (last + 1u) & max();
}

void require_width(const CounterState& counter, const unsigned width, const std::string_view owner) {
  if (counter.width() != width) {
    throw std::invalid_argument(std::string(owner) + " requires a " + std::to_string(width) +
                                "-bit counter, got " + std::to_string(counter.width()));
  }
}

}  // namespace ulidtool::counter
