#include "ulidtool/strategy/default_strategy.h"

#include <array>

namespace ulidtool::strategy {

core::Uint128 DefaultStrategy::next() {
  std::array<std::uint8_t, UlidTraits::kRandomnessBits / 8> draw{};
  entropy_.fill(draw);
  return core::from_big_endian<UlidTraits::kRandomnessBits / 8>(draw);
}

}  // namespace ulidtool::strategy
