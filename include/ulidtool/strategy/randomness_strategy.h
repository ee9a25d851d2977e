#pragma once

#include "ulidtool/core/uint128.h"
#include "ulidtool/identifier.h"

#include <optional>
#include <string_view>

namespace ulidtool::strategy {

// IRandomnessStrategy produces the randomness field of one identifier format.
//
// Contract:
// - next() returns a value that fits in Traits::kRandomnessBits
// - next() never fails; counter-based strategies wrap silently
// - seeded strategies report their SeedLayout so prime() can recover the seed
//
// Thread-safety is per implementation and documented on each class.
template <typename Traits>
class IRandomnessStrategy {
 public:
  using traits_type = Traits;

  virtual ~IRandomnessStrategy() = default;

  virtual core::Uint128 next() = 0;

  [[nodiscard]] virtual std::string_view name() const = 0;

  [[nodiscard]] virtual std::optional<SeedLayout> seed_layout() const { return std::nullopt; }

 protected:
  IRandomnessStrategy() = default;
  IRandomnessStrategy(const IRandomnessStrategy&) = default;
  IRandomnessStrategy& operator=(const IRandomnessStrategy&) = default;
  IRandomnessStrategy(IRandomnessStrategy&&) = default;
  IRandomnessStrategy& operator=(IRandomnessStrategy&&) = default;
};

using IUlidStrategy = IRandomnessStrategy<UlidTraits>;
using ISlidStrategy = IRandomnessStrategy<SlidTraits>;

}  // namespace ulidtool::strategy
