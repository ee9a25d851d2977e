#pragma once

#include "ulidtool/core/entropy.h"
#include "ulidtool/strategy/randomness_strategy.h"

namespace ulidtool::strategy {

// DefaultStrategy draws 80 fresh bits from the entropy source per call.
// Thread-safe if the entropy source is.
class DefaultStrategy final : public IUlidStrategy {
 public:
  explicit DefaultStrategy(core::IEntropySource& entropy) : entropy_(entropy) {}

  core::Uint128 next() override;
  [[nodiscard]] std::string_view name() const override { return "default"; }

 private:
  core::IEntropySource& entropy_;
};

}  // namespace ulidtool::strategy
