#pragma once

#include "ulidtool/counter/counter_state.h"
#include "ulidtool/counter/persisted_counter.h"
#include "ulidtool/strategy/randomness_strategy.h"

namespace ulidtool::strategy {

// RuntimeLexicalStrategy uses the whole 80-bit randomness field as a counter,
// so identifiers minted in the same millisecond sort in mint order.
// The counter is process-scoped and starts at 0.
//
// NOT thread-safe: the counter is shared and unsynchronized.
class RuntimeLexicalStrategy final : public IUlidStrategy {
 public:
  // Throws std::invalid_argument unless counter is 80 bits wide.
  explicit RuntimeLexicalStrategy(counter::CounterState& counter);

  core::Uint128 next() override { return counter_.next(); }
  [[nodiscard]] std::string_view name() const override { return "runtime_lexical"; }

 private:
  counter::CounterState& counter_;
};

// LocalLexicalStrategy is RuntimeLexicalStrategy over a PersistedCounter:
// ordering continues across process restarts.
//
// NOT thread-safe.
class LocalLexicalStrategy final : public IUlidStrategy {
 public:
  // Throws std::invalid_argument unless counter is 80 bits wide.
  explicit LocalLexicalStrategy(counter::PersistedCounter& counter);

  core::Uint128 next() override { return counter_.state().next(); }
  [[nodiscard]] std::string_view name() const override { return "local_lexical"; }

 private:
  counter::PersistedCounter& counter_;
};

}  // namespace ulidtool::strategy
