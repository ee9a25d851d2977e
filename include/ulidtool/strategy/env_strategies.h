#pragma once

#include "ulidtool/counter/counter_state.h"
#include "ulidtool/seed/seed_registry.h"
#include "ulidtool/strategy/randomness_strategy.h"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace ulidtool::strategy {

// Seeded strategies split the low bits of the randomness field into
// [seed][counter]. The seed keeps processes (or threads) apart; the counter
// orders identifiers within one of them.

// EnvLexicalStrategy: [process seed byte: 8][process counter: 72].
// NOT thread-safe: the counter is shared across threads.
class EnvLexicalStrategy final : public IUlidStrategy {
 public:
  static constexpr SeedLayout kLayout{8, 72};

  // Throws std::invalid_argument unless counter is 72 bits wide.
  EnvLexicalStrategy(seed::SeedRegistry& seeds, counter::CounterState& counter);

  core::Uint128 next() override;
  [[nodiscard]] std::string_view name() const override { return "env_lexical"; }
  [[nodiscard]] std::optional<SeedLayout> seed_layout() const override { return kLayout; }

 private:
  seed::SeedRegistry& seeds_;
  counter::CounterState& counter_;
};

// ThreadEnvLexicalStrategy: [thread seed byte: 8][thread counter: 72].
// Each thread gets its own counter, stored thread_local and keyed by this
// strategy instance, so next() is safe to call from any number of threads.
// Identifiers from different threads differ in the seed byte (up to 256 threads).
// A destroyed strategy's counters are released lazily: each thread drops them the
// next time it starts a counter for another instance.
class ThreadEnvLexicalStrategy final : public IUlidStrategy {
 public:
  static constexpr SeedLayout kLayout{8, 72};

  explicit ThreadEnvLexicalStrategy(seed::SeedRegistry& seeds);

  core::Uint128 next() override;
  [[nodiscard]] std::string_view name() const override { return "thread_env_lexical"; }
  [[nodiscard]] std::optional<SeedLayout> seed_layout() const override { return kLayout; }

  // Per-instance counters the calling thread currently holds.
  [[nodiscard]] static std::size_t counters_on_this_thread();

 private:
  seed::SeedRegistry& seeds_;
  std::uint64_t instance_id_;
  // Expires with the strategy; thread-local counters hold a weak_ptr to it.
  std::shared_ptr<const int> liveness_;
};

// ShortEnvLexicalStrategy: [process seed nibble: 4][counter nibble: 4],
// right-aligned in the 80-bit field. Only 16 identifiers per millisecond
// stay ordered before the counter wraps.
// NOT thread-safe.
class ShortEnvLexicalStrategy final : public IUlidStrategy {
 public:
  static constexpr SeedLayout kLayout{4, 4};

  // Throws std::invalid_argument unless counter is 4 bits wide.
  ShortEnvLexicalStrategy(seed::SeedRegistry& seeds, counter::CounterState& counter);

  core::Uint128 next() override;
  [[nodiscard]] std::string_view name() const override { return "short_env_lexical"; }
  [[nodiscard]] std::optional<SeedLayout> seed_layout() const override { return kLayout; }

 private:
  seed::SeedRegistry& seeds_;
  counter::CounterState& counter_;
};

// SlidLexicalStrategy fills the 16-bit SLID randomness field:
// [process seed byte: 8][counter byte: 8].
// NOT thread-safe.
class SlidLexicalStrategy final : public ISlidStrategy {
 public:
  static constexpr SeedLayout kLayout{8, 8};

  // Throws std::invalid_argument unless counter is 8 bits wide.
  SlidLexicalStrategy(seed::SeedRegistry& seeds, counter::CounterState& counter);

  core::Uint128 next() override;
  [[nodiscard]] std::string_view name() const override { return "slid_lexical"; }
  [[nodiscard]] std::optional<SeedLayout> seed_layout() const override { return kLayout; }

 private:
  seed::SeedRegistry& seeds_;
  counter::CounterState& counter_;
};

}  // namespace ulidtool::strategy
