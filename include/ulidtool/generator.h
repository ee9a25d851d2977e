#pragma once

#include "ulidtool/core/clock.h"
#include "ulidtool/core/entropy.h"
#include "ulidtool/counter/counter_state.h"
#include "ulidtool/counter/persisted_counter.h"
#include "ulidtool/identifier.h"
#include "ulidtool/integrity/integrity.h"
#include "ulidtool/seed/seed_registry.h"
#include "ulidtool/storage/counter_store.h"
#include "ulidtool/strategy/default_strategy.h"
#include "ulidtool/strategy/env_strategies.h"
#include "ulidtool/strategy/lexical_strategies.h"
#include "ulidtool/strategy/randomness_strategy.h"

#include <memory>
#include <optional>

namespace ulidtool {

struct GeneratorOptions {
  // Run integrity::run_system_checks at construction and refuse to start on failure.
  bool system_checks{true};  // NOLINT(readability-identifier-naming)

  // Backing store for local_lexical(). Not owned; must outlive the Generator.
  // nullptr disables local_lexical().
  storage::ICounterStore* counter_store{nullptr};  // NOLINT(readability-identifier-naming)
};

// Generator is the composition root for identifier construction.
// It references the injected clock and entropy source and owns everything
// with process lifetime: the seed registry, one counter per counter-based
// strategy, and the strategies themselves.
//
// Construction order:
// 1. system checks (unless disabled); failure throws FatalInitializationError
// 2. persisted counter restored from options.counter_store, if any
//
// Destruction writes the local_lexical counter back to its store.
//
// Thread-safety: ulid() and thread_env_lexical() may be called concurrently
// (given a thread-safe clock and entropy source). The other lexical members
// share unsynchronized counters and need external serialization.
class Generator {
 public:
  Generator(core::ITimeSource& clock, core::IEntropySource& entropy, GeneratorOptions options = {});
  ~Generator() = default;

  Generator(const Generator&) = delete;
  Generator& operator=(const Generator&) = delete;
  Generator(Generator&&) = delete;
  Generator& operator=(Generator&&) = delete;

  // Timestamp from the clock, randomness from strategy. Throws
  // FatalInitializationError if the clock value does not fit in 48 bits; the
  // strategy is not advanced in that case.
  template <typename Traits>
  [[nodiscard]] BasicIdentifier<Traits> construct(strategy::IRandomnessStrategy<Traits>& strategy) {
    const std::uint64_t timestamp = now();
    return BasicIdentifier<Traits>::from_fields(timestamp, strategy.next());
  }

  [[nodiscard]] Ulid ulid() { return construct(default_); }
  [[nodiscard]] Ulid runtime_lexical() { return construct(runtime_); }
  // Throws std::logic_error when no counter store was configured.
  [[nodiscard]] Ulid local_lexical();
  [[nodiscard]] Ulid env_lexical() { return construct(env_); }
  [[nodiscard]] Ulid thread_env_lexical() { return construct(thread_env_); }
  [[nodiscard]] Ulid short_env_lexical() { return construct(short_env_); }
  [[nodiscard]] Slid slid() { return construct(slid_); }

  [[nodiscard]] seed::SeedRegistry& seeds() { return seeds_; }

  // Report of the startup checks; nullopt when they were disabled.
  [[nodiscard]] const std::optional<integrity::IntegrityReport>& integrity_report() const {
    return integrity_report_;
  }

  // Writes the local_lexical counter back early; propagates store errors.
  void flush();

 private:
  [[nodiscard]] std::uint64_t now();

  core::ITimeSource& clock_;
  std::optional<integrity::IntegrityReport> integrity_report_;

  seed::SeedRegistry seeds_;
  counter::CounterState runtime_counter_;
  counter::CounterState env_counter_;
  counter::CounterState short_env_counter_;
  counter::CounterState slid_counter_;
  std::unique_ptr<counter::PersistedCounter> local_counter_;

  strategy::DefaultStrategy default_;
  strategy::RuntimeLexicalStrategy runtime_;
  strategy::EnvLexicalStrategy env_;
  strategy::ThreadEnvLexicalStrategy thread_env_;
  strategy::ShortEnvLexicalStrategy short_env_;
  strategy::SlidLexicalStrategy slid_;
  std::unique_ptr<strategy::LocalLexicalStrategy> local_;
};

}  // namespace ulidtool
