#include "ulidtool/strategy/env_strategies.h"

#include <atomic>
#include <memory>
#include <unordered_map>
#include <utility>

namespace ulidtool::strategy {

namespace {

core::Uint128 compose(const std::uint8_t seed, const core::Uint128 count, const SeedLayout layout) {
  return (core::Uint128{seed} << layout.counter_bits) | count;
}

std::uint64_t next_instance_id() {
  static std::atomic<std::uint64_t> sequence{0};
  return sequence.fetch_add(1, std::memory_order_relaxed);
}

struct ThreadCounter {
  std::weak_ptr<const int> owner;
  counter::CounterState state;
};

using ThreadCounters = std::unordered_map<std::uint64_t, ThreadCounter>;

ThreadCounters& thread_counters() {
  thread_local ThreadCounters counters;
  return counters;
}

// One counter per (thread, strategy instance). Instance ids are never reused,
// so a strategy created later cannot pick up a destroyed one's counter. Entries
// of destroyed strategies are dropped whenever the thread adds a new entry.
counter::CounterState& thread_counter(const std::uint64_t instance_id,
                                      const std::shared_ptr<const int>& owner) {
  auto& counters = thread_counters();
  auto it = counters.find(instance_id);
  if (it == counters.end()) {
    std::erase_if(counters, [](const auto& entry) { return entry.second.owner.expired(); });
    ThreadCounter fresh{owner,
                        counter::CounterState(ThreadEnvLexicalStrategy::kLayout.counter_bits)};
    it = counters.emplace(instance_id, std::move(fresh)).first;
  }
  return it->second.state;
}

}  // namespace

EnvLexicalStrategy::EnvLexicalStrategy(seed::SeedRegistry& seeds, counter::CounterState& counter)
    : seeds_(seeds), counter_(counter) {
  counter::require_width(counter_, kLayout.counter_bits, "env_lexical");
}

core::Uint128 EnvLexicalStrategy::next() {
  return compose(seeds_.process_byte(), counter_.next(), kLayout);
}

ThreadEnvLexicalStrategy::ThreadEnvLexicalStrategy(seed::SeedRegistry& seeds)
    : seeds_(seeds), instance_id_(next_instance_id()), liveness_(std::make_shared<const int>(0)) {}

core::Uint128 ThreadEnvLexicalStrategy::next() {
  return compose(seeds_.thread_byte(), thread_counter(instance_id_, liveness_).next(), kLayout);
}

std::size_t ThreadEnvLexicalStrategy::counters_on_this_thread() {
  return thread_counters().size();
}

ShortEnvLexicalStrategy::ShortEnvLexicalStrategy(seed::SeedRegistry& seeds,
                                                 counter::CounterState& counter)
    : seeds_(seeds), counter_(counter) {
  counter::require_width(counter_, kLayout.counter_bits, "short_env_lexical");
}

core::Uint128 ShortEnvLexicalStrategy::next() {
  return compose(seeds_.process_nibble(), counter_.next(), kLayout);
}

SlidLexicalStrategy::SlidLexicalStrategy(seed::SeedRegistry& seeds, counter::CounterState& counter)
    : seeds_(seeds), counter_(counter) {
  counter::require_width(counter_, kLayout.counter_bits, "slid_lexical");
}

core::Uint128 SlidLexicalStrategy::next() {
  return compose(seeds_.process_byte(), counter_.next(), kLayout);
}

}  // namespace ulidtool::strategy
