#include "ulidtool/seed/seed_registry.h"

#include <array>
#include <atomic>
#include <limits>

namespace ulidtool::seed {

namespace {

constexpr std::uint64_t kNoRegistry = std::numeric_limits<std::uint64_t>::max();

std::uint64_t next_registry_id() {
  static std::atomic<std::uint64_t> sequence{0};
  return sequence.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace

SeedRegistry::SeedRegistry(core::IEntropySource& entropy)
    : entropy_(entropy), registry_id_(next_registry_id()) {}

std::uint8_t SeedRegistry::process_byte() {
  std::call_once(process_once_, [this] {
    std::array<std::uint8_t, 1> draw{};
    entropy_.fill(draw);
    process_byte_ = draw[0];
  });
  return process_byte_;
}

std::uint8_t SeedRegistry::process_nibble() {
  return static_cast<std::uint8_t>(process_byte() >> 4u);
}

std::uint8_t SeedRegistry::thread_byte() {
  struct CachedSeed {
    std::uint64_t registry_id{kNoRegistry};
    std::uint8_t seed{0};
  };
  thread_local CachedSeed cached;
  if (cached.registry_id == registry_id_) {
    return cached.seed;
  }

  const auto id = std::this_thread::get_id();
  std::lock_guard<std::mutex> lock(threads_mutex_);
  auto it = thread_seeds_.find(id);
  if (it == thread_seeds_.end()) {
    const auto seed = static_cast<std::uint8_t>(next_thread_index_ % 256u);
    ++next_thread_index_;
    it = thread_seeds_.emplace(id, seed).first;
  }
  cached = CachedSeed{registry_id_, it->second};
  return it->second;
}

std::size_t SeedRegistry::known_threads() const {
  std::lock_guard<std::mutex> lock(threads_mutex_);
  return thread_seeds_.size();
}

}  // namespace ulidtool::seed
