#pragma once

#include "ulidtool/core/entropy.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace ulidtool::seed {

// SeedRegistry hands out the one-time identifying seeds that keep concurrently
// running scopes apart when they share a counter space.
//
// - process seed: one byte drawn from the entropy source on first use
//   (std::call_once) and immutable afterwards; the nibble is its high 4 bits
// - thread seed: a sequential id assigned to each thread on first sight,
//   reduced mod 256; stable for the thread's lifetime. The mutex is taken only
//   on first sight; later calls read a thread_local cache.
//
// Seeds are not cryptographic and are never persisted. Thread-safe.
class SeedRegistry {
 public:
  explicit SeedRegistry(core::IEntropySource& entropy);
  ~SeedRegistry() = default;

  SeedRegistry(const SeedRegistry&) = delete;
  SeedRegistry& operator=(const SeedRegistry&) = delete;
  SeedRegistry(SeedRegistry&&) = delete;
  SeedRegistry& operator=(SeedRegistry&&) = delete;

  [[nodiscard]] std::uint8_t process_byte();
  [[nodiscard]] std::uint8_t process_nibble();

  // Seed of the calling thread. Threads are numbered 0, 1, 2, ... in order of
  // first call; above 256 live threads seeds repeat.
  [[nodiscard]] std::uint8_t thread_byte();

  [[nodiscard]] std::size_t known_threads() const;

 private:
  core::IEntropySource& entropy_;
  // Process-unique, never reused; tags the thread_local cache entries.
  std::uint64_t registry_id_;

  std::once_flag process_once_;
  std::uint8_t process_byte_{0};

  mutable std::mutex threads_mutex_;
  std::unordered_map<std::thread::id, std::uint8_t> thread_seeds_;
  std::size_t next_thread_index_{0};
};

}  // namespace ulidtool::seed
