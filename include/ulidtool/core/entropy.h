#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <span>
#include <vector>

namespace ulidtool::core {

// Abstract entropy source for randomness injection.
// Production code reads the OS random device; tests use a seeded, reproducible stream.
// Randomness here defends against collisions, not against an adversary.
class IEntropySource {
 public:
  virtual ~IEntropySource() = default;

  // Fill out with random bytes. Never fails for a working source.
  virtual void fill(std::span<std::uint8_t> out) = 0;

  [[nodiscard]] std::vector<std::uint8_t> bytes(std::size_t n) {
    std::vector<std::uint8_t> out(n);
    fill(out);
    return out;
  }

 protected:
  IEntropySource() = default;
  IEntropySource(const IEntropySource&) = default;
  IEntropySource& operator=(const IEntropySource&) = default;
  IEntropySource(IEntropySource&&) = default;
  IEntropySource& operator=(IEntropySource&&) = default;
};

// Production entropy: std::random_device (/dev/urandom or getrandom on Linux).
class SystemEntropySource final : public IEntropySource {
 public:
  SystemEntropySource() = default;
  ~SystemEntropySource() override = default;

  // Not copyable or movable (owns the random device handle)
  SystemEntropySource(const SystemEntropySource&) = delete;
  SystemEntropySource& operator=(const SystemEntropySource&) = delete;
  SystemEntropySource(SystemEntropySource&&) = delete;
  SystemEntropySource& operator=(SystemEntropySource&&) = delete;

  void fill(std::span<std::uint8_t> out) override;

 private:
  std::random_device device_;
};

// Deterministic entropy: mt19937_64 stream from a fixed seed.
// Same seed and same sequence of fill() calls produce the same bytes.
class DeterministicEntropySource final : public IEntropySource {
 public:
  explicit DeterministicEntropySource(std::uint64_t seed) : engine_(seed) {}
  ~DeterministicEntropySource() override = default;

  DeterministicEntropySource(const DeterministicEntropySource&) = default;
  DeterministicEntropySource& operator=(const DeterministicEntropySource&) = default;
  DeterministicEntropySource(DeterministicEntropySource&&) = default;
  DeterministicEntropySource& operator=(DeterministicEntropySource&&) = default;

  void fill(std::span<std::uint8_t> out) override;

 private:
  std::mt19937_64 engine_;
};

}  // namespace ulidtool::core
