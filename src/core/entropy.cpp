#include "ulidtool/core/entropy.h"

namespace ulidtool::core {

void SystemEntropySource::fill(std::span<std::uint8_t> out) {
  // random_device yields 32-bit words; spread each over four bytes.
  std::size_t i = 0;
  while (i < out.size()) {
    const std::uint32_t word = device_();
    for (unsigned shift = 0; shift < 32u && i < out.size(); shift += 8u, ++i) {
      out[i] = static_cast<std::uint8_t>(word >> shift);
    }
  }
}

void DeterministicEntropySource::fill(std::span<std::uint8_t> out) {
  std::size_t i = 0;
  while (i < out.size()) {
    const std::uint64_t word = engine_();
    for (unsigned shift = 0; shift < 64u && i < out.size(); shift += 8u, ++i) {
      out[i] = static_cast<std::uint8_t>(word >> shift);
    }
  }
}

}  // namespace ulidtool::core
