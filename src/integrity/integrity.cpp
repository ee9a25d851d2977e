#include "ulidtool/integrity/integrity.h"

#include "ulidtool/core/errors.h"
#include "ulidtool/core/uint128.h"
#include "ulidtool/counter/counter_state.h"

#include <array>
#include <chrono>
#include <climits>
#include <ctime>
#include <exception>
#include <iomanip>
#include <ratio>
#include <sstream>
#include <utility>

namespace ulidtool::integrity {

namespace {

CheckResult pass(std::string name, std::string detail = {}) {
  return CheckResult{std::move(name), true, std::move(detail)};
}

CheckResult fail(std::string name, std::string detail) {
  return CheckResult{std::move(name), false, std::move(detail)};
}

}  // namespace

bool IntegrityReport::ok() const {
  for (const auto& check : checks) {
    if (!check.passed) {
      return false;
    }
  }
  return true;
}

std::vector<CheckResult> IntegrityReport::failures() const {
  std::vector<CheckResult> failed;
  for (const auto& check : checks) {
    if (!check.passed) {
      failed.push_back(check);
    }
  }
  return failed;
}

CheckResult check_uint128_arithmetic() {
  const std::string name = "uint128_arithmetic";
  constexpr std::uint64_t kAllOnes = ~std::uint64_t{0};

  if (core::Uint128{0u, kAllOnes} + 1u != core::Uint128{1u, 0u}) {
    return fail(name, "carry from low to high half lost");
  }
  if (core::Uint128{1u, 0u} - 1u != core::Uint128{0u, kAllOnes}) {
    return fail(name, "borrow from high to low half lost");
  }
  if (core::Uint128::max() + 1u != core::Uint128{}) {
    return fail(name, "2^128 - 1 + 1 does not wrap to 0");
  }
  if (core::Uint128{} - 1u != core::Uint128::max()) {
    return fail(name, "0 - 1 does not wrap to 2^128 - 1");
  }
  if ((core::Uint128{1u} << 100u) >> 100u != core::Uint128{1u} ||
      (core::Uint128{1u} << 64u) != core::Uint128{1u, 0u}) {
    return fail(name, "shift across the 64-bit boundary is wrong");
  }
  return pass(name);
}

CheckResult check_byte_order_round_trip() {
  const std::string name = "byte_order_round_trip";
  std::array<std::uint8_t, 16> pattern{};
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    pattern[i] = static_cast<std::uint8_t>(0xf0u | i);
  }

  const core::Uint128 packed = core::from_big_endian<16>(pattern);
  if (packed.hi >> 56u != 0xf0u || (packed.lo & 0xffu) != 0xffu) {
    return fail(name, "first byte is not the most significant");
  }
  if (core::to_big_endian<16>(packed) != pattern) {
    return fail(name, "pack/unpack does not restore the pattern");
  }
  return pass(name);
}

CheckResult check_counter_wrap(const unsigned width) {
  const std::string name = "counter_wrap_" + std::to_string(width);
  try {
    const core::Uint128 top = core::Uint128::low_mask(width);
    counter::CounterState counter(width, top);
    if (counter.next() != top) {
      return fail(name, "counter did not hand out its maximum");
    }
    if (counter.next() != core::Uint128{}) {
      return fail(name, "counter did not wrap to 0 after its maximum");
    }
  } catch (const std::exception& e) {
    return fail(name, e.what());
  }
  return pass(name);
}

CheckResult check_clock_resolution() {
  using Period = std::chrono::system_clock::period;
  const std::string detail =
      "period " + std::to_string(Period::num) + "/" + std::to_string(Period::den) + " s";
  if (!std::ratio_less_equal_v<Period, std::milli>) {
    return fail("clock_resolution", "system clock is coarser than 1 ms: " + detail);
  }
  return pass("clock_resolution", detail);
}

CheckResult check_epoch_origin() {
  const std::time_t origin = 0;
  const std::tm* utc = std::gmtime(&origin);
  if (utc == nullptr) {
    return fail("epoch_origin", "gmtime(0) failed");
  }
  std::ostringstream oss;
  oss << std::put_time(utc, "%Y-%m-%dT%H:%M:%SZ");
  if (oss.str() != "1970-01-01T00:00:00Z") {
    return fail("epoch_origin", "time 0 is " + oss.str());
  }
  return pass("epoch_origin", oss.str());
}

CheckResult check_time_t_width() {
  constexpr std::size_t kBits = sizeof(std::time_t) * CHAR_BIT;
  if (kBits < 64u) {
    return fail("time_t_width", "time_t is " + std::to_string(kBits) + " bits (Y2K38)");
  }
  return pass("time_t_width", std::to_string(kBits) + " bits");
}

CheckResult check_clock_plausible(core::ITimeSource& clock) {
  const std::string name = "clock_plausible";
  std::uint64_t now = 0;
  try {
    now = clock.now_ms();
  } catch (const core::FatalInitializationError& e) {
    return fail(name, e.what());
  }
  if (now < kPlausibleClockFloorMs) {
    return fail(name, "clock reports " + std::to_string(now) + " ms, before 2025-01-01");
  }
  if (now > core::kMaxTimestampMs) {
    return fail(name, "clock reports " + std::to_string(now) + " ms, beyond 48 bits");
  }
  return pass(name, std::to_string(now) + " ms");
}

CheckResult check_entropy_varies(core::IEntropySource& entropy) {
  const auto first = entropy.bytes(8);
  const auto second = entropy.bytes(8);
  if (first == second) {
    return fail("entropy_varies", "two consecutive draws are identical");
  }
  return pass("entropy_varies");
}

IntegrityReport run_system_checks(core::ITimeSource& clock, core::IEntropySource& entropy) {
  IntegrityReport report;
  report.checks.push_back(check_uint128_arithmetic());
  report.checks.push_back(check_byte_order_round_trip());
  for (const unsigned width : {4u, 8u, 16u, 72u, 80u}) {
    report.checks.push_back(check_counter_wrap(width));
  }
  report.checks.push_back(check_clock_resolution());
  report.checks.push_back(check_epoch_origin());
  report.checks.push_back(check_time_t_width());
  report.checks.push_back(check_clock_plausible(clock));
  report.checks.push_back(check_entropy_varies(entropy));
  return report;
}

void enforce(const IntegrityReport& report) {
  const auto failed = report.failures();
  if (failed.empty()) {
    return;
  }
  std::string message = "system integrity checks failed:";
  for (const auto& check : failed) {
    message += "\n  " + check.name + ": " + check.detail;
  }
  throw core::FatalInitializationError(message);
}

}  // namespace ulidtool::integrity
