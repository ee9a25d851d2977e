#pragma once

#include "ulidtool/core/clock.h"
#include "ulidtool/core/entropy.h"

#include <string>
#include <vector>

// Startup verification of the host assumptions identifier generation rests on.
// Each check is a pure function returning a CheckResult; run_system_checks
// collects them and enforce() turns any failure into FatalInitializationError.
namespace ulidtool::integrity {

struct CheckResult {
  std::string name;    // NOLINT(readability-identifier-naming)
  bool passed{false};  // NOLINT(readability-identifier-naming)
  std::string detail;  // NOLINT(readability-identifier-naming)
};

struct IntegrityReport {
  std::vector<CheckResult> checks;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const;
  [[nodiscard]] std::vector<CheckResult> failures() const;
};

// Earliest wall-clock time a healthy clock may report: 2025-01-01T00:00:00Z.
constexpr std::uint64_t kPlausibleClockFloorMs = 1735689600000ull;

// ── Arithmetic and layout ───────────────────────────────────────────────────

// Carry and borrow across the 64-bit halves, wrap at 2^128, shifts across halves.
[[nodiscard]] CheckResult check_uint128_arithmetic();

// A 16-byte pattern survives big-endian pack and unpack, most significant byte first.
[[nodiscard]] CheckResult check_byte_order_round_trip();

// A counter of the given width hands out its maximum and then wraps to 0.
// Named "counter_wrap_<width>".
[[nodiscard]] CheckResult check_counter_wrap(unsigned width);

// ── Host clock and time representation ─────────────────────────────────────

// std::chrono::system_clock ticks at least once per millisecond.
[[nodiscard]] CheckResult check_clock_resolution();

// time_t 0 renders as 1970-01-01T00:00:00Z.
[[nodiscard]] CheckResult check_epoch_origin();

// time_t is at least 64 bits wide (no Y2K38 overflow).
[[nodiscard]] CheckResult check_time_t_width();

// clock reports a time at or after kPlausibleClockFloorMs that fits in 48 bits.
[[nodiscard]] CheckResult check_clock_plausible(core::ITimeSource& clock);

// Two consecutive 8-byte draws differ.
[[nodiscard]] CheckResult check_entropy_varies(core::IEntropySource& entropy);

// Runs every check above, counter_wrap for widths 4, 8, 16, 72 and 80.
[[nodiscard]] IntegrityReport run_system_checks(core::ITimeSource& clock,
                                                core::IEntropySource& entropy);

// Throws core::FatalInitializationError listing every failed check.
void enforce(const IntegrityReport& report);

}  // namespace ulidtool::integrity
