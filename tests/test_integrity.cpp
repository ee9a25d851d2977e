#include "ulidtool/core/clock.h"
#include "ulidtool/core/entropy.h"
#include "ulidtool/core/errors.h"
#include "ulidtool/integrity/integrity.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <string>

using namespace ulidtool;

namespace {

constexpr std::int64_t kNowMs = 1760000000000;  // 2025-10-09

// Entropy source that always returns the same bytes.
class StuckEntropySource final : public core::IEntropySource {
 public:
  void fill(std::span<std::uint8_t> out) override { std::fill(out.begin(), out.end(), 0x5a); }
};

const integrity::CheckResult* find_check(const integrity::IntegrityReport& report,
                                         const std::string& name) {
  for (const auto& check : report.checks) {
    if (check.name == name) {
      return &check;
    }
  }
  return nullptr;
}

}  // namespace

// ── Individual checks ───────────────────────────────────────────────────────

TEST_CASE("integrity: host-independent checks pass", "[integrity]") {
  CHECK(integrity::check_uint128_arithmetic().passed);
  CHECK(integrity::check_byte_order_round_trip().passed);
  for (const unsigned width : {4u, 8u, 16u, 72u, 80u}) {
    const auto result = integrity::check_counter_wrap(width);
    CHECK(result.passed);
    CHECK(result.name == "counter_wrap_" + std::to_string(width));
  }
}

TEST_CASE("integrity: host clock and time_t checks pass on a 64-bit host", "[integrity]") {
  CHECK(integrity::check_clock_resolution().passed);
  const auto epoch = integrity::check_epoch_origin();
  CHECK(epoch.passed);
  CHECK(epoch.detail == "1970-01-01T00:00:00Z");
  CHECK(integrity::check_time_t_width().passed);
}

TEST_CASE("check_clock_plausible: rejects a clock stuck before 2025", "[integrity]") {
  core::FixedClock stale(0);
  const auto result = integrity::check_clock_plausible(stale);
  CHECK_FALSE(result.passed);
  CHECK(result.name == "clock_plausible");

  core::FixedClock current(kNowMs);
  CHECK(integrity::check_clock_plausible(current).passed);
}

TEST_CASE("check_entropy_varies: rejects a stuck source", "[integrity]") {
  StuckEntropySource stuck;
  CHECK_FALSE(integrity::check_entropy_varies(stuck).passed);

  core::DeterministicEntropySource varying(17);
  CHECK(integrity::check_entropy_varies(varying).passed);
}

TEST_CASE("check_counter_wrap: invalid width is reported, not thrown", "[integrity]") {
  const auto result = integrity::check_counter_wrap(0);
  CHECK_FALSE(result.passed);
  CHECK_FALSE(result.detail.empty());
}

// ── Report and enforcement ──────────────────────────────────────────────────

TEST_CASE("run_system_checks: healthy host passes every check", "[integrity]") {
  core::FixedClock clock(kNowMs);
  core::DeterministicEntropySource entropy(1);
  const auto report = integrity::run_system_checks(clock, entropy);

  CHECK(report.checks.size() == 12u);
  CHECK(report.ok());
  CHECK(report.failures().empty());
  for (const char* name : {"uint128_arithmetic", "byte_order_round_trip", "counter_wrap_4",
                           "counter_wrap_80", "clock_resolution", "epoch_origin", "time_t_width",
                           "clock_plausible", "entropy_varies"}) {
    CHECK(find_check(report, name) != nullptr);
  }
  CHECK_NOTHROW(integrity::enforce(report));
}

TEST_CASE("enforce: lists every failed check", "[integrity]") {
  core::FixedClock clock(0);
  StuckEntropySource entropy;
  const auto report = integrity::run_system_checks(clock, entropy);
  REQUIRE_FALSE(report.ok());
  CHECK(report.failures().size() == 2u);

  try {
    integrity::enforce(report);
    FAIL("enforce did not throw");
  } catch (const core::FatalInitializationError& e) {
    const std::string message = e.what();
    CHECK(message.find("clock_plausible") != std::string::npos);
    CHECK(message.find("entropy_varies") != std::string::npos);
  }
}
