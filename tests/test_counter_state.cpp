#include "ulidtool/counter/counter_state.h"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace ulidtool::counter;
using ulidtool::core::Uint128;

TEST_CASE("CounterState: hands out 0, 1, 2, ... from a zero start", "[counter]") {
  CounterState counter(8);
  CHECK(counter.next() == Uint128{0u});
  CHECK(counter.next() == Uint128{1u});
  CHECK(counter.next() == Uint128{2u});
  CHECK(counter.peek() == Uint128{3u});
  REQUIRE(counter.last().has_value());
  CHECK(*counter.last() == Uint128{2u});
}

TEST_CASE("CounterState: wraps to 0 exactly after 2^width values", "[counter]") {
  for (const unsigned width : {1u, 4u, 8u, 16u}) {
    CounterState counter(width);
    const std::uint64_t period = std::uint64_t{1} << width;
    for (std::uint64_t i = 0; i < period; ++i) {
      const Uint128 value = counter.next();
      CHECK(value.fits_in(width));
    }
    CHECK(counter.next() == Uint128{0u});
  }
}

TEST_CASE("CounterState: wide counters wrap at their maximum", "[counter]") {
  for (const unsigned width : {72u, 80u, 128u}) {
    CounterState counter(width, Uint128::low_mask(width));
    CHECK(counter.next() == Uint128::low_mask(width));
    CHECK(counter.next() == Uint128{0u});
  }
}

TEST_CASE("CounterState: restore_last resumes after the restored value", "[counter]") {
  CounterState counter(80);
  counter.restore_last(Uint128{41u});
  REQUIRE(counter.last().has_value());
  CHECK(*counter.last() == Uint128{41u});
  CHECK(counter.next() == Uint128{42u});

  CounterState at_max(4);
  at_max.restore_last(Uint128{15u});
  CHECK(at_max.next() == Uint128{0u});
}

TEST_CASE("CounterState: no last value before first use", "[counter]") {
  const CounterState counter(16);
  CHECK_FALSE(counter.last().has_value());
  CHECK(counter.max() == Uint128{0xffffu});
}

TEST_CASE("CounterState: rejects invalid widths and initial values", "[counter]") {
  CHECK_THROWS_AS(CounterState(0), std::invalid_argument);
  CHECK_THROWS_AS(CounterState(129), std::invalid_argument);
  CHECK_THROWS_AS(CounterState(4, Uint128{16u}), std::invalid_argument);
}

TEST_CASE("require_width: names the owner on mismatch", "[counter]") {
  const CounterState counter(8);
  CHECK_NOTHROW(require_width(counter, 8, "owner"));
  CHECK_THROWS_AS(require_width(counter, 72, "owner"), std::invalid_argument);
}
