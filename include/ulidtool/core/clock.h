#pragma once

#include <cstdint>

namespace ulidtool::core {

// Largest timestamp representable in the 48-bit field (~ year 10889).
constexpr std::uint64_t kMaxTimestampMs = (std::uint64_t{1} << 48u) - 1u;

// checked_timestamp validates a millisecond count against the 48-bit field.
// Throws FatalInitializationError when ms is negative or exceeds kMaxTimestampMs.
[[nodiscard]] std::uint64_t checked_timestamp(std::int64_t ms);

// Abstract time source for timestamp injection.
// Allows production code to use system time while tests/demos use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class ITimeSource {
 public:
  virtual ~ITimeSource() = default;

  // Return milliseconds since the Unix epoch.
  // Contract: returned value fits in 48 bits.
  virtual std::uint64_t now_ms() = 0;

 protected:
  ITimeSource() = default;
  ITimeSource(const ITimeSource&) = default;
  ITimeSource& operator=(const ITimeSource&) = default;
  ITimeSource(ITimeSource&&) = default;
  ITimeSource& operator=(ITimeSource&&) = default;
};

// Production clock: reads std::chrono::system_clock.
class SystemClock final : public ITimeSource {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::uint64_t now_ms() override;
};

// Fixed clock: returns a settable timestamp for deterministic tests/demos.
class FixedClock final : public ITimeSource {
 public:
  explicit FixedClock(std::int64_t fixed_ms) : fixed_ms_(checked_timestamp(fixed_ms)) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::uint64_t now_ms() override;

  void set(std::int64_t ms) { fixed_ms_ = checked_timestamp(ms); }

 private:
  std::uint64_t fixed_ms_;
};

}  // namespace ulidtool::core
