#pragma once

#include "ulidtool/core/uint128.h"
#include "ulidtool/identifier.h"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>

// Arithmetic stepping over identifiers.
// The packed value is treated as one unsigned integer of the format's width
// (128 bits for ULID, 64 for SLID). Steps wrap modulo 2^width and carry
// freely from the randomness field into the timestamp.
namespace ulidtool::progression {

template <typename Traits>
[[nodiscard]] constexpr BasicIdentifier<Traits> forward(const BasicIdentifier<Traits>& id,
                                                        const core::Uint128 steps = 1u) {
  return BasicIdentifier<Traits>::from_packed(id.packed() + steps);
}

template <typename Traits>
[[nodiscard]] constexpr BasicIdentifier<Traits> backward(const BasicIdentifier<Traits>& id,
                                                         const core::Uint128 steps = 1u) {
  return BasicIdentifier<Traits>::from_packed(id.packed() - steps);
}

template <typename Traits>
[[nodiscard]] constexpr BasicIdentifier<Traits> next(const BasicIdentifier<Traits>& id) {
  return forward(id, 1u);
}

template <typename Traits>
[[nodiscard]] constexpr BasicIdentifier<Traits> previous(const BasicIdentifier<Traits>& id) {
  return backward(id, 1u);
}

enum class Direction { kForward, kBackward };

// Sequence is a lazy range of identifiers starting at start() and stepping by
// one in direction(). A bounded sequence yields exactly size() identifiers; an
// unbounded one never ends and the caller decides when to stop.
//
// Sequences are values: begin() can be called any number of times and each
// iteration starts over from start().
template <typename Traits>
class Sequence {
 public:
  using value_type = BasicIdentifier<Traits>;

  class iterator {
   public:
    using value_type = BasicIdentifier<Traits>;
    using difference_type = std::ptrdiff_t;

    iterator() = default;
    iterator(value_type current, std::optional<std::uint64_t> remaining, Direction direction)
        : current_(current), remaining_(remaining), direction_(direction) {}

    [[nodiscard]] value_type operator*() const { return current_; }

    iterator& operator++() {
      current_ = direction_ == Direction::kForward ? progression::next(current_)
                                                   : progression::previous(current_);
      if (remaining_.has_value() && *remaining_ > 0u) {
        --*remaining_;
      }
      return *this;
    }

    iterator operator++(int) {
      iterator copy = *this;
      ++*this;
      return copy;
    }

    friend bool operator==(const iterator&, const iterator&) = default;

    friend bool operator==(const iterator& it, std::default_sentinel_t) {
      return it.remaining_.has_value() && *it.remaining_ == 0u;
    }

   private:
    value_type current_{};
    std::optional<std::uint64_t> remaining_;
    Direction direction_{Direction::kForward};
  };

  Sequence(value_type start, std::optional<std::uint64_t> count,
           Direction direction = Direction::kForward)
      : start_(start), count_(count), direction_(direction) {}

  [[nodiscard]] iterator begin() const { return iterator(start_, count_, direction_); }
  [[nodiscard]] std::default_sentinel_t end() const { return {}; }

  // Same start and length, opposite direction.
  [[nodiscard]] Sequence reversed() const {
    return Sequence(start_, count_,
                    direction_ == Direction::kForward ? Direction::kBackward : Direction::kForward);
  }

  [[nodiscard]] value_type start() const { return start_; }
  [[nodiscard]] Direction direction() const { return direction_; }

  // nullopt for an unbounded sequence.
  [[nodiscard]] std::optional<std::uint64_t> size() const { return count_; }
  [[nodiscard]] bool bounded() const { return count_.has_value(); }

 private:
  value_type start_;
  std::optional<std::uint64_t> count_;
  Direction direction_;
};

// sequence yields count identifiers: id, next(id), next(next(id)), ...
template <typename Traits>
[[nodiscard]] Sequence<Traits> sequence(const BasicIdentifier<Traits>& id, const std::uint64_t count) {
  return Sequence<Traits>(id, count);
}

template <typename Traits>
[[nodiscard]] Sequence<Traits> unbounded(const BasicIdentifier<Traits>& id) {
  return Sequence<Traits>(id, std::nullopt);
}

}  // namespace ulidtool::progression
