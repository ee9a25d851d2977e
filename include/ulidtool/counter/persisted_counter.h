#pragma once

#include "ulidtool/counter/counter_state.h"
#include "ulidtool/storage/counter_store.h"

namespace ulidtool::counter {

// PersistedCounter is a CounterState whose position survives process restarts.
//
// Lifecycle (RAII):
// - construction reads the store; the first value handed out is
//   (stored + 1) mod 2^width, or 0 when nothing was stored
// - destruction writes the last handed-out value back to the store
// - flush() writes early and propagates store errors; the destructor cannot
//   throw, so a failed write-back there is reported on std::cerr
//
// The store must outlive this object. Not synchronized (see CounterState).
class PersistedCounter {
 public:
  // Throws std::runtime_error if the store cannot be read or holds a value
  // wider than width bits; std::invalid_argument for an invalid width.
  PersistedCounter(storage::ICounterStore& store, unsigned width);
  ~PersistedCounter();

  PersistedCounter(const PersistedCounter&) = delete;
  PersistedCounter& operator=(const PersistedCounter&) = delete;
  PersistedCounter(PersistedCounter&&) = delete;
  PersistedCounter& operator=(PersistedCounter&&) = delete;

  [[nodiscard]] CounterState& state() { return state_; }
  [[nodiscard]] const CounterState& state() const { return state_; }

  // Writes last() to the store if there is anything to write.
  void flush();

 private:
  storage::ICounterStore& store_;
  CounterState state_;
};

}  // namespace ulidtool::counter
