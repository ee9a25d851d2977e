#include "ulidtool/counter/persisted_counter.h"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

namespace ulidtool::counter {

namespace {

CounterState restore(storage::ICounterStore& store, const unsigned width) {
  CounterState state(width);
  const auto stored = store.load();
  if (stored.has_value()) {
    if (!stored->fits_in(width)) {
      throw std::runtime_error("persisted counter value " + core::to_string(*stored) +
                               " exceeds " + std::to_string(width) + " bits");
    }
    state.restore_last(*stored);
  }
  return state;
}

}  // namespace

PersistedCounter::PersistedCounter(storage::ICounterStore& store, const unsigned width)
    : store_(store), state_(restore(store, width)) {}

PersistedCounter::~PersistedCounter() {
  try {
    flush();
  } catch (const std::exception& e) {
    std::cerr << "WARNING: counter write-back failed, next run may reuse values: " << e.what()
              << "\n";
  }
}

void PersistedCounter::flush() {
  const auto last = state_.last();
  if (last.has_value()) {
    store_.save(*last);
  }
}

}  // namespace ulidtool::counter
