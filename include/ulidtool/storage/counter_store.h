#pragma once

#include "ulidtool/core/uint128.h"

#include <filesystem>
#include <optional>
#include <utility>

namespace ulidtool::storage {

// ICounterStore persists the last value handed out by a counter between runs.
// Assumed single-writer per process: no cross-process locking is provided and
// two processes sharing one store will corrupt the counter.
class ICounterStore {
 public:
  virtual ~ICounterStore() = default;

  // Returns the stored value, or nullopt if nothing has been stored yet.
  // Throws std::runtime_error if the backing storage is unreadable or malformed.
  [[nodiscard]] virtual std::optional<core::Uint128> load() = 0;

  // Overwrites the stored value. Throws std::runtime_error on failure.
  virtual void save(core::Uint128 value) = 0;

 protected:
  ICounterStore() = default;
  ICounterStore(const ICounterStore&) = default;
  ICounterStore& operator=(const ICounterStore&) = default;
  ICounterStore(ICounterStore&&) = default;
  ICounterStore& operator=(ICounterStore&&) = default;
};

// In-memory store for tests: survives PersistedCounter scopes, not processes.
class InMemoryCounterStore final : public ICounterStore {
 public:
  InMemoryCounterStore() = default;
  explicit InMemoryCounterStore(core::Uint128 value) : value_(value) {}

  [[nodiscard]] std::optional<core::Uint128> load() override { return value_; }
  void save(core::Uint128 value) override { value_ = value; }

 private:
  std::optional<core::Uint128> value_;
};

// FileCounterStore keeps the value as a decimal integer in a text file.
// A missing file means no stored value; the file is rewritten on every save.
class FileCounterStore final : public ICounterStore {
 public:
  explicit FileCounterStore(std::filesystem::path path) : path_(std::move(path)) {}

  [[nodiscard]] std::optional<core::Uint128> load() override;
  void save(core::Uint128 value) override;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace ulidtool::storage
