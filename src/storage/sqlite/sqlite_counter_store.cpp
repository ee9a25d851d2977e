#include "ulidtool/storage/sqlite/sqlite_counter_store.h"

#include <stdexcept>
#include <string>

namespace ulidtool::storage::sqlite {

SqliteCounterStore::SqliteCounterStore(std::shared_ptr<SqliteDb> db, std::string counter_name)
    : db_(std::move(db)), counter_name_(std::move(counter_name)) {}

std::optional<core::Uint128> SqliteCounterStore::load() {
  Statement stmt(*db_, "SELECT value FROM counters WHERE name = ?", "SqliteCounterStore::load");
  stmt.bind_text(1, counter_name_);
  if (!stmt.step()) {
    return std::nullopt;
  }

  const std::string stored = stmt.column_text(0).value_or("");
  const auto value = core::parse_uint128(stored, 10);
  if (!value.has_value()) {
    throw std::runtime_error("SqliteCounterStore::load malformed value for counter '" +
                             counter_name_ + "': '" + stored + "'");
  }
  return value;
}

void SqliteCounterStore::save(const core::Uint128 value) {
  Statement stmt(*db_, R"(
    INSERT INTO counters (name, value, updated_at)
    VALUES (?, ?, datetime('now'))
    ON CONFLICT(name) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at
  )",
                 "SqliteCounterStore::save");
  stmt.bind_text(1, counter_name_).bind_text(2, core::to_string(value, 10));
  static_cast<void>(stmt.step());
}

}  // namespace ulidtool::storage::sqlite
