#pragma once

#include "ulidtool/storage/counter_store.h"
#include "ulidtool/storage/sqlite/sqlite_db.h"

#include <memory>
#include <string>

namespace ulidtool::storage::sqlite {

// SqliteCounterStore persists one named counter in the counters table (schema v1).
// Several counters can share a database under different names.
// save() is an upsert; load() returns nullopt when the row does not exist.
class SqliteCounterStore final : public ICounterStore {
 public:
  SqliteCounterStore(std::shared_ptr<SqliteDb> db, std::string counter_name);

  [[nodiscard]] std::optional<core::Uint128> load() override;
  void save(core::Uint128 value) override;

 private:
  std::shared_ptr<SqliteDb> db_;
  std::string counter_name_;
};

}  // namespace ulidtool::storage::sqlite
