#include "ulidtool/counter/persisted_counter.h"
#include "ulidtool/storage/counter_store.h"
#include "ulidtool/storage/sqlite/sqlite_counter_store.h"
#include "ulidtool/storage/sqlite/sqlite_db.h"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace ulidtool;
using ulidtool::core::Uint128;

namespace {

// Fresh path under the system temp directory, removed on scope exit.
class TempFile {
 public:
  explicit TempFile(const std::string& name)
      : path_(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove(path_);
  }
  ~TempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;
  TempFile(TempFile&&) = delete;
  TempFile& operator=(TempFile&&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

std::shared_ptr<storage::sqlite::SqliteDb> open_memory_db() {
  auto db_result = storage::sqlite::SqliteDb::open_migrated(":memory:");
  REQUIRE(db_result.has_value());
  return db_result.value();
}

}  // namespace

// ── PersistedCounter over the in-memory store ──────────────────────────────

TEST_CASE("PersistedCounter: starts at 0 on an empty store", "[counter][persisted]") {
  storage::InMemoryCounterStore store;
  counter::PersistedCounter counter(store, 80);
  CHECK(counter.state().next() == Uint128{0u});
}

TEST_CASE("PersistedCounter: resumes after the stored value", "[counter][persisted]") {
  storage::InMemoryCounterStore store(Uint128{41u});
  counter::PersistedCounter counter(store, 80);
  CHECK(counter.state().next() == Uint128{42u});
}

TEST_CASE("PersistedCounter: writes the last value back on destruction", "[counter][persisted]") {
  storage::InMemoryCounterStore store;
  {
    counter::PersistedCounter counter(store, 80);
    (void)counter.state().next();
    (void)counter.state().next();
    (void)counter.state().next();
  }
  REQUIRE(store.load().has_value());
  CHECK(*store.load() == Uint128{2u});

  // A second scope continues the sequence.
  counter::PersistedCounter again(store, 80);
  CHECK(again.state().next() == Uint128{3u});
}

TEST_CASE("PersistedCounter: unused counter on an empty store writes nothing",
          "[counter][persisted]") {
  storage::InMemoryCounterStore store;
  { counter::PersistedCounter counter(store, 80); }
  CHECK_FALSE(store.load().has_value());
}

TEST_CASE("PersistedCounter: flush writes early", "[counter][persisted]") {
  storage::InMemoryCounterStore store;
  counter::PersistedCounter counter(store, 8);
  (void)counter.state().next();
  counter.flush();
  REQUIRE(store.load().has_value());
  CHECK(*store.load() == Uint128{0u});
}

TEST_CASE("PersistedCounter: wraps after the maximum stored value", "[counter][persisted]") {
  storage::InMemoryCounterStore store(Uint128{255u});
  counter::PersistedCounter counter(store, 8);
  CHECK(counter.state().next() == Uint128{0u});
}

TEST_CASE("PersistedCounter: stored value wider than the counter is rejected",
          "[counter][persisted]") {
  storage::InMemoryCounterStore store(Uint128{256u});
  CHECK_THROWS_AS(counter::PersistedCounter(store, 8), std::runtime_error);
}

// ── FileCounterStore ────────────────────────────────────────────────────────

TEST_CASE("FileCounterStore: missing file loads nothing", "[storage][file]") {
  const TempFile file("ulidtool_test_counter_missing.txt");
  storage::FileCounterStore store(file.path());
  CHECK_FALSE(store.load().has_value());
}

TEST_CASE("FileCounterStore: save then load preserves 128-bit values", "[storage][file]") {
  const TempFile file("ulidtool_test_counter_roundtrip.txt");
  storage::FileCounterStore store(file.path());
  const Uint128 value = Uint128::low_mask(80);
  store.save(value);

  storage::FileCounterStore reopened(file.path());
  const auto loaded = reopened.load();
  REQUIRE(loaded.has_value());
  CHECK(*loaded == value);
}

TEST_CASE("FileCounterStore: malformed content throws", "[storage][file]") {
  const TempFile file("ulidtool_test_counter_malformed.txt");
  {
    std::ofstream out(file.path());
    out << "not a number\n";
  }
  storage::FileCounterStore store(file.path());
  CHECK_THROWS_AS(store.load(), std::runtime_error);
}

TEST_CASE("FileCounterStore: counter survives a simulated restart", "[storage][file]") {
  const TempFile file("ulidtool_test_counter_restart.txt");
  {
    storage::FileCounterStore store(file.path());
    counter::PersistedCounter counter(store, 80);
    for (int i = 0; i < 10; ++i) {
      (void)counter.state().next();
    }
  }
  storage::FileCounterStore store(file.path());
  counter::PersistedCounter counter(store, 80);
  CHECK(counter.state().next() == Uint128{10u});
}

// ── SqliteCounterStore ──────────────────────────────────────────────────────

TEST_CASE("SqliteCounterStore: missing row loads nothing", "[storage][sqlite]") {
  auto db = open_memory_db();
  storage::sqlite::SqliteCounterStore store(db, "local_lexical");
  CHECK_FALSE(store.load().has_value());
}

TEST_CASE("SqliteCounterStore: save upserts", "[storage][sqlite]") {
  auto db = open_memory_db();
  storage::sqlite::SqliteCounterStore store(db, "local_lexical");
  store.save(Uint128{7u});
  store.save(Uint128{1u, 0u});
  const auto loaded = store.load();
  REQUIRE(loaded.has_value());
  CHECK(*loaded == Uint128{1u, 0u});
}

TEST_CASE("SqliteCounterStore: counters are isolated by name", "[storage][sqlite]") {
  auto db = open_memory_db();
  storage::sqlite::SqliteCounterStore first(db, "first");
  storage::sqlite::SqliteCounterStore second(db, "second");
  first.save(Uint128{5u});
  CHECK_FALSE(second.load().has_value());
}

TEST_CASE("SqliteCounterStore: malformed value throws", "[storage][sqlite]") {
  auto db = open_memory_db();
  REQUIRE(db->exec("INSERT INTO counters (name, value, updated_at) "
                   "VALUES ('broken', 'xyz', datetime('now'))")
              .has_value());
  storage::sqlite::SqliteCounterStore store(db, "broken");
  CHECK_THROWS_AS(store.load(), std::runtime_error);
}

TEST_CASE("SqliteCounterStore: backs a PersistedCounter across scopes", "[storage][sqlite]") {
  auto db = open_memory_db();
  storage::sqlite::SqliteCounterStore store(db, "local_lexical");
  {
    counter::PersistedCounter counter(store, 80);
    (void)counter.state().next();
    (void)counter.state().next();
  }
  counter::PersistedCounter counter(store, 80);
  CHECK(counter.state().next() == Uint128{2u});
}

TEST_CASE("SqliteDb: migrate brings a fresh database to the latest schema once",
          "[storage][sqlite]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  CHECK(db->schema_version() == 0);

  REQUIRE(db->migrate().has_value());
  CHECK(db->schema_version() == storage::sqlite::kSchemaVersion);
  REQUIRE(db->migrate().has_value());
  CHECK(db->schema_version() == storage::sqlite::kSchemaVersion);
}

TEST_CASE("SqliteDb: open reports an unreachable path", "[storage][sqlite]") {
  const auto db_result = storage::sqlite::SqliteDb::open("/nonexistent-dir/ulidtool/counter.db");
  REQUIRE_FALSE(db_result.has_value());
  CHECK(db_result.error().find("cannot open counter database") != std::string::npos);
}
