#include "ulidtool/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace ulidtool::storage::sqlite {

namespace {

using DbResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;
using ExecResult = core::Result<bool, std::string>;

// Migration steps, index i upgrades a database from version i to i + 1.
constexpr const char* kMigrations[] = {
    R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS counters (
  name TEXT PRIMARY KEY,
  value TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
)",
};

static_assert(static_cast<int>(std::size(kMigrations)) == kSchemaVersion, "one migration per schema version");

}  // namespace

void SqliteDb::ConnectionCloser::operator()(sqlite3* db) const {
  sqlite3_close(db);
}

void Statement::Finalizer::operator()(sqlite3_stmt* stmt) const {
  sqlite3_finalize(stmt);
}

// ── SqliteDb ────────────────────────────────────────────────────────────────

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

DbResult SqliteDb::open(const std::string& path) {
  sqlite3* db = nullptr;
  const int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    const std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return DbResult::err("cannot open counter database '" + path + "': " + error);
  }
  return DbResult::ok(std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

DbResult SqliteDb::open_migrated(const std::string& path) {
  auto opened = open(path);
  if (!opened.has_value()) {
    return opened;
  }
  auto migrated = opened.value()->migrate();
  if (!migrated.has_value()) {
    return DbResult::err(migrated.error());
  }
  return opened;
}

int SqliteDb::schema_version() const {
  sqlite3_stmt* raw = nullptr;
  const char* sql = "SELECT MAX(version) FROM schema_version";
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return 0;  // no schema_version table yet
  }
  int version = 0;
  if (sqlite3_step(raw) == SQLITE_ROW) {
    version = sqlite3_column_int(raw, 0);
  }
  sqlite3_finalize(raw);
  return version;
}

ExecResult SqliteDb::migrate() {
  for (int version = schema_version(); version < kSchemaVersion; ++version) {
    const std::string step = std::string("BEGIN;\n") + kMigrations[version] +  // NOLINT
                             "INSERT INTO schema_version (version, applied_at) VALUES (" +
                             std::to_string(version + 1) + ", datetime('now'));\nCOMMIT;";
    auto result = exec(step);
    if (!result.has_value()) {
      static_cast<void>(exec("ROLLBACK;"));
      return ExecResult::err("migration to schema v" + std::to_string(version + 1) +
                             " failed: " + result.error());
    }
  }
  return ExecResult::ok(true);
}

ExecResult SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    const std::string error = err_msg != nullptr ? err_msg : last_error();
    sqlite3_free(err_msg);
    return ExecResult::err(error);
  }
  return ExecResult::ok(true);
}

std::string SqliteDb::last_error() const {
  return sqlite3_errmsg(db_.get());
}

// ── Statement ───────────────────────────────────────────────────────────────

Statement::Statement(const SqliteDb& db, const std::string_view sql, std::string owner)
    : db_(db), owner_(std::move(owner)) {
  sqlite3_stmt* raw = nullptr;
  const int rc = sqlite3_prepare_v2(db_.connection(), sql.data(), static_cast<int>(sql.size()),
                                    &raw, nullptr);
  stmt_.reset(raw);
  if (rc != SQLITE_OK) {
    fail("prepare");
  }
}

Statement& Statement::bind_text(const int index, const std::string& value) {
  if (sqlite3_bind_text(stmt_.get(), index, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
    fail("bind parameter " + std::to_string(index));
  }
  return *this;
}

bool Statement::step() {
  const int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  fail("step");
}

std::optional<std::string> Statement::column_text(const int index) const {
  const auto* text =
      reinterpret_cast<const char*>(sqlite3_column_text(stmt_.get(), index));  // NOLINT
  if (text == nullptr) {
    return std::nullopt;
  }
  return std::string(text);
}

void Statement::fail(const std::string& action) const {
  throw std::runtime_error(owner_ + " failed to " + action + ": " + db_.last_error());
}

}  // namespace ulidtool::storage::sqlite
