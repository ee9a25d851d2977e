#pragma once

#include "ulidtool/core/result.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace ulidtool::storage::sqlite {

// Latest schema layout. Version 1: one `counters` table keyed by name, values as
// decimal TEXT (128-bit counters do not fit an SQLite INTEGER).
constexpr int kSchemaVersion = 1;

// SqliteDb owns one connection to a counter database.
// Connections are not shared across threads; open one per thread if needed.
class SqliteDb {
 public:
  // Open or create the database at path (":memory:" for a private in-memory one).
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  // open() followed by migrate(): the form every caller outside tests wants.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open_migrated(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 for a database no migration has touched.
  [[nodiscard]] int schema_version() const;

  // Brings the schema up to kSchemaVersion. A no-op on an up-to-date database.
  [[nodiscard]] core::Result<bool, std::string> migrate();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  [[nodiscard]] std::string last_error() const;

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct ConnectionCloser {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, ConnectionCloser> db_;
};

// Statement is a prepared statement over text parameters and text columns,
// which is all the counters table needs. Every failure throws std::runtime_error
// naming the statement's owner, so store code reads as a straight line.
class Statement {
 public:
  Statement(const SqliteDb& db, std::string_view sql, std::string owner);
  ~Statement() = default;

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&&) = delete;
  Statement& operator=(Statement&&) = delete;

  // Binds 1-based parameter index.
  Statement& bind_text(int index, const std::string& value);

  // true when a row is available, false when the statement is done.
  [[nodiscard]] bool step();

  // Column of the current row; nullopt for SQL NULL.
  [[nodiscard]] std::optional<std::string> column_text(int index) const;

 private:
  struct Finalizer {
    void operator()(sqlite3_stmt* stmt) const;
  };

  [[noreturn]] void fail(const std::string& action) const;

  const SqliteDb& db_;
  std::string owner_;
  std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
};

}  // namespace ulidtool::storage::sqlite
