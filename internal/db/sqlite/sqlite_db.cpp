#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace aiknowsys::db::sqlite {

namespace {

std::string ErrorText(sqlite3* db, const std::string& what) {
  return what + ": " + (db ? sqlite3_errmsg(db) : "out of memory");
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    auto msg = ErrorText(db_, "cannot open " + path_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) return;

  std::string msg = err ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);
  throw std::runtime_error(path_ + ": " + msg);
}

StmtPtr SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  const int     rc  = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
  StmtPtr       stmt(raw);
  if (rc != SQLITE_OK) {
    throw std::runtime_error(ErrorText(db_, "prepare failed"));
  }
  return stmt;
}

int SqliteDB::UserVersion() {
  auto stmt = Prepare("PRAGMA user_version;");
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    throw std::runtime_error(ErrorText(db_, "cannot read user_version"));
  }
  return sqlite3_column_int(stmt.get(), 0);
}

void SqliteDB::SetUserVersion(int version) {
  // PRAGMA arguments cannot be bound
  Exec("PRAGMA user_version = " + std::to_string(version) + ";");
}

void SqliteDB::Configure() {
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error(ErrorText(db_, "busy_timeout"));
  }
}

// ------------------------------------------------------------------
// WriteTransaction
// ------------------------------------------------------------------

SqliteDB::WriteTransaction::WriteTransaction(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
}

SqliteDB::WriteTransaction::~WriteTransaction() {
  if (!open_) return;
  try {
    db_.Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    AIKNOWSYS_LOG_WARN("rollback failed", {observability::StringField("db", db_.Path()), observability::StringField("error", e.what())});
  }
}

void SqliteDB::WriteTransaction::Commit() {
  db_.Exec("COMMIT;");
  open_ = false;
}

} // namespace aiknowsys::db::sqlite
