#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace aiknowsys::db::sqlite {

struct StmtDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    if (stmt) sqlite3_finalize(stmt);
  }
};

using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

/*
  One connection to the knowledge database.

  The connection is opened in WAL mode so `query-*` commands keep reading
  while another process rebuilds the index. Every failure surfaces as
  std::runtime_error carrying sqlite's own message.
*/
class SqliteDB {
 public:
  // milliseconds a writer waits on a locked database before SQLITE_BUSY
  static constexpr int kBusyTimeoutMs = 5000;

  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  void    Exec(const std::string& sql);
  StmtPtr Prepare(const std::string& sql);

  // PRAGMA user_version, used as the schema version
  int  UserVersion();
  void SetUserVersion(int version);

  /*
    Scoped write lock.

    BEGIN IMMEDIATE takes the reserved lock on construction, so a concurrent
    rebuild waits in the busy handler instead of failing on its first
    INSERT. Anything not committed is rolled back when the scope exits.
  */
  class WriteTransaction {
   public:
    explicit WriteTransaction(SqliteDB& db);
    ~WriteTransaction();

    WriteTransaction(const WriteTransaction&)            = delete;
    WriteTransaction& operator=(const WriteTransaction&) = delete;

    void Commit();

   private:
    SqliteDB& db_;
    bool      open_ = true;
  };

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace aiknowsys::db::sqlite
