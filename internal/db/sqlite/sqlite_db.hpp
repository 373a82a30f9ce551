#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace medsync::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  // synchronous: OFF | NORMAL | FULL | EXTRA (empty means FULL)
  explicit SqliteDB(std::string path, std::string synchronous = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, synchronous, busy timeout)
  void Configure(const std::string& synchronous);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace medsync::db::sqlite
