#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace fleet::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
  One connection shared by the process; transactions on it are serialized
  through WriterLock().
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Held for the lifetime of a transaction.
  std::unique_lock<std::mutex> WriterLock() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

  // Configure PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace fleet::db::sqlite
