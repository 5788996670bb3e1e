#pragma once

namespace fleet::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:
  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor rolls back if not committed

  SQLite: BEGIN IMMEDIATE, one transaction per connection at a time
  Memory: snapshot copy-on-write
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;
};

} // namespace fleet::db
