#pragma once

#include <stdexcept>
#include <string>

namespace ctxsync::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws TransactionConflict when a concurrent writer
    invalidated the rows this transaction wrote

  SQLite: BEGIN IMMEDIATE (serialized per database handle)
  Postgres: pqxx::work, serialization failures surface as conflicts
  Memory: snapshot + write set, per-row stamps checked at commit
*/

class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace ctxsync::db
