#pragma once

namespace handoff::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes and releases row claims
  - Destructor MUST rollback if not committed
  - Commit() throws util::Aborted when a concurrent writer won, and
    util::Conflict when the one-active-transfer rule would break

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: snapshot + per-row versions
*/

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

}
