#pragma once

namespace quotecast::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Transactions of one repository are serialized: Begin() blocks while
    another transaction is open, so never Begin() twice on one thread

  SQLite: BEGIN IMMEDIATE (plus an in-process mutex on the shared handle)
  Memory: tx mutex + snapshot copy, swapped in on commit
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
