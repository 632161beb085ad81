#pragma once

namespace walship::db {

/*
  Unit of atomicity for one commit or one replicated frame: the frame row,
  the page images it carries and the database header (generation, txid,
  page_count) land together or not at all.

  A transaction that is destroyed without Commit() rolls back. Backends
  admit one writer at a time; Begin() blocks until the previous writer
  finishes.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace walship::db
