#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace progress::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_ && lock_.owns_lock()) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      PROGRESS_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception& e) {
    // A failed COMMIT leaves the transaction open on the shared connection.
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& rollback_error) {
      PROGRESS_LOG_WARN("sqlite rollback after failed commit failed",
                        {observability::StringField("error", rollback_error.what())});
    }
    finished_ = true;
    lock_.unlock();
    throw;
  }
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception&) {
    lock_.unlock();
    throw;
  }
  lock_.unlock();
}

} // namespace progress::db::sqlite
