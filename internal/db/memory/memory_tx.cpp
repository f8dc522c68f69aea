#include "memory_tx.hpp"

#include <stdexcept>

namespace repricer::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_(repo.writer_, std::defer_lock) {
  if (!writer_.try_lock_for(repo_.busy_timeout_)) {
    throw std::runtime_error("memory repository busy: another transaction is open");
  }
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  Finish();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) {
    return;
  }
  rolled_back_ = true;
  Finish();
}

void MemoryTransaction::Finish() {
  if (writer_.owns_lock()) {
    writer_.unlock();
  }
}

} // namespace repricer::db::memory
