#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace repricer::db::memory {

/*
  Transaction = exclusive writer lock + snapshot copy
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  void Finish();

  MemoryRepository&                    repo_;
  std::unique_lock<std::timed_mutex>   writer_;
  MemoryRepository::State              working_;
  bool                                 committed_   = false;
  bool                                 rolled_back_ = false;
};

} // namespace repricer::db::memory
