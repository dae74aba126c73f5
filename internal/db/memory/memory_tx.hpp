#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace fleet::db::memory {

/*
  Snapshot of the queue and context tables taken at Begin().

  Only transactions that wrote anything take part in conflict detection;
  a reader never fails to commit.
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
    wrote_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::uint64_t           snapshot_version_ = 0;
  bool                    wrote_            = false;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace fleet::db::memory
