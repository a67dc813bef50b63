#pragma once

#include <functional>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace docflow::db::memory {

/*
  Transaction = snapshot + write log

  Every mutation is applied to the private snapshot immediately (so reads
  see their own writes) and recorded; Commit() replays the log onto the
  repository's committed state under its mutex.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Mutation = std::function<void(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_ || rolled_back_;
  }

  const MemoryRepository::State& View() const {
    return working_;
  }

  void Apply(Mutation mutation);

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::vector<Mutation>   log_;
  bool                    committed_   = false;
  bool                    rolled_back_ = false;
};

} // namespace docflow::db::memory
