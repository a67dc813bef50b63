#include "memory_tx.hpp"

#include <stdexcept>

namespace docflow::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Apply(Mutation mutation) {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("memory transaction already finished");
  }
  mutation(working_);
  log_.push_back(std::move(mutation));
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::runtime_error("memory transaction already rolled back");
  }
  std::scoped_lock lock(repo_.mutex_);
  for (auto& mutation : log_) {
    mutation(repo_.committed_);
  }
  log_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  log_.clear();
  rolled_back_ = true;
}

} // namespace docflow::db::memory
