#include "TransactionPool.h"
#include "../lib/Utilities.h"

#include <utility>

namespace pl {

TransactionPool::TransactionPool() : Module("ledger.pool") {}

TransactionPool::Roe<size_t> TransactionPool::submit(Transaction tx) {
  if (tx.timestamp == 0) {
    tx.timestamp = utl::getCurrentTimeMs();
  }

  auto valid = tx.validate();
  if (!valid) {
    log().warning << "Rejected transaction " << tx.from << " -> " << tx.to
                  << ": " << valid.error().message;
    return Error(valid.error().code, valid.error().message);
  }

  size_t size = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(tx));
    size = pending_.size();
  }

  log().info << "Transaction added to pending pool, pending " << size;
  return size;
}

std::vector<Transaction> TransactionPool::drain() {
  std::vector<Transaction> drained;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    drained.swap(pending_);
  }
  log().debug << "Drained " << drained.size() << " pending transactions";
  return drained;
}

std::vector<Transaction> TransactionPool::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_;
}

void TransactionPool::restore(std::vector<Transaction> transactions) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_ = std::move(transactions);
}

size_t TransactionPool::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

bool TransactionPool::isEmpty() const { return size() == 0; }

} // namespace pl
