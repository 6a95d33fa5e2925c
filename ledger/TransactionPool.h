#pragma once

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "Transaction.h"

#include <cstddef>
#include <mutex>
#include <vector>

namespace pl {

/**
 * Transactions accepted but not yet embedded in a block.
 *
 * All methods are thread-safe. drain() hands the whole pool to exactly one
 * caller, so a block being assembled never shares transactions with
 * submissions that arrive while it is mined.
 */
class TransactionPool : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  TransactionPool();
  ~TransactionPool() override = default;

  /**
   * Validate and append a transaction
   * A zero timestamp is replaced by the submission time.
   * @return New pool size, or E_VALIDATION with the pool unchanged
   */
  Roe<size_t> submit(Transaction tx);

  /**
   * Remove and return every pending transaction in submission order
   */
  std::vector<Transaction> drain();

  /**
   * Copy of the pending transactions, pool unchanged
   */
  std::vector<Transaction> snapshot() const;

  /**
   * Replace the pool content (rehydration from a snapshot)
   */
  void restore(std::vector<Transaction> transactions);

  size_t size() const;
  bool isEmpty() const;

private:
  mutable std::mutex mutex_;
  std::vector<Transaction> pending_;
};

} // namespace pl
