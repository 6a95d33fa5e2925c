#pragma once

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "Block.h"
#include "SnapshotStore.h"
#include "Transaction.h"
#include "TransactionPool.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pl {

/**
 * Append-only chain of proof-of-work sealed blocks plus the pool of
 * pending transactions.
 *
 * Concurrency:
 * - append() and minePendingTransactions() are serialized by a writer
 *   mutex; each reads latest() and extends the chain inside that section.
 * - The nonce search runs without holding the chain lock, so readers
 *   (getBalance, isValid, getBlock, getState) proceed during mining.
 * - Snapshot saves happen inside the writer section, in call order.
 */
class Ledger : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  struct Config {
    uint32_t difficulty{ 4 };
    double miningReward{ 100 };
    uint64_t maxNonce{ 1000000 };
    // Consumed by whoever builds the SnapshotStore; the ledger does no I/O
    std::string snapshotPath{ "./data/blockchain.json" };

    Roe<void> validate() const;
  };

  static constexpr const char *REWARD_SENDER = "Blockchain System";

  explicit Ledger(SnapshotStore &store);
  ~Ledger() override = default;

  /**
   * Load the persisted state, or start a new chain with a genesis block.
   *
   * The store is read exactly once. A missing, unreadable or empty
   * snapshot falls back to a fresh genesis chain which is saved right away.
   * A loaded snapshot keeps its own difficulty and mining reward when they
   * are in range.
   *
   * @return E_VALIDATION for a bad config or a second call, E_PERSISTENCE
   *         if the fresh chain could not be saved (the ledger is usable)
   */
  Roe<void> init(const Config &config);
  bool isInitialized() const;

  // ----------------- mutating operations ---------------------------

  /**
   * Validate and queue a transaction for the next block
   * @return Pending pool size after the submission
   */
  Roe<size_t> submitTransaction(const Transaction &tx);

  /**
   * Same as above for the JSON shape {"from","to","amount","timestamp"?,
   * "signature"?}; a missing timestamp defaults to now
   */
  Roe<size_t> submitTransaction(const nlohmann::json &tx);

  /**
   * Link the block to the latest one, mine it and append it.
   * @return The sealed block; E_VALIDATION for a null payload,
   *         E_MINING_EXHAUSTED (not appended), E_CHAIN_EMPTY, or
   *         E_PERSISTENCE (appended in memory but not saved)
   */
  Roe<Block> append(Block block);

  /**
   * Bundle every pending transaction and a reward transaction for
   * rewardAddress into a new block and append it.
   * Drained transactions are not returned to the pool if mining fails.
   */
  Roe<Block> minePendingTransactions(const std::string &rewardAddress);

  /**
   * Save the full current state through the snapshot store
   */
  Roe<void> persist();

  // ----------------- read-only operations --------------------------

  Roe<Block> getLatestBlock() const;
  Roe<Block> getBlock(uint64_t index) const;
  std::vector<Block> getBlocks() const;
  size_t getSize() const;
  size_t getPendingCount() const;

  /**
   * Replay every transaction of every block: outgoing amounts are
   * subtracted, incoming ones added. Not cached.
   */
  double getBalance(const std::string &address) const;

  /**
   * Recompute every seal from index 1 on and check each link to the
   * previous block. The genesis block is trusted.
   */
  bool isValid() const;

  /**
   * Copy of the full state for status reporting
   */
  LedgerState getState() const;

  uint32_t getDifficulty() const;
  double getMiningReward() const;
  uint64_t getMaxNonce() const { return config_.maxNonce; }

  /**
   * Progress notification forwarded to Block::mine(); set before mining
   */
  void setMiningProgressCallback(Block::ProgressCallback callback);

private:
  // Caller holds writeMutex_
  Roe<Block> appendLocked(Block block);
  Roe<void> saveState();

  LedgerState buildState() const;

  SnapshotStore &store_;
  Config config_;
  TransactionPool pool_;
  Block::ProgressCallback progress_;

  std::mutex writeMutex_;
  mutable std::shared_mutex chainMutex_;
  std::vector<Block> chain_;
  uint32_t difficulty_{ 0 };
  double miningReward_{ 0 };
  bool initialized_{ false };
  std::atomic<int64_t> lastSaved_{ 0 };
};

} // namespace pl
