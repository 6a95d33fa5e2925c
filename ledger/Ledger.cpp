#include "Ledger.h"
#include "../lib/Utilities.h"

#include <cmath>
#include <utility>

namespace pl {

Ledger::Roe<void> Ledger::Config::validate() const {
  if (difficulty < MIN_DIFFICULTY || difficulty > MAX_DIFFICULTY) {
    return Error(E_VALIDATION, "Difficulty must be an integer between 1 and 10, got " +
                                   std::to_string(difficulty));
  }
  if (!std::isfinite(miningReward) || miningReward < 0) {
    return Error(E_VALIDATION, "Mining reward must be a non-negative number");
  }
  return {};
}

Ledger::Ledger(SnapshotStore &store) : Module("ledger"), store_(store) {}

Ledger::Roe<void> Ledger::init(const Config &config) {
  auto valid = config.validate();
  if (!valid) {
    return valid;
  }

  std::lock_guard<std::mutex> writeLock(writeMutex_);
  {
    std::shared_lock<std::shared_mutex> lock(chainMutex_);
    if (initialized_) {
      return Error(E_VALIDATION, "Ledger is already initialized");
    }
  }

  config_ = config;

  auto loaded = store_.load();
  if (loaded && !loaded->chain.empty()) {
    auto &state = loaded.value();
    {
      std::unique_lock<std::shared_mutex> lock(chainMutex_);
      chain_ = std::move(state.chain);
      difficulty_ = state.difficulty.value_or(config.difficulty);
      miningReward_ = state.miningReward.value_or(config.miningReward);
      initialized_ = true;
    }
    pool_.restore(std::move(state.pendingTransactions));
    lastSaved_ = state.lastSaved;

    log().info << "Ledger loaded from snapshot: " << getSize() << " blocks, "
               << pool_.size() << " pending transactions, difficulty "
               << getDifficulty() << ", mining reward " << getMiningReward();
    if (!isValid()) {
      log().warning << "Loaded chain failed the integrity check";
    }
    return {};
  }

  if (loaded) {
    log().warning << "Snapshot holds no blocks; starting a new chain";
  } else if (loaded.error().code == E_NOT_FOUND) {
    log().warning << "No snapshot found; starting a new chain";
  } else {
    log().warning << "Failed to load snapshot (" << loaded.error().message
                  << "); starting a new chain, previous state is discarded";
  }

  {
    std::unique_lock<std::shared_mutex> lock(chainMutex_);
    chain_.clear();
    chain_.push_back(Block::createGenesis());
    difficulty_ = config.difficulty;
    miningReward_ = config.miningReward;
    initialized_ = true;
  }
  pool_.restore({});

  log().info << "Ledger initialized: difficulty " << difficulty_
             << ", mining reward " << miningReward_;

  auto saved = saveState();
  if (!saved) {
    return Error(E_PERSISTENCE,
                 "New chain created but not persisted: " + saved.error().message);
  }
  return {};
}

bool Ledger::isInitialized() const {
  std::shared_lock<std::shared_mutex> lock(chainMutex_);
  return initialized_;
}

Ledger::Roe<size_t> Ledger::submitTransaction(const Transaction &tx) {
  auto result = pool_.submit(tx);
  if (!result) {
    return Error(result.error().code, result.error().message);
  }
  return result.value();
}

Ledger::Roe<size_t> Ledger::submitTransaction(const nlohmann::json &tx) {
  auto parsed = Transaction::fromJson(tx, utl::getCurrentTimeMs());
  if (!parsed) {
    log().warning << "Rejected transaction: " << parsed.error().message;
    return Error(parsed.error().code, parsed.error().message);
  }
  return submitTransaction(parsed.value());
}

Ledger::Roe<Block> Ledger::append(Block block) {
  std::lock_guard<std::mutex> writeLock(writeMutex_);
  return appendLocked(std::move(block));
}

Ledger::Roe<Block> Ledger::minePendingTransactions(const std::string &rewardAddress) {
  if (rewardAddress.empty()) {
    return Error(E_VALIDATION, "Mining reward address is required");
  }

  std::lock_guard<std::mutex> writeLock(writeMutex_);

  auto transactions = pool_.drain();
  const size_t drained = transactions.size();

  Transaction reward;
  reward.from = REWARD_SENDER;
  reward.to = rewardAddress;
  reward.amount = getMiningReward();
  reward.timestamp = utl::getCurrentTimeMs();
  transactions.push_back(std::move(reward));

  auto result = appendLocked(Block(transactions));
  if (!result) {
    if (drained > 0) {
      log().warning << "Mining failed; " << drained
                    << " drained transactions were not restored to the pool";
    }
    return result;
  }

  log().info << "Pending transactions mined into block "
             << result->getIndex() << " (" << transactions.size()
             << " transactions)";
  return result;
}

Ledger::Roe<void> Ledger::persist() {
  std::lock_guard<std::mutex> writeLock(writeMutex_);
  return saveState();
}

Ledger::Roe<Block> Ledger::appendLocked(Block block) {
  if (block.getData().is_null()) {
    return Error(E_VALIDATION, "Invalid block: \"data\" is required");
  }

  uint32_t difficulty = 0;
  {
    std::shared_lock<std::shared_mutex> lock(chainMutex_);
    if (chain_.empty()) {
      log().critical << "Append attempted on an empty chain";
      return Error(E_CHAIN_EMPTY, "Blockchain is empty");
    }
    const Block &latest = chain_.back();
    block.setPreviousHash(latest.getHash());
    block.setIndex(latest.getIndex() + 1);
    difficulty = difficulty_;
  }

  auto mined = block.mine(difficulty, config_.maxNonce, progress_);
  if (!mined) {
    log().error << "Failed to add block " << block.getIndex() << ": "
                << mined.error().message;
    return Error(mined.error().code, mined.error().message);
  }

  size_t size = 0;
  {
    std::unique_lock<std::shared_mutex> lock(chainMutex_);
    chain_.push_back(block);
    size = chain_.size();
  }

  log().info << "Block " << block.getIndex() << " added: "
             << block.getHash().substr(0, 10) << "..., chain length " << size;

  auto saved = saveState();
  if (!saved) {
    return Error(E_PERSISTENCE, "Block " + std::to_string(block.getIndex()) +
                                    " appended but not persisted: " +
                                    saved.error().message);
  }
  return block;
}

Ledger::Roe<void> Ledger::saveState() {
  LedgerState state = buildState();
  state.lastSaved = utl::getCurrentTimeMs();

  auto saved = store_.save(state);
  if (!saved) {
    log().error << "Failed to save ledger state: " << saved.error().message;
    return Error(E_PERSISTENCE, saved.error().message);
  }
  lastSaved_ = state.lastSaved;
  return {};
}

LedgerState Ledger::buildState() const {
  LedgerState state;
  {
    std::shared_lock<std::shared_mutex> lock(chainMutex_);
    state.chain = chain_;
    state.difficulty = difficulty_;
    state.miningReward = miningReward_;
  }
  state.pendingTransactions = pool_.snapshot();
  state.lastSaved = lastSaved_;
  return state;
}

Ledger::Roe<Block> Ledger::getLatestBlock() const {
  std::shared_lock<std::shared_mutex> lock(chainMutex_);
  if (chain_.empty()) {
    log().critical << "Latest block requested from an empty chain";
    return Error(E_CHAIN_EMPTY, "Blockchain is empty");
  }
  return chain_.back();
}

Ledger::Roe<Block> Ledger::getBlock(uint64_t index) const {
  std::shared_lock<std::shared_mutex> lock(chainMutex_);
  if (index >= chain_.size()) {
    return Error(E_NOT_FOUND, "Block " + std::to_string(index) +
                                  " not found (chain length " +
                                  std::to_string(chain_.size()) + ")");
  }
  return chain_[index];
}

std::vector<Block> Ledger::getBlocks() const {
  std::shared_lock<std::shared_mutex> lock(chainMutex_);
  return chain_;
}

size_t Ledger::getSize() const {
  std::shared_lock<std::shared_mutex> lock(chainMutex_);
  return chain_.size();
}

size_t Ledger::getPendingCount() const { return pool_.size(); }

double Ledger::getBalance(const std::string &address) const {
  std::shared_lock<std::shared_mutex> lock(chainMutex_);

  double balance = 0;
  for (const auto &block : chain_) {
    for (const auto &tx : block.getTransactions()) {
      if (tx.from == address) {
        balance -= tx.amount;
      }
      if (tx.to == address) {
        balance += tx.amount;
      }
    }
  }

  log().debug << "Balance of " << address << ": " << balance;
  return balance;
}

bool Ledger::isValid() const {
  std::shared_lock<std::shared_mutex> lock(chainMutex_);

  for (size_t i = 1; i < chain_.size(); ++i) {
    const Block &current = chain_[i];
    const Block &previous = chain_[i - 1];

    if (current.getHash() != current.calculateHash()) {
      log().warning << "Invalid block hash at index " << current.getIndex();
      return false;
    }

    if (current.getPreviousHash() != previous.getHash()) {
      log().warning << "Invalid chain linkage at index " << current.getIndex();
      return false;
    }
  }

  log().debug << "Chain validated: " << chain_.size() << " blocks";
  return true;
}

LedgerState Ledger::getState() const { return buildState(); }

uint32_t Ledger::getDifficulty() const {
  std::shared_lock<std::shared_mutex> lock(chainMutex_);
  return difficulty_;
}

double Ledger::getMiningReward() const {
  std::shared_lock<std::shared_mutex> lock(chainMutex_);
  return miningReward_;
}

void Ledger::setMiningProgressCallback(Block::ProgressCallback callback) {
  std::lock_guard<std::mutex> writeLock(writeMutex_);
  progress_ = std::move(callback);
}

} // namespace pl
