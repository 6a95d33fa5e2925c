#pragma once

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "Block.h"
#include "Transaction.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pl {

/**
 * Full ledger state as persisted:
 * {"chain", "difficulty", "miningReward", "pendingTransactions", "lastSaved"}
 */
struct LedgerState {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  std::vector<Block> chain;
  // Empty when a loaded snapshot has no usable value
  std::optional<uint32_t> difficulty;
  std::optional<double> miningReward;
  std::vector<Transaction> pendingTransactions;
  int64_t lastSaved{ 0 };

  nlohmann::json toJson() const;

  /**
   * Parse a persisted state.
   * A malformed chain entry fails the whole parse. Out-of-range difficulty
   * or reward values are dropped, and pending transactions that fail
   * validation are skipped.
   */
  static Roe<LedgerState> fromJson(const nlohmann::json &j);
};

/**
 * Load/save contract for the ledger's persisted state.
 * Implementations serialize concurrent save() calls in call order.
 */
class SnapshotStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  explicit SnapshotStore(const std::string &name) : Module(name) {}
  ~SnapshotStore() override = default;

  /**
   * @return The stored state, E_NOT_FOUND if nothing was stored yet, or
   *         E_PERSISTENCE if the stored state cannot be read
   */
  virtual Roe<LedgerState> load() = 0;

  /**
   * Replace the stored state
   * @return E_PERSISTENCE on failure
   */
  virtual Roe<void> save(const LedgerState &state) = 0;
};

} // namespace pl
