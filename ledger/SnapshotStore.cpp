#include "SnapshotStore.h"
#include "../lib/Logger.h"

#include <cmath>

namespace pl {

nlohmann::json LedgerState::toJson() const {
  nlohmann::json j;
  j["chain"] = nlohmann::json::array();
  for (const auto &block : chain) {
    j["chain"].push_back(block.toJson());
  }
  if (difficulty) {
    j["difficulty"] = *difficulty;
  }
  if (miningReward) {
    j["miningReward"] = amountToJson(*miningReward);
  }
  j["pendingTransactions"] = nlohmann::json::array();
  for (const auto &tx : pendingTransactions) {
    j["pendingTransactions"].push_back(tx.toJson());
  }
  j["lastSaved"] = lastSaved;
  return j;
}

LedgerState::Roe<LedgerState> LedgerState::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(E_VALIDATION, "Invalid snapshot: expected a JSON object");
  }

  LedgerState state;

  auto chain = j.find("chain");
  if (chain == j.end() || !chain->is_array()) {
    return Error(E_VALIDATION, "Invalid snapshot: \"chain\" must be an array");
  }
  for (size_t i = 0; i < chain->size(); ++i) {
    auto block = Block::fromJson((*chain)[i]);
    if (!block) {
      return Error(E_VALIDATION, "Invalid snapshot: chain entry " +
                                     std::to_string(i) + ": " +
                                     block.error().message);
    }
    state.chain.push_back(std::move(block.value()));
  }

  auto difficulty = j.find("difficulty");
  if (difficulty != j.end() && difficulty->is_number_integer()) {
    int64_t value = difficulty->get<int64_t>();
    if (value >= MIN_DIFFICULTY && value <= MAX_DIFFICULTY) {
      state.difficulty = static_cast<uint32_t>(value);
    }
  }

  auto reward = j.find("miningReward");
  if (reward != j.end() && reward->is_number()) {
    double value = reward->get<double>();
    if (std::isfinite(value) && value >= 0) {
      state.miningReward = value;
    }
  }

  auto lastSaved = j.find("lastSaved");
  if (lastSaved != j.end() && lastSaved->is_number_integer()) {
    state.lastSaved = lastSaved->get<int64_t>();
  }

  auto pending = j.find("pendingTransactions");
  if (pending != j.end() && pending->is_array()) {
    for (const auto &entry : *pending) {
      auto tx = Transaction::fromJson(entry, state.lastSaved);
      if (!tx) {
        logging::getLogger("ledger.snapshot").warning
            << "Skipping pending transaction: " << tx.error().message;
        continue;
      }
      state.pendingTransactions.push_back(std::move(tx.value()));
    }
  }

  return state;
}

} // namespace pl
