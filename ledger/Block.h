#pragma once

#include "../lib/ResultOrError.hpp"
#include "Transaction.h"
#include "Types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pl {

/**
 * A ledger block sealed by a proof-of-work nonce.
 *
 * The seal binds index, previous hash, timestamp, payload and nonce:
 *   sha256(index + previousHash + timestamp + canonicalJson(data) + nonce)
 * with integers in decimal and the payload as compact JSON with sorted keys.
 *
 * The payload is either an array of transactions or an opaque JSON value.
 * It is kept as JSON so that the sealed bytes never depend on a
 * re-serialization of parsed transactions.
 */
class Block {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  /**
   * Called every PROGRESS_INTERVAL attempts during mine()
   * @param attempts Nonces tried so far
   * @param hash Most recent candidate hash
   */
  using ProgressCallback =
      std::function<void(uint64_t attempts, const std::string &hash)>;

  static constexpr uint64_t PROGRESS_INTERVAL = 10000;
  static constexpr const char *GENESIS_DATA = "Genesis block";
  static constexpr const char *GENESIS_PREVIOUS_HASH = "0";

  Block();
  explicit Block(nlohmann::json data, const std::string &previousHash = "");
  explicit Block(const std::vector<Transaction> &transactions,
                 const std::string &previousHash = "");

  static Block createGenesis();

  /**
   * Compute the seal of the given fields. Pure and deterministic.
   * @return 64 lowercase hex characters
   */
  static std::string seal(uint64_t index, const std::string &previousHash,
                          int64_t timestamp, const nlohmann::json &data,
                          uint64_t nonce);

  /**
   * Canonical serialization of a payload as used by seal()
   */
  static std::string canonicalData(const nlohmann::json &data);

  uint64_t getIndex() const { return index_; }
  int64_t getTimestamp() const { return timestamp_; }
  const nlohmann::json &getData() const { return data_; }
  const std::string &getPreviousHash() const { return previousHash_; }
  const std::string &getHash() const { return hash_; }
  uint64_t getNonce() const { return nonce_; }

  std::string calculateHash() const;

  /**
   * True if the stored hash has `difficulty` leading '0' characters
   */
  bool meetsDifficulty(uint32_t difficulty) const;

  /**
   * Search for a nonce whose seal meets the difficulty target.
   *
   * Starts from the current nonce. Each increment of the nonce counts as
   * one attempt; when attempts exceed maxNonce the search stops with
   * E_MINING_EXHAUSTED and the block keeps its previous nonce and hash.
   *
   * @param difficulty Required leading zero hex digits, in [1, 10]
   * @param maxNonce Maximum number of attempts
   * @param progress Optional progress notification
   * @return The sealed hash, E_VALIDATION for a bad difficulty, or
   *         E_MINING_EXHAUSTED
   */
  Roe<std::string> mine(uint32_t difficulty, uint64_t maxNonce,
                        const ProgressCallback &progress = {});

  /**
   * Transaction-shaped entries of the payload in order: objects with string
   * "from" and "to" and a numeric "amount". Other payloads yield nothing.
   */
  std::vector<Transaction> getTransactions() const;

  void setIndex(uint64_t index);
  void setTimestamp(int64_t timestamp);
  void setPreviousHash(const std::string &previousHash);
  void setData(nlohmann::json data);
  void setHash(const std::string &hash);
  void setNonce(uint64_t nonce);

  nlohmann::json toJson() const;

  /**
   * Parse a block from its persisted JSON shape.
   * Checks field types and the previousHash format; does not check the seal.
   */
  static Roe<Block> fromJson(const nlohmann::json &j);

private:
  uint64_t index_{ 0 };
  int64_t timestamp_{ 0 };
  nlohmann::json data_;
  std::string previousHash_;
  std::string hash_;
  uint64_t nonce_{ 0 };
};

} // namespace pl
