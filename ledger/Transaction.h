#ifndef POW_LEDGER_TRANSACTION_H
#define POW_LEDGER_TRANSACTION_H

#include "../lib/ResultOrError.hpp"
#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace pl {

/**
 * Transfer of `amount` from one address to another.
 *
 * JSON shape: {"from", "to", "amount", "timestamp", "signature"?}.
 * The signature is carried as-is and never verified.
 */
struct Transaction {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  std::string from;
  std::string to;
  double amount{ 0 };
  int64_t timestamp{ 0 };
  std::optional<std::string> signature;

  /**
   * Check the shape constraints: non-empty addresses, finite amount > 0
   */
  Roe<void> validate() const;

  nlohmann::json toJson() const;

  /**
   * Build a transaction from its JSON shape and validate it.
   * @param j JSON object
   * @param defaultTimestamp Used when "timestamp" is absent
   * @return Transaction or E_VALIDATION error naming the offending field
   */
  static Roe<Transaction> fromJson(const nlohmann::json &j,
                                   int64_t defaultTimestamp);

  bool operator==(const Transaction &other) const {
    return from == other.from && to == other.to && amount == other.amount &&
           timestamp == other.timestamp && signature == other.signature;
  }
};

/**
 * Convert an amount to JSON; integral values are written as integers so the
 * serialized form does not depend on how the value was produced.
 */
nlohmann::json amountToJson(double amount);

} // namespace pl

#endif // POW_LEDGER_TRANSACTION_H
