#include "Transaction.h"

#include <cmath>
#include <limits>

namespace pl {

nlohmann::json amountToJson(double amount) {
  double integral = 0;
  if (std::modf(amount, &integral) == 0.0 &&
      std::fabs(amount) < 9007199254740992.0) { // 2^53
    return static_cast<int64_t>(amount);
  }
  return amount;
}

Transaction::Roe<void> Transaction::validate() const {
  if (from.empty()) {
    return Error(E_VALIDATION, "Invalid transaction: \"from\" must be a non-empty string");
  }
  if (to.empty()) {
    return Error(E_VALIDATION, "Invalid transaction: \"to\" must be a non-empty string");
  }
  if (!std::isfinite(amount) || amount <= 0) {
    return Error(E_VALIDATION, "Invalid transaction: \"amount\" must be a positive number");
  }
  return {};
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["from"] = from;
  j["to"] = to;
  j["amount"] = amountToJson(amount);
  j["timestamp"] = timestamp;
  if (signature) {
    j["signature"] = *signature;
  }
  return j;
}

Transaction::Roe<Transaction> Transaction::fromJson(const nlohmann::json &j,
                                                    int64_t defaultTimestamp) {
  if (!j.is_object()) {
    return Error(E_VALIDATION, "Invalid transaction: expected a JSON object");
  }

  Transaction tx;

  auto from = j.find("from");
  if (from == j.end() || !from->is_string()) {
    return Error(E_VALIDATION, "Invalid transaction: \"from\" is required");
  }
  tx.from = from->get<std::string>();

  auto to = j.find("to");
  if (to == j.end() || !to->is_string()) {
    return Error(E_VALIDATION, "Invalid transaction: \"to\" is required");
  }
  tx.to = to->get<std::string>();

  auto amount = j.find("amount");
  if (amount == j.end() || !amount->is_number()) {
    return Error(E_VALIDATION, "Invalid transaction: \"amount\" is required");
  }
  tx.amount = amount->get<double>();

  auto timestamp = j.find("timestamp");
  if (timestamp == j.end() || timestamp->is_null()) {
    tx.timestamp = defaultTimestamp;
  } else if (timestamp->is_number_integer()) {
    tx.timestamp = timestamp->get<int64_t>();
  } else if (timestamp->is_number_float()) {
    double ts = timestamp->get<double>();
    if (!std::isfinite(ts) ||
        std::fabs(ts) > static_cast<double>(std::numeric_limits<int64_t>::max())) {
      return Error(E_VALIDATION, "Invalid transaction: \"timestamp\" is out of range");
    }
    tx.timestamp = static_cast<int64_t>(ts);
  } else {
    return Error(E_VALIDATION, "Invalid transaction: \"timestamp\" must be a number");
  }

  auto signature = j.find("signature");
  if (signature != j.end() && !signature->is_null()) {
    if (!signature->is_string()) {
      return Error(E_VALIDATION, "Invalid transaction: \"signature\" must be a string");
    }
    tx.signature = signature->get<std::string>();
  }

  auto valid = tx.validate();
  if (!valid) {
    return valid.error();
  }
  return tx;
}

} // namespace pl
