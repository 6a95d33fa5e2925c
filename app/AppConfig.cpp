#include "AppConfig.h"

#include <cmath>

namespace pl {

Roe<void> AppConfig::applyJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(1, "Configuration must be a JSON object");
  }

  AppConfig updated = *this;

  if (j.contains("difficulty")) {
    const auto &value = j["difficulty"];
    if (!value.is_number_integer() || value.get<int64_t>() < MIN_DIFFICULTY ||
        value.get<int64_t>() > MAX_DIFFICULTY) {
      return Error(2, "\"difficulty\" must be an integer between 1 and 10");
    }
    updated.ledger.difficulty = value.get<uint32_t>();
  }

  if (j.contains("miningReward")) {
    const auto &value = j["miningReward"];
    if (!value.is_number() || !std::isfinite(value.get<double>()) ||
        value.get<double>() < 0) {
      return Error(2, "\"miningReward\" must be a non-negative number");
    }
    updated.ledger.miningReward = value.get<double>();
  }

  if (j.contains("maxNonce")) {
    const auto &value = j["maxNonce"];
    if (!value.is_number_unsigned() || value.get<uint64_t>() == 0) {
      return Error(2, "\"maxNonce\" must be a positive integer");
    }
    updated.ledger.maxNonce = value.get<uint64_t>();
  }

  if (j.contains("snapshotPath")) {
    const auto &value = j["snapshotPath"];
    if (!value.is_string() || value.get<std::string>().empty()) {
      return Error(2, "\"snapshotPath\" must be a non-empty string");
    }
    updated.ledger.snapshotPath = value.get<std::string>();
  }

  if (j.contains("logLevel")) {
    const auto &value = j["logLevel"];
    if (!value.is_string() ||
        !logging::parseLevel(value.get<std::string>(), updated.logLevel)) {
      return Error(2, "\"logLevel\" must be one of debug, info, warning, error, critical");
    }
  }

  if (j.contains("logFile")) {
    const auto &value = j["logFile"];
    if (!value.is_string()) {
      return Error(2, "\"logFile\" must be a string");
    }
    updated.logFile = value.get<std::string>();
  }

  *this = updated;
  return {};
}

Roe<void> AppConfig::validate() const {
  auto valid = ledger.validate();
  if (!valid) {
    return Error(valid.error().code, valid.error().message);
  }
  if (ledger.maxNonce == 0) {
    return Error(E_VALIDATION, "Maximum nonce must be greater than 0");
  }
  if (ledger.snapshotPath.empty()) {
    return Error(E_VALIDATION, "Snapshot path must not be empty");
  }
  return {};
}

Roe<AppConfig> loadAppConfig(const std::string &path) {
  auto json = utl::loadJsonFile(path);
  if (!json) {
    return json.error();
  }

  AppConfig config;
  auto applied = config.applyJson(json.value());
  if (!applied) {
    return Error(applied.error().code,
                 "Invalid configuration " + path + ": " + applied.error().message);
  }
  return config;
}

} // namespace pl
