#ifndef POW_LEDGER_APP_CONFIG_H
#define POW_LEDGER_APP_CONFIG_H

#include "../ledger/Ledger.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <string>

#include <nlohmann/json.hpp>

namespace pl {

/**
 * Settings of the pow-ledger command line front end.
 *
 * config.json keys (all optional):
 *   difficulty    integer 1-10
 *   miningReward  number >= 0
 *   maxNonce      integer > 0
 *   snapshotPath  string
 *   logLevel      "debug" | "info" | "warning" | "error" | "critical"
 *   logFile       string, appended to
 */
struct AppConfig {
  Ledger::Config ledger;
  logging::Level logLevel{ logging::Level::WARNING };
  std::string logFile;

  /**
   * Overlay the keys present in `j` onto this config
   * @return Error naming the first invalid key; config unchanged on error
   */
  Roe<void> applyJson(const nlohmann::json &j);

  /**
   * Check the combined settings before the ledger is built
   */
  Roe<void> validate() const;
};

/**
 * Read config.json on top of the defaults
 */
Roe<AppConfig> loadAppConfig(const std::string &path);

} // namespace pl

#endif // POW_LEDGER_APP_CONFIG_H
