#include "AppConfig.h"
#include "../ledger/FileSnapshotStore.h"
#include "../ledger/Ledger.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using json = nlohmann::json;

static constexpr int EXIT_INVALID_CHAIN = 2;

static void printBlock(const pl::Block &block) {
  std::cout << block.toJson().dump(2) << "\n";
}

static int runStatus(const pl::Ledger &ledger) {
  auto latest = ledger.getLatestBlock();
  if (!latest) {
    std::cerr << "Error: " << latest.error().message << "\n";
    return 1;
  }
  auto state = ledger.getState();

  json status;
  status["chainLength"] = state.chain.size();
  status["difficulty"] = ledger.getDifficulty();
  status["miningReward"] = pl::amountToJson(ledger.getMiningReward());
  status["maxNonce"] = ledger.getMaxNonce();
  status["pendingTransactions"] = state.pendingTransactions.size();
  status["latestHash"] = latest->getHash();
  status["lastSaved"] = state.lastSaved;
  status["isValid"] = ledger.isValid();
  std::cout << status.dump(2) << "\n";
  return 0;
}

static int runAddTx(pl::Ledger &ledger, const std::string &from, const std::string &to,
             double amount, const std::string &signature) {
  json tx;
  tx["from"] = from;
  tx["to"] = to;
  tx["amount"] = pl::amountToJson(amount);
  if (!signature.empty()) {
    tx["signature"] = signature;
  }

  auto result = ledger.submitTransaction(tx);
  if (!result) {
    std::cerr << "Error: " << result.error().message << "\n";
    return 1;
  }
  std::cout << "Transaction added, pending transactions: " << *result << "\n";
  return 0;
}

static int runMine(pl::Ledger &ledger, const std::string &rewardAddress) {
  ledger.setMiningProgressCallback(
      [](uint64_t attempts, const std::string & /*hash*/) {
        std::cerr << "\rMining... " << attempts << " attempts" << std::flush;
      });

  auto block = ledger.minePendingTransactions(rewardAddress);
  std::cerr << "\r";
  if (!block) {
    std::cerr << "Error: " << block.error().message << "\n";
    return 1;
  }
  std::cout << "Block mined: index " << block->getIndex() << ", hash "
            << block->getHash() << "\n";
  return 0;
}

static int runAddBlock(pl::Ledger &ledger, const std::string &data) {
  // JSON text becomes a structured payload, anything else a string payload
  json payload = json::parse(data, nullptr, false);
  if (payload.is_discarded()) {
    payload = data;
  }

  auto block = ledger.append(pl::Block(payload));
  if (!block) {
    std::cerr << "Error: " << block.error().message << "\n";
    return 1;
  }
  std::cout << "Block added: index " << block->getIndex() << ", hash "
            << block->getHash() << "\n";
  return 0;
}

static int runBlock(const pl::Ledger &ledger, uint64_t index) {
  auto block = ledger.getBlock(index);
  if (!block) {
    std::cerr << "Error: " << block.error().message << "\n";
    return 1;
  }
  printBlock(*block);
  return 0;
}

static int runLatest(const pl::Ledger &ledger) {
  auto block = ledger.getLatestBlock();
  if (!block) {
    std::cerr << "Error: " << block.error().message << "\n";
    return 1;
  }
  printBlock(*block);
  return 0;
}

static int runBalance(const pl::Ledger &ledger, const std::string &address) {
  json balance;
  balance["address"] = address;
  balance["balance"] = pl::amountToJson(ledger.getBalance(address));
  std::cout << balance.dump(2) << "\n";
  return 0;
}

static int runValidate(const pl::Ledger &ledger) {
  bool valid = ledger.isValid();
  std::cout << (valid ? "Chain is valid" : "Chain is INVALID") << "\n";
  return valid ? 0 : EXIT_INVALID_CHAIN;
}

static int runBlocks(const pl::Ledger &ledger) {
  json blocks = json::array();
  for (const auto &block : ledger.getBlocks()) {
    blocks.push_back(block.toJson());
  }
  std::cout << blocks.dump(2) << "\n";
  return 0;
}

int main(int argc, char *argv[]) {
  CLI::App app{"pow-ledger - proof-of-work ledger with a pending transaction pool"};
  app.require_subcommand(1);

  // Global options
  std::string configPath;
  app.add_option("-c,--config", configPath, "JSON configuration file");

  uint32_t difficulty = 0;
  auto *difficultyOpt = app.add_option("--difficulty", difficulty,
                                       "Leading zero hex digits required (1-10)")
                            ->check(CLI::Range(1, 10));

  double reward = 0;
  auto *rewardOpt = app.add_option("--reward", reward, "Mining reward")
                        ->check(CLI::NonNegativeNumber);

  uint64_t maxNonce = 0;
  auto *maxNonceOpt = app.add_option("--max-nonce", maxNonce,
                                     "Maximum nonce attempts per block")
                          ->check(CLI::PositiveNumber);

  std::string snapshotPath;
  auto *snapshotOpt = app.add_option("-s,--snapshot", snapshotPath,
                                     "Ledger snapshot file");

  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging");

  std::string logFile;
  auto *logFileOpt = app.add_option("--log-file", logFile, "Append logs to this file");

  // Subcommands
  auto *status_cmd = app.add_subcommand("status", "Show chain status");

  auto *add_tx_cmd = app.add_subcommand("add-tx", "Add a transaction to the pending pool");
  std::string tx_from, tx_to, tx_signature;
  double tx_amount = 0;
  add_tx_cmd->add_option("from", tx_from, "Sender address")->required();
  add_tx_cmd->add_option("to", tx_to, "Recipient address")->required();
  add_tx_cmd->add_option("amount", tx_amount, "Amount to transfer")->required();
  add_tx_cmd->add_option("--signature", tx_signature, "Signature (stored, not verified)");

  auto *mine_cmd = app.add_subcommand("mine", "Mine pending transactions into a new block");
  std::string mine_address;
  mine_cmd->add_option("address", mine_address, "Mining reward address")->required();

  auto *add_block_cmd = app.add_subcommand("add-block", "Mine and append a block with a custom payload");
  std::string block_data;
  add_block_cmd->add_option("data", block_data, "Block payload (JSON or plain text)")->required();

  auto *block_cmd = app.add_subcommand("block", "Show a block by index");
  uint64_t block_index = 0;
  block_cmd->add_option("index", block_index, "Block index")->required();

  auto *latest_cmd = app.add_subcommand("latest", "Show the latest block");

  auto *balance_cmd = app.add_subcommand("balance", "Show the balance of an address");
  std::string balance_address;
  balance_cmd->add_option("address", balance_address, "Address")->required();

  auto *validate_cmd = app.add_subcommand("validate", "Check seals and links of the whole chain");

  auto *blocks_cmd = app.add_subcommand("blocks", "Show all blocks");

  CLI11_PARSE(app, argc, argv);

  // Defaults, then config file, then command line flags
  pl::AppConfig config;
  if (!configPath.empty()) {
    auto loaded = pl::loadAppConfig(configPath);
    if (!loaded) {
      std::cerr << "Error: " << loaded.error().message << "\n";
      return 1;
    }
    config = *loaded;
  }
  if (difficultyOpt->count() > 0) {
    config.ledger.difficulty = difficulty;
  }
  if (rewardOpt->count() > 0) {
    config.ledger.miningReward = reward;
  }
  if (maxNonceOpt->count() > 0) {
    config.ledger.maxNonce = maxNonce;
  }
  if (snapshotOpt->count() > 0) {
    config.ledger.snapshotPath = snapshotPath;
  }
  if (logFileOpt->count() > 0) {
    config.logFile = logFile;
  }
  if (debug) {
    config.logLevel = pl::logging::Level::DEBUG;
  }

  auto valid = config.validate();
  if (!valid) {
    std::cerr << "Error: " << valid.error().message << "\n";
    return 1;
  }

  auto rootLogger = pl::logging::getRootLogger();
  rootLogger.setLevel(config.logLevel);
  if (!config.logFile.empty()) {
    try {
      rootLogger.addFileHandler(config.logFile, config.logLevel);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }

  pl::FileSnapshotStore store(config.ledger.snapshotPath);
  pl::Ledger ledger(store);

  auto init = ledger.init(config.ledger);
  if (!init) {
    if (init.error().code != pl::E_PERSISTENCE) {
      std::cerr << "Error: " << init.error().message << "\n";
      return 1;
    }
    rootLogger.warning << init.error().message;
  }

  int rc = 0;
  if (status_cmd->parsed()) {
    rc = runStatus(ledger);
  } else if (add_tx_cmd->parsed()) {
    rc = runAddTx(ledger, tx_from, tx_to, tx_amount, tx_signature);
  } else if (mine_cmd->parsed()) {
    rc = runMine(ledger, mine_address);
  } else if (add_block_cmd->parsed()) {
    rc = runAddBlock(ledger, block_data);
  } else if (block_cmd->parsed()) {
    rc = runBlock(ledger, block_index);
  } else if (latest_cmd->parsed()) {
    rc = runLatest(ledger);
  } else if (balance_cmd->parsed()) {
    rc = runBalance(ledger, balance_address);
  } else if (validate_cmd->parsed()) {
    rc = runValidate(ledger);
  } else if (blocks_cmd->parsed()) {
    rc = runBlocks(ledger);
  }

  // Final snapshot so pool submissions survive this process
  auto persisted = ledger.persist();
  if (!persisted) {
    std::cerr << "Error: " << persisted.error().message << "\n";
    return rc == 0 ? 1 : rc;
  }
  return rc;
}
