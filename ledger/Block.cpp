#include "Block.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <utility>

namespace pl {

namespace {

logging::Logger blockLogger() { return logging::getLogger("ledger.block"); }

bool isValidPreviousHash(const std::string &hash) {
  return hash == Block::GENESIS_PREVIOUS_HASH ||
         (hash.size() <= 64 && utl::isHex(hash));
}

bool readUInt64(const nlohmann::json &j, const char *key, uint64_t &value) {
  auto it = j.find(key);
  if (it == j.end()) {
    return false;
  }
  if (it->is_number_unsigned()) {
    value = it->get<uint64_t>();
    return true;
  }
  if (it->is_number_integer() && it->get<int64_t>() >= 0) {
    value = static_cast<uint64_t>(it->get<int64_t>());
    return true;
  }
  return false;
}

} // namespace

Block::Block() : Block(nlohmann::json::array()) {}

Block::Block(nlohmann::json data, const std::string &previousHash)
    : timestamp_(utl::getCurrentTimeMs()), data_(std::move(data)),
      previousHash_(previousHash) {
  hash_ = calculateHash();
}

Block::Block(const std::vector<Transaction> &transactions,
             const std::string &previousHash)
    : Block(nlohmann::json::array(), previousHash) {
  for (const auto &tx : transactions) {
    data_.push_back(tx.toJson());
  }
  hash_ = calculateHash();
}

Block Block::createGenesis() {
  Block genesis(nlohmann::json(GENESIS_DATA), GENESIS_PREVIOUS_HASH);
  genesis.index_ = 0;
  genesis.hash_ = genesis.calculateHash();
  blockLogger().info << "Genesis block created: " << genesis.hash_.substr(0, 10)
                     << "...";
  return genesis;
}

std::string Block::canonicalData(const nlohmann::json &data) {
  // Keys are sorted by nlohmann::json's object map; invalid UTF-8 is
  // replaced rather than thrown on so that any payload can be sealed
  return data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Block::seal(uint64_t index, const std::string &previousHash,
                        int64_t timestamp, const nlohmann::json &data,
                        uint64_t nonce) {
  return utl::sha256(std::to_string(index) + previousHash +
                     std::to_string(timestamp) + canonicalData(data) +
                     std::to_string(nonce));
}

std::string Block::calculateHash() const {
  return seal(index_, previousHash_, timestamp_, data_, nonce_);
}

bool Block::meetsDifficulty(uint32_t difficulty) const {
  if (hash_.size() < difficulty) {
    return false;
  }
  for (uint32_t i = 0; i < difficulty; ++i) {
    if (hash_[i] != '0') {
      return false;
    }
  }
  return true;
}

Block::Roe<std::string> Block::mine(uint32_t difficulty, uint64_t maxNonce,
                                    const ProgressCallback &progress) {
  if (difficulty < MIN_DIFFICULTY || difficulty > MAX_DIFFICULTY) {
    return Error(E_VALIDATION,
                 "Invalid difficulty " + std::to_string(difficulty) +
                     ": must be an integer between 1 and 10");
  }

  auto log = blockLogger();
  log.info << "Mining block " << index_ << " at difficulty " << difficulty;

  // Everything but the nonce is fixed for the whole search
  const std::string prefix = std::to_string(index_) + previousHash_ +
                             std::to_string(timestamp_) + canonicalData(data_);
  const std::string target(difficulty, '0');

  uint64_t nonce = nonce_;
  std::string hash = utl::sha256(prefix + std::to_string(nonce));
  uint64_t attempts = 0;

  while (hash.compare(0, difficulty, target) != 0) {
    if (attempts >= maxNonce) {
      log.error << "Mining block " << index_ << " failed: exceeded maximum attempts ("
                << maxNonce << ")";
      return Error(E_MINING_EXHAUSTED,
                   "Mining failed: exceeded maximum attempts (" +
                       std::to_string(maxNonce) + ")");
    }
    ++nonce;
    ++attempts;
    hash = utl::sha256(prefix + std::to_string(nonce));

    if (attempts % PROGRESS_INTERVAL == 0) {
      log.debug << "Mining progress: block " << index_ << ", attempts "
                << attempts << ", current hash " << hash.substr(0, 10) << "...";
      if (progress) {
        progress(attempts, hash);
      }
    }
  }

  nonce_ = nonce;
  hash_ = hash;
  log.info << "Block " << index_ << " mined: nonce " << nonce_ << ", attempts "
           << attempts << ", hash " << hash_;
  return hash_;
}

std::vector<Transaction> Block::getTransactions() const {
  std::vector<Transaction> transactions;
  if (!data_.is_array()) {
    return transactions;
  }

  for (const auto &entry : data_) {
    if (!entry.is_object()) {
      continue;
    }
    auto from = entry.find("from");
    auto to = entry.find("to");
    auto amount = entry.find("amount");
    if (from == entry.end() || !from->is_string() || to == entry.end() ||
        !to->is_string() || amount == entry.end() || !amount->is_number()) {
      continue;
    }

    Transaction tx;
    tx.from = from->get<std::string>();
    tx.to = to->get<std::string>();
    tx.amount = amount->get<double>();
    auto timestamp = entry.find("timestamp");
    if (timestamp != entry.end() && timestamp->is_number_integer()) {
      tx.timestamp = timestamp->get<int64_t>();
    }
    auto signature = entry.find("signature");
    if (signature != entry.end() && signature->is_string()) {
      tx.signature = signature->get<std::string>();
    }
    transactions.push_back(std::move(tx));
  }
  return transactions;
}

void Block::setIndex(uint64_t index) { index_ = index; }

void Block::setTimestamp(int64_t timestamp) { timestamp_ = timestamp; }

void Block::setPreviousHash(const std::string &previousHash) {
  previousHash_ = previousHash;
}

void Block::setData(nlohmann::json data) { data_ = std::move(data); }

void Block::setHash(const std::string &hash) { hash_ = hash; }

void Block::setNonce(uint64_t nonce) { nonce_ = nonce; }

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["index"] = index_;
  j["timestamp"] = timestamp_;
  j["data"] = data_;
  j["previousHash"] = previousHash_;
  j["hash"] = hash_;
  j["nonce"] = nonce_;
  return j;
}

Block::Roe<Block> Block::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(E_VALIDATION, "Invalid block: expected a JSON object");
  }

  Block block;

  if (!readUInt64(j, "index", block.index_)) {
    return Error(E_VALIDATION, "Invalid block: \"index\" must be a non-negative integer");
  }

  auto timestamp = j.find("timestamp");
  if (timestamp == j.end() || !timestamp->is_number_integer()) {
    return Error(E_VALIDATION, "Invalid block: \"timestamp\" must be an integer");
  }
  block.timestamp_ = timestamp->get<int64_t>();

  auto data = j.find("data");
  if (data == j.end() || data->is_null()) {
    return Error(E_VALIDATION, "Invalid block: \"data\" is required");
  }
  block.data_ = *data;

  auto previousHash = j.find("previousHash");
  if (previousHash == j.end() || !previousHash->is_string() ||
      !isValidPreviousHash(previousHash->get<std::string>())) {
    return Error(E_VALIDATION, "Invalid block: \"previousHash\" must be \"0\" or a hex hash");
  }
  block.previousHash_ = previousHash->get<std::string>();

  auto hash = j.find("hash");
  if (hash == j.end() || !hash->is_string()) {
    return Error(E_VALIDATION, "Invalid block: \"hash\" is required");
  }
  block.hash_ = hash->get<std::string>();

  if (!readUInt64(j, "nonce", block.nonce_)) {
    return Error(E_VALIDATION, "Invalid block: \"nonce\" must be a non-negative integer");
  }

  return block;
}

} // namespace pl
