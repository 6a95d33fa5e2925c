#include "Utilities.h"

#include <sodium.h>

#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pl {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodium_initializer;
} // namespace

int64_t getCurrentTimeMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string sha256(const std::string &input) {
  unsigned char hash[crypto_hash_sha256_BYTES];

  if (crypto_hash_sha256(hash,
                         reinterpret_cast<const unsigned char *>(input.data()),
                         input.size()) != 0) {
    throw std::runtime_error("crypto_hash_sha256 failed");
  }

  return hexEncode(std::string(reinterpret_cast<const char *>(hash),
                               crypto_hash_sha256_BYTES));
}

std::string hexEncode(const std::string &data) {
  std::ostringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

bool isHex(const std::string &str) {
  if (str.empty()) {
    return false;
  }
  for (unsigned char c : str) {
    if (!std::isxdigit(c)) {
      return false;
    }
  }
  return true;
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Error(1, "File not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Error(2, "Failed to open file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (file.bad()) {
    return Error(2, "Failed to read file: " + path);
  }

  try {
    return nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON in " + path + ": " + e.what());
  }
}

Roe<void> writeFileAtomic(const std::string &path, const std::string &content) {
  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
    if (!std::filesystem::create_directories(parent, ec) && ec) {
      return Error(1, "Failed to create directory " + parent.string() + ": " +
                          ec.message());
    }
  }

  std::string tempPath = path + ".tmp";
  {
    std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
    if (!file) {
      return Error(2, "Failed to open file for writing: " + tempPath);
    }
    file << content;
    file.flush();
    if (!file.good()) {
      return Error(3, "Failed to write file: " + tempPath);
    }
  }

  std::filesystem::rename(tempPath, path, ec);
  if (ec) {
    return Error(4, "Failed to rename " + tempPath + ": " + ec.message());
  }
  return {};
}

} // namespace utl
} // namespace pl
