#ifndef POW_LEDGER_UTILITIES_H
#define POW_LEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace pl {

// Error type for utility functions
struct Error : RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in milliseconds since the epoch
 */
int64_t getCurrentTimeMs();

/**
 * Compute SHA-256 using libsodium
 * @param input Input bytes
 * @return Lowercase hex digest (64 characters)
 * @throws std::runtime_error if the digest cannot be computed
 */
std::string sha256(const std::string &input);

/**
 * Encode binary data as lowercase hex
 */
std::string hexEncode(const std::string &data);

/**
 * True if the string is non-empty and made only of hex digits
 */
bool isHex(const std::string &str);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed document; error code 1 if the file does not exist,
 *         2 if it cannot be read, 3 if it is not valid JSON
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Replace a file's content atomically
 * Writes to `path + ".tmp"` then renames it over `path`. Parent
 * directories are created as needed.
 * @param path Destination file
 * @param content Bytes to write
 */
Roe<void> writeFileAtomic(const std::string &path, const std::string &content);

} // namespace utl
} // namespace pl

#endif // POW_LEDGER_UTILITIES_H
