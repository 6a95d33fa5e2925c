#ifndef POW_LEDGER_TYPES_HPP
#define POW_LEDGER_TYPES_HPP

#include <cstdint>

namespace pl {

// Error codes shared by the ledger components
constexpr int32_t E_VALIDATION = 1;
constexpr int32_t E_MINING_EXHAUSTED = 2;
constexpr int32_t E_CHAIN_EMPTY = 3;
constexpr int32_t E_PERSISTENCE = 4;
constexpr int32_t E_NOT_FOUND = 5;

constexpr uint32_t MIN_DIFFICULTY = 1;
constexpr uint32_t MAX_DIFFICULTY = 10;

} // namespace pl

#endif // POW_LEDGER_TYPES_HPP
