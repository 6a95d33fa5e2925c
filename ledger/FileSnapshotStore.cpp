#include "FileSnapshotStore.h"
#include "../lib/Utilities.h"

#include <filesystem>

namespace pl {

FileSnapshotStore::FileSnapshotStore(const std::string &path)
    : SnapshotStore("ledger.snapshot"), path_(path) {}

FileSnapshotStore::Roe<LedgerState> FileSnapshotStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return Error(E_NOT_FOUND, "Snapshot not found: " + path_);
  }

  auto json = utl::loadJsonFile(path_);
  if (!json) {
    return Error(E_PERSISTENCE, json.error().message);
  }

  auto state = LedgerState::fromJson(json.value());
  if (!state) {
    return Error(E_PERSISTENCE, "Failed to load snapshot " + path_ + ": " +
                                    state.error().message);
  }

  log().debug << "Loaded snapshot " << path_ << ": " << state->chain.size()
              << " blocks, last saved " << state->lastSaved;
  return state.value();
}

FileSnapshotStore::Roe<void> FileSnapshotStore::save(const LedgerState &state) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::string content;
  try {
    content = state.toJson().dump(2, ' ', false,
                                  nlohmann::json::error_handler_t::replace);
  } catch (const nlohmann::json::exception &e) {
    return Error(E_PERSISTENCE, std::string("Failed to serialize snapshot: ") + e.what());
  }

  auto written = utl::writeFileAtomic(path_, content);
  if (!written) {
    log().error << "Failed to save snapshot " << path_ << ": "
                << written.error().message;
    return Error(E_PERSISTENCE, written.error().message);
  }

  log().debug << "Snapshot saved to " << path_ << " (" << state.chain.size()
              << " blocks)";
  return {};
}

} // namespace pl
