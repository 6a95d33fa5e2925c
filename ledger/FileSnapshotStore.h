#pragma once

#include "SnapshotStore.h"

#include <mutex>
#include <string>

namespace pl {

/**
 * SnapshotStore backed by a single JSON file.
 * Saves go through a temporary file and a rename so a crash mid-write
 * leaves the previous snapshot in place.
 */
class FileSnapshotStore : public SnapshotStore {
public:
  explicit FileSnapshotStore(const std::string &path);
  ~FileSnapshotStore() override = default;

  Roe<LedgerState> load() override;
  Roe<void> save(const LedgerState &state) override;

  const std::string &getPath() const { return path_; }

private:
  std::string path_;
  std::mutex mutex_;
};

} // namespace pl
