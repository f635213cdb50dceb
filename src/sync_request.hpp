#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "transfer_queue.hpp"

enum class ChangeType {
  Created,
  Modified,
  Deleted,
  Renamed
};

inline const char* to_string(ChangeType type) {
  switch(type) {
    case ChangeType::Created:  return "created";
    case ChangeType::Modified: return "modified";
    case ChangeType::Deleted:  return "deleted";
    case ChangeType::Renamed:  return "renamed";
  }
  return "modified";
}

struct FileChange {
  std::string relative_path;
  ChangeType type = ChangeType::Modified;
  std::optional<std::string> previous_path;   // Renamed only
  std::uint64_t timestamp = 0;                // unix millis
};

// Hand-off from the watch engine (or any other producer) to the sync dispatcher.
// An empty target_peers list means every peer currently in the directory.
struct SyncRequest {
  std::string modpack_name;
  std::vector<FileChange> changes;
  std::vector<std::string> target_peers;
  TransferPriority priority = TransferPriority::Normal;
};
