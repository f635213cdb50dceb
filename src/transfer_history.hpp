#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"

enum class TransferDirection {
  Upload,
  Download
};

enum class TransferResult {
  Success,
  Failed,
  Cancelled,
  PartialSuccess
};

const char* to_string(TransferDirection direction);
const char* to_string(TransferResult result);

struct TransferHistoryEntry {
  std::string id;
  std::string session_id;
  std::string peer_id;
  std::optional<std::string> peer_nickname;
  std::string modpack_name;
  TransferDirection direction = TransferDirection::Upload;
  TransferResult result = TransferResult::Success;
  std::uint64_t files_count = 0;
  std::uint64_t total_bytes = 0;
  std::uint64_t started_at = 0;       // unix seconds
  std::uint64_t completed_at = 0;
  std::uint64_t duration_seconds = 0;
  std::uint64_t avg_speed_bps = 0;
  std::optional<std::string> error;
};

nlohmann::json history_entry_to_json(const TransferHistoryEntry& entry);
TransferHistoryEntry history_entry_from_json(const nlohmann::json& j);

// Fills id, completed_at, duration (at least one second) and average speed.
TransferHistoryEntry make_history_entry(const std::string& session_id,
                                        const std::string& peer_id,
                                        std::optional<std::string> peer_nickname,
                                        const std::string& modpack_name,
                                        TransferDirection direction,
                                        TransferResult result,
                                        std::uint64_t files_count,
                                        std::uint64_t total_bytes,
                                        std::uint64_t started_at,
                                        std::optional<std::string> error);

struct HistoryStats {
  std::size_t total_transfers = 0;
  std::size_t successful = 0;
  std::size_t failed = 0;
  std::uint64_t total_bytes_sent = 0;
  std::uint64_t total_bytes_received = 0;
};

inline constexpr std::size_t kMaxHistoryEntries = 1000;

// Newest first, capped at kMaxHistoryEntries. With a file path set every
// change is written through; a failed write is logged and the in-memory
// history stays authoritative.
class TransferHistory {
public:
  explicit TransferHistory(std::filesystem::path file = {}, std::shared_ptr<Logger> logger = nullptr);

  bool load();
  bool save() const;

  void record(TransferHistoryEntry entry);
  std::vector<TransferHistoryEntry> entries() const;
  std::vector<TransferHistoryEntry> get_recent(std::size_t limit) const;
  std::vector<TransferHistoryEntry> get_by_peer(const std::string& peer_id) const;
  std::vector<TransferHistoryEntry> get_by_modpack(const std::string& modpack_name) const;
  bool clear();
  HistoryStats stats() const;
  std::size_t size() const;

private:
  bool save_locked() const;

  std::filesystem::path file_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::deque<TransferHistoryEntry> entries_;
};
