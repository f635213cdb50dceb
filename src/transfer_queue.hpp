#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class TransferPriority {
  Low = 0,
  Normal = 1,
  High = 2,
  Critical = 3
};

enum class TransferState {
  Queued,
  Active,
  Completed,
  Failed,
  Cancelled
};

const char* to_string(TransferPriority priority);
const char* to_string(TransferState state);
std::optional<TransferPriority> priority_from_string(const std::string& text);

struct QueuedTransfer {
  std::string id;
  std::string peer_id;
  std::optional<std::string> peer_nickname;
  std::string modpack_name;
  TransferPriority priority = TransferPriority::Normal;
  TransferState state = TransferState::Queued;
  std::uint64_t created_at = 0;       // unix seconds
  std::uint32_t attempts = 0;
  std::optional<std::string> session_id;
  std::optional<std::string> error;
  std::uint64_t sequence = 0;         // insertion order, breaks priority ties
};

inline constexpr std::size_t kDefaultMaxConcurrentTransfers = 3;

// Priority admission control for transfers. get_next() is the only way an item
// becomes Active, so the Active count never exceeds max_concurrent().
// Mutations with an unknown id throw MeshError{TransferNotFound}; transitions
// that are not allowed from the current state throw MeshError{InvalidTransition}.
class TransferQueue {
public:
  explicit TransferQueue(std::size_t max_concurrent = kDefaultMaxConcurrentTransfers);

  std::string add(const std::string& peer_id,
                  std::optional<std::string> peer_nickname,
                  const std::string& modpack_name,
                  TransferPriority priority = TransferPriority::Normal);

  // Highest priority Queued item, FIFO among equals, if a slot is free.
  std::optional<QueuedTransfer> get_next();

  void mark_started(const std::string& id, const std::string& session_id);
  void mark_completed(const std::string& id);
  void mark_failed(const std::string& id, const std::string& error);

  void cancel(const std::string& id);
  void set_priority(const std::string& id, TransferPriority priority);
  void retry(const std::string& id);
  std::size_t retry_all_failed();

  // Only affects later get_next() calls. Values below 1 are raised to 1.
  void set_max_concurrent(std::size_t max_concurrent);
  std::size_t max_concurrent() const;

  // Drops Completed, Failed and Cancelled items.
  void cleanup();
  // Drops everything that is not Active.
  void clear();

  std::optional<QueuedTransfer> get(const std::string& id) const;
  std::vector<QueuedTransfer> get_all() const;
  std::vector<QueuedTransfer> get_pending() const;
  std::vector<QueuedTransfer> get_active() const;
  std::size_t size() const;
  std::size_t active_count() const;

private:
  QueuedTransfer& find_locked(const std::string& id);
  std::vector<QueuedTransfer> ordered_locked(bool (*filter)(const QueuedTransfer&)) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, QueuedTransfer> items_;
  std::size_t max_concurrent_;
  std::size_t active_ = 0;
  std::uint64_t next_sequence_ = 1;
};
