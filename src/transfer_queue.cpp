#include "transfer_queue.hpp"

#include <algorithm>

#include "mesh_error.hpp"
#include "utils.hpp"

namespace {

bool runs_before(const QueuedTransfer& a, const QueuedTransfer& b) {
  if(a.priority != b.priority) return a.priority > b.priority;
  return a.sequence < b.sequence;
}

bool is_terminal(TransferState state) {
  return state == TransferState::Completed ||
         state == TransferState::Failed ||
         state == TransferState::Cancelled;
}

} // namespace

const char* to_string(TransferPriority priority) {
  switch(priority) {
    case TransferPriority::Low:      return "low";
    case TransferPriority::Normal:   return "normal";
    case TransferPriority::High:     return "high";
    case TransferPriority::Critical: return "critical";
  }
  return "normal";
}

const char* to_string(TransferState state) {
  switch(state) {
    case TransferState::Queued:    return "queued";
    case TransferState::Active:    return "active";
    case TransferState::Completed: return "completed";
    case TransferState::Failed:    return "failed";
    case TransferState::Cancelled: return "cancelled";
  }
  return "queued";
}

std::optional<TransferPriority> priority_from_string(const std::string& text) {
  if(text == "low") return TransferPriority::Low;
  if(text == "normal") return TransferPriority::Normal;
  if(text == "high") return TransferPriority::High;
  if(text == "critical") return TransferPriority::Critical;
  return std::nullopt;
}

TransferQueue::TransferQueue(std::size_t max_concurrent)
  : max_concurrent_(std::max<std::size_t>(1, max_concurrent)) {}

std::string TransferQueue::add(const std::string& peer_id,
                               std::optional<std::string> peer_nickname,
                               const std::string& modpack_name,
                               TransferPriority priority) {
  QueuedTransfer item;
  item.id = random_uuid();
  item.peer_id = peer_id;
  item.peer_nickname = std::move(peer_nickname);
  item.modpack_name = modpack_name;
  item.priority = priority;
  item.created_at = unix_now_secs();

  std::lock_guard<std::mutex> lock(mutex_);
  item.sequence = next_sequence_++;
  auto id = item.id;
  items_.emplace(id, std::move(item));
  return id;
}

std::optional<QueuedTransfer> TransferQueue::get_next() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(active_ >= max_concurrent_) return std::nullopt;

  QueuedTransfer* best = nullptr;
  for(auto& entry : items_) {
    auto& item = entry.second;
    if(item.state != TransferState::Queued) continue;
    if(!best || runs_before(item, *best)) best = &item;
  }
  if(!best) return std::nullopt;

  best->state = TransferState::Active;
  ++active_;
  return *best;
}

QueuedTransfer& TransferQueue::find_locked(const std::string& id) {
  auto it = items_.find(id);
  if(it == items_.end()) {
    throw MeshError(MeshErrc::TransferNotFound, "Transfer not found: " + id);
  }
  return it->second;
}

void TransferQueue::mark_started(const std::string& id, const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = find_locked(id);
  if(item.state != TransferState::Active) {
    throw MeshError(MeshErrc::InvalidTransition, "Only active transfers can be bound to a session");
  }
  item.session_id = session_id;
}

void TransferQueue::mark_completed(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = find_locked(id);
  if(item.state != TransferState::Active) {
    throw MeshError(MeshErrc::InvalidTransition, "Only active transfers can complete");
  }
  item.state = TransferState::Completed;
  item.error.reset();
  --active_;
}

void TransferQueue::mark_failed(const std::string& id, const std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = find_locked(id);
  if(item.state != TransferState::Active) {
    throw MeshError(MeshErrc::InvalidTransition, "Only active transfers can fail");
  }
  item.state = TransferState::Failed;
  item.error = error;
  --active_;
}

void TransferQueue::cancel(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = find_locked(id);
  if(item.state == TransferState::Active) {
    --active_;
  } else if(item.state != TransferState::Queued) {
    throw MeshError(MeshErrc::InvalidTransition,
                    std::string("Cannot cancel a ") + to_string(item.state) + " transfer");
  }
  item.state = TransferState::Cancelled;
}

void TransferQueue::set_priority(const std::string& id, TransferPriority priority) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = find_locked(id);
  if(item.state != TransferState::Queued) {
    throw MeshError(MeshErrc::InvalidTransition, "Can only change priority of pending transfers");
  }
  item.priority = priority;
}

void TransferQueue::retry(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = find_locked(id);
  if(item.state != TransferState::Failed) {
    throw MeshError(MeshErrc::InvalidTransition, "Can only retry failed transfers");
  }
  item.state = TransferState::Queued;
  item.attempts += 1;
  item.error.reset();
  item.session_id.reset();
  item.sequence = next_sequence_++;
}

std::size_t TransferQueue::retry_all_failed() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<QueuedTransfer*> failed;
  for(auto& entry : items_) {
    if(entry.second.state == TransferState::Failed) failed.push_back(&entry.second);
  }
  // Requeue in their original order so FIFO among them survives.
  std::sort(failed.begin(), failed.end(),
            [](const QueuedTransfer* a, const QueuedTransfer* b){ return a->sequence < b->sequence; });
  for(auto* item : failed) {
    item->state = TransferState::Queued;
    item->attempts += 1;
    item->error.reset();
    item->session_id.reset();
    item->sequence = next_sequence_++;
  }
  return failed.size();
}

void TransferQueue::set_max_concurrent(std::size_t max_concurrent) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_concurrent_ = std::max<std::size_t>(1, max_concurrent);
}

std::size_t TransferQueue::max_concurrent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return max_concurrent_;
}

void TransferQueue::cleanup() {
  std::lock_guard<std::mutex> lock(mutex_);
  for(auto it = items_.begin(); it != items_.end();) {
    if(is_terminal(it->second.state)) {
      it = items_.erase(it);
    } else {
      ++it;
    }
  }
}

void TransferQueue::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  for(auto it = items_.begin(); it != items_.end();) {
    if(it->second.state != TransferState::Active) {
      it = items_.erase(it);
    } else {
      ++it;
    }
  }
}

std::optional<QueuedTransfer> TransferQueue::get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = items_.find(id);
  if(it == items_.end()) return std::nullopt;
  return it->second;
}

std::vector<QueuedTransfer> TransferQueue::ordered_locked(bool (*filter)(const QueuedTransfer&)) const {
  std::vector<QueuedTransfer> out;
  for(const auto& entry : items_) {
    if(!filter || filter(entry.second)) out.push_back(entry.second);
  }
  std::sort(out.begin(), out.end(), runs_before);
  return out;
}

std::vector<QueuedTransfer> TransferQueue::get_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ordered_locked(nullptr);
}

std::vector<QueuedTransfer> TransferQueue::get_pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ordered_locked([](const QueuedTransfer& t){ return t.state == TransferState::Queued; });
}

std::vector<QueuedTransfer> TransferQueue::get_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ordered_locked([](const QueuedTransfer& t){ return t.state == TransferState::Active; });
}

std::size_t TransferQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

std::size_t TransferQueue::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}
