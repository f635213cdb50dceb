#include "transfer_history.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

#include "utils.hpp"

using json = nlohmann::json;

const char* to_string(TransferDirection direction) {
  return direction == TransferDirection::Upload ? "upload" : "download";
}

const char* to_string(TransferResult result) {
  switch(result) {
    case TransferResult::Success:        return "success";
    case TransferResult::Failed:         return "failed";
    case TransferResult::Cancelled:      return "cancelled";
    case TransferResult::PartialSuccess: return "partial_success";
  }
  return "failed";
}

namespace {

TransferDirection direction_from_string(const std::string& text) {
  return text == "download" ? TransferDirection::Download : TransferDirection::Upload;
}

TransferResult result_from_string(const std::string& text) {
  if(text == "success") return TransferResult::Success;
  if(text == "cancelled") return TransferResult::Cancelled;
  if(text == "partial_success") return TransferResult::PartialSuccess;
  return TransferResult::Failed;
}

} // namespace

json history_entry_to_json(const TransferHistoryEntry& entry) {
  json j = {
    {"id", entry.id},
    {"session_id", entry.session_id},
    {"peer_id", entry.peer_id},
    {"modpack_name", entry.modpack_name},
    {"direction", to_string(entry.direction)},
    {"result", to_string(entry.result)},
    {"files_count", entry.files_count},
    {"total_bytes", entry.total_bytes},
    {"started_at", entry.started_at},
    {"completed_at", entry.completed_at},
    {"duration_seconds", entry.duration_seconds},
    {"avg_speed_bps", entry.avg_speed_bps}
  };
  j["peer_nickname"] = entry.peer_nickname ? json(*entry.peer_nickname) : json(nullptr);
  j["error"] = entry.error ? json(*entry.error) : json(nullptr);
  return j;
}

TransferHistoryEntry history_entry_from_json(const json& j) {
  TransferHistoryEntry entry;
  entry.id = j.at("id").get<std::string>();
  entry.session_id = j.value("session_id", "");
  entry.peer_id = j.at("peer_id").get<std::string>();
  if(j.contains("peer_nickname") && j["peer_nickname"].is_string()) {
    entry.peer_nickname = j["peer_nickname"].get<std::string>();
  }
  entry.modpack_name = j.at("modpack_name").get<std::string>();
  entry.direction = direction_from_string(j.value("direction", "upload"));
  entry.result = result_from_string(j.value("result", "failed"));
  entry.files_count = j.value("files_count", std::uint64_t{0});
  entry.total_bytes = j.value("total_bytes", std::uint64_t{0});
  entry.started_at = j.value("started_at", std::uint64_t{0});
  entry.completed_at = j.value("completed_at", std::uint64_t{0});
  entry.duration_seconds = j.value("duration_seconds", std::uint64_t{0});
  entry.avg_speed_bps = j.value("avg_speed_bps", std::uint64_t{0});
  if(j.contains("error") && j["error"].is_string()) {
    entry.error = j["error"].get<std::string>();
  }
  return entry;
}

TransferHistoryEntry make_history_entry(const std::string& session_id,
                                        const std::string& peer_id,
                                        std::optional<std::string> peer_nickname,
                                        const std::string& modpack_name,
                                        TransferDirection direction,
                                        TransferResult result,
                                        std::uint64_t files_count,
                                        std::uint64_t total_bytes,
                                        std::uint64_t started_at,
                                        std::optional<std::string> error) {
  TransferHistoryEntry entry;
  entry.id = random_uuid();
  entry.session_id = session_id;
  entry.peer_id = peer_id;
  entry.peer_nickname = std::move(peer_nickname);
  entry.modpack_name = modpack_name;
  entry.direction = direction;
  entry.result = result;
  entry.files_count = files_count;
  entry.total_bytes = total_bytes;
  entry.started_at = started_at;
  entry.completed_at = unix_now_secs();
  auto elapsed = entry.completed_at > started_at ? entry.completed_at - started_at : 0;
  entry.duration_seconds = std::max<std::uint64_t>(1, elapsed);
  entry.avg_speed_bps = total_bytes / entry.duration_seconds;
  entry.error = std::move(error);
  return entry;
}

TransferHistory::TransferHistory(std::filesystem::path file, std::shared_ptr<Logger> logger)
  : file_(std::move(file)), logger_(std::move(logger)) {}

bool TransferHistory::load() {
  if(file_.empty()) return false;
  std::ifstream in(file_);
  if(!in) return false;

  std::deque<TransferHistoryEntry> loaded;
  try {
    json doc;
    in >> doc;
    for(const auto& item : doc) {
      loaded.push_back(history_entry_from_json(item));
      if(loaded.size() >= kMaxHistoryEntries) break;
    }
  } catch(const json::exception& ex) {
    log_error(logger_.get(), "Failed to read transfer history {}: {}", file_.string(), ex.what());
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  entries_ = std::move(loaded);
  return true;
}

bool TransferHistory::save() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return save_locked();
}

bool TransferHistory::save_locked() const {
  if(file_.empty()) return true;
  std::error_code ec;
  if(file_.has_parent_path()) {
    std::filesystem::create_directories(file_.parent_path(), ec);
  }
  json doc = json::array();
  for(const auto& entry : entries_) doc.push_back(history_entry_to_json(entry));

  std::ofstream out(file_, std::ios::trunc);
  if(!out) {
    log_error(logger_.get(), "Unable to write transfer history to {}", file_.string());
    return false;
  }
  out << doc.dump(2);
  return static_cast<bool>(out);
}

void TransferHistory::record(TransferHistoryEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_front(std::move(entry));
  while(entries_.size() > kMaxHistoryEntries) entries_.pop_back();
  save_locked();
}

std::vector<TransferHistoryEntry> TransferHistory::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {entries_.begin(), entries_.end()};
}

std::vector<TransferHistoryEntry> TransferHistory::get_recent(std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto count = std::min(limit, entries_.size());
  return {entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(count)};
}

std::vector<TransferHistoryEntry> TransferHistory::get_by_peer(const std::string& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TransferHistoryEntry> out;
  std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(out),
               [&](const TransferHistoryEntry& e){ return e.peer_id == peer_id; });
  return out;
}

std::vector<TransferHistoryEntry> TransferHistory::get_by_modpack(const std::string& modpack_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TransferHistoryEntry> out;
  std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(out),
               [&](const TransferHistoryEntry& e){ return e.modpack_name == modpack_name; });
  return out;
}

bool TransferHistory::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  return save_locked();
}

HistoryStats TransferHistory::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  HistoryStats stats;
  stats.total_transfers = entries_.size();
  for(const auto& e : entries_) {
    if(e.result == TransferResult::Success) ++stats.successful;
    if(e.result == TransferResult::Failed) ++stats.failed;
    if(e.direction == TransferDirection::Upload) stats.total_bytes_sent += e.total_bytes;
    else stats.total_bytes_received += e.total_bytes;
  }
  return stats;
}

std::size_t TransferHistory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}
