#include "peer_directory.hpp"

#include <algorithm>

PeerEventKind PeerDirectory::upsert(PeerInfo peer) {
  PeerEvent event;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer.id);
    if(it == peers_.end()) {
      event.kind = PeerEventKind::Added;
      it = peers_.emplace(peer.id, std::move(peer)).first;
    } else {
      event.kind = PeerEventKind::Updated;
      auto previous_seen = it->second.last_seen;
      it->second = std::move(peer);
      it->second.last_seen = std::max(previous_seen, it->second.last_seen);
    }
    event.peer = it->second;
  }
  notify({event});
  return event.kind;
}

PeerEventKind PeerDirectory::sighted(const std::string& id,
                                     const std::string& address,
                                     std::uint16_t port,
                                     const std::string& app_version,
                                     Clock::time_point when) {
  PeerEvent event;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(id);
    if(it == peers_.end()) {
      PeerInfo peer;
      peer.id = id;
      peer.last_seen = when;
      it = peers_.emplace(id, std::move(peer)).first;
      event.kind = PeerEventKind::Added;
    } else {
      event.kind = PeerEventKind::Updated;
      it->second.last_seen = std::max(it->second.last_seen, when);
    }
    it->second.address = address;
    it->second.port = port;
    if(!app_version.empty()) it->second.app_version = app_version;
    event.peer = it->second;
  }
  notify({event});
  return event.kind;
}

bool PeerDirectory::touch(const std::string& id, Clock::time_point when) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if(it == peers_.end()) return false;
  it->second.last_seen = std::max(it->second.last_seen, when);
  return true;
}

bool PeerDirectory::remove(const std::string& id) {
  PeerEvent event;
  event.kind = PeerEventKind::Removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(id);
    if(it == peers_.end()) return false;
    event.peer = std::move(it->second);
    peers_.erase(it);
  }
  notify({event});
  return true;
}

void PeerDirectory::clear() {
  std::vector<PeerEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    events.reserve(peers_.size());
    for(auto& entry : peers_) {
      events.push_back({PeerEventKind::Removed, std::move(entry.second)});
    }
    peers_.clear();
  }
  notify(events);
}

std::vector<std::string> PeerDirectory::sweep(Clock::time_point now, Clock::duration timeout) {
  std::vector<PeerEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(auto it = peers_.begin(); it != peers_.end();) {
      if(now - it->second.last_seen > timeout) {
        events.push_back({PeerEventKind::Removed, std::move(it->second)});
        it = peers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  std::vector<std::string> removed;
  removed.reserve(events.size());
  for(const auto& event : events) removed.push_back(event.peer.id);
  notify(events);
  return removed;
}

std::optional<PeerInfo> PeerDirectory::get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if(it == peers_.end()) return std::nullopt;
  return it->second;
}

std::vector<PeerInfo> PeerDirectory::snapshot() const {
  std::vector<PeerInfo> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(peers_.size());
    for(const auto& entry : peers_) out.push_back(entry.second);
  }
  std::sort(out.begin(), out.end(),
            [](const PeerInfo& a, const PeerInfo& b){ return a.id < b.id; });
  return out;
}

std::size_t PeerDirectory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

bool PeerDirectory::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.count(id) > 0;
}

std::size_t PeerDirectory::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  auto handle = next_listener_++;
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void PeerDirectory::remove_listener(std::size_t handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void PeerDirectory::notify(const std::vector<PeerEvent>& events) {
  if(events.empty()) return;
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for(const auto& entry : listeners_) listeners.push_back(entry.second);
  }
  for(const auto& event : events) {
    for(const auto& listener : listeners) listener(event);
  }
}
