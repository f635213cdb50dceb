#include "update_notifier.hpp"

#include <algorithm>

#include "utils.hpp"

using json = nlohmann::json;

json notification_to_json(const UpdateNotification& n) {
  json j = {
    {"id", n.id},
    {"peer_id", n.peer_id},
    {"modpack_name", n.modpack_name},
    {"local_version", n.local_version},
    {"peer_version", n.peer_version},
    {"files_diff", n.files_diff},
    {"size_diff", n.size_diff},
    {"created_at", iso8601_from_secs(n.created_at)},
    {"read", n.read},
    {"dismissed", n.dismissed}
  };
  j["peer_nickname"] = n.peer_nickname ? json(*n.peer_nickname) : json(nullptr);
  return j;
}

void UpdateNotifier::set_enabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  enabled_ = enabled;
}

bool UpdateNotifier::is_enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_;
}

void UpdateNotifier::track_modpack(const std::string& modpack_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  tracked_.insert(modpack_name);
}

void UpdateNotifier::untrack_modpack(const std::string& modpack_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  tracked_.erase(modpack_name);
}

std::vector<std::string> UpdateNotifier::tracked_modpacks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {tracked_.begin(), tracked_.end()};
}

bool UpdateNotifier::is_tracked(const std::string& modpack_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tracked_locked(modpack_name);
}

bool UpdateNotifier::tracked_locked(const std::string& modpack_name) const {
  return tracked_.empty() || tracked_.count(modpack_name) > 0;
}

void UpdateNotifier::set_local_version(const std::string& modpack_name,
                                       const std::string& version,
                                       std::uint64_t files_count,
                                       std::uint64_t total_size) {
  std::vector<NotificationEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    local_versions_[modpack_name] = LocalVersion{version, files_count, total_size};
    if(enabled_) {
      for(const auto& peer : peer_versions_) {
        auto it = peer.second.find(modpack_name);
        if(it == peer.second.end()) continue;
        if(auto created = check_locked(it->second)) {
          NotificationEvent event;
          event.kind = NotificationEventKind::NewUpdate;
          event.peer_id = created->peer_id;
          event.modpack_name = modpack_name;
          event.new_version = created->peer_version;
          event.notification = std::move(created);
          events.push_back(std::move(event));
        }
      }
    }
  }
  emit(events);
}

std::optional<std::string> UpdateNotifier::local_version(const std::string& modpack_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = local_versions_.find(modpack_name);
  if(it == local_versions_.end()) return std::nullopt;
  return it->second.version;
}

void UpdateNotifier::update_peer_version(const PeerModpackVersion& version) {
  std::vector<NotificationEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!enabled_) return;

    auto& modpacks = peer_versions_[version.peer_id];
    std::optional<std::string> old_version;
    auto it = modpacks.find(version.modpack_name);
    if(it != modpacks.end()) old_version = it->second.version;
    modpacks[version.modpack_name] = version;

    if(old_version && *old_version == version.version) return;

    NotificationEvent changed;
    changed.kind = NotificationEventKind::PeerVersionChanged;
    changed.peer_id = version.peer_id;
    changed.modpack_name = version.modpack_name;
    changed.old_version = old_version;
    changed.new_version = version.version;
    events.push_back(std::move(changed));

    if(auto created = check_locked(version)) {
      NotificationEvent event;
      event.kind = NotificationEventKind::NewUpdate;
      event.peer_id = version.peer_id;
      event.modpack_name = version.modpack_name;
      event.new_version = version.version;
      event.notification = std::move(created);
      events.push_back(std::move(event));
    }
  }
  emit(events);
}

std::optional<UpdateNotification> UpdateNotifier::check_locked(const PeerModpackVersion& peer) {
  if(!tracked_locked(peer.modpack_name)) return std::nullopt;
  auto local = local_versions_.find(peer.modpack_name);
  if(local == local_versions_.end()) return std::nullopt;
  if(local->second.version == peer.version) return std::nullopt;

  bool exists = std::any_of(notifications_.begin(), notifications_.end(), [&](const UpdateNotification& n){
    return n.peer_id == peer.peer_id && n.modpack_name == peer.modpack_name &&
           n.peer_version == peer.version && !n.dismissed;
  });
  if(exists) return std::nullopt;

  UpdateNotification notification;
  notification.id = random_uuid();
  notification.peer_id = peer.peer_id;
  notification.peer_nickname = peer.peer_nickname;
  notification.modpack_name = peer.modpack_name;
  notification.local_version = local->second.version;
  notification.peer_version = peer.version;
  if(local->second.files_count > 0 || local->second.total_size > 0) {
    notification.files_diff = static_cast<std::int64_t>(peer.files_count) -
                              static_cast<std::int64_t>(local->second.files_count);
    notification.size_diff = static_cast<std::int64_t>(peer.total_size) -
                             static_cast<std::int64_t>(local->second.total_size);
  }
  notification.created_at = unix_now_secs();
  notifications_.push_back(notification);
  return notification;
}

std::vector<PeerModpackVersion> UpdateNotifier::peer_modpacks(const std::string& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerModpackVersion> out;
  auto it = peer_versions_.find(peer_id);
  if(it == peer_versions_.end()) return out;
  for(const auto& entry : it->second) out.push_back(entry.second);
  return out;
}

std::vector<PeerModpackVersion> UpdateNotifier::peers_with_modpack(const std::string& modpack_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerModpackVersion> out;
  for(const auto& peer : peer_versions_) {
    auto it = peer.second.find(modpack_name);
    if(it != peer.second.end()) out.push_back(it->second);
  }
  return out;
}

void UpdateNotifier::remove_peer(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  peer_versions_.erase(peer_id);
}

std::vector<UpdateNotification> UpdateNotifier::notifications() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return notifications_;
}

std::vector<UpdateNotification> UpdateNotifier::unread_notifications() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<UpdateNotification> out;
  for(const auto& n : notifications_) {
    if(!n.read && !n.dismissed) out.push_back(n);
  }
  return out;
}

std::size_t UpdateNotifier::unread_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(notifications_.begin(), notifications_.end(),
    [](const UpdateNotification& n){ return !n.read && !n.dismissed; }));
}

std::vector<UpdateNotification> UpdateNotifier::notifications_for_modpack(const std::string& modpack_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<UpdateNotification> out;
  for(const auto& n : notifications_) {
    if(n.modpack_name == modpack_name && !n.dismissed) out.push_back(n);
  }
  return out;
}

bool UpdateNotifier::mark_read(const std::string& notification_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for(auto& n : notifications_) {
    if(n.id == notification_id) {
      n.read = true;
      return true;
    }
  }
  return false;
}

void UpdateNotifier::mark_all_read() {
  std::lock_guard<std::mutex> lock(mutex_);
  for(auto& n : notifications_) n.read = true;
}

bool UpdateNotifier::dismiss(const std::string& notification_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for(auto& n : notifications_) {
    if(n.id == notification_id) {
      n.dismissed = true;
      return true;
    }
  }
  return false;
}

bool UpdateNotifier::delete_notification(const std::string& notification_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto before = notifications_.size();
  notifications_.erase(std::remove_if(notifications_.begin(), notifications_.end(),
                                      [&](const UpdateNotification& n){ return n.id == notification_id; }),
                       notifications_.end());
  return notifications_.size() != before;
}

void UpdateNotifier::clear_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  notifications_.clear();
}

void UpdateNotifier::cleanup_old(std::uint64_t max_age_secs) {
  auto now = unix_now_secs();
  auto cutoff = now > max_age_secs ? now - max_age_secs : 0;
  std::lock_guard<std::mutex> lock(mutex_);
  notifications_.erase(std::remove_if(notifications_.begin(), notifications_.end(),
                                      [&](const UpdateNotification& n){ return n.created_at < cutoff; }),
                       notifications_.end());
}

std::size_t UpdateNotifier::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  auto handle = next_listener_++;
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void UpdateNotifier::remove_listener(std::size_t handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void UpdateNotifier::emit(const std::vector<NotificationEvent>& events) {
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
