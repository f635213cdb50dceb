#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct PeerModpackVersion {
  std::string peer_id;
  std::optional<std::string> peer_nickname;
  std::string modpack_name;
  std::string version;
  std::uint64_t files_count = 0;
  std::uint64_t total_size = 0;
  std::uint64_t updated_at = 0;    // unix seconds
};

struct UpdateNotification {
  std::string id;
  std::string peer_id;
  std::optional<std::string> peer_nickname;
  std::string modpack_name;
  std::string local_version;
  std::string peer_version;
  std::int64_t files_diff = 0;     // peer minus local
  std::int64_t size_diff = 0;
  std::uint64_t created_at = 0;
  bool read = false;
  bool dismissed = false;
};

nlohmann::json notification_to_json(const UpdateNotification& notification);

enum class NotificationEventKind {
  NewUpdate,
  PeerVersionChanged
};

struct NotificationEvent {
  NotificationEventKind kind = NotificationEventKind::NewUpdate;
  std::optional<UpdateNotification> notification;      // NewUpdate
  std::string peer_id;
  std::string modpack_name;
  std::optional<std::string> old_version;              // PeerVersionChanged
  std::string new_version;
};

// Compares what peers advertise with the local modpack versions and raises a
// notification once per (peer, modpack, version) until the user dismisses it.
class UpdateNotifier {
public:
  using Listener = std::function<void(const NotificationEvent& event)>;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  // An empty tracked set means every modpack is tracked.
  void track_modpack(const std::string& modpack_name);
  void untrack_modpack(const std::string& modpack_name);
  std::vector<std::string> tracked_modpacks() const;
  bool is_tracked(const std::string& modpack_name) const;

  void set_local_version(const std::string& modpack_name,
                         const std::string& version,
                         std::uint64_t files_count = 0,
                         std::uint64_t total_size = 0);
  std::optional<std::string> local_version(const std::string& modpack_name) const;

  void update_peer_version(const PeerModpackVersion& version);
  std::vector<PeerModpackVersion> peer_modpacks(const std::string& peer_id) const;
  std::vector<PeerModpackVersion> peers_with_modpack(const std::string& modpack_name) const;
  void remove_peer(const std::string& peer_id);

  std::vector<UpdateNotification> notifications() const;
  std::vector<UpdateNotification> unread_notifications() const;
  std::size_t unread_count() const;
  std::vector<UpdateNotification> notifications_for_modpack(const std::string& modpack_name) const;
  bool mark_read(const std::string& notification_id);
  void mark_all_read();
  bool dismiss(const std::string& notification_id);
  bool delete_notification(const std::string& notification_id);
  void clear_all();
  // Drops notifications older than max_age_secs.
  void cleanup_old(std::uint64_t max_age_secs);

  std::size_t add_listener(Listener listener);
  void remove_listener(std::size_t handle);

private:
  struct LocalVersion {
    std::string version;
    std::uint64_t files_count = 0;
    std::uint64_t total_size = 0;
  };

  bool tracked_locked(const std::string& modpack_name) const;
  std::optional<UpdateNotification> check_locked(const PeerModpackVersion& peer);
  void emit(const std::vector<NotificationEvent>& events);

  mutable std::mutex mutex_;
  bool enabled_ = true;
  std::set<std::string> tracked_;
  std::map<std::string, LocalVersion> local_versions_;
  std::map<std::string, std::map<std::string, PeerModpackVersion>> peer_versions_;   // peer -> modpack
  std::vector<UpdateNotification> notifications_;

  std::mutex listener_mutex_;
  std::map<std::size_t, Listener> listeners_;
  std::size_t next_listener_ = 1;
};
