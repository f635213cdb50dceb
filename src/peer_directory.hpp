#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "protocol.hpp"

enum class PeerEventKind {
  Added,
  Updated,
  Removed
};

struct PeerEvent {
  PeerEventKind kind = PeerEventKind::Added;
  PeerInfo peer;
};

// Known peers keyed by id. Every mutation is one short critical section with no
// I/O inside it; listeners are notified after the lock is released.
class PeerDirectory {
public:
  using Clock = std::chrono::steady_clock;
  using Listener = std::function<void(const PeerEvent&)>;

  // Inserts or refreshes a peer. last_seen never moves backwards.
  PeerEventKind upsert(PeerInfo peer);
  // Records a sighting of id at address:port. Existing profile fields
  // (nickname, status, modpacks) are kept; unknown peers are added.
  PeerEventKind sighted(const std::string& id,
                        const std::string& address,
                        std::uint16_t port,
                        const std::string& app_version,
                        Clock::time_point when);
  bool touch(const std::string& id, Clock::time_point when);
  bool remove(const std::string& id);
  void clear();

  // Evicts every peer whose last_seen is older than timeout. Returns the evicted ids.
  std::vector<std::string> sweep(Clock::time_point now, Clock::duration timeout);

  std::optional<PeerInfo> get(const std::string& id) const;
  std::vector<PeerInfo> snapshot() const;
  std::size_t size() const;
  bool contains(const std::string& id) const;

  std::size_t add_listener(Listener listener);
  void remove_listener(std::size_t handle);

private:
  void notify(const std::vector<PeerEvent>& events);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, PeerInfo> peers_;

  std::mutex listener_mutex_;
  std::map<std::size_t, Listener> listeners_;
  std::size_t next_listener_ = 1;
};
