#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

class SettingsManager;

inline constexpr std::uint16_t kDefaultDiscoveryPort = 19847;

enum class Visibility {
  Invisible,
  FriendsOnly,
  AuthorizedOnly,
  Everyone
};

const char* to_string(Visibility visibility);
std::optional<Visibility> visibility_from_string(const std::string& text);

// Snapshot of the privacy settings the network services consult.
struct ConnectSettings {
  bool enabled = false;
  std::string nickname;
  bool show_nickname = true;
  Visibility visibility = Visibility::Invisible;
  std::uint16_t discovery_port = kDefaultDiscoveryPort;
  std::set<std::string> blocked_peers;

  bool is_blocked(const std::string& peer_id) const { return blocked_peers.count(peer_id) > 0; }
  bool visible() const { return visibility != Visibility::Invisible; }
  std::optional<std::string> public_nickname() const;
};

// Throws std::runtime_error when a stored value cannot be interpreted.
ConnectSettings connect_settings_from(const SettingsManager& settings);
