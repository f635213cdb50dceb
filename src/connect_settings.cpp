#include "connect_settings.hpp"

#include <stdexcept>

#include "settings_manager.hpp"

const char* to_string(Visibility visibility) {
  switch(visibility) {
    case Visibility::Invisible:      return "invisible";
    case Visibility::FriendsOnly:    return "friends_only";
    case Visibility::AuthorizedOnly: return "authorized_only";
    case Visibility::Everyone:       return "everyone";
  }
  return "invisible";
}

std::optional<Visibility> visibility_from_string(const std::string& text) {
  auto lowered = SettingsManager::to_lower(text);
  if(lowered == "invisible") return Visibility::Invisible;
  if(lowered == "friends_only") return Visibility::FriendsOnly;
  if(lowered == "authorized_only") return Visibility::AuthorizedOnly;
  if(lowered == "everyone") return Visibility::Everyone;
  return std::nullopt;
}

std::optional<std::string> ConnectSettings::public_nickname() const {
  if(!show_nickname || nickname.empty()) return std::nullopt;
  return nickname;
}

ConnectSettings connect_settings_from(const SettingsManager& settings) {
  ConnectSettings out;
  out.enabled = settings.get<bool>("enabled");
  out.nickname = settings.get<std::string>("nickname");
  out.show_nickname = settings.get<bool>("show_nickname");

  auto visibility = visibility_from_string(settings.get<std::string>("visibility"));
  if(!visibility) {
    throw std::runtime_error("Invalid visibility '" + settings.get<std::string>("visibility") + "'");
  }
  out.visibility = *visibility;

  int port = settings.get<int>("discovery_port");
  if(port <= 0 || port > 65535) {
    throw std::runtime_error("Invalid discovery_port '" + std::to_string(port) + "'");
  }
  out.discovery_port = static_cast<std::uint16_t>(port);

  auto blocked = settings.get<nlohmann::json>("blocked_peers");
  if(!blocked.is_array()) {
    throw std::runtime_error("blocked_peers must be a JSON array of peer ids");
  }
  for(const auto& id : blocked) {
    if(id.is_string()) out.blocked_peers.insert(id.get<std::string>());
  }
  return out;
}
