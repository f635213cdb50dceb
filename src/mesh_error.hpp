#pragma once

#include <optional>
#include <stdexcept>
#include <string>

// Logical failures surfaced to callers. Transport problems inside background
// loops are logged where they happen and never reach this type.
enum class MeshErrc {
  PeerNotFound,
  PeerBlocked,
  InviteNotFound,
  InviteDeactivated,
  InviteQuotaExceeded,
  InviteExpired,
  WatchConfigMissing,
  WatchDisabled,
  WatchAlreadyRunning,
  TransferNotFound,
  InvalidTransition,
  NotInitialized,
  ConnectTimeout,
  CodeRejected,
  InvalidCode,
  BindFailed,
  Persistence
};

inline const char* to_string(MeshErrc code) {
  switch(code) {
    case MeshErrc::PeerNotFound:        return "peer_not_found";
    case MeshErrc::PeerBlocked:         return "peer_blocked";
    case MeshErrc::InviteNotFound:      return "invite_not_found";
    case MeshErrc::InviteDeactivated:   return "invite_deactivated";
    case MeshErrc::InviteQuotaExceeded: return "invite_quota_exceeded";
    case MeshErrc::InviteExpired:       return "invite_expired";
    case MeshErrc::WatchConfigMissing:  return "watch_config_missing";
    case MeshErrc::WatchDisabled:       return "watch_disabled";
    case MeshErrc::WatchAlreadyRunning: return "watch_already_running";
    case MeshErrc::TransferNotFound:    return "transfer_not_found";
    case MeshErrc::InvalidTransition:   return "invalid_transition";
    case MeshErrc::NotInitialized:      return "not_initialized";
    case MeshErrc::ConnectTimeout:      return "connect_timeout";
    case MeshErrc::CodeRejected:        return "code_rejected";
    case MeshErrc::InvalidCode:         return "invalid_code";
    case MeshErrc::BindFailed:          return "bind_failed";
    case MeshErrc::Persistence:         return "persistence";
  }
  return "unknown";
}

inline std::optional<MeshErrc> mesh_errc_from_string(const std::string& name) {
  for(int i = 0; i <= static_cast<int>(MeshErrc::Persistence); ++i) {
    auto code = static_cast<MeshErrc>(i);
    if(name == to_string(code)) return code;
  }
  return std::nullopt;
}

class MeshError : public std::runtime_error {
public:
  MeshError(MeshErrc code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

  MeshErrc code() const noexcept { return code_; }

private:
  MeshErrc code_;
};
