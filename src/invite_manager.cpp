#include "invite_manager.hpp"

#include <fstream>

#include "mesh_error.hpp"
#include "protocol.hpp"
#include "utils.hpp"

using json = nlohmann::json;

bool ServerInvite::is_valid(std::uint64_t now) const {
  if(!active) return false;
  if(expires_at > 0 && now > expires_at) return false;
  if(max_uses > 0 && use_count >= max_uses) return false;
  return true;
}

bool ServerInvite::is_valid() const {
  return is_valid(unix_now_secs());
}

std::optional<std::uint64_t> ServerInvite::time_remaining(std::uint64_t now) const {
  if(expires_at == 0) return std::nullopt;
  return now >= expires_at ? 0 : expires_at - now;
}

std::optional<std::uint64_t> ServerInvite::time_remaining() const {
  return time_remaining(unix_now_secs());
}

json invite_to_json(const ServerInvite& invite) {
  return {
    {"id", invite.id},
    {"code", invite.code},
    {"server_instance_id", invite.server_instance_id},
    {"server_name", invite.server_name},
    {"mc_version", invite.mc_version},
    {"loader", invite.loader},
    {"server_address", invite.server_address},
    {"host_peer_id", invite.host_peer_id},
    {"created_at", invite.created_at},
    {"expires_at", invite.expires_at},
    {"max_uses", invite.max_uses},
    {"use_count", invite.use_count},
    {"active", invite.active}
  };
}

ServerInvite invite_from_json(const json& j) {
  ServerInvite invite;
  invite.id = j.at("id").get<std::string>();
  invite.code = j.at("code").get<std::string>();
  invite.server_instance_id = j.at("server_instance_id").get<std::string>();
  invite.server_name = j.value("server_name", "");
  invite.mc_version = j.value("mc_version", "");
  invite.loader = j.value("loader", "");
  invite.server_address = j.value("server_address", "");
  invite.host_peer_id = j.value("host_peer_id", "");
  invite.created_at = j.value("created_at", std::uint64_t{0});
  invite.expires_at = j.value("expires_at", std::uint64_t{0});
  invite.max_uses = j.value("max_uses", std::uint32_t{0});
  invite.use_count = j.value("use_count", std::uint32_t{0});
  invite.active = j.value("active", true);
  return invite;
}

std::string format_invite_for_sharing(const ServerInvite& invite) {
  std::string text = fmt::format("Join the server {}!\n\n", invite.server_name);
  text += fmt::format("Version: {} ({})\n", invite.mc_version, invite.loader);
  text += fmt::format("Address: {}\n\n", invite.server_address);
  text += fmt::format("Invite code: {}\n\n", invite.code);
  text += fmt::format("Run \"join {}\" in packmesh to connect", invite.code);

  if(auto remaining = invite.time_remaining()) {
    if(*remaining > 0) {
      auto hours = *remaining / 3600;
      auto minutes = (*remaining % 3600) / 60;
      if(hours > 0) {
        text += fmt::format("\nValid for another {}h {}m", hours, minutes);
      } else {
        text += fmt::format("\nValid for another {}m", minutes);
      }
    }
  }
  return text;
}

InviteManager::InviteManager(std::filesystem::path file, std::shared_ptr<Logger> logger)
  : file_(std::move(file)), logger_(std::move(logger)) {}

bool InviteManager::load() {
  if(file_.empty()) return false;
  std::ifstream in(file_);
  if(!in) return false;

  std::map<std::string, ServerInvite> loaded;
  try {
    json doc;
    in >> doc;
    for(const auto& item : doc) {
      auto invite = invite_from_json(item);
      auto canonical = canonical_code(invite.code, kInvitePrefix);
      if(!canonical) {
        log_warn(logger_.get(), "Skipping invite with malformed code '{}'", invite.code);
        continue;
      }
      invite.code = *canonical;
      loaded[*canonical] = std::move(invite);
    }
  } catch(const json::exception& ex) {
    log_error(logger_.get(), "Failed to read invites {}: {}", file_.string(), ex.what());
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  invites_ = std::move(loaded);
  return true;
}

bool InviteManager::save() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return save_locked();
}

bool InviteManager::save_locked() const {
  if(file_.empty()) return true;
  std::error_code ec;
  if(file_.has_parent_path()) std::filesystem::create_directories(file_.parent_path(), ec);

  json doc = json::array();
  for(const auto& entry : invites_) doc.push_back(invite_to_json(entry.second));
  std::ofstream out(file_, std::ios::trunc);
  if(!out) {
    log_error(logger_.get(), "Unable to write invites to {}", file_.string());
    return false;
  }
  out << doc.dump(2);
  return static_cast<bool>(out);
}

void InviteManager::set_host_peer_id(std::string peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  host_peer_id_ = std::move(peer_id);
}

std::string InviteManager::host_peer_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return host_peer_id_;
}

ServerInvite InviteManager::create_invite(const std::string& server_instance_id,
                                          const std::string& server_name,
                                          const std::string& mc_version,
                                          const std::string& loader,
                                          const std::string& server_address,
                                          std::optional<std::chrono::seconds> expires_in,
                                          std::optional<std::uint32_t> max_uses) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(host_peer_id_.empty()) {
    throw MeshError(MeshErrc::NotInitialized, "P2P not initialized");
  }

  auto now = unix_now_secs();
  ServerInvite invite;
  invite.id = random_uuid();
  do {
    invite.code = generate_short_code(kInvitePrefix);
  } while(invites_.count(invite.code));
  invite.server_instance_id = server_instance_id;
  invite.server_name = server_name;
  invite.mc_version = mc_version;
  invite.loader = loader;
  invite.server_address = server_address;
  invite.host_peer_id = host_peer_id_;
  invite.created_at = now;
  invite.expires_at = expires_in ? now + static_cast<std::uint64_t>(expires_in->count()) : 0;
  invite.max_uses = max_uses.value_or(0);

  invites_[invite.code] = invite;
  if(!save_locked()) {
    throw MeshError(MeshErrc::Persistence, "Unable to save invites to " + file_.string());
  }
  log_info(logger_.get(), "Created invite {} for server {}", invite.code, server_instance_id);
  return invite;
}

std::optional<ServerInvite> InviteManager::get_invite(const std::string& code) const {
  auto canonical = canonical_code(code, kInvitePrefix);
  if(!canonical) return std::nullopt;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = invites_.find(*canonical);
  if(it == invites_.end()) return std::nullopt;
  return it->second;
}

void InviteManager::check_usable(const ServerInvite& invite, std::uint64_t now) {
  if(invite.is_valid(now)) return;
  if(!invite.active) {
    throw MeshError(MeshErrc::InviteDeactivated, "Invite has been deactivated");
  }
  if(invite.max_uses > 0 && invite.use_count >= invite.max_uses) {
    throw MeshError(MeshErrc::InviteQuotaExceeded, "Invite has reached maximum uses");
  }
  throw MeshError(MeshErrc::InviteExpired, "Invite has expired");
}

ServerInvite InviteManager::validate_invite(const std::string& code) const {
  auto invite = get_invite(code);
  if(!invite) {
    throw MeshError(MeshErrc::InviteNotFound, "Invite not found");
  }
  check_usable(*invite, unix_now_secs());
  return *invite;
}

ServerInvite InviteManager::use_invite(const std::string& code) {
  auto canonical = canonical_code(code, kInvitePrefix);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = canonical ? invites_.find(*canonical) : invites_.end();
  if(it == invites_.end()) {
    throw MeshError(MeshErrc::InviteNotFound, "Invite not found");
  }
  check_usable(it->second, unix_now_secs());
  it->second.use_count += 1;
  if(!save_locked()) {
    log_warn(logger_.get(), "Use of invite {} is not persisted", it->first);
  }
  return it->second;
}

void InviteManager::revoke_invite(const std::string& code) {
  auto canonical = canonical_code(code, kInvitePrefix);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = canonical ? invites_.find(*canonical) : invites_.end();
  if(it == invites_.end()) {
    throw MeshError(MeshErrc::InviteNotFound, "Invite not found");
  }
  it->second.active = false;
  save_locked();
  log_info(logger_.get(), "Revoked invite {}", it->first);
}

bool InviteManager::delete_invite(const std::string& code) {
  auto canonical = canonical_code(code, kInvitePrefix);
  if(!canonical) return false;
  std::lock_guard<std::mutex> lock(mutex_);
  if(invites_.erase(*canonical) == 0) return false;
  save_locked();
  return true;
}

std::vector<ServerInvite> InviteManager::get_server_invites(const std::string& server_instance_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ServerInvite> out;
  for(const auto& entry : invites_) {
    if(entry.second.server_instance_id == server_instance_id) out.push_back(entry.second);
  }
  return out;
}

std::vector<ServerInvite> InviteManager::get_active_invites() const {
  auto now = unix_now_secs();
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ServerInvite> out;
  for(const auto& entry : invites_) {
    if(entry.second.is_valid(now)) out.push_back(entry.second);
  }
  return out;
}

std::vector<ServerInvite> InviteManager::all_invites() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ServerInvite> out;
  for(const auto& entry : invites_) out.push_back(entry.second);
  return out;
}

std::size_t InviteManager::cleanup_expired_invites() {
  auto now = unix_now_secs();
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for(auto it = invites_.begin(); it != invites_.end();) {
    if(it->second.expires_at != 0 && it->second.expires_at <= now) {
      it = invites_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if(removed > 0) save_locked();
  return removed;
}
