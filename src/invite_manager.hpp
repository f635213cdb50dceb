#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"

inline constexpr char kInvitePrefix[] = "JOIN";

struct ServerInvite {
  std::string id;
  std::string code;                  // JOIN-XXXX-XXXX
  std::string server_instance_id;
  std::string server_name;
  std::string mc_version;
  std::string loader;
  std::string server_address;
  std::string host_peer_id;
  std::uint64_t created_at = 0;      // unix seconds
  std::uint64_t expires_at = 0;      // 0 = never
  std::uint32_t max_uses = 0;        // 0 = unlimited
  std::uint32_t use_count = 0;
  bool active = true;

  bool is_valid(std::uint64_t now) const;
  bool is_valid() const;
  // nullopt for invites that never expire, 0 once expired.
  std::optional<std::uint64_t> time_remaining(std::uint64_t now) const;
  std::optional<std::uint64_t> time_remaining() const;
};

nlohmann::json invite_to_json(const ServerInvite& invite);
ServerInvite invite_from_json(const nlohmann::json& j);

// Shareable text with the code, the server details and how long it is still good for.
std::string format_invite_for_sharing(const ServerInvite& invite);

// What a joining client needs from whoever issued the invite.
class InviteAuthority {
public:
  virtual ~InviteAuthority() = default;
  // Throws MeshError naming exactly why the code cannot be used.
  virtual ServerInvite validate_invite(const std::string& code) const = 0;
  // Validates and consumes one use in a single step. Throws like validate_invite.
  virtual ServerInvite use_invite(const std::string& code) = 0;
};

// Invites issued by this host, persisted as one JSON document.
class InviteManager : public InviteAuthority {
public:
  explicit InviteManager(std::filesystem::path file = {}, std::shared_ptr<Logger> logger = nullptr);

  bool load();
  bool save() const;

  // Empty means P2P is not up yet; create_invite refuses until it is set.
  void set_host_peer_id(std::string peer_id);
  std::string host_peer_id() const;

  // Throws MeshError{NotInitialized} without a host peer id.
  ServerInvite create_invite(const std::string& server_instance_id,
                             const std::string& server_name,
                             const std::string& mc_version,
                             const std::string& loader,
                             const std::string& server_address,
                             std::optional<std::chrono::seconds> expires_in = std::nullopt,
                             std::optional<std::uint32_t> max_uses = std::nullopt);

  // Accepts JOIN-XXXX-XXXX, joinxxxxxxxx, XXXX-XXXX and the bare 8 symbols.
  std::optional<ServerInvite> get_invite(const std::string& code) const;
  ServerInvite validate_invite(const std::string& code) const override;
  ServerInvite use_invite(const std::string& code) override;

  // Soft: the invite stays listed but no longer validates.
  void revoke_invite(const std::string& code);
  bool delete_invite(const std::string& code);

  std::vector<ServerInvite> get_server_invites(const std::string& server_instance_id) const;
  std::vector<ServerInvite> get_active_invites() const;
  std::vector<ServerInvite> all_invites() const;
  // Drops invites whose expiry has passed. Returns how many went.
  std::size_t cleanup_expired_invites();

private:
  static void check_usable(const ServerInvite& invite, std::uint64_t now);
  bool save_locked() const;

  std::filesystem::path file_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::string host_peer_id_;
  std::map<std::string, ServerInvite> invites_;   // by canonical code
};
