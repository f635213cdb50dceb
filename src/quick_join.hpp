#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "invite_manager.hpp"
#include "log.hpp"
#include "manifest.hpp"
#include "peer_directory.hpp"
#include "transfer_backend.hpp"
#include "transfer_history.hpp"

// Creates the local game instance a join syncs into.
class InstanceProvisioner {
public:
  virtual ~InstanceProvisioner() = default;
  // Returns the new instance id. Throws std::runtime_error on failure.
  virtual std::string create_instance(const ServerInvite& invite) = 0;
  // What the instance already has on disk.
  virtual ModpackManifest instance_manifest(const std::string& instance_id, const std::string& modpack_name) = 0;
};

class GameLauncher {
public:
  virtual ~GameLauncher() = default;
  // Throws std::runtime_error on failure.
  virtual void launch(const std::string& instance_id, const std::string& server_address) = 0;
};

namespace join_stage {

struct ValidatingInvite {};
struct Connecting { std::string host_peer_id; };
struct CreatingInstance { std::string instance_name; };
struct Downloading {
  float progress = 0.0f;
  std::string current_file;
  std::size_t files_done = 0;
  std::size_t files_total = 0;
  std::uint64_t bytes_done = 0;
  std::uint64_t bytes_total = 0;
};
struct Ready { std::string client_instance_id; };
struct Launching { std::string server_address; };
struct Complete {};
struct Failed { std::string error; };

} // namespace join_stage

using QuickJoinStatus = std::variant<join_stage::ValidatingInvite,
                                     join_stage::Connecting,
                                     join_stage::CreatingInstance,
                                     join_stage::Downloading,
                                     join_stage::Ready,
                                     join_stage::Launching,
                                     join_stage::Complete,
                                     join_stage::Failed>;

const char* stage_name(const QuickJoinStatus& status);
nlohmann::json status_to_json(const QuickJoinStatus& status);

struct QuickJoinRequest {
  std::string invite_code;
  std::optional<std::string> client_instance_id;   // reuse instead of creating one
  bool auto_launch = true;
};

struct QuickJoinResult {
  bool success = false;
  std::optional<std::string> client_instance_id;
  std::optional<std::string> error;
  std::size_t files_synced = 0;
  std::uint64_t bytes_synced = 0;
  std::uint64_t duration_ms = 0;
};

// Joins a server from an invite code. Stages only move forward and every run
// ends in Complete or Failed. The invite is consumed right after Ready, so a
// join that fails earlier never spends one of its uses.
class QuickJoin {
public:
  using StageListener = std::function<void(const QuickJoinStatus& status)>;

  QuickJoin(std::shared_ptr<InviteAuthority> invites,
            std::shared_ptr<PeerDirectory> directory,
            std::shared_ptr<TransferBackend> backend,
            std::shared_ptr<InstanceProvisioner> provisioner,
            std::shared_ptr<GameLauncher> launcher = nullptr,
            std::shared_ptr<TransferHistory> history = nullptr,
            std::shared_ptr<Logger> logger = nullptr);

  // Blocks for the whole flow. Never call from the io_context thread.
  QuickJoinResult join(const QuickJoinRequest& request, const StageListener& listener = nullptr);

private:
  std::shared_ptr<InviteAuthority> invites_;
  std::shared_ptr<PeerDirectory> directory_;
  std::shared_ptr<TransferBackend> backend_;
  std::shared_ptr<InstanceProvisioner> provisioner_;
  std::shared_ptr<GameLauncher> launcher_;
  std::shared_ptr<TransferHistory> history_;
  std::shared_ptr<Logger> logger_;
};
