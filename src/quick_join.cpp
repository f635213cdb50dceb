#include "quick_join.hpp"

#include <chrono>
#include <stdexcept>

#include "mesh_error.hpp"
#include "protocol.hpp"
#include "utils.hpp"

using json = nlohmann::json;

const char* stage_name(const QuickJoinStatus& status) {
  return std::visit(overloaded{
    [](const join_stage::ValidatingInvite&) { return "validating_invite"; },
    [](const join_stage::Connecting&)       { return "connecting"; },
    [](const join_stage::CreatingInstance&) { return "creating_instance"; },
    [](const join_stage::Downloading&)      { return "downloading"; },
    [](const join_stage::Ready&)            { return "ready"; },
    [](const join_stage::Launching&)        { return "launching"; },
    [](const join_stage::Complete&)         { return "complete"; },
    [](const join_stage::Failed&)           { return "failed"; }
  }, status);
}

json status_to_json(const QuickJoinStatus& status) {
  json j = {{"stage", stage_name(status)}};
  std::visit(overloaded{
    [](const join_stage::ValidatingInvite&) {},
    [&](const join_stage::Connecting& s) { j["host_peer_id"] = s.host_peer_id; },
    [&](const join_stage::CreatingInstance& s) { j["instance_name"] = s.instance_name; },
    [&](const join_stage::Downloading& s) {
      j["progress"] = s.progress;
      j["current_file"] = s.current_file;
      j["files_done"] = s.files_done;
      j["files_total"] = s.files_total;
      j["bytes_done"] = s.bytes_done;
      j["bytes_total"] = s.bytes_total;
    },
    [&](const join_stage::Ready& s) { j["client_instance_id"] = s.client_instance_id; },
    [&](const join_stage::Launching& s) { j["server_address"] = s.server_address; },
    [](const join_stage::Complete&) {},
    [&](const join_stage::Failed& s) { j["error"] = s.error; }
  }, status);
  return j;
}

QuickJoin::QuickJoin(std::shared_ptr<InviteAuthority> invites,
                     std::shared_ptr<PeerDirectory> directory,
                     std::shared_ptr<TransferBackend> backend,
                     std::shared_ptr<InstanceProvisioner> provisioner,
                     std::shared_ptr<GameLauncher> launcher,
                     std::shared_ptr<TransferHistory> history,
                     std::shared_ptr<Logger> logger)
  : invites_(std::move(invites)),
    directory_(std::move(directory)),
    backend_(std::move(backend)),
    provisioner_(std::move(provisioner)),
    launcher_(std::move(launcher)),
    history_(std::move(history)),
    logger_(std::move(logger)) {}

QuickJoinResult QuickJoin::join(const QuickJoinRequest& request, const StageListener& listener) {
  auto started = std::chrono::steady_clock::now();
  auto started_secs = unix_now_secs();
  QuickJoinResult result;
  auto notify = [&](const QuickJoinStatus& status){
    log_debug(logger_.get(), "Quick join {}: {}", request.invite_code, stage_name(status));
    if(listener) listener(status);
  };
  auto elapsed_ms = [&](){
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started).count());
  };

  ServerInvite invite;
  std::optional<PeerInfo> host;
  try {
    notify(join_stage::ValidatingInvite{});
    invite = invites_->validate_invite(request.invite_code);

    notify(join_stage::Connecting{invite.host_peer_id});
    host = directory_->get(invite.host_peer_id);
    if(!host) {
      throw MeshError(MeshErrc::PeerNotFound, "Host peer " + invite.host_peer_id + " is not reachable");
    }

    std::string instance_id;
    if(request.client_instance_id) {
      instance_id = *request.client_instance_id;
    } else {
      notify(join_stage::CreatingInstance{invite.server_name});
      instance_id = provisioner_->create_instance(invite);
    }
    result.client_instance_id = instance_id;

    auto local = provisioner_->instance_manifest(instance_id, invite.server_instance_id);
    notify(join_stage::Downloading{});
    auto pulled = backend_->pull_sync(*host, invite.server_instance_id, local,
      [&](const SyncProgress& progress){
        join_stage::Downloading stage;
        stage.progress = progress.fraction();
        stage.current_file = progress.current_file;
        stage.files_done = progress.files_done;
        stage.files_total = progress.files_total;
        stage.bytes_done = progress.bytes_done;
        stage.bytes_total = progress.bytes_total;
        notify(stage);
      });
    if(!pulled.success) {
      throw std::runtime_error("Sync failed: " + pulled.error.value_or("unknown error"));
    }
    result.files_synced = pulled.files;
    result.bytes_synced = pulled.bytes;
    notify(join_stage::Ready{instance_id});

    invites_->use_invite(request.invite_code);

    if(request.auto_launch && launcher_) {
      notify(join_stage::Launching{invite.server_address});
      launcher_->launch(instance_id, invite.server_address);
    }
    notify(join_stage::Complete{});
    result.success = true;
  } catch(const std::exception& ex) {
    log_warn(logger_.get(), "Quick join with {} failed: {}", request.invite_code, ex.what());
    result.error = ex.what();
    notify(join_stage::Failed{ex.what()});
  }
  result.duration_ms = elapsed_ms();

  if(history_ && host) {
    history_->record(make_history_entry("", host->id, host->nickname, invite.server_instance_id,
                                        TransferDirection::Download,
                                        result.success ? TransferResult::Success : TransferResult::Failed,
                                        result.files_synced, result.bytes_synced, started_secs, result.error));
  }
  return result;
}
