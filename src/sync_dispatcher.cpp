#include "sync_dispatcher.hpp"

#include "mesh_error.hpp"
#include "utils.hpp"

std::shared_ptr<SyncDispatcher> SyncDispatcher::create(std::shared_ptr<TransferQueue> queue,
                                                       std::shared_ptr<TransferBackend> backend,
                                                       std::shared_ptr<PeerDirectory> directory,
                                                       ManifestProvider manifests,
                                                       std::shared_ptr<TransferHistory> history,
                                                       std::shared_ptr<Logger> logger) {
  auto dispatcher = std::shared_ptr<SyncDispatcher>(
    new SyncDispatcher(std::move(queue), std::move(backend), std::move(directory),
                       std::move(manifests), std::move(history), std::move(logger)));
  if(dispatcher->backend_) dispatcher->backend_->set_session_observer(dispatcher);
  return dispatcher;
}

SyncDispatcher::SyncDispatcher(std::shared_ptr<TransferQueue> queue,
                               std::shared_ptr<TransferBackend> backend,
                               std::shared_ptr<PeerDirectory> directory,
                               ManifestProvider manifests,
                               std::shared_ptr<TransferHistory> history,
                               std::shared_ptr<Logger> logger)
  : queue_(std::move(queue)),
    backend_(std::move(backend)),
    directory_(std::move(directory)),
    manifests_(std::move(manifests)),
    history_(std::move(history)),
    logger_(std::move(logger)) {}

std::vector<std::string> SyncDispatcher::submit(const SyncRequest& request) {
  std::vector<std::string> targets = request.target_peers;
  if(targets.empty()) {
    for(const auto& peer : directory_->snapshot()) targets.push_back(peer.id);
  }
  if(targets.empty()) {
    throw MeshError(MeshErrc::PeerNotFound, "No peers to sync '" + request.modpack_name + "' with");
  }

  std::vector<std::string> ids;
  for(const auto& peer_id : targets) {
    std::optional<std::string> nickname;
    if(auto peer = directory_->get(peer_id)) nickname = peer->nickname;
    auto id = queue_->add(peer_id, nickname, request.modpack_name, request.priority);
    log_debug(logger_.get(), "Queued {} for {} ({} changes)", request.modpack_name, peer_id, request.changes.size());
    ids.push_back(id);
    emit(id);
  }
  pump();
  return ids;
}

void SyncDispatcher::pump() {
  while(auto next = queue_->get_next()) {
    emit(next->id);
    start_transfer(*next);
  }
}

void SyncDispatcher::start_transfer(const QueuedTransfer& transfer) {
  auto peer = directory_->get(transfer.peer_id);
  if(!peer) {
    fail_transfer(transfer, "Peer not found");
    return;
  }
  std::optional<ModpackManifest> manifest;
  if(manifests_) {
    try {
      manifest = manifests_(transfer.modpack_name);
    } catch(const std::runtime_error& ex) {
      fail_transfer(transfer, std::string("Unable to build manifest: ") + ex.what());
      return;
    }
  }
  if(!manifest) {
    fail_transfer(transfer, "Unknown modpack '" + transfer.modpack_name + "'");
    return;
  }

  auto started_at = unix_now_secs();
  std::weak_ptr<SyncDispatcher> weak = shared_from_this();
  auto transfer_id = transfer.id;
  auto results = backend_->broadcast_sync({*peer}, transfer.modpack_name, *manifest,
    [weak, transfer_id](const SyncProgress& progress){
      if(auto self = weak.lock()) self->emit(transfer_id, progress);
    });
  if(results.empty() || !results.front().ok()) {
    fail_transfer(transfer, results.empty() ? std::string("Backend returned no result")
                                            : results.front().error.value_or("Backend refused the session"));
    return;
  }

  auto session_id = *results.front().session_id;
  try {
    queue_->mark_started(transfer.id, session_id);
  } catch(const MeshError&) {
    if(!was_cancelled(transfer.id)) throw;
    log_info(logger_.get(), "Transfer {} was cancelled before session {} started", transfer.id, session_id);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!early_outcomes_.erase(session_id)) abandoned_sessions_.insert(session_id);
    }
    backend_->cancel_session(session_id);
    record_cancelled(transfer, session_id, started_at);
    emit(transfer.id);
    return;
  }

  std::optional<SessionOutcome> early;
  Running running{transfer.id, started_at};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = early_outcomes_.find(session_id);
    if(it != early_outcomes_.end()) {
      early = std::move(it->second);
      early_outcomes_.erase(it);
    } else {
      running_[session_id] = running;
    }
  }
  log_info(logger_.get(), "Transfer {} of {} to {} started (session {})",
           transfer.id, transfer.modpack_name, transfer.peer_id, session_id);
  if(early) finish(running, *early);
}

void SyncDispatcher::fail_transfer(const QueuedTransfer& transfer, const std::string& error) {
  try {
    queue_->mark_failed(transfer.id, error);
  } catch(const MeshError&) {
    if(!was_cancelled(transfer.id)) throw;
    log_info(logger_.get(), "Transfer {} was cancelled before it started", transfer.id);
    record_cancelled(transfer, "", unix_now_secs());
    emit(transfer.id);
    return;
  }
  log_warn(logger_.get(), "Transfer {} to {} failed: {}", transfer.id, transfer.peer_id, error);
  if(history_) {
    history_->record(make_history_entry("", transfer.peer_id, transfer.peer_nickname, transfer.modpack_name,
                                        TransferDirection::Upload, TransferResult::Failed, 0, 0,
                                        unix_now_secs(), error));
  }
  emit(transfer.id);
}

bool SyncDispatcher::was_cancelled(const std::string& transfer_id) const {
  auto transfer = queue_->get(transfer_id);
  return transfer && transfer->state == TransferState::Cancelled;
}

void SyncDispatcher::record_cancelled(const QueuedTransfer& transfer,
                                      const std::string& session_id,
                                      std::uint64_t started_at) {
  if(!history_) return;
  history_->record(make_history_entry(session_id, transfer.peer_id, transfer.peer_nickname, transfer.modpack_name,
                                      TransferDirection::Upload, TransferResult::Cancelled, 0, 0,
                                      started_at, std::nullopt));
}

void SyncDispatcher::on_session_finished(const SessionOutcome& outcome) {
  Running running;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(outcome.session_id);
    if(it == running_.end()) {
      if(abandoned_sessions_.erase(outcome.session_id)) return;
      early_outcomes_[outcome.session_id] = outcome;
      return;
    }
    running = it->second;
    running_.erase(it);
  }
  finish(running, outcome);
  pump();
}

void SyncDispatcher::finish(const Running& running, const SessionOutcome& outcome) {
  auto transfer = queue_->get(running.transfer_id);
  if(!transfer) return;

  TransferResult result = outcome.success ? TransferResult::Success : TransferResult::Failed;
  if(transfer->state == TransferState::Cancelled) {
    result = TransferResult::Cancelled;
  } else {
    try {
      if(outcome.success) {
        queue_->mark_completed(transfer->id);
      } else {
        queue_->mark_failed(transfer->id, outcome.error.value_or("Session failed"));
      }
    } catch(const MeshError& ex) {
      log_debug(logger_.get(), "Transfer {} already left Active: {}", transfer->id, ex.what());
    }
  }

  if(history_) {
    history_->record(make_history_entry(outcome.session_id, transfer->peer_id, transfer->peer_nickname,
                                        transfer->modpack_name, TransferDirection::Upload, result,
                                        outcome.files, outcome.bytes, running.started_at,
                                        outcome.success ? std::optional<std::string>() : outcome.error));
  }
  emit(transfer->id);
}

void SyncDispatcher::cancel(const std::string& transfer_id) {
  auto transfer = queue_->get(transfer_id);
  if(!transfer) {
    throw MeshError(MeshErrc::TransferNotFound, "Transfer not found: " + transfer_id);
  }
  queue_->cancel(transfer_id);
  if(transfer->state == TransferState::Active && transfer->session_id) {
    backend_->cancel_session(*transfer->session_id);
  }
  emit(transfer_id);
  pump();
}

void SyncDispatcher::retry(const std::string& transfer_id) {
  queue_->retry(transfer_id);
  emit(transfer_id);
  pump();
}

std::size_t SyncDispatcher::retry_all_failed() {
  auto count = queue_->retry_all_failed();
  if(count > 0) pump();
  return count;
}

std::size_t SyncDispatcher::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  auto handle = next_listener_++;
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void SyncDispatcher::remove_listener(std::size_t handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void SyncDispatcher::emit(const std::string& transfer_id, std::optional<SyncProgress> progress) {
  auto transfer = queue_->get(transfer_id);
  if(!transfer) return;

  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for(const auto& entry : listeners_) listeners.push_back(entry.second);
  }
  TransferEvent event{*transfer, transfer->state, std::move(progress)};
  for(const auto& listener : listeners) listener(event);
}
