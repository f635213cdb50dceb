#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "log.hpp"
#include "manifest.hpp"
#include "peer_directory.hpp"
#include "sync_request.hpp"
#include "transfer_backend.hpp"
#include "transfer_history.hpp"
#include "transfer_queue.hpp"

struct TransferEvent {
  QueuedTransfer transfer;
  TransferState state = TransferState::Queued;
  std::optional<SyncProgress> progress;
};

// Turns SyncRequests into queued transfers and drives them through the
// backend. TransferQueue::get_next() decides what may run; the dispatcher
// only reacts to what it hands out.
class SyncDispatcher : public SessionObserver,
                       public std::enable_shared_from_this<SyncDispatcher> {
public:
  using Listener = std::function<void(const TransferEvent& event)>;

  static std::shared_ptr<SyncDispatcher> create(std::shared_ptr<TransferQueue> queue,
                                                std::shared_ptr<TransferBackend> backend,
                                                std::shared_ptr<PeerDirectory> directory,
                                                ManifestProvider manifests,
                                                std::shared_ptr<TransferHistory> history,
                                                std::shared_ptr<Logger> logger = nullptr);

  // One transfer per target peer. Throws MeshError{PeerNotFound} when there is
  // nobody to send to.
  std::vector<std::string> submit(const SyncRequest& request);

  // Starts queued transfers while the queue grants slots.
  void pump();

  void cancel(const std::string& transfer_id);
  void retry(const std::string& transfer_id);
  std::size_t retry_all_failed();

  void on_session_finished(const SessionOutcome& outcome) override;

  std::size_t add_listener(Listener listener);
  void remove_listener(std::size_t handle);

private:
  struct Running {
    std::string transfer_id;
    std::uint64_t started_at = 0;
  };

  SyncDispatcher(std::shared_ptr<TransferQueue> queue,
                 std::shared_ptr<TransferBackend> backend,
                 std::shared_ptr<PeerDirectory> directory,
                 ManifestProvider manifests,
                 std::shared_ptr<TransferHistory> history,
                 std::shared_ptr<Logger> logger);

  void start_transfer(const QueuedTransfer& transfer);
  void fail_transfer(const QueuedTransfer& transfer, const std::string& error);
  bool was_cancelled(const std::string& transfer_id) const;
  void record_cancelled(const QueuedTransfer& transfer, const std::string& session_id, std::uint64_t started_at);
  void finish(const Running& running, const SessionOutcome& outcome);
  void emit(const std::string& transfer_id, std::optional<SyncProgress> progress = std::nullopt);

  std::shared_ptr<TransferQueue> queue_;
  std::shared_ptr<TransferBackend> backend_;
  std::shared_ptr<PeerDirectory> directory_;
  ManifestProvider manifests_;
  std::shared_ptr<TransferHistory> history_;
  std::shared_ptr<Logger> logger_;

  std::mutex mutex_;
  std::map<std::string, Running> running_;            // session id -> transfer
  std::map<std::string, SessionOutcome> early_outcomes_;
  std::set<std::string> abandoned_sessions_;          // cancelled before they were bound

  std::mutex listener_mutex_;
  std::map<std::size_t, Listener> listeners_;
  std::size_t next_listener_ = 1;
};
