#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "manifest.hpp"
#include "protocol.hpp"

struct SyncProgress {
  std::string session_id;
  std::string peer_id;
  std::string current_file;
  std::size_t files_done = 0;
  std::size_t files_total = 0;
  std::uint64_t bytes_done = 0;
  std::uint64_t bytes_total = 0;

  float fraction() const {
    if(bytes_total > 0) return static_cast<float>(bytes_done) / static_cast<float>(bytes_total);
    if(files_total > 0) return static_cast<float>(files_done) / static_cast<float>(files_total);
    return 1.0f;
  }
};

using SyncProgressCallback = std::function<void(const SyncProgress& progress)>;

// Per peer answer of broadcast_sync: a session id, or why none was opened.
struct SyncResult {
  std::string peer_id;
  std::optional<std::string> session_id;
  std::optional<std::string> error;

  bool ok() const { return session_id.has_value(); }
};

struct SessionOutcome {
  std::string session_id;
  std::string peer_id;
  bool success = false;
  std::optional<std::string> error;
  std::size_t files = 0;
  std::uint64_t bytes = 0;
};

class SessionObserver {
public:
  virtual ~SessionObserver() = default;
  virtual void on_session_finished(const SessionOutcome& outcome) = 0;
};

struct PullResult {
  bool success = false;
  std::optional<std::string> error;
  std::size_t files = 0;
  std::uint64_t bytes = 0;
  std::string remote_version;
};

// Moves a modpack between peers. broadcast_sync only opens sessions and returns
// at once; each opened session later ends in exactly one on_session_finished.
class TransferBackend {
public:
  virtual ~TransferBackend() = default;

  virtual std::vector<SyncResult> broadcast_sync(const std::vector<PeerInfo>& peers,
                                                 const std::string& modpack_name,
                                                 const ModpackManifest& manifest,
                                                 SyncProgressCallback progress) = 0;

  // False when the session is unknown or already finished.
  virtual bool cancel_session(const std::string& session_id) = 0;

  // Blocks until host has answered or the attempt failed. Never call from the
  // thread that runs the backend's io_context.
  virtual PullResult pull_sync(const PeerInfo& host,
                               const std::string& modpack_name,
                               const ModpackManifest& local,
                               SyncProgressCallback progress) = 0;

  virtual void set_session_observer(std::weak_ptr<SessionObserver> observer) = 0;
};
