#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "path_filter.hpp"
#include "sync_request.hpp"

inline constexpr std::uint64_t kDefaultDebounceMs = 2000;

struct WatchConfig {
  std::string modpack_name;
  std::filesystem::path modpack_path;
  std::vector<std::string> target_peers;    // empty = every known peer
  bool enabled = true;
  std::uint64_t debounce_ms = kDefaultDebounceMs;
  std::vector<std::string> ignore_patterns = default_ignore_patterns();
  std::vector<std::string> watch_folders = default_watch_folders();
};

nlohmann::json watch_config_to_json(const WatchConfig& config);
// Missing optional keys fall back to the defaults above.
WatchConfig watch_config_from_json(const nlohmann::json& j);

enum class WatchEventKind {
  WatchStarted,
  WatchStopped,
  ChangesDetected,
  SyncStarted,
  SyncCompleted
};

const char* to_string(WatchEventKind kind);

struct WatchEvent {
  WatchEventKind kind = WatchEventKind::WatchStarted;
  std::string modpack_name;
  std::size_t count = 0;                 // changes for ChangesDetected, peers for SyncStarted
  bool success = false;                  // SyncCompleted
  std::optional<std::string> error;      // SyncCompleted
};

// Watches modpack folders with inotify and batches changes. Every accepted
// event pushes the flush deadline out by debounce_ms, so one quiet period
// produces exactly one SyncRequest. Events, flushes and syncs run on the
// io_context thread.
class WatchEngine : public std::enable_shared_from_this<WatchEngine> {
public:
  // Returns how many peers the request went out to. Throwing marks the sync failed.
  using SyncHandler = std::function<std::size_t(const SyncRequest& request)>;
  using Listener = std::function<void(const WatchEvent& event)>;

  static std::shared_ptr<WatchEngine> create(asio::io_context& io,
                                             std::filesystem::path config_file = {},
                                             std::shared_ptr<Logger> logger = nullptr);
  ~WatchEngine();

  WatchEngine(const WatchEngine&) = delete;
  WatchEngine& operator=(const WatchEngine&) = delete;

  bool load_configs();
  bool save_configs() const;

  // Replaces the config of the same name. A running watch is restarted with it.
  void set_config(WatchConfig config);
  std::optional<WatchConfig> get_config(const std::string& modpack_name) const;
  // Stops the watch first. Returns false if there was no such config.
  bool remove_config(const std::string& modpack_name);
  std::vector<WatchConfig> configs() const;

  // Throws MeshError{WatchConfigMissing}, MeshError{WatchDisabled} or
  // MeshError{WatchAlreadyRunning}; std::runtime_error if inotify is unavailable.
  void start_watching(const std::string& modpack_name);
  // Drops changes that have not been flushed yet. Returns false if not watching.
  bool stop_watching(const std::string& modpack_name);
  bool is_watching(const std::string& modpack_name) const;
  std::vector<std::string> watching() const;
  void stop_all();

  void set_sync_handler(SyncHandler handler);
  std::size_t add_listener(Listener listener);
  void remove_listener(std::size_t handle);

private:
  struct Session;

  WatchEngine(asio::io_context& io, std::filesystem::path config_file, std::shared_ptr<Logger> logger);

  void add_watch_recursive(Session& session, const std::filesystem::path& dir);
  void read_events(const std::shared_ptr<Session>& session);
  void handle_events(const std::shared_ptr<Session>& session, const char* data, std::size_t size);
  void accept_tree(const std::shared_ptr<Session>& session, const std::filesystem::path& dir);
  void accept_change(const std::shared_ptr<Session>& session, FileChange change);
  void arm_debounce(const std::shared_ptr<Session>& session);
  void wait_debounce(const std::shared_ptr<Session>& session, std::chrono::steady_clock::time_point due);
  void flush(const std::shared_ptr<Session>& session);
  void release(Session& session);
  void emit(const WatchEvent& event);

  asio::io_context& io_;
  std::filesystem::path config_file_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::map<std::string, WatchConfig> configs_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
  SyncHandler sync_handler_;

  std::mutex listener_mutex_;
  std::map<std::size_t, Listener> listeners_;
  std::size_t next_listener_ = 1;
};
