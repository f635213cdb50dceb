#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "discovery_service.hpp"
#include "sync_link.hpp"

class ConnectCLI;
class InviteAuthority;
class InviteManager;
class InstanceProvisioner;
class GameLauncher;
class Logger;
class PeerDirectory;
class QuickJoin;
class SettingsManager;
class SyncDispatcher;
class TransferHistory;
class TransferQueue;
class UpdateNotifier;
class WatchEngine;
struct QuickJoinRequest;
struct QuickJoinResult;

inline constexpr char kPackmeshVersion[] = "0.4.0";

class ConnectEngine {
public:
  struct Options {
    std::filesystem::path data_dir;                 // empty = data_dir setting, then cwd
    bool start_cli_thread = false;
    DiscoveryService::Options discovery;
    TcpSyncBackend::Options sync;
    std::chrono::seconds invite_cleanup_interval{300};
  };

  ConnectEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~ConnectEngine();

  ConnectEngine(const ConnectEngine&) = delete;
  ConnectEngine& operator=(const ConnectEngine&) = delete;

  void start();
  void run();
  void start_background();
  void stop();
  // Lets run() return. Safe from any thread.
  void request_stop();

  void execute_command(const std::string& line);

  // Pushes the current settings into the running services.
  void apply_settings();

  QuickJoinResult join(const QuickJoinRequest& request);

  void set_instance_provisioner(std::shared_ptr<InstanceProvisioner> provisioner);
  void set_game_launcher(std::shared_ptr<GameLauncher> launcher);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<PeerDirectory> directory() const { return directory_; }
  std::shared_ptr<DiscoveryService> discovery() const { return discovery_; }
  std::shared_ptr<TransferQueue> queue() const { return queue_; }
  std::shared_ptr<SyncDispatcher> dispatcher() const { return dispatcher_; }
  std::shared_ptr<TcpSyncBackend> sync_backend() const { return backend_; }
  std::shared_ptr<WatchEngine> watch() const { return watch_; }
  std::shared_ptr<InviteManager> invites() const { return invites_; }
  std::shared_ptr<UpdateNotifier> notifier() const { return notifier_; }
  std::shared_ptr<TransferHistory> history() const { return history_; }
  const std::filesystem::path& data_dir() const { return data_dir_; }

  struct Stats {
    std::size_t known_peers = 0;
    std::size_t queued_transfers = 0;
    std::size_t active_transfers = 0;
    std::size_t watched_modpacks = 0;
  };

  Stats stats() const;

private:
  std::optional<ModpackManifest> local_manifest(const std::string& modpack_name);
  void start_network(const ConnectSettings& connect);
  void schedule_cleanup_tick();
  void start_cli();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  std::filesystem::path data_dir_;

  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  std::unique_ptr<asio::steady_timer> cleanup_timer_;

  std::shared_ptr<PeerDirectory> directory_;
  std::shared_ptr<DiscoveryService> discovery_;
  std::shared_ptr<TransferQueue> queue_;
  std::shared_ptr<TransferHistory> history_;
  std::shared_ptr<TcpSyncBackend> backend_;
  std::shared_ptr<SyncDispatcher> dispatcher_;
  std::shared_ptr<WatchEngine> watch_;
  std::shared_ptr<InviteManager> invites_;
  std::shared_ptr<InviteAuthority> invite_authority_;
  std::shared_ptr<UpdateNotifier> notifier_;
  std::shared_ptr<InstanceProvisioner> provisioner_;
  std::shared_ptr<GameLauncher> launcher_;
  std::unique_ptr<ConnectCLI> cli_;

  bool started_ = false;
  bool cli_thread_running_ = false;
  std::size_t directory_listener_ = 0;
};
