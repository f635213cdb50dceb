#include "connect_engine.hpp"

#include <stdexcept>
#include <system_error>

#include "connect_cli.hpp"
#include "invite_client.hpp"
#include "invite_manager.hpp"
#include "log.hpp"
#include "peer_directory.hpp"
#include "quick_join.hpp"
#include "settings_manager.hpp"
#include "sync_dispatcher.hpp"
#include "transfer_history.hpp"
#include "transfer_queue.hpp"
#include "update_notifier.hpp"
#include "utils.hpp"
#include "watch_engine.hpp"

namespace {

// Joined instances live under <data_dir>/instances/<id>.
class LocalInstanceProvisioner : public InstanceProvisioner {
public:
  explicit LocalInstanceProvisioner(std::filesystem::path root)
    : root_(std::move(root)) {}

  std::string create_instance(const ServerInvite& invite) override {
    auto id = invite.server_instance_id + "-" + random_token(4);
    std::filesystem::create_directories(root_ / id);
    return id;
  }

  ModpackManifest instance_manifest(const std::string& instance_id,
                                    const std::string& modpack_name) override {
    return build_manifest(modpack_name, root_ / instance_id,
                          default_watch_folders(), default_ignore_patterns());
  }

private:
  std::filesystem::path root_;
};

std::size_t clamp_concurrency(int value) {
  return value < 1 ? 1 : static_cast<std::size_t>(value);
}

} // namespace

ConnectEngine::ConnectEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("packmesh")) {
  if(options_.invite_cleanup_interval.count() <= 0) {
    options_.invite_cleanup_interval = std::chrono::seconds(300);
  }
  data_dir_ = options_.data_dir;
  if(data_dir_.empty()) {
    auto configured = settings_->get<std::string>("data_dir");
    data_dir_ = configured.empty() ? std::filesystem::current_path() : std::filesystem::path(configured);
  }

  directory_ = std::make_shared<PeerDirectory>();
  queue_ = std::make_shared<TransferQueue>(clamp_concurrency(settings_->get<int>("max_concurrent_transfers")));
  history_ = std::make_shared<TransferHistory>(data_dir_ / "transfer_history.json", logger_);
  invites_ = std::make_shared<InviteManager>(data_dir_ / "server_invites.json", logger_);
  notifier_ = std::make_shared<UpdateNotifier>();
  watch_ = WatchEngine::create(io_, data_dir_ / "watch_configs.json", logger_);
  provisioner_ = std::make_shared<LocalInstanceProvisioner>(data_dir_ / "instances");

  ManifestProvider provider = [this](const std::string& name){ return local_manifest(name); };
  backend_ = TcpSyncBackend::create(io_, provider, options_.sync, logger_);
  dispatcher_ = SyncDispatcher::create(queue_, backend_, directory_, provider, history_, logger_);
  backend_->set_invite_authority(invites_);
  invite_authority_ = std::make_shared<PeerInviteAuthority>(invites_, directory_, backend_, logger_);

  std::weak_ptr<SyncDispatcher> weak_dispatcher = dispatcher_;
  watch_->set_sync_handler([weak_dispatcher](const SyncRequest& request) -> std::size_t {
    auto dispatcher = weak_dispatcher.lock();
    if(!dispatcher) throw std::runtime_error("Sync dispatcher is gone");
    return dispatcher->submit(request).size();
  });

  std::weak_ptr<UpdateNotifier> weak_notifier = notifier_;
  backend_->set_offer_listener([weak_notifier](const TcpSyncBackend::IncomingOffer& offer){
    auto notifier = weak_notifier.lock();
    if(!notifier) return;
    PeerModpackVersion version;
    version.peer_id = offer.peer_id;
    version.peer_nickname = offer.peer_nickname;
    version.modpack_name = offer.manifest.modpack_name;
    version.version = offer.manifest.version_hash;
    version.files_count = offer.manifest.files.size();
    version.total_size = offer.manifest.total_size;
    version.updated_at = unix_now_secs();
    notifier->update_peer_version(version);
  });

  directory_listener_ = directory_->add_listener([weak_notifier](const PeerEvent& event){
    if(event.kind != PeerEventKind::Removed) return;
    if(auto notifier = weak_notifier.lock()) {
      notifier->remove_peer(event.peer.id);
    }
  });
}

ConnectEngine::~ConnectEngine() {
  stop();
  directory_->remove_listener(directory_listener_);
}

std::optional<ModpackManifest> ConnectEngine::local_manifest(const std::string& modpack_name) {
  auto config = watch_->get_config(modpack_name);
  if(!config) return std::nullopt;
  try {
    auto manifest = build_manifest(modpack_name, config->modpack_path,
                                   config->watch_folders, config->ignore_patterns);
    notifier_->set_local_version(modpack_name, manifest.version_hash,
                                 manifest.files.size(), manifest.total_size);
    return manifest;
  } catch(const std::exception& e) {
    logger_->error("Unable to index modpack '{}' at {}: {}",
                   modpack_name, config->modpack_path.string(), e.what());
    return std::nullopt;
  }
}

void ConnectEngine::start() {
  if(started_) return;
  started_ = true;

  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if(ec) {
    logger_->warn("Unable to create data directory {}: {}", data_dir_.string(), ec.message());
  }

  init_logging(settings_->get<bool>("verbose"));

  work_.emplace(asio::make_work_guard(io_));

  watch_->load_configs();
  invites_->load();
  history_->load();
  for(const auto& config : watch_->configs()) {
    notifier_->track_modpack(config.modpack_name);
  }

  auto connect = connect_settings_from(*settings_);
  queue_->set_max_concurrent(clamp_concurrency(settings_->get<int>("max_concurrent_transfers")));

  if(connect.enabled) {
    start_network(connect);
  } else {
    logger_->info("P2P is disabled (enabled=false); discovery and sync stay off");
  }

  cleanup_timer_ = std::make_unique<asio::steady_timer>(io_);
  schedule_cleanup_tick();

  cli_ = std::make_unique<ConnectCLI>(*this);
  if(options_.start_cli_thread) {
    start_cli();
  }
}

void ConnectEngine::start_network(const ConnectSettings& connect) {
  if(!backend_->is_running()) {
    std::uint16_t tcp_port = static_cast<std::uint16_t>(connect.discovery_port + kTcpPortOffset);
    try {
      backend_->start(tcp_port);
    } catch(const MeshError& e) {
      logger_->warn("{}; using an ephemeral sync port", e.what());
      backend_->start(0);
    }
  }

  if(!discovery_) {
    auto discovery_options = options_.discovery;
    if(discovery_options.app_version.empty()) {
      auto configured = settings_->get<std::string>("app_version");
      discovery_options.app_version = configured.empty() ? kPackmeshVersion : configured;
    }
    discovery_ = DiscoveryService::create(io_, directory_, connect, discovery_options, logger_);
  } else {
    discovery_->update_settings(connect);
  }
  discovery_->set_tcp_port(backend_->listen_port());
  backend_->set_local_identity(discovery_->local_peer_id(), connect.public_nickname());
  invites_->set_host_peer_id(discovery_->local_peer_id());

  if(!connect.visible()) {
    if(discovery_->is_running()) {
      discovery_->stop();
      logger_->info("Visibility is invisible, discovery stopped");
    }
    return;
  }
  if(discovery_->is_running()) return;
  try {
    discovery_->start();
  } catch(const MeshError& e) {
    logger_->error("Discovery unavailable: {}", e.what());
    return;
  }
  if(discovery_->is_running()) {
    logger_->info("Peer {} online, code {}, sync port {}",
                  discovery_->local_peer_id(), discovery_->local_code(), backend_->listen_port());
  }
}

void ConnectEngine::schedule_cleanup_tick() {
  if(!cleanup_timer_) return;
  cleanup_timer_->expires_after(options_.invite_cleanup_interval);
  cleanup_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    auto removed = invites_->cleanup_expired_invites();
    if(removed > 0) {
      logger_->info("Removed {} expired invite(s)", removed);
    }
    queue_->cleanup();
    schedule_cleanup_tick();
  });
}

void ConnectEngine::apply_settings() {
  auto connect = connect_settings_from(*settings_);
  queue_->set_max_concurrent(clamp_concurrency(settings_->get<int>("max_concurrent_transfers")));
  dispatcher_->pump();
  if(!started_) return;

  if(!connect.enabled) {
    if(discovery_) discovery_->stop();
    if(backend_->is_running()) {
      backend_->stop();
      logger_->info("P2P disabled");
    }
    return;
  }
  if(discovery_ && discovery_->is_running() &&
     connect.discovery_port != discovery_->settings().discovery_port) {
    logger_->warn("discovery_port change takes effect after restart");
    connect.discovery_port = discovery_->settings().discovery_port;
  }
  start_network(connect);
}

QuickJoinResult ConnectEngine::join(const QuickJoinRequest& request) {
  QuickJoin quick_join(invite_authority_, directory_, backend_, provisioner_, launcher_, history_, logger_);
  return quick_join.join(request, [this](const QuickJoinStatus& status){
    if(auto* downloading = std::get_if<join_stage::Downloading>(&status)) {
      logger_->debug("Downloading {}/{} {}",
                     downloading->files_done, downloading->files_total, downloading->current_file);
      return;
    }
    logger_->info("Quick join: {}", stage_name(status));
  });
}

void ConnectEngine::set_instance_provisioner(std::shared_ptr<InstanceProvisioner> provisioner) {
  if(provisioner) provisioner_ = std::move(provisioner);
}

void ConnectEngine::set_game_launcher(std::shared_ptr<GameLauncher> launcher) {
  launcher_ = std::move(launcher);
}

void ConnectEngine::run() {
  if(!started_) start();
  io_.run();
}

void ConnectEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void ConnectEngine::request_stop() {
  asio::post(io_, [this](){
    work_.reset();
    io_.stop();
  });
}

void ConnectEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(cli_) {
    cli_->stop();
    cli_thread_running_ = false;
  }

  if(cleanup_timer_) {
    std::error_code ec;
    cleanup_timer_->cancel(ec);
  }
  cleanup_timer_.reset();

  watch_->stop_all();
  if(discovery_) {
    discovery_->stop();
  }
  backend_->stop();
  work_.reset();

  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  io_.restart();
}

void ConnectEngine::start_cli() {
  if(!cli_ || cli_thread_running_) return;
  cli_->set_quit_handler([this](){ request_stop(); });
  cli_->start();
  cli_thread_running_ = true;
}

void ConnectEngine::execute_command(const std::string& line) {
  if(cli_) {
    cli_->execute_command(line);
  }
}

ConnectEngine::Stats ConnectEngine::stats() const {
  Stats s;
  s.known_peers = directory_->size();
  s.queued_transfers = queue_->get_pending().size();
  s.active_transfers = queue_->active_count();
  s.watched_modpacks = watch_->watching().size();
  return s;
}
