#include "watch_engine.hpp"

#include <sys/inotify.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

#include "mesh_error.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr std::uint32_t kWatchMask = IN_CREATE | IN_DELETE | IN_MODIFY | IN_CLOSE_WRITE |
                                     IN_MOVED_FROM | IN_MOVED_TO;

} // namespace

const char* to_string(WatchEventKind kind) {
  switch(kind) {
    case WatchEventKind::WatchStarted:    return "watch_started";
    case WatchEventKind::WatchStopped:    return "watch_stopped";
    case WatchEventKind::ChangesDetected: return "changes_detected";
    case WatchEventKind::SyncStarted:     return "sync_started";
    case WatchEventKind::SyncCompleted:   return "sync_completed";
  }
  return "watch_event";
}

json watch_config_to_json(const WatchConfig& config) {
  return {
    {"modpack_name", config.modpack_name},
    {"modpack_path", config.modpack_path.string()},
    {"target_peers", config.target_peers},
    {"enabled", config.enabled},
    {"debounce_ms", config.debounce_ms},
    {"ignore_patterns", config.ignore_patterns},
    {"watch_folders", config.watch_folders}
  };
}

WatchConfig watch_config_from_json(const json& j) {
  WatchConfig config;
  config.modpack_name = j.at("modpack_name").get<std::string>();
  config.modpack_path = j.at("modpack_path").get<std::string>();
  config.target_peers = j.value("target_peers", std::vector<std::string>{});
  config.enabled = j.value("enabled", true);
  config.debounce_ms = j.value("debounce_ms", kDefaultDebounceMs);
  if(j.contains("ignore_patterns")) config.ignore_patterns = j["ignore_patterns"].get<std::vector<std::string>>();
  if(j.contains("watch_folders")) config.watch_folders = j["watch_folders"].get<std::vector<std::string>>();
  return config;
}

struct WatchEngine::Session {
  explicit Session(asio::io_context& io) : descriptor(io), debounce(io) {}

  WatchConfig config;
  asio::posix::stream_descriptor descriptor;
  asio::steady_timer debounce;
  std::mutex mutex;
  std::map<int, fs::path> watches;                       // wd -> directory
  std::vector<FileChange> pending;
  std::map<std::uint32_t, FileChange> pending_moves;     // cookie -> moved away
  alignas(inotify_event) std::array<char, 64 * 1024> buffer{};
  std::chrono::steady_clock::time_point last_change;
  bool armed = false;
  bool stopped = false;
};

std::shared_ptr<WatchEngine> WatchEngine::create(asio::io_context& io,
                                                 fs::path config_file,
                                                 std::shared_ptr<Logger> logger) {
  return std::shared_ptr<WatchEngine>(new WatchEngine(io, std::move(config_file), std::move(logger)));
}

WatchEngine::WatchEngine(asio::io_context& io, fs::path config_file, std::shared_ptr<Logger> logger)
  : io_(io), config_file_(std::move(config_file)), logger_(std::move(logger)) {}

WatchEngine::~WatchEngine() {
  std::lock_guard<std::mutex> lock(mutex_);
  for(auto& entry : sessions_) {
    std::lock_guard<std::mutex> session_lock(entry.second->mutex);
    release(*entry.second);
  }
  sessions_.clear();
}

bool WatchEngine::load_configs() {
  if(config_file_.empty()) return false;
  std::ifstream in(config_file_);
  if(!in) return false;

  std::map<std::string, WatchConfig> loaded;
  try {
    json doc;
    in >> doc;
    for(const auto& item : doc) {
      auto config = watch_config_from_json(item);
      loaded[config.modpack_name] = std::move(config);
    }
  } catch(const json::exception& ex) {
    log_error(logger_.get(), "Failed to read watch configs {}: {}", config_file_.string(), ex.what());
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  configs_ = std::move(loaded);
  return true;
}

bool WatchEngine::save_configs() const {
  if(config_file_.empty()) return true;
  json doc = json::array();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& entry : configs_) doc.push_back(watch_config_to_json(entry.second));
  }
  std::error_code ec;
  if(config_file_.has_parent_path()) fs::create_directories(config_file_.parent_path(), ec);
  std::ofstream out(config_file_, std::ios::trunc);
  if(!out) {
    log_error(logger_.get(), "Unable to write watch configs to {}", config_file_.string());
    return false;
  }
  out << doc.dump(2);
  return static_cast<bool>(out);
}

void WatchEngine::set_config(WatchConfig config) {
  auto name = config.modpack_name;
  bool enabled = config.enabled;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    configs_[name] = std::move(config);
  }
  save_configs();
  if(stop_watching(name) && enabled) {
    start_watching(name);
  }
}

std::optional<WatchConfig> WatchEngine::get_config(const std::string& modpack_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = configs_.find(modpack_name);
  if(it == configs_.end()) return std::nullopt;
  return it->second;
}

bool WatchEngine::remove_config(const std::string& modpack_name) {
  stop_watching(modpack_name);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(configs_.erase(modpack_name) == 0) return false;
  }
  save_configs();
  return true;
}

std::vector<WatchConfig> WatchEngine::configs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<WatchConfig> out;
  for(const auto& entry : configs_) out.push_back(entry.second);
  return out;
}

void WatchEngine::start_watching(const std::string& modpack_name) {
  WatchConfig config;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(modpack_name);
    if(it == configs_.end()) {
      throw MeshError(MeshErrc::WatchConfigMissing, "No watch config for modpack: " + modpack_name);
    }
    if(!it->second.enabled) {
      throw MeshError(MeshErrc::WatchDisabled, "Watch is disabled for modpack: " + modpack_name);
    }
    if(sessions_.count(modpack_name)) {
      throw MeshError(MeshErrc::WatchAlreadyRunning, "Already watching modpack: " + modpack_name);
    }
    config = it->second;
  }

  int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if(fd < 0) {
    throw std::runtime_error(std::string("inotify_init1 failed: ") + std::strerror(errno));
  }

  auto session = std::make_shared<Session>(io_);
  session->config = config;
  session->descriptor.assign(fd);

  std::lock_guard<std::mutex> session_lock(session->mutex);
  for(const auto& folder : config.watch_folders) {
    std::error_code ec;
    auto dir = config.modpack_path / folder;
    if(fs::is_directory(dir, ec)) add_watch_recursive(*session, dir);
  }
  if(session->watches.empty()) {
    log_warn(logger_.get(), "Nothing to watch for {} under {}", modpack_name, config.modpack_path.string());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(sessions_.count(modpack_name)) {
      release(*session);
      throw MeshError(MeshErrc::WatchAlreadyRunning, "Already watching modpack: " + modpack_name);
    }
    sessions_[modpack_name] = session;
  }
  read_events(session);

  log_info(logger_.get(), "Watching {} ({} directories)", modpack_name, session->watches.size());
  emit({WatchEventKind::WatchStarted, modpack_name});
}

void WatchEngine::add_watch_recursive(Session& session, const fs::path& dir) {
  auto add = [&](const fs::path& path){
    int wd = inotify_add_watch(session.descriptor.native_handle(), path.c_str(), kWatchMask);
    if(wd < 0) {
      log_warn(logger_.get(), "Failed to watch {}: {}", path.string(), std::strerror(errno));
      return;
    }
    session.watches[wd] = path;
  };

  add(dir);
  std::error_code ec;
  fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  for(; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if(it->is_directory(ec)) add(it->path());
  }
}

void WatchEngine::read_events(const std::shared_ptr<Session>& session) {
  std::weak_ptr<WatchEngine> weak = shared_from_this();
  session->descriptor.async_read_some(asio::buffer(session->buffer),
    [weak, session](std::error_code ec, std::size_t bytes){
      auto self = weak.lock();
      if(!self) return;
      std::lock_guard<std::mutex> lock(session->mutex);
      if(session->stopped) return;
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          log_error(self->logger_.get(), "inotify read failed for {}: {}",
                    session->config.modpack_name, ec.message());
        }
        return;
      }
      self->handle_events(session, session->buffer.data(), bytes);
      self->read_events(session);
    });
}

void WatchEngine::handle_events(const std::shared_ptr<Session>& session, const char* data, std::size_t size) {
  std::size_t offset = 0;
  while(offset + sizeof(inotify_event) <= size) {
    const auto* event = reinterpret_cast<const inotify_event*>(data + offset);
    offset += sizeof(inotify_event) + event->len;

    if(event->mask & IN_Q_OVERFLOW) {
      log_warn(logger_.get(), "inotify queue overflow for {}", session->config.modpack_name);
      continue;
    }
    auto it = session->watches.find(event->wd);
    if(it == session->watches.end()) continue;
    if(event->mask & IN_IGNORED) {
      session->watches.erase(it);
      continue;
    }
    if(event->len == 0) continue;

    auto full = it->second / event->name;
    if(event->mask & IN_ISDIR) {
      if(event->mask & (IN_CREATE | IN_MOVED_TO)) {
        add_watch_recursive(*session, full);
        accept_tree(session, full);
      } else if(event->mask & (IN_MOVED_FROM | IN_DELETE)) {
        FileChange change;
        change.relative_path = full.lexically_relative(session->config.modpack_path).generic_string();
        change.type = ChangeType::Deleted;
        change.timestamp = unix_now_millis();
        accept_change(session, std::move(change));
      }
      continue;
    }

    FileChange change;
    change.relative_path = full.lexically_relative(session->config.modpack_path).generic_string();
    change.timestamp = unix_now_millis();

    if(event->mask & IN_MOVED_FROM) {
      change.type = ChangeType::Deleted;
      session->pending_moves[event->cookie] = change;
      arm_debounce(session);
      continue;
    }
    if(event->mask & IN_MOVED_TO) {
      auto moved = session->pending_moves.find(event->cookie);
      if(moved != session->pending_moves.end()) {
        change.type = ChangeType::Renamed;
        change.previous_path = moved->second.relative_path;
        session->pending_moves.erase(moved);
      } else {
        change.type = ChangeType::Created;
      }
    } else if(event->mask & IN_CREATE) {
      change.type = ChangeType::Created;
    } else if(event->mask & IN_DELETE) {
      change.type = ChangeType::Deleted;
    } else if(event->mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
      change.type = ChangeType::Modified;
    } else {
      continue;
    }
    accept_change(session, std::move(change));
  }
}

// Files that arrive with a new directory never raise events of their own.
void WatchEngine::accept_tree(const std::shared_ptr<Session>& session, const fs::path& dir) {
  auto created = [&](const fs::path& path){
    FileChange change;
    change.relative_path = path.lexically_relative(session->config.modpack_path).generic_string();
    change.type = ChangeType::Created;
    change.timestamp = unix_now_millis();
    accept_change(session, std::move(change));
  };

  std::error_code ec;
  if(fs::is_empty(dir, ec) && !ec) {
    created(dir);
    return;
  }
  fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  for(; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if(it->is_regular_file(entry_ec)) {
      created(it->path());
    } else if(it->is_directory(entry_ec) && fs::is_empty(it->path(), entry_ec) && !entry_ec) {
      created(it->path());
    }
  }
  if(ec) {
    log_warn(logger_.get(), "Failed to scan {}: {}", dir.string(), ec.message());
  }
}

void WatchEngine::accept_change(const std::shared_ptr<Session>& session, FileChange change) {
  const auto& patterns = session->config.ignore_patterns;
  bool ignored = matches_ignore_pattern(change.relative_path, patterns);

  if(change.type == ChangeType::Renamed) {
    bool was_ignored = matches_ignore_pattern(*change.previous_path, patterns);
    if(ignored && was_ignored) return;
    if(ignored) {
      // Moved out of sight: for the peers it is gone.
      change.relative_path = *change.previous_path;
      change.type = ChangeType::Deleted;
      change.previous_path.reset();
    } else if(was_ignored) {
      change.type = ChangeType::Created;
      change.previous_path.reset();
    }
  } else if(ignored) {
    return;
  }

  session->pending.push_back(std::move(change));
  arm_debounce(session);
}

// Quiet period restarts with every change; the timer is armed once per burst.
void WatchEngine::arm_debounce(const std::shared_ptr<Session>& session) {
  session->last_change = std::chrono::steady_clock::now();
  if(session->armed) return;
  session->armed = true;
  wait_debounce(session, session->last_change + std::chrono::milliseconds(session->config.debounce_ms));
}

void WatchEngine::wait_debounce(const std::shared_ptr<Session>& session,
                                std::chrono::steady_clock::time_point due) {
  std::weak_ptr<WatchEngine> weak = shared_from_this();
  session->debounce.expires_at(due);
  session->debounce.async_wait([weak, session](const std::error_code& ec){
    if(ec) return;
    if(auto self = weak.lock()) self->flush(session);
  });
}

void WatchEngine::flush(const std::shared_ptr<Session>& session) {
  std::vector<FileChange> changes;
  {
    std::lock_guard<std::mutex> lock(session->mutex);
    if(session->stopped) return;
    auto due = session->last_change + std::chrono::milliseconds(session->config.debounce_ms);
    if(std::chrono::steady_clock::now() < due) {
      wait_debounce(session, due);
      return;
    }
    session->armed = false;
    for(auto& entry : session->pending_moves) {
      if(!matches_ignore_pattern(entry.second.relative_path, session->config.ignore_patterns)) {
        session->pending.push_back(std::move(entry.second));
      }
    }
    session->pending_moves.clear();
    changes.swap(session->pending);
  }
  if(changes.empty()) return;

  const auto& name = session->config.modpack_name;
  log_info(logger_.get(), "{} change(s) detected in {}", changes.size(), name);
  WatchEvent detected{WatchEventKind::ChangesDetected, name};
  detected.count = changes.size();
  emit(detected);

  SyncHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = sync_handler_;
  }
  if(!handler) {
    log_debug(logger_.get(), "No sync handler, {} change(s) in {} not shared", changes.size(), name);
    return;
  }

  SyncRequest request;
  request.modpack_name = name;
  request.changes = std::move(changes);
  request.target_peers = session->config.target_peers;

  WatchEvent completed{WatchEventKind::SyncCompleted, name};
  try {
    auto peers = handler(request);
    WatchEvent started{WatchEventKind::SyncStarted, name};
    started.count = peers;
    emit(started);
    completed.success = true;
  } catch(const std::exception& ex) {
    log_warn(logger_.get(), "Sync of {} failed: {}", name, ex.what());
    completed.error = ex.what();
  }
  emit(completed);
}

bool WatchEngine::stop_watching(const std::string& modpack_name) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(modpack_name);
    if(it == sessions_.end()) return false;
    session = it->second;
    sessions_.erase(it);
  }
  {
    std::lock_guard<std::mutex> lock(session->mutex);
    release(*session);
  }
  log_info(logger_.get(), "Stopped watching {}", modpack_name);
  emit({WatchEventKind::WatchStopped, modpack_name});
  return true;
}

void WatchEngine::release(Session& session) {
  session.stopped = true;
  session.debounce.cancel();
  for(const auto& entry : session.watches) {
    inotify_rm_watch(session.descriptor.native_handle(), entry.first);
  }
  session.watches.clear();
  session.pending.clear();
  session.pending_moves.clear();
  std::error_code ec;
  session.descriptor.close(ec);
}

bool WatchEngine::is_watching(const std::string& modpack_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.count(modpack_name) > 0;
}

std::vector<std::string> WatchEngine::watching() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  for(const auto& entry : sessions_) names.push_back(entry.first);
  return names;
}

void WatchEngine::stop_all() {
  for(const auto& name : watching()) stop_watching(name);
}

void WatchEngine::set_sync_handler(SyncHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  sync_handler_ = std::move(handler);
}

std::size_t WatchEngine::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  auto handle = next_listener_++;
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void WatchEngine::remove_listener(std::size_t handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void WatchEngine::emit(const WatchEvent& event) {
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for(const auto& entry : listeners_) listeners.push_back(entry.second);
  }
  for(const auto& listener : listeners) listener(event);
}
