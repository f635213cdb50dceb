#include "connect_cli.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <vector>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "connect_engine.hpp"
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

std::string rest_of(std::istringstream& iss) {
  std::string rest;
  std::getline(iss, rest);
  return trim(rest);
}

std::vector<std::string> words_of(std::istringstream& iss) {
  std::vector<std::string> out;
  std::string word;
  while(iss >> word) out.push_back(word);
  return out;
}

std::string human_bytes(std::uint64_t bytes) {
  static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while(value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
    value /= 1024.0;
    ++unit;
  }
  if(unit == 0) return fmt::format("{} B", bytes);
  return fmt::format("{:.1f} {}", value, units[unit]);
}

std::string short_version(const std::string& hash) {
  return hash.size() > 12 ? hash.substr(0, 12) : hash;
}

} // namespace

ConnectCLI::ConnectCLI(ConnectEngine& engine)
  : engine_(engine), logger_(engine.logger()) {}

ConnectCLI::~ConnectCLI() {
  stop();
}

void ConnectCLI::start() {
  if(cli_thread_.joinable()) return;
  running_ = true;
  cli_thread_ = std::thread([this](){ run_loop(); });
}

void ConnectCLI::stop() {
  running_ = false;
  if(cli_thread_.joinable()) {
    if(cli_thread_.get_id() == std::this_thread::get_id()) {
      cli_thread_.detach();
    } else {
      cli_thread_.join();
    }
  }
}

void ConnectCLI::set_quit_handler(std::function<void()> handler) {
  quit_handler_ = std::move(handler);
}

void ConnectCLI::request_quit() {
  running_ = false;
  if(quit_handler_) quit_handler_();
}

void ConnectCLI::run_loop() {
  while(running_) {
    auto input = read_command_line("> ");
    if(!input) {
      request_quit();
      break;
    }
    if(input->empty()) continue;
    if(!execute_command(*input)) {
      request_quit();
      break;
    }
  }
}

std::optional<std::string> ConnectCLI::read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
  char* line = readline(prompt);
  if(!line) return std::nullopt;
  std::string result(line);
  if(!result.empty()) add_history(result.c_str());
  free(line);
  return result;
#else
  std::cout << prompt;
  std::cout.flush();
  std::string line;
  if(!std::getline(std::cin, line)) return std::nullopt;
  return line;
#endif
}

bool ConnectCLI::execute_command(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  if(cmd.empty()) return true;

  try {
    if(cmd == "peers" || cmd == "p") {
      list_peers();
    } else if(cmd == "code") {
      show_code();
    } else if(cmd == "connect") {
      connect_command(rest_of(iss));
    } else if(cmd == "status") {
      show_status();
    } else if(cmd == "sync") {
      sync_command(rest_of(iss));
    } else if(cmd == "queue" || cmd == "q") {
      handle_queue_command(rest_of(iss));
    } else if(cmd == "watch" || cmd == "w") {
      handle_watch_command(rest_of(iss));
    } else if(cmd == "invite" || cmd == "i") {
      handle_invite_command(rest_of(iss));
    } else if(cmd == "join") {
      join_command(rest_of(iss));
    } else if(cmd == "history") {
      handle_history_command(rest_of(iss));
    } else if(cmd == "updates" || cmd == "u") {
      handle_updates_command(rest_of(iss));
    } else if(cmd == "settings" || cmd == "s") {
      auto args = rest_of(iss);
      handle_settings_command(args.empty() ? "list" : args);
    } else if(cmd == "set") {
      auto args = rest_of(iss);
      handle_settings_command(args.empty() ? "list" : "set " + args);
    } else if(cmd == "get") {
      auto args = rest_of(iss);
      handle_settings_command(args.empty() ? "get" : "get " + args);
    } else if(cmd == "save") {
      handle_settings_command("save");
    } else if(cmd == "load") {
      handle_settings_command("load");
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "quit" || cmd == "exit") {
      print_out(logger_.get(), "Quitting...");
      return false;
    } else {
      print_help();
      print_out(logger_.get(), "Unknown command: {}", cmd);
    }
  } catch(const std::exception& e) {
    print_err(logger_.get(), "Error: {}", e.what());
  }
  return true;
}

void ConnectCLI::list_peers() {
  auto peers = engine_.directory()->snapshot();
  if(peers.empty()) {
    print_out(logger_.get(), "No peers discovered.");
    return;
  }
  std::sort(peers.begin(), peers.end(), [](const PeerInfo& a, const PeerInfo& b){
    return a.display_name() < b.display_name();
  });
  for(const auto& peer : peers) {
    auto age = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::steady_clock::now() - peer.last_seen).count();
    print_out(logger_.get(), "{:<20} {:<36} {}:{} {} v{} seen {}s ago",
              peer.display_name(), peer.id, peer.address, peer.port,
              to_string(peer.status), peer.app_version, age);
  }
}

void ConnectCLI::show_code() {
  auto discovery = engine_.discovery();
  if(!discovery) {
    print_out(logger_.get(), "P2P is disabled. Run \"set enabled true\" first.");
    return;
  }
  print_out(logger_.get(), "Your code: {}", discovery->local_code());
  print_out(logger_.get(), "Peer id:   {}", discovery->local_peer_id());
}

void ConnectCLI::connect_command(const std::string& args) {
  if(args.empty()) {
    print_out(logger_.get(), "Usage: connect <PKM-XXXX-XXXX>");
    return;
  }
  auto discovery = engine_.discovery();
  if(!discovery) {
    print_out(logger_.get(), "P2P is disabled. Run \"set enabled true\" first.");
    return;
  }
  print_out(logger_.get(), "Looking for {}...", args);
  auto peer = discovery->connect_by_code(args);
  print_out(logger_.get(), "Connected to {} at {}:{}", peer.display_name(), peer.address, peer.port);
}

void ConnectCLI::show_status() {
  auto stats = engine_.stats();
  auto settings = engine_.settings();
  print_out(logger_.get(), "enabled     {}", settings->value_as_string("enabled"));
  print_out(logger_.get(), "visibility  {}", settings->value_as_string("visibility"));
  print_out(logger_.get(), "peers       {}", stats.known_peers);
  print_out(logger_.get(), "transfers   {} queued, {} active", stats.queued_transfers, stats.active_transfers);
  print_out(logger_.get(), "watching    {}", stats.watched_modpacks);
  print_out(logger_.get(), "updates     {} unread", engine_.notifier()->unread_count());
}

void ConnectCLI::sync_command(const std::string& args) {
  std::istringstream iss(args);
  SyncRequest request;
  iss >> request.modpack_name;
  if(request.modpack_name.empty()) {
    print_out(logger_.get(), "Usage: sync <modpack> [peer_id...]");
    return;
  }
  request.target_peers = words_of(iss);
  auto ids = engine_.dispatcher()->submit(request);
  print_out(logger_.get(), "Queued {} transfer(s) for '{}'", ids.size(), request.modpack_name);
}

void ConnectCLI::handle_queue_command(const std::string& args) {
  std::istringstream iss(args);
  std::string action;
  iss >> action;
  auto queue = engine_.queue();
  auto dispatcher = engine_.dispatcher();

  if(action.empty() || action == "list") {
    auto items = queue->get_all();
    if(items.empty()) {
      print_out(logger_.get(), "Transfer queue is empty.");
      return;
    }
    for(const auto& item : items) {
      print_out(logger_.get(), "{} {:<9} {:<8} {} -> {}{}",
                item.id, to_string(item.state), to_string(item.priority), item.modpack_name,
                item.peer_nickname.value_or(item.peer_id),
                item.error ? " (" + *item.error + ")" : std::string());
    }
    return;
  }

  std::string id;
  iss >> id;
  if(action == "cancel" && !id.empty()) {
    dispatcher->cancel(id);
    print_out(logger_.get(), "Cancelled {}", id);
  } else if(action == "retry" && !id.empty()) {
    dispatcher->retry(id);
    print_out(logger_.get(), "Requeued {}", id);
  } else if(action == "retry-all") {
    print_out(logger_.get(), "Requeued {} failed transfer(s)", dispatcher->retry_all_failed());
  } else if(action == "priority" && !id.empty()) {
    std::string level;
    iss >> level;
    auto priority = priority_from_string(level);
    if(!priority) {
      print_out(logger_.get(), "Priority must be low, normal, high or critical");
      return;
    }
    queue->set_priority(id, *priority);
    print_out(logger_.get(), "{} priority = {}", id, to_string(*priority));
  } else if(action == "cleanup") {
    queue->cleanup();
    print_out(logger_.get(), "Removed finished transfers");
  } else if(action == "clear") {
    queue->clear();
    print_out(logger_.get(), "Transfer queue cleared");
  } else {
    print_out(logger_.get(), "Usage: queue [list|cancel <id>|retry <id>|retry-all|priority <id> <level>|cleanup|clear]");
  }
}

void ConnectCLI::handle_watch_command(const std::string& args) {
  std::istringstream iss(args);
  std::string action;
  iss >> action;
  auto watch = engine_.watch();

  if(action.empty() || action == "list") {
    auto configs = watch->configs();
    if(configs.empty()) {
      print_out(logger_.get(), "No modpacks configured. Use \"watch add <name> <path>\".");
      return;
    }
    for(const auto& config : configs) {
      print_out(logger_.get(), "{:<20} {} {} debounce={}ms peers={}",
                config.modpack_name, config.modpack_path.string(),
                watch->is_watching(config.modpack_name) ? "watching" : (config.enabled ? "idle" : "disabled"),
                config.debounce_ms,
                config.target_peers.empty() ? std::string("all") : std::to_string(config.target_peers.size()));
    }
    return;
  }

  std::string name;
  iss >> name;
  if(name.empty()) {
    print_out(logger_.get(), "Usage: watch [list|add <name> <path> [peer...]|remove|start|stop|debounce|ignore] <name>");
    return;
  }

  if(action == "add") {
    WatchConfig config;
    config.modpack_name = name;
    std::string path;
    iss >> path;
    if(path.empty()) {
      print_out(logger_.get(), "Usage: watch add <name> <path> [peer_id...]");
      return;
    }
    config.modpack_path = std::filesystem::absolute(path);
    config.target_peers = words_of(iss);
    watch->set_config(config);
    engine_.notifier()->track_modpack(name);
    print_out(logger_.get(), "Configured '{}' at {}", name, config.modpack_path.string());
  } else if(action == "remove") {
    if(watch->remove_config(name)) {
      engine_.notifier()->untrack_modpack(name);
      print_out(logger_.get(), "Removed '{}'", name);
    } else {
      print_out(logger_.get(), "No modpack named '{}'", name);
    }
  } else if(action == "start") {
    watch->start_watching(name);
    print_out(logger_.get(), "Watching '{}'", name);
  } else if(action == "stop") {
    if(watch->stop_watching(name)) {
      print_out(logger_.get(), "Stopped watching '{}'", name);
    } else {
      print_out(logger_.get(), "'{}' is not being watched", name);
    }
  } else if(action == "debounce" || action == "ignore" || action == "enable" || action == "disable") {
    auto config = watch->get_config(name);
    if(!config) {
      print_out(logger_.get(), "No modpack named '{}'", name);
      return;
    }
    if(action == "debounce") {
      std::uint64_t ms = 0;
      if(!(iss >> ms)) {
        print_out(logger_.get(), "Usage: watch debounce <name> <ms>");
        return;
      }
      config->debounce_ms = ms;
    } else if(action == "ignore") {
      auto pattern = rest_of(iss);
      if(pattern.empty()) {
        print_out(logger_.get(), "Usage: watch ignore <name> <pattern>");
        return;
      }
      config->ignore_patterns.push_back(pattern);
    } else {
      config->enabled = action == "enable";
    }
    watch->set_config(*config);
    print_out(logger_.get(), "Updated '{}'", name);
  } else {
    print_out(logger_.get(), "Unknown watch command '{}'", action);
  }
}

void ConnectCLI::handle_invite_command(const std::string& args) {
  std::istringstream iss(args);
  std::string action;
  iss >> action;
  auto invites = engine_.invites();

  if(action.empty() || action == "list") {
    auto all = invites->all_invites();
    if(all.empty()) {
      print_out(logger_.get(), "No invites.");
      return;
    }
    for(const auto& invite : all) {
      std::string uses = invite.max_uses == 0
        ? fmt::format("{}/unlimited", invite.use_count)
        : fmt::format("{}/{}", invite.use_count, invite.max_uses);
      print_out(logger_.get(), "{} {:<20} uses {} {}{}",
                invite.code, invite.server_name, uses,
                invite.is_valid() ? "valid" : "invalid",
                invite.expires_at ? " expires " + iso8601_from_secs(invite.expires_at) : std::string());
    }
    return;
  }

  if(action == "create") {
    auto words = words_of(iss);
    if(words.size() < 5) {
      print_out(logger_.get(), "Usage: invite create <modpack> <server_name> <mc_version> <loader> <address> [hours] [max_uses]");
      return;
    }
    std::optional<std::chrono::seconds> expires_in;
    std::optional<std::uint32_t> max_uses;
    if(words.size() > 5) {
      expires_in = std::chrono::hours(std::stoul(words[5]));
    }
    if(words.size() > 6) {
      max_uses = static_cast<std::uint32_t>(std::stoul(words[6]));
    }
    auto invite = invites->create_invite(words[0], words[1], words[2], words[3], words[4], expires_in, max_uses);
    print_out(logger_.get(), "{}", format_invite_for_sharing(invite));
    return;
  }

  if(action == "cleanup") {
    print_out(logger_.get(), "Removed {} expired invite(s)", invites->cleanup_expired_invites());
    return;
  }

  std::string code;
  iss >> code;
  if(code.empty()) {
    print_out(logger_.get(), "Usage: invite [list|create|share|revoke|delete|cleanup] <code>");
    return;
  }
  if(action == "share" || action == "show") {
    auto invite = invites->get_invite(code);
    if(!invite) {
      print_out(logger_.get(), "Invite not found");
      return;
    }
    print_out(logger_.get(), "{}", format_invite_for_sharing(*invite));
  } else if(action == "revoke") {
    invites->revoke_invite(code);
    print_out(logger_.get(), "Revoked {}", code);
  } else if(action == "delete") {
    if(invites->delete_invite(code)) {
      print_out(logger_.get(), "Deleted {}", code);
    } else {
      print_out(logger_.get(), "Invite not found");
    }
  } else {
    print_out(logger_.get(), "Unknown invite command '{}'", action);
  }
}

void ConnectCLI::join_command(const std::string& args) {
  std::istringstream iss(args);
  QuickJoinRequest request;
  iss >> request.invite_code;
  if(request.invite_code.empty()) {
    print_out(logger_.get(), "Usage: join <JOIN-XXXX-XXXX> [instance_id] [--no-launch]");
    return;
  }
  for(const auto& word : words_of(iss)) {
    if(word == "--no-launch") {
      request.auto_launch = false;
    } else {
      request.client_instance_id = word;
    }
  }
  auto result = engine_.join(request);
  if(!result.success) {
    print_out(logger_.get(), "Join failed: {}", result.error.value_or("unknown error"));
    return;
  }
  print_out(logger_.get(), "Joined into instance {} ({} files, {}) in {} ms",
            result.client_instance_id.value_or("?"), result.files_synced,
            human_bytes(result.bytes_synced), result.duration_ms);
}

void ConnectCLI::handle_history_command(const std::string& args) {
  auto history = engine_.history();
  if(args == "clear") {
    if(history->clear()) {
      print_out(logger_.get(), "History cleared");
    } else {
      print_out(logger_.get(), "Failed to clear history");
    }
    return;
  }
  if(args == "stats") {
    auto stats = history->stats();
    print_out(logger_.get(), "transfers {} ({} ok, {} failed)", stats.total_transfers, stats.successful, stats.failed);
    print_out(logger_.get(), "sent      {}", human_bytes(stats.total_bytes_sent));
    print_out(logger_.get(), "received  {}", human_bytes(stats.total_bytes_received));
    return;
  }

  std::size_t limit = 20;
  if(!args.empty()) limit = std::stoul(args);
  auto entries = history->get_recent(limit);
  if(entries.empty()) {
    print_out(logger_.get(), "No transfers recorded.");
    return;
  }
  for(const auto& entry : entries) {
    print_out(logger_.get(), "{} {:<8} {:<14} {} {} {} files {}{}",
              iso8601_from_secs(entry.completed_at), to_string(entry.direction), to_string(entry.result),
              entry.modpack_name, entry.peer_nickname.value_or(entry.peer_id),
              entry.files_count, human_bytes(entry.total_bytes),
              entry.error ? " (" + *entry.error + ")" : std::string());
  }
}

void ConnectCLI::handle_updates_command(const std::string& args) {
  std::istringstream iss(args);
  std::string action;
  iss >> action;
  auto notifier = engine_.notifier();

  if(action.empty() || action == "list" || action == "unread") {
    auto items = action == "unread" ? notifier->unread_notifications() : notifier->notifications();
    if(items.empty()) {
      print_out(logger_.get(), "No update notifications.");
      return;
    }
    for(const auto& item : items) {
      print_out(logger_.get(), "{} {}{} '{}' {} -> {} from {} ({:+} files, {:+} bytes)",
                item.id, item.read ? " " : "*", item.dismissed ? "x" : " ",
                item.modpack_name, short_version(item.local_version), short_version(item.peer_version),
                item.peer_nickname.value_or(item.peer_id), item.files_diff, item.size_diff);
    }
    return;
  }
  if(action == "read-all") {
    notifier->mark_all_read();
    return;
  }
  if(action == "clear") {
    notifier->clear_all();
    return;
  }

  std::string id;
  iss >> id;
  bool found = false;
  if(action == "read") {
    found = notifier->mark_read(id);
  } else if(action == "dismiss") {
    found = notifier->dismiss(id);
  } else if(action == "delete") {
    found = notifier->delete_notification(id);
  } else {
    print_out(logger_.get(), "Usage: updates [list|unread|read <id>|read-all|dismiss <id>|delete <id>|clear]");
    return;
  }
  if(!found) {
    print_out(logger_.get(), "Notification not found");
  }
}

void ConnectCLI::handle_settings_command(const std::string& args) {
  auto settings = engine_.settings();
  std::istringstream iss(args);
  std::string action;
  iss >> action;

  if(action.empty() || action == "list") {
    list_settings();
    return;
  }

  if(action == "get") {
    std::string key;
    iss >> key;
    if(key.empty()) {
      print_out(logger_.get(), "Usage: settings get <key>");
      return;
    }
    auto resolved = settings->resolve_key(key);
    if(!resolved) {
      print_out(logger_.get(), "Unknown setting '{}'.", key);
      return;
    }
    print_out(logger_.get(), "{} = {}", *resolved, settings->value_as_string(*resolved));
    return;
  }

  if(action == "set") {
    std::string key;
    iss >> key;
    auto value = rest_of(iss);
    if(key.empty() || value.empty()) {
      print_out(logger_.get(), "Usage: settings set <key> <value>");
      return;
    }
    auto resolved = settings->resolve_key(key);
    if(!resolved) {
      print_out(logger_.get(), "Unknown setting '{}'.", key);
      return;
    }
    std::string error;
    if(settings->set_from_string(*resolved, value, error)) {
      engine_.apply_settings();
      print_out(logger_.get(), "{} = {}", *resolved, settings->value_as_string(*resolved));
    } else {
      print_out(logger_.get(), "Failed to set {}: {}", *resolved, error);
    }
    return;
  }

  if(action == "save") {
    if(settings->save()) {
      print_out(logger_.get(), "Saved settings to {}", settings->settings_path().string());
    } else {
      print_out(logger_.get(), "Failed to save settings.");
    }
    return;
  }

  if(action == "load") {
    if(settings->load()) {
      engine_.apply_settings();
      print_out(logger_.get(), "Loaded settings from {}", settings->settings_path().string());
    } else {
      print_out(logger_.get(), "Settings file not found.");
    }
    return;
  }

  print_out(logger_.get(), "Unknown settings command.");
}

void ConnectCLI::list_settings() {
  auto settings = engine_.settings();
  auto keys = settings->keys();
  std::sort(keys.begin(), keys.end());
  for(const auto& key : keys) {
    print_out(logger_.get(), "{} = {}", key, settings->value_as_string(key));
  }
}

void ConnectCLI::print_help() {
  print_out(logger_.get(),
    "Available commands:\n"
    "  help|h|?                          Show this help message\n"
    "  quit|exit                         Exit the application\n"
    "  status                            Summary of peers, transfers and watches\n"
    "  peers|p                           List discovered peers\n"
    "  code                              Show your connection code\n"
    "  connect <code>                    Find a peer by its PKM-XXXX-XXXX code\n"
    "  sync <modpack> [peer...]          Queue a sync to all or the given peers\n"
    "  queue [list|cancel|retry|retry-all|priority|cleanup|clear]  Manage transfers\n"
    "  watch [list|add|remove|start|stop|debounce|ignore|enable|disable]  Manage modpack watches\n"
    "  invite [list|create|share|revoke|delete|cleanup]  Manage server invites\n"
    "  join <code> [instance] [--no-launch]  Join a server from an invite code\n"
    "  history [n|stats|clear]           Show the transfer history\n"
    "  updates [list|unread|read|read-all|dismiss|delete|clear]  Modpack update notifications\n"
    "  settings [list|get|set|save|load] Manage runtime settings\n"
    "  set [key value]                   Shortcut for settings set (lists when empty)\n"
    "  get <key>                         Shortcut for settings get\n"
    "  save                              Shortcut for settings save\n"
    "  load                              Shortcut for settings load");
}
