#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

class ConnectEngine;
class Logger;

// Line-oriented console for a running ConnectEngine. Output goes through the
// engine logger's print channel so tests can capture it.
class ConnectCLI {
public:
  explicit ConnectCLI(ConnectEngine& engine);
  ~ConnectCLI();

  ConnectCLI(const ConnectCLI&) = delete;
  ConnectCLI& operator=(const ConnectCLI&) = delete;

  void start();
  void stop();

  void set_quit_handler(std::function<void()> handler);

  // Returns false when the line asked to quit.
  bool execute_command(const std::string& line);

private:
  void run_loop();
  std::optional<std::string> read_command_line(const char* prompt);
  void request_quit();

  void list_peers();
  void show_code();
  void connect_command(const std::string& args);
  void show_status();
  void sync_command(const std::string& args);
  void handle_queue_command(const std::string& args);
  void handle_watch_command(const std::string& args);
  void handle_invite_command(const std::string& args);
  void join_command(const std::string& args);
  void handle_history_command(const std::string& args);
  void handle_updates_command(const std::string& args);
  void handle_settings_command(const std::string& args);
  void list_settings();
  void print_help();

  ConnectEngine& engine_;
  std::shared_ptr<Logger> logger_;
  std::function<void()> quit_handler_;
  std::atomic<bool> running_{false};
  std::thread cli_thread_;
};
