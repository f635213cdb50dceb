#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

enum class LogChannel {
  Info,
  Warn,
  Error,
  Debug,
  Print,
  PrintErr
};

const char* to_string(LogChannel channel);
spdlog::level::level_enum level_for(LogChannel channel);

struct LogRecord {
  std::string source;
  LogChannel channel = LogChannel::Info;
  spdlog::level::level_enum level = spdlog::level::info;
  std::string message;
};

void init_logging(bool verbose = false);
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

// Named log source. Listeners see every record first; if any of them returns
// true the record is considered consumed and skips the process-wide sinks.
class Logger {
public:
  using Listener = std::function<bool(const LogRecord& record)>;

  Logger() = default;
  explicit Logger(std::string name);

  std::string name() const;

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
  }

  void write(LogChannel channel, std::string message);

private:
  mutable std::mutex mutex_;
  std::string name_;
  std::map<LogListenerHandle, Listener> listeners_;
  LogListenerHandle next_handle_ = 1;
};

namespace detail {
void emit_default(const LogRecord& record);
void route(Logger* logger, LogChannel channel, std::string message);
} // namespace detail

template<typename... Args>
inline void log_info(Logger* logger,
                     spdlog::format_string_t<Args...> fmt,
                     Args&&... args) {
  detail::route(logger, LogChannel::Info, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_warn(Logger* logger,
                     spdlog::format_string_t<Args...> fmt,
                     Args&&... args) {
  detail::route(logger, LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_error(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  detail::route(logger, LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_debug(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  detail::route(logger, LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_out(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  detail::route(logger, LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_err(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  detail::route(logger, LogChannel::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
}
