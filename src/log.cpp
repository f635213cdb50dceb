#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <memory>
#include <vector>

namespace {

struct DefaultSinks {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

std::once_flag g_sinks_once;
DefaultSinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_sink_logger(const std::string& name,
                                                 spdlog::sink_ptr sink,
                                                 const char* pattern,
                                                 spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  logger->set_level(spdlog::level::info);
  return logger;
}

const DefaultSinks& sinks() {
  std::call_once(g_sinks_once, [](){
    const char* stamped = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    g_sinks.info = make_sink_logger("packmesh.info",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), stamped, spdlog::level::warn);
    g_sinks.error = make_sink_logger("packmesh.error",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), stamped, spdlog::level::err);
    g_sinks.print = make_sink_logger("packmesh.print",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v", spdlog::level::info);
    g_sinks.print_err = make_sink_logger("packmesh.print_err",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "%v", spdlog::level::err);
  });
  return g_sinks;
}

spdlog::logger* sink_for(LogChannel channel) {
  const auto& s = sinks();
  switch(channel) {
    case LogChannel::Print:    return s.print.get();
    case LogChannel::PrintErr: return s.print_err.get();
    case LogChannel::Error:    return s.error.get();
    case LogChannel::Info:
    case LogChannel::Warn:
    case LogChannel::Debug:    return s.info.get();
  }
  return s.info.get();
}

} // namespace

const char* to_string(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info:     return "info";
    case LogChannel::Warn:     return "warn";
    case LogChannel::Error:    return "error";
    case LogChannel::Debug:    return "debug";
    case LogChannel::Print:    return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum level_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn:     return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug:    return spdlog::level::debug;
    case LogChannel::Info:
    case LogChannel::Print:    return spdlog::level::info;
  }
  return spdlog::level::info;
}

void init_logging(bool verbose) {
  const auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.info->set_level(level);
  spdlog::set_default_logger(s.info);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

std::string Logger::name() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(mutex_);
  auto handle = next_handle_++;
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(handle);
}

void Logger::write(LogChannel channel, std::string message) {
  LogRecord record;
  record.channel = channel;
  record.level = level_for(channel);
  record.message = std::move(message);

  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    record.source = name_;
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }

  bool consumed = false;
  for(const auto& listener : snapshot) {
    try {
      if(listener(record)) consumed = true;
    } catch(const std::exception& e) {
      detail::emit_default({record.source, LogChannel::Error, spdlog::level::err,
                            fmt::format("log listener failed: {}", e.what())});
    }
  }
  if(!consumed) detail::emit_default(record);
}

namespace detail {

void emit_default(const LogRecord& record) {
  if(!log_passthrough()) return;
  auto* sink = sink_for(record.channel);
  if(record.source.empty()) {
    sink->log(record.level, record.message);
  } else {
    sink->log(record.level, fmt::format("[{}] {}", record.source, record.message));
  }
}

void route(Logger* logger, LogChannel channel, std::string message) {
  if(logger) {
    logger->write(channel, std::move(message));
    return;
  }
  emit_default({std::string(), channel, level_for(channel), std::move(message)});
}

} // namespace detail
