#pragma once

#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace packmesh::test {

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener([this, label](const LogRecord& record) {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!label.empty()) {
        lines_.emplace_back(label + ": " + record.message);
      } else {
        lines_.emplace_back(std::string(to_string(record.channel)) + ": " + record.message);
      }
      cv_.notify_all();
      return false;
    });
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(20)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

// Fresh, empty directory under the system temp dir.
inline std::filesystem::path scratch_dir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / "packmesh_tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir);
  return dir;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if(!out) throw std::runtime_error("cannot write " + path.string());
  out << content;
}

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Runs every case, printing '.' per pass and 'F (name)' plus captured log lines
// per failure. Returns the process exit code.
inline int run_test_cases(const std::string& suite,
                          const std::vector<TestCase>& tests,
                          int argc,
                          char** argv) {
  bool verbose = (std::getenv("PACKMESH_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }
  bool show_logs = (std::getenv("PACKMESH_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }

  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";

  if(suppress_logs) {
    set_log_passthrough(true);
  }

  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace packmesh::test
