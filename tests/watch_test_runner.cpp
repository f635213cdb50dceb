#include "io_thread.hpp"
#include "mesh_error.hpp"
#include "test_runner_utils.hpp"
#include "watch_engine.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using packmesh::test::IoThread;
using packmesh::test::TestCase;
using packmesh::test::TestContext;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

template<typename Fn>
bool throws_code(MeshErrc code, Fn&& fn) {
  try {
    fn();
  } catch(const MeshError& e) {
    return e.code() == code;
  }
  return false;
}

struct WatchFixture {
  IoThread io;
  fs::path root;
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("watch");

  std::mutex mutex;
  std::vector<SyncRequest> requests;
  std::vector<std::chrono::steady_clock::time_point> request_times;
  std::vector<WatchEvent> events;
  std::size_t handler_result = 2;
  bool handler_throws = false;

  std::shared_ptr<WatchEngine> engine;

  WatchFixture(TestContext& ctx, const std::string& name) : root(packmesh::test::scratch_dir(name)) {
    ctx.logs.attach(logger, "watch");
    fs::create_directories(root / "pack" / "mods");
    fs::create_directories(root / "pack" / "config");
    engine = WatchEngine::create(io.io(), root / "watch_configs.json", logger);
    engine->set_sync_handler([this](const SyncRequest& request) -> std::size_t {
      std::lock_guard<std::mutex> lock(mutex);
      requests.push_back(request);
      request_times.push_back(std::chrono::steady_clock::now());
      if(handler_throws) throw MeshError(MeshErrc::PeerNotFound, "No peers to sync '" + request.modpack_name + "' with");
      return handler_result;
    });
    engine->add_listener([this](const WatchEvent& event){
      std::lock_guard<std::mutex> lock(mutex);
      events.push_back(event);
    });
  }

  ~WatchFixture() {
    engine->stop_all();
    io.run([]{});
  }

  WatchConfig config(std::uint64_t debounce_ms) const {
    WatchConfig c;
    c.modpack_name = "pack";
    c.modpack_path = root / "pack";
    c.target_peers = {"peer-a"};
    c.debounce_ms = debounce_ms;
    return c;
  }

  void write(const std::string& relative, const std::string& content = "data") {
    packmesh::test::write_file(root / "pack" / relative, content);
  }

  std::size_t request_count() {
    std::lock_guard<std::mutex> lock(mutex);
    return requests.size();
  }

  std::vector<SyncRequest> all_requests() {
    std::lock_guard<std::mutex> lock(mutex);
    return requests;
  }

  std::vector<WatchEvent> all_events() {
    std::lock_guard<std::mutex> lock(mutex);
    return events;
  }

  bool wait_for_request(std::chrono::milliseconds timeout = 3000ms) {
    return packmesh::test::wait_for_condition([this]{ return request_count() > 0; }, timeout);
  }
};

bool has_change(const SyncRequest& request, const std::string& path, ChangeType type) {
  return std::any_of(request.changes.begin(), request.changes.end(), [&](const FileChange& c){
    return c.relative_path == path && c.type == type;
  });
}

bool has_path(const SyncRequest& request, const std::string& path) {
  return std::any_of(request.changes.begin(), request.changes.end(), [&](const FileChange& c){
    return c.relative_path == path;
  });
}

bool test_burst_collapses_into_one_request(TestContext& ctx) {
  WatchFixture f(ctx, "watch_burst");
  f.engine->set_config(f.config(300));
  f.engine->start_watching("pack");
  for(int i = 0; i < 5; ++i) f.write("mods/mod" + std::to_string(i) + ".jar");
  f.write("config/options.txt");

  if(!f.wait_for_request()) return false;
  std::this_thread::sleep_for(700ms);
  auto requests = f.all_requests();
  if(requests.size() != 1) return false;
  const auto& request = requests[0];
  for(int i = 0; i < 5; ++i) {
    if(!has_path(request, "mods/mod" + std::to_string(i) + ".jar")) return false;
  }
  if(!has_path(request, "config/options.txt")) return false;
  if(request.modpack_name != "pack" || request.target_peers != std::vector<std::string>{"peer-a"}) return false;

  auto events = f.all_events();
  std::vector<WatchEventKind> kinds;
  for(const auto& e : events) kinds.push_back(e.kind);
  std::vector<WatchEventKind> expected = {WatchEventKind::WatchStarted, WatchEventKind::ChangesDetected,
                                          WatchEventKind::SyncStarted, WatchEventKind::SyncCompleted};
  return kinds == expected &&
         events[1].count == request.changes.size() &&
         events[2].count == 2 &&
         events[3].success && !events[3].error;
}

bool test_activity_slides_the_window(TestContext& ctx) {
  WatchFixture f(ctx, "watch_sliding");
  f.engine->set_config(f.config(400));
  f.engine->start_watching("pack");

  auto last_write = std::chrono::steady_clock::now();
  for(int i = 0; i < 6; ++i) {
    f.write("mods/tick" + std::to_string(i) + ".jar");
    last_write = std::chrono::steady_clock::now();
    std::this_thread::sleep_for(150ms);
    if(f.request_count() != 0) return false;
  }
  if(!f.wait_for_request()) return false;
  std::this_thread::sleep_for(600ms);

  std::lock_guard<std::mutex> lock(f.mutex);
  return f.requests.size() == 1 &&
         f.request_times[0] - last_write >= 350ms &&
         has_path(f.requests[0], "mods/tick0.jar") &&
         has_path(f.requests[0], "mods/tick5.jar");
}

bool test_ignored_paths_never_trigger(TestContext& ctx) {
  WatchFixture f(ctx, "watch_ignore");
  auto config = f.config(200);
  config.ignore_patterns.push_back("config/local/*");
  f.engine->set_config(config);
  f.engine->start_watching("pack");

  f.write("mods/debug.log");
  f.write("mods/download.tmp");
  f.write("config/local/machine.txt");
  std::this_thread::sleep_for(600ms);
  if(f.request_count() != 0) return false;

  f.write("mods/real.jar");
  f.write("mods/other.log");
  if(!f.wait_for_request()) return false;
  auto request = f.all_requests()[0];
  return has_path(request, "mods/real.jar") &&
         std::all_of(request.changes.begin(), request.changes.end(), [](const FileChange& c){
           return c.relative_path == "mods/real.jar";
         });
}

bool test_renames_are_paired(TestContext& ctx) {
  WatchFixture f(ctx, "watch_rename");
  f.write("mods/old.jar");
  f.write("mods/keep.jar");
  f.engine->set_config(f.config(250));
  f.engine->start_watching("pack");

  fs::rename(f.root / "pack" / "mods" / "old.jar", f.root / "pack" / "mods" / "new.jar");
  fs::rename(f.root / "pack" / "mods" / "keep.jar", f.root / "pack" / "mods" / "keep.jar.tmp");
  if(!f.wait_for_request()) return false;

  auto request = f.all_requests()[0];
  auto renamed = std::find_if(request.changes.begin(), request.changes.end(), [](const FileChange& c){
    return c.type == ChangeType::Renamed;
  });
  return renamed != request.changes.end() &&
         renamed->relative_path == "mods/new.jar" &&
         renamed->previous_path == std::optional<std::string>("mods/old.jar") &&
         has_change(request, "mods/keep.jar", ChangeType::Deleted) &&
         !has_path(request, "mods/keep.jar.tmp");
}

bool test_moved_out_counts_as_deleted(TestContext& ctx) {
  WatchFixture f(ctx, "watch_move_out");
  f.write("mods/gone.jar");
  f.engine->set_config(f.config(250));
  f.engine->start_watching("pack");

  fs::rename(f.root / "pack" / "mods" / "gone.jar", f.root / "outside.jar");
  if(!f.wait_for_request()) return false;
  auto request = f.all_requests()[0];
  return request.changes.size() == 1 && has_change(request, "mods/gone.jar", ChangeType::Deleted);
}

bool test_new_subdirectories_are_watched(TestContext& ctx) {
  WatchFixture f(ctx, "watch_subdir");
  f.engine->set_config(f.config(300));
  f.engine->start_watching("pack");

  fs::create_directories(f.root / "pack" / "mods" / "nested");
  std::this_thread::sleep_for(100ms);
  f.write("mods/nested/inner.jar");
  if(!f.wait_for_request()) return false;
  std::this_thread::sleep_for(400ms);
  auto requests = f.all_requests();
  return std::any_of(requests.begin(), requests.end(), [](const SyncRequest& r){
    return has_path(r, "mods/nested/inner.jar");
  });
}

bool test_directory_moved_in_reports_its_files(TestContext& ctx) {
  WatchFixture f(ctx, "watch_dir_in");
  auto staged = f.root / "staging" / "bundle";
  packmesh::test::write_file(staged / "alpha.jar", "a");
  packmesh::test::write_file(staged / "deep" / "beta.jar", "b");
  fs::create_directories(staged / "empty");
  f.engine->set_config(f.config(250));
  f.engine->start_watching("pack");

  fs::rename(staged, f.root / "pack" / "mods" / "bundle");
  if(!f.wait_for_request()) return false;
  std::this_thread::sleep_for(400ms);
  auto requests = f.all_requests();
  if(requests.size() != 1) return false;
  const auto& request = requests[0];
  if(!has_change(request, "mods/bundle/alpha.jar", ChangeType::Created) ||
     !has_change(request, "mods/bundle/deep/beta.jar", ChangeType::Created) ||
     !has_change(request, "mods/bundle/empty", ChangeType::Created)) {
    return false;
  }

  // The moved-in tree is watched like any other.
  f.write("mods/bundle/deep/gamma.jar");
  if(!packmesh::test::wait_for_condition([&]{ return f.request_count() > 1; }, 3000ms)) return false;
  return has_path(f.all_requests()[1], "mods/bundle/deep/gamma.jar");
}

bool test_directory_removed_counts_as_deleted(TestContext& ctx) {
  WatchFixture f(ctx, "watch_dir_out");
  f.write("mods/packed/one.jar");
  fs::create_directories(f.root / "pack" / "mods" / "scratch");
  f.engine->set_config(f.config(250));
  f.engine->start_watching("pack");

  fs::rename(f.root / "pack" / "mods" / "packed", f.root / "packed");
  fs::remove(f.root / "pack" / "mods" / "scratch");
  if(!f.wait_for_request()) return false;
  auto request = f.all_requests()[0];
  return has_change(request, "mods/packed", ChangeType::Deleted) &&
         has_change(request, "mods/scratch", ChangeType::Deleted);
}

bool test_start_rejects_bad_configs(TestContext& ctx) {
  WatchFixture f(ctx, "watch_errors");
  auto disabled = f.config(200);
  disabled.modpack_name = "off";
  disabled.enabled = false;
  f.engine->set_config(disabled);
  f.engine->set_config(f.config(200));
  f.engine->start_watching("pack");

  return throws_code(MeshErrc::WatchConfigMissing, [&]{ f.engine->start_watching("missing"); }) &&
         throws_code(MeshErrc::WatchDisabled, [&]{ f.engine->start_watching("off"); }) &&
         throws_code(MeshErrc::WatchAlreadyRunning, [&]{ f.engine->start_watching("pack"); }) &&
         f.engine->watching() == std::vector<std::string>{"pack"} &&
         !f.engine->stop_watching("off") &&
         f.engine->stop_watching("pack") &&
         !f.engine->is_watching("pack");
}

bool test_missing_folders_are_skipped(TestContext& ctx) {
  WatchFixture f(ctx, "watch_missing_folders");
  auto config = f.config(200);
  config.modpack_path = f.root / "empty_pack";
  fs::create_directories(config.modpack_path);
  f.engine->set_config(config);
  f.engine->start_watching("pack");
  return f.engine->is_watching("pack") &&
         ctx.logs.contains("Nothing to watch for pack");
}

bool test_stop_discards_pending_changes(TestContext& ctx) {
  WatchFixture f(ctx, "watch_stop");
  f.engine->set_config(f.config(500));
  f.engine->start_watching("pack");
  f.write("mods/pending.jar");
  std::this_thread::sleep_for(150ms);
  f.engine->stop_watching("pack");
  std::this_thread::sleep_for(800ms);
  if(f.request_count() != 0) return false;

  f.engine->start_watching("pack");
  std::this_thread::sleep_for(800ms);
  if(f.request_count() != 0) return false;

  auto events = f.all_events();
  return std::count_if(events.begin(), events.end(), [](const WatchEvent& e){
           return e.kind == WatchEventKind::WatchStopped;
         }) == 1 &&
         std::none_of(events.begin(), events.end(), [](const WatchEvent& e){
           return e.kind == WatchEventKind::ChangesDetected;
         });
}

bool test_handler_failure_is_reported(TestContext& ctx) {
  WatchFixture f(ctx, "watch_handler_failure");
  f.handler_throws = true;
  f.engine->set_config(f.config(200));
  f.engine->start_watching("pack");
  f.write("mods/a.jar");

  bool completed = packmesh::test::wait_for_condition([&]{
    auto events = f.all_events();
    return std::any_of(events.begin(), events.end(), [](const WatchEvent& e){
      return e.kind == WatchEventKind::SyncCompleted;
    });
  }, 3000ms);
  if(!completed) return false;
  auto events = f.all_events();
  auto last = events.back();
  bool no_started = std::none_of(events.begin(), events.end(), [](const WatchEvent& e){
    return e.kind == WatchEventKind::SyncStarted;
  });
  return no_started && last.kind == WatchEventKind::SyncCompleted && !last.success &&
         last.error && last.error->find("No peers") != std::string::npos;
}

bool test_configs_persist(TestContext& ctx) {
  auto dir = packmesh::test::scratch_dir("watch_persist");
  auto logger = std::make_shared<Logger>("watch");
  ctx.logs.attach(logger, "watch");
  IoThread io;
  {
    auto engine = WatchEngine::create(io.io(), dir / "watch_configs.json", logger);
    WatchConfig a;
    a.modpack_name = "alpha";
    a.modpack_path = dir / "alpha";
    a.target_peers = {"p1", "p2"};
    a.debounce_ms = 750;
    a.ignore_patterns = {"*.bak"};
    a.watch_folders = {"mods"};
    engine->set_config(a);
    WatchConfig b;
    b.modpack_name = "beta";
    b.modpack_path = dir / "beta";
    b.enabled = false;
    engine->set_config(b);
  }

  auto engine = WatchEngine::create(io.io(), dir / "watch_configs.json", logger);
  if(!engine->load_configs() || engine->configs().size() != 2) return false;
  auto alpha = engine->get_config("alpha");
  auto beta = engine->get_config("beta");
  if(!alpha || !beta) return false;
  if(alpha->target_peers != std::vector<std::string>{"p1", "p2"} || alpha->debounce_ms != 750 ||
     alpha->ignore_patterns != std::vector<std::string>{"*.bak"} ||
     alpha->watch_folders != std::vector<std::string>{"mods"} || alpha->modpack_path != dir / "alpha") {
    return false;
  }
  if(beta->enabled || beta->debounce_ms != kDefaultDebounceMs) return false;

  if(!engine->remove_config("beta") || engine->remove_config("beta")) return false;
  auto reloaded = WatchEngine::create(io.io(), dir / "watch_configs.json", logger);
  reloaded->load_configs();

  auto sparse = watch_config_from_json({{"modpack_name", "gamma"}, {"modpack_path", "/srv/gamma"}});
  return reloaded->configs().size() == 1 &&
         sparse.enabled && sparse.debounce_ms == kDefaultDebounceMs &&
         sparse.ignore_patterns == default_ignore_patterns() &&
         sparse.watch_folders == default_watch_folders() &&
         sparse.target_peers.empty();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"burst_collapses_into_one_request", test_burst_collapses_into_one_request},
    {"activity_slides_the_window", test_activity_slides_the_window},
    {"ignored_paths_never_trigger", test_ignored_paths_never_trigger},
    {"renames_are_paired", test_renames_are_paired},
    {"moved_out_counts_as_deleted", test_moved_out_counts_as_deleted},
    {"new_subdirectories_are_watched", test_new_subdirectories_are_watched},
    {"directory_moved_in_reports_its_files", test_directory_moved_in_reports_its_files},
    {"directory_removed_counts_as_deleted", test_directory_removed_counts_as_deleted},
    {"start_rejects_bad_configs", test_start_rejects_bad_configs},
    {"missing_folders_are_skipped", test_missing_folders_are_skipped},
    {"stop_discards_pending_changes", test_stop_discards_pending_changes},
    {"handler_failure_is_reported", test_handler_failure_is_reported},
    {"configs_persist", test_configs_persist}
  };
  return packmesh::test::run_test_cases("watch", tests, argc, argv);
}
