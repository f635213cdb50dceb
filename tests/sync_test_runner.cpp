#include "fake_backend.hpp"
#include "io_thread.hpp"
#include "mesh_error.hpp"
#include "sync_dispatcher.hpp"
#include "sync_link.hpp"
#include "test_runner_utils.hpp"
#include "transfer_history.hpp"
#include "utils.hpp"

#include <asio.hpp>

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using packmesh::test::FakeBackend;
using packmesh::test::IoThread;
using packmesh::test::TestCase;
using packmesh::test::TestContext;
using namespace std::chrono_literals;

namespace {

ModpackManifest make_manifest(const std::string& name, std::vector<ManifestEntry> files) {
  ModpackManifest manifest;
  manifest.modpack_name = name;
  manifest.files = std::move(files);
  seal_manifest(manifest);
  return manifest;
}

PeerInfo make_peer(const std::string& id, const std::string& address = "10.0.0.2", std::uint16_t port = 19848) {
  PeerInfo peer;
  peer.id = id;
  peer.nickname = "nick-" + id;
  peer.address = address;
  peer.port = port;
  peer.last_seen = std::chrono::steady_clock::now();
  return peer;
}

template<typename Fn>
bool throws_code(MeshErrc code, Fn&& fn) {
  try {
    fn();
  } catch(const MeshError& e) {
    return e.code() == code;
  }
  return false;
}

struct DispatchFixture {
  std::shared_ptr<TransferQueue> queue;
  std::shared_ptr<FakeBackend> backend = std::make_shared<FakeBackend>();
  std::shared_ptr<PeerDirectory> directory = std::make_shared<PeerDirectory>();
  std::shared_ptr<TransferHistory> history = std::make_shared<TransferHistory>();
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("dispatch");
  std::shared_ptr<SyncDispatcher> dispatcher;

  DispatchFixture(TestContext& ctx, std::size_t max_concurrent = 3)
    : queue(std::make_shared<TransferQueue>(max_concurrent)) {
    ctx.logs.attach(logger, "dispatch");
    ManifestProvider provider = [](const std::string& name) -> std::optional<ModpackManifest> {
      if(name != "pack") return std::nullopt;
      return make_manifest("pack", {{"mods/a.jar", 10, "h1"}});
    };
    dispatcher = SyncDispatcher::create(queue, backend, directory, provider, history, logger);
  }

  SyncRequest request(std::vector<std::string> targets = {}, const std::string& name = "pack") {
    SyncRequest r;
    r.modpack_name = name;
    r.target_peers = std::move(targets);
    r.changes.push_back({"mods/a.jar", ChangeType::Modified, std::nullopt, 0});
    return r;
  }
};

// ---- dispatcher -----------------------------------------------------------

bool test_submit_targets_every_known_peer(TestContext& ctx) {
  DispatchFixture f(ctx);
  f.directory->upsert(make_peer("p1"));
  f.directory->upsert(make_peer("p2"));

  auto ids = f.dispatcher->submit(f.request());
  if(ids.size() != 2 || f.backend->broadcasts.size() != 2) return false;
  for(const auto& id : ids) {
    auto t = f.queue->get(id);
    if(!t || t->state != TransferState::Active || !t->session_id) return false;
  }

  for(const auto& session : f.backend->open_sessions()) f.backend->complete(session, true);
  for(const auto& id : ids) {
    if(f.queue->get(id)->state != TransferState::Completed) return false;
  }
  auto entries = f.history->entries();
  return entries.size() == 2 &&
         entries[0].result == TransferResult::Success &&
         entries[0].direction == TransferDirection::Upload &&
         entries[0].files_count == 3 && entries[0].total_bytes == 300 &&
         f.history->stats().total_bytes_sent == 600;
}

bool test_submit_without_peers_fails(TestContext& ctx) {
  DispatchFixture f(ctx);
  return throws_code(MeshErrc::PeerNotFound, [&]{ f.dispatcher->submit(f.request()); }) &&
         f.queue->size() == 0;
}

bool test_concurrency_limit_drains_in_order(TestContext& ctx) {
  DispatchFixture f(ctx, 1);
  for(auto id : {"p1", "p2", "p3"}) f.directory->upsert(make_peer(id));
  auto ids = f.dispatcher->submit(f.request({"p1", "p2", "p3"}));
  if(f.backend->broadcasts.size() != 1 || f.backend->broadcasts[0].peer_id != "p1") return false;

  auto first = f.backend->broadcasts[0].session_id;
  f.backend->complete(first, true);
  if(f.backend->broadcasts.size() != 2 || f.backend->broadcasts[1].peer_id != "p2") return false;
  auto second = f.backend->broadcasts[1].session_id;
  f.backend->complete(second, false, std::string("disk full"));
  if(f.backend->broadcasts.size() != 3) return false;

  auto failed = f.queue->get(ids[1]);
  return failed && failed->state == TransferState::Failed &&
         failed->error == std::optional<std::string>("disk full") &&
         f.queue->active_count() == 1;
}

bool test_unknown_peer_and_modpack_fail(TestContext& ctx) {
  DispatchFixture f(ctx);
  f.directory->upsert(make_peer("p1"));
  auto missing_peer = f.dispatcher->submit(f.request({"ghost"}));
  auto missing_pack = f.dispatcher->submit(f.request({"p1"}, "other"));

  auto a = f.queue->get(missing_peer[0]);
  auto b = f.queue->get(missing_pack[0]);
  auto stats = f.history->stats();
  return a && a->state == TransferState::Failed && a->error == std::optional<std::string>("Peer not found") &&
         b && b->state == TransferState::Failed && b->error &&
         b->error->find("Unknown modpack") != std::string::npos &&
         f.backend->broadcasts.empty() && stats.failed == 2 && f.queue->active_count() == 0;
}

bool test_backend_refusal_fails_transfer(TestContext& ctx) {
  DispatchFixture f(ctx);
  f.directory->upsert(make_peer("p1"));
  f.backend->refuse_with = "Peer has no transfer endpoint";
  auto ids = f.dispatcher->submit(f.request());
  auto t = f.queue->get(ids[0]);
  return t && t->state == TransferState::Failed &&
         t->error == std::optional<std::string>("Peer has no transfer endpoint");
}

bool test_outcome_before_registration(TestContext& ctx) {
  DispatchFixture f(ctx);
  f.directory->upsert(make_peer("p1"));
  f.backend->finish_immediately = true;
  auto ids = f.dispatcher->submit(f.request());
  auto t = f.queue->get(ids[0]);
  return t && t->state == TransferState::Completed && f.history->size() == 1 && f.queue->active_count() == 0;
}

bool test_cancel_active_records_cancelled(TestContext& ctx) {
  DispatchFixture f(ctx, 1);
  f.directory->upsert(make_peer("p1"));
  f.directory->upsert(make_peer("p2"));
  auto ids = f.dispatcher->submit(f.request({"p1", "p2"}));
  f.dispatcher->cancel(ids[0]);

  auto cancelled = f.queue->get(ids[0]);
  auto entries = f.history->entries();
  return cancelled && cancelled->state == TransferState::Cancelled &&
         f.backend->cancelled.size() == 1 &&
         f.backend->broadcasts.size() == 2 && f.backend->broadcasts[1].peer_id == "p2" &&
         entries.size() == 1 && entries[0].result == TransferResult::Cancelled &&
         throws_code(MeshErrc::TransferNotFound, [&]{ f.dispatcher->cancel("nope"); });
}

// Remembers which transfer each peer's send belongs to as it goes active.
std::shared_ptr<std::map<std::string, std::string>> track_active(DispatchFixture& f) {
  auto active = std::make_shared<std::map<std::string, std::string>>();
  f.dispatcher->add_listener([active](const TransferEvent& event){
    if(event.state == TransferState::Active) (*active)[event.transfer.peer_id] = event.transfer.id;
  });
  return active;
}

bool test_cancel_while_session_opens(TestContext& ctx) {
  DispatchFixture f(ctx, 1);
  f.directory->upsert(make_peer("p1"));
  f.directory->upsert(make_peer("p2"));
  auto active = track_active(f);
  f.backend->on_broadcast = [&](const std::string& peer_id){
    if(peer_id == "p1") f.dispatcher->cancel(active->at("p1"));
  };

  auto ids = f.dispatcher->submit(f.request({"p1", "p2"}));
  auto first = f.queue->get(ids[0]);
  auto second = f.queue->get(ids[1]);
  auto entries = f.history->entries();
  return first && first->state == TransferState::Cancelled && !first->session_id &&
         second && second->state == TransferState::Active && second->session_id &&
         f.backend->cancelled == std::vector<std::string>{"session-1"} &&
         f.backend->open_sessions() == std::vector<std::string>{"session-2"} &&
         f.queue->active_count() == 1 &&
         entries.size() == 1 && entries[0].result == TransferResult::Cancelled &&
         entries[0].session_id == "session-1" && entries[0].peer_id == "p1" &&
         ctx.logs.contains("dispatch: Transfer " + ids[0] + " was cancelled before session session-1 started");
}

bool test_cancel_before_refusal_is_not_a_failure(TestContext& ctx) {
  DispatchFixture f(ctx);
  f.directory->upsert(make_peer("p1"));
  f.backend->refuse_with = "Peer has no transfer endpoint";
  auto active = track_active(f);
  f.backend->on_broadcast = [&](const std::string& peer_id){ f.dispatcher->cancel(active->at(peer_id)); };

  auto ids = f.dispatcher->submit(f.request({"p1"}));
  auto t = f.queue->get(ids[0]);
  auto entries = f.history->entries();
  return t && t->state == TransferState::Cancelled && !t->error &&
         entries.size() == 1 && entries[0].result == TransferResult::Cancelled &&
         !ctx.logs.contains("failed: Peer has no transfer endpoint");
}

bool test_retry_after_peer_appears(TestContext& ctx) {
  DispatchFixture f(ctx);
  auto ids = f.dispatcher->submit(f.request({"late"}));
  if(f.queue->get(ids[0])->state != TransferState::Failed) return false;

  f.directory->upsert(make_peer("late"));
  f.dispatcher->retry(ids[0]);
  auto t = f.queue->get(ids[0]);
  return t && t->state == TransferState::Active && t->attempts == 1 && f.backend->broadcasts.size() == 1;
}

bool test_events_follow_lifecycle(TestContext& ctx) {
  DispatchFixture f(ctx);
  f.directory->upsert(make_peer("p1"));
  std::vector<TransferState> states;
  bool saw_progress = false;
  f.dispatcher->add_listener([&](const TransferEvent& e){
    states.push_back(e.state);
    if(e.progress && e.progress->fraction() == 1.0f) saw_progress = true;
  });
  f.dispatcher->submit(f.request());
  auto session = f.backend->broadcasts[0].session_id;
  f.backend->complete(session, true);
  return saw_progress && states.front() == TransferState::Queued &&
         std::find(states.begin(), states.end(), TransferState::Active) != states.end() &&
         states.back() == TransferState::Completed;
}

// ---- history --------------------------------------------------------------

bool test_history_persists_newest_first(TestContext& ctx) {
  auto dir = packmesh::test::scratch_dir("sync_history");
  auto logger = std::make_shared<Logger>("history");
  ctx.logs.attach(logger, "history");
  {
    TransferHistory history(dir / "transfer_history.json", logger);
    auto now = unix_now_secs();
    history.record(make_history_entry("s1", "p1", std::string("Pat"), "pack", TransferDirection::Upload,
                                      TransferResult::Success, 2, 1000, now - 10, std::nullopt));
    history.record(make_history_entry("s2", "p2", std::nullopt, "pack", TransferDirection::Download,
                                      TransferResult::Failed, 0, 0, now, std::string("refused")));
    history.record(make_history_entry("s3", "p1", std::nullopt, "other", TransferDirection::Download,
                                      TransferResult::Success, 1, 500, now, std::nullopt));
  }

  TransferHistory reloaded(dir / "transfer_history.json", logger);
  if(!reloaded.load()) return false;
  auto entries = reloaded.entries();
  if(entries.size() != 3 || entries[0].session_id != "s3" || entries[2].session_id != "s1") return false;
  if(entries[2].duration_seconds < 10 || entries[2].avg_speed_bps > 100) return false;
  if(entries[1].error != std::optional<std::string>("refused")) return false;
  if(entries[2].peer_nickname != std::optional<std::string>("Pat")) return false;

  auto stats = reloaded.stats();
  return reloaded.get_by_peer("p1").size() == 2 &&
         reloaded.get_by_modpack("other").size() == 1 &&
         reloaded.get_recent(1).size() == 1 &&
         stats.total_transfers == 3 && stats.successful == 2 && stats.failed == 1 &&
         stats.total_bytes_sent == 1000 && stats.total_bytes_received == 500 &&
         reloaded.clear() && reloaded.size() == 0;
}

bool test_history_is_capped(TestContext&) {
  TransferHistory history;
  for(std::size_t i = 0; i < kMaxHistoryEntries + 5; ++i) {
    history.record(make_history_entry("s" + std::to_string(i), "p", std::nullopt, "pack",
                                      TransferDirection::Upload, TransferResult::Success, 1, 1,
                                      unix_now_secs(), std::nullopt));
  }
  auto entries = history.get_recent(1);
  return history.size() == kMaxHistoryEntries &&
         entries[0].session_id == "s" + std::to_string(kMaxHistoryEntries + 4) &&
         history.entries().back().session_id == "s5";
}

// ---- TCP backend over loopback ------------------------------------------

class RecordingObserver : public SessionObserver {
public:
  void on_session_finished(const SessionOutcome& outcome) override {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.push_back(outcome);
  }

  std::vector<SessionOutcome> outcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<SessionOutcome> outcomes_;
};

ManifestProvider host_provider() {
  return [](const std::string& name) -> std::optional<ModpackManifest> {
    if(name != "pack") return std::nullopt;
    return make_manifest("pack", {{"mods/a.jar", 10, "h1"}, {"mods/b.jar", 20, "h2"}});
  };
}

TcpSyncBackend::Options short_timeout() {
  TcpSyncBackend::Options options;
  options.bind_address = "127.0.0.1";
  options.session_timeout = 500ms;
  return options;
}

bool test_offer_is_acknowledged(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("tcp");
  ctx.logs.attach(logger, "tcp");
  auto host = TcpSyncBackend::create(io.io(), host_provider(), short_timeout(), logger);
  auto sender = TcpSyncBackend::create(io.io(), nullptr, short_timeout(), logger);
  host->start(0);
  sender->set_local_identity("sender-id", std::string("Sam"));

  std::mutex offers_mutex;
  std::vector<TcpSyncBackend::IncomingOffer> offers;
  host->set_offer_listener([&](const TcpSyncBackend::IncomingOffer& offer){
    std::lock_guard<std::mutex> lock(offers_mutex);
    offers.push_back(offer);
  });
  auto observer = std::make_shared<RecordingObserver>();
  sender->set_session_observer(observer);

  auto offered = make_manifest("pack", {{"mods/a.jar", 10, "h1"}, {"mods/b.jar", 25, "h2-new"}, {"mods/c.jar", 5, "h3"}});
  std::mutex progress_mutex;
  std::vector<SyncProgress> progress;
  auto results = sender->broadcast_sync({make_peer("host", "127.0.0.1", host->listen_port())}, "pack", offered,
    [&](const SyncProgress& p){
      std::lock_guard<std::mutex> lock(progress_mutex);
      progress.push_back(p);
    });
  if(results.size() != 1 || !results[0].ok()) return false;

  bool finished = packmesh::test::wait_for_condition([&]{ return !observer->outcomes().empty(); }, 3s);
  host->stop();
  if(!finished) return false;

  auto outcome = observer->outcomes().front();
  std::lock_guard<std::mutex> lock(offers_mutex);
  std::lock_guard<std::mutex> progress_lock(progress_mutex);
  return outcome.success && outcome.session_id == *results[0].session_id &&
         outcome.files == 2 && outcome.bytes == 30 &&
         offers.size() == 1 && offers[0].peer_id == "sender-id" &&
         offers[0].peer_nickname == std::optional<std::string>("Sam") &&
         offers[0].manifest.version_hash == offered.version_hash &&
         progress.size() == 1 && sender->active_sessions() == 0;
}

bool test_offer_for_unknown_modpack_fails(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("tcp");
  ctx.logs.attach(logger, "tcp");
  auto host = TcpSyncBackend::create(io.io(), host_provider(), short_timeout(), logger);
  auto sender = TcpSyncBackend::create(io.io(), nullptr, short_timeout(), logger);
  host->start(0);
  auto observer = std::make_shared<RecordingObserver>();
  sender->set_session_observer(observer);

  sender->broadcast_sync({make_peer("host", "127.0.0.1", host->listen_port())}, "unknown",
                         make_manifest("unknown", {}), nullptr);
  bool finished = packmesh::test::wait_for_condition([&]{ return !observer->outcomes().empty(); }, 3s);
  host->stop();
  if(!finished) return false;
  auto outcome = observer->outcomes().front();
  return !outcome.success && outcome.error && outcome.error->find("Unknown modpack") != std::string::npos;
}

bool test_unreachable_peers(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("tcp");
  ctx.logs.attach(logger, "tcp");
  auto sender = TcpSyncBackend::create(io.io(), nullptr, short_timeout(), logger);
  auto observer = std::make_shared<RecordingObserver>();
  sender->set_session_observer(observer);

  std::uint16_t closed_port = 0;
  {
    asio::ip::tcp::acceptor placeholder(io.io(), asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    closed_port = placeholder.local_endpoint().port();
  }

  auto results = sender->broadcast_sync({make_peer("no-endpoint", "", 0),
                                         make_peer("closed", "127.0.0.1", closed_port)},
                                        "pack", make_manifest("pack", {}), nullptr);
  if(results.size() != 2 || results[0].ok() ||
     results[0].error != std::optional<std::string>("Peer has no transfer endpoint") || !results[1].ok()) {
    return false;
  }
  bool finished = packmesh::test::wait_for_condition([&]{ return !observer->outcomes().empty(); }, 3s);
  if(!finished) return false;
  auto outcome = observer->outcomes().front();
  return !outcome.success && outcome.peer_id == "closed" && outcome.error &&
         outcome.error->find("Connect failed") != std::string::npos;
}

bool test_silent_host_times_out(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("tcp");
  ctx.logs.attach(logger, "tcp");
  asio::ip::tcp::acceptor silent(io.io(), asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  auto held = std::make_shared<asio::ip::tcp::socket>(io.io());
  silent.async_accept(*held, [](std::error_code){});

  auto sender = TcpSyncBackend::create(io.io(), nullptr, short_timeout(), logger);
  auto observer = std::make_shared<RecordingObserver>();
  sender->set_session_observer(observer);
  sender->broadcast_sync({make_peer("silent", "127.0.0.1", silent.local_endpoint().port())},
                         "pack", make_manifest("pack", {}), nullptr);

  bool finished = packmesh::test::wait_for_condition([&]{ return !observer->outcomes().empty(); }, 3s);
  io.run([&]{
    std::error_code ec;
    silent.close(ec);
    held->close(ec);
  });
  if(!finished) return false;
  auto outcome = observer->outcomes().front();
  return !outcome.success && outcome.error == std::optional<std::string>("Sync session timed out") &&
         observer->outcomes().size() == 1;
}

bool test_cancel_session(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("tcp");
  ctx.logs.attach(logger, "tcp");
  asio::ip::tcp::acceptor silent(io.io(), asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  auto held = std::make_shared<asio::ip::tcp::socket>(io.io());
  silent.async_accept(*held, [](std::error_code){});

  auto options = short_timeout();
  options.session_timeout = 5s;
  auto sender = TcpSyncBackend::create(io.io(), nullptr, options, logger);
  auto observer = std::make_shared<RecordingObserver>();
  sender->set_session_observer(observer);
  auto results = sender->broadcast_sync({make_peer("silent", "127.0.0.1", silent.local_endpoint().port())},
                                        "pack", make_manifest("pack", {}), nullptr);
  bool accepted = sender->cancel_session(*results[0].session_id);
  bool finished = packmesh::test::wait_for_condition([&]{ return !observer->outcomes().empty(); }, 2s);
  io.run([&]{
    std::error_code ec;
    silent.close(ec);
    held->close(ec);
  });
  return accepted && finished && observer->outcomes().front().error == std::optional<std::string>("cancelled") &&
         !sender->cancel_session(*results[0].session_id);
}

bool test_pull_reports_missing_files(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("tcp");
  ctx.logs.attach(logger, "tcp");
  auto host = TcpSyncBackend::create(io.io(), host_provider(), short_timeout(), logger);
  auto joiner = TcpSyncBackend::create(io.io(), nullptr, short_timeout(), logger);
  host->start(0);

  auto local = make_manifest("pack", {{"mods/a.jar", 10, "h1"}, {"mods/stale.jar", 3, "h9"}});
  std::vector<SyncProgress> steps;
  auto result = joiner->pull_sync(make_peer("host", "127.0.0.1", host->listen_port()), "pack", local,
                                  [&](const SyncProgress& p){ steps.push_back(p); });
  auto missing = joiner->pull_sync(make_peer("host", "127.0.0.1", host->listen_port()), "nope", local, nullptr);
  host->stop();

  return result.success && result.files == 1 && result.bytes == 20 &&
         result.remote_version == host_provider()("pack")->version_hash &&
         steps.size() == 1 && steps[0].current_file == "mods/b.jar" && steps[0].fraction() == 1.0f &&
         !missing.success && missing.error && missing.error->find("Unknown modpack") != std::string::npos;
}

bool test_bind_conflict_reports_error(TestContext& ctx) {
  IoThread io;
  auto logger = std::make_shared<Logger>("tcp");
  ctx.logs.attach(logger, "tcp");
  auto first = TcpSyncBackend::create(io.io(), nullptr, short_timeout(), logger);
  auto second = TcpSyncBackend::create(io.io(), nullptr, short_timeout(), logger);
  first->start(0);
  bool conflict = throws_code(MeshErrc::BindFailed, [&]{ second->start(first->listen_port()); });
  first->stop();
  return conflict && !second->is_running();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"submit_targets_every_known_peer", test_submit_targets_every_known_peer},
    {"submit_without_peers_fails", test_submit_without_peers_fails},
    {"concurrency_limit_drains_in_order", test_concurrency_limit_drains_in_order},
    {"unknown_peer_and_modpack_fail", test_unknown_peer_and_modpack_fail},
    {"backend_refusal_fails_transfer", test_backend_refusal_fails_transfer},
    {"outcome_before_registration", test_outcome_before_registration},
    {"cancel_active_records_cancelled", test_cancel_active_records_cancelled},
    {"cancel_while_session_opens", test_cancel_while_session_opens},
    {"cancel_before_refusal_is_not_a_failure", test_cancel_before_refusal_is_not_a_failure},
    {"retry_after_peer_appears", test_retry_after_peer_appears},
    {"events_follow_lifecycle", test_events_follow_lifecycle},
    {"history_persists_newest_first", test_history_persists_newest_first},
    {"history_is_capped", test_history_is_capped},
    {"offer_is_acknowledged", test_offer_is_acknowledged},
    {"offer_for_unknown_modpack_fails", test_offer_for_unknown_modpack_fails},
    {"unreachable_peers", test_unreachable_peers},
    {"silent_host_times_out", test_silent_host_times_out},
    {"cancel_session", test_cancel_session},
    {"pull_reports_missing_files", test_pull_reports_missing_files},
    {"bind_conflict_reports_error", test_bind_conflict_reports_error}
  };
  return packmesh::test::run_test_cases("sync", tests, argc, argv);
}
