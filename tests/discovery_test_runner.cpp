#include "discovery_service.hpp"
#include "io_thread.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>

#include <cctype>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using packmesh::test::IoThread;
using packmesh::test::free_udp_port;
using packmesh::test::TestCase;
using packmesh::test::TestContext;
using namespace std::chrono_literals;

namespace {

using udp = asio::ip::udp;

struct Node {
  std::shared_ptr<PeerDirectory> directory = std::make_shared<PeerDirectory>();
  std::shared_ptr<Logger> logger;
  std::shared_ptr<DiscoveryService> service;
  std::uint16_t port = 0;
};

ConnectSettings visible_settings(const std::string& nickname, std::uint16_t port) {
  ConnectSettings settings;
  settings.enabled = true;
  settings.nickname = nickname;
  settings.visibility = Visibility::Everyone;
  settings.discovery_port = port;
  return settings;
}

DiscoveryService::Options fast_options(std::uint16_t target_port) {
  DiscoveryService::Options options;
  options.app_version = "test-1.0";
  options.bind_address = "127.0.0.1";
  options.broadcast_targets = {udp::endpoint(asio::ip::make_address("127.0.0.1"), target_port)};
  options.broadcast_interval = 100ms;
  options.sweep_interval = 100ms;
  options.peer_timeout = 400ms;
  options.connect_timeout = 500ms;
  return options;
}

Node make_node(TestContext& ctx,
               asio::io_context& io,
               const std::string& name,
               ConnectSettings settings,
               std::uint16_t target_port,
               std::uint16_t tcp_port) {
  Node node;
  node.port = settings.discovery_port;
  node.logger = std::make_shared<Logger>(name);
  ctx.logs.attach(node.logger, name);
  node.service = DiscoveryService::create(io, node.directory, std::move(settings),
                                          fast_options(target_port), node.logger);
  node.service->set_tcp_port(tcp_port);
  return node;
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

bool test_symmetric_discovery(TestContext& ctx) {
  IoThread io;
  auto port_a = free_udp_port();
  auto port_b = free_udp_port(port_a);
  auto a = make_node(ctx, io.io(), "A", visible_settings("Alice", port_a), port_b, 5001);
  auto b = make_node(ctx, io.io(), "B", visible_settings("Bob", port_b), port_a, 5002);
  a.service->start();
  b.service->start();

  bool found = packmesh::test::wait_for_condition([&]{
    return a.directory->contains(b.service->local_peer_id()) &&
           b.directory->contains(a.service->local_peer_id());
  }, 3s);

  auto seen_b = a.directory->get(b.service->local_peer_id());
  auto seen_a = b.directory->get(a.service->local_peer_id());
  a.service->stop();
  b.service->stop();

  return found && seen_b && seen_a &&
         seen_b->address == "127.0.0.1" && seen_b->port == 5002 &&
         seen_a->port == 5001 && seen_b->app_version == "test-1.0" &&
         a.service->bound_port() == port_a;
}

bool test_invisible_peer_stays_silent(TestContext& ctx) {
  IoThread io;
  auto port_a = free_udp_port();
  auto port_b = free_udp_port(port_a);
  auto hidden = visible_settings("Hidden", port_b);
  hidden.visibility = Visibility::Invisible;
  auto a = make_node(ctx, io.io(), "A", visible_settings("Alice", port_a), port_b, 5001);
  auto b = make_node(ctx, io.io(), "B", hidden, port_a, 5002);
  a.service->start();
  b.service->start();

  std::this_thread::sleep_for(500ms);
  bool silent = a.directory->size() == 0 && !b.service->is_running();
  a.service->stop();
  return silent;
}

bool test_blocked_peer_ignored(TestContext& ctx) {
  IoThread io;
  auto port_a = free_udp_port();
  auto port_b = free_udp_port(port_a);
  auto b = make_node(ctx, io.io(), "B", visible_settings("Bob", port_b), port_a, 5002);
  auto settings_a = visible_settings("Alice", port_a);
  settings_a.blocked_peers.insert(b.service->local_peer_id());
  auto a = make_node(ctx, io.io(), "A", settings_a, port_b, 5001);
  a.service->start();
  b.service->start();

  bool b_sees_a = packmesh::test::wait_for_condition([&]{
    return b.directory->contains(a.service->local_peer_id());
  }, 3s);
  std::this_thread::sleep_for(300ms);
  bool a_ignores_b = !a.directory->contains(b.service->local_peer_id());
  a.service->stop();
  b.service->stop();
  return b_sees_a && a_ignores_b;
}

bool test_stale_peer_evicted(TestContext& ctx) {
  IoThread io;
  auto port_a = free_udp_port();
  auto port_b = free_udp_port(port_a);
  auto a = make_node(ctx, io.io(), "A", visible_settings("Alice", port_a), port_b, 5001);
  auto b = make_node(ctx, io.io(), "B", visible_settings("Bob", port_b), port_a, 5002);
  a.service->start();
  b.service->start();

  auto id_b = b.service->local_peer_id();
  if(!packmesh::test::wait_for_condition([&]{ return a.directory->contains(id_b); }, 3s)) return false;

  std::vector<std::string> removed;
  std::mutex removed_mutex;
  a.directory->add_listener([&](const PeerEvent& e){
    if(e.kind != PeerEventKind::Removed) return;
    std::lock_guard<std::mutex> lock(removed_mutex);
    removed.push_back(e.peer.id);
  });
  b.service->stop();

  bool evicted = packmesh::test::wait_for_condition([&]{ return !a.directory->contains(id_b); }, 3s);
  a.service->stop();
  std::lock_guard<std::mutex> lock(removed_mutex);
  return evicted && !removed.empty() && removed.front() == id_b &&
         ctx.logs.contains("timed out");
}

bool test_connect_by_code(TestContext& ctx) {
  IoThread io;
  auto port_a = free_udp_port();
  auto port_b = free_udp_port(port_a);
  auto a = make_node(ctx, io.io(), "A", visible_settings("Alice", port_a), port_b, 5001);
  auto b = make_node(ctx, io.io(), "B", visible_settings("Bob", port_b), port_a, 5002);
  a.service->start();
  b.service->start();

  // Lowercase body without prefix is accepted as well.
  auto code = b.service->local_code();
  std::string sloppy = code.substr(4);
  for(auto& ch : sloppy) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

  auto peer = a.service->connect_by_code(sloppy);
  bool requester_listed = packmesh::test::wait_for_condition([&]{
    auto seen = b.directory->get(a.service->local_peer_id());
    return seen && seen->port == 5001 && seen->nickname == std::optional<std::string>("Alice");
  }, 2s);
  a.service->stop();
  b.service->stop();

  return peer.id == b.service->local_peer_id() && peer.address == "127.0.0.1" &&
         peer.port == 5002 && peer.nickname == std::optional<std::string>("Bob") &&
         requester_listed;
}

bool test_connect_by_code_timeout(TestContext& ctx) {
  IoThread io;
  auto port_a = free_udp_port();
  auto port_b = free_udp_port(port_a);
  auto a = make_node(ctx, io.io(), "A", visible_settings("Alice", port_a), port_b, 5001);
  auto b = make_node(ctx, io.io(), "B", visible_settings("Bob", port_b), port_a, 5002);
  a.service->start();
  b.service->start();

  std::string unknown = "PKM-ZZZZ-ZZZZ";
  if(b.service->local_code() == unknown) unknown = "PKM-YYYY-YYYY";
  auto started = std::chrono::steady_clock::now();
  bool timed_out = throws_code(MeshErrc::ConnectTimeout, [&]{ a.service->connect_by_code(unknown); });
  auto elapsed = std::chrono::steady_clock::now() - started;
  a.service->stop();
  b.service->stop();
  return timed_out && elapsed >= 400ms && elapsed < 3s;
}

bool test_connect_by_code_rejects_bad_input(TestContext& ctx) {
  IoThread io;
  auto port_a = free_udp_port();
  auto a = make_node(ctx, io.io(), "A", visible_settings("Alice", port_a), free_udp_port(), 5001);
  if(!throws_code(MeshErrc::NotInitialized, [&]{ a.service->connect_by_code("PKM-ABCD-EFGH"); })) return false;
  a.service->start();
  bool invalid = throws_code(MeshErrc::InvalidCode, [&]{ a.service->connect_by_code("PKM-AB"); });
  a.service->stop();
  return invalid;
}

bool test_busy_port_falls_back(TestContext& ctx) {
  IoThread io;
  auto port = free_udp_port();
  if(port > 65535 - 40) return true;
  udp::socket blocker(io.io(), udp::endpoint(asio::ip::make_address("127.0.0.1"), port));

  auto a = make_node(ctx, io.io(), "A", visible_settings("Alice", port), port, 5001);
  bool started = false;
  try {
    a.service->start();
    started = a.service->is_running();
  } catch(const MeshError& e) {
    // All four candidates busy is legal on a crowded host.
    started = e.code() == MeshErrc::BindFailed;
    return started;
  }
  auto bound = a.service->bound_port();
  a.service->stop();
  return started && bound != port && (bound - port) % 10 == 0 &&
         ctx.logs.contains("alternative port");
}

bool test_status_ping_and_friend_requests(TestContext& ctx) {
  IoThread io;
  auto port_a = free_udp_port();
  auto port_b = free_udp_port(port_a);
  auto a = make_node(ctx, io.io(), "A", visible_settings("Alice", port_a), port_b, 5001);
  auto b = make_node(ctx, io.io(), "B", visible_settings("Bob", port_b), port_a, 5002);

  std::mutex mutex;
  std::optional<nlohmann::json> friend_payload;
  a.service->set_friend_request_handler([&](const nlohmann::json& payload, const udp::endpoint&){
    std::lock_guard<std::mutex> lock(mutex);
    friend_payload = payload;
  });
  a.service->set_local_status(PeerStatus::InGame);
  a.service->start();
  b.service->start();

  bool seen_in_game = packmesh::test::wait_for_condition([&]{
    auto peer = b.directory->get(a.service->local_peer_id());
    return peer && peer->status == PeerStatus::InGame;
  }, 3s);

  asio::io_context sender_io;
  udp::socket sender(sender_io, udp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  udp::endpoint target(asio::ip::make_address("127.0.0.1"), a.service->bound_port());
  sender.send_to(asio::buffer(encode_message(wire::Ping{4242})), target);

  std::vector<std::uint8_t> buffer(kMaxDatagramSize);
  udp::endpoint from;
  std::size_t got = 0;
  if(packmesh::test::wait_for_condition([&]{ return sender.available() > 0; }, 2s)) {
    got = sender.receive_from(asio::buffer(buffer), from);
  }
  auto reply = decode_message(buffer.data(), got);
  const auto* pong = reply ? std::get_if<wire::Pong>(&*reply) : nullptr;
  bool ponged = pong && pong->timestamp == 4242 && pong->peer_id == a.service->local_peer_id();

  sender.send_to(asio::buffer(encode_message(wire::FriendRequest{nlohmann::json{{"from", "sender"}, {"note", "hi"}}})), target);
  bool forwarded = packmesh::test::wait_for_condition([&]{
    std::lock_guard<std::mutex> lock(mutex);
    return friend_payload && friend_payload->value("note", "") == "hi";
  }, 2s);

  a.service->stop();
  b.service->stop();
  return seen_in_game && ponged && forwarded;
}

// Counts Discovery datagrams arriving on a plain loopback socket.
class DiscoveryListener {
public:
  DiscoveryListener()
    : socket_(io_, udp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

  std::uint16_t port() const { return socket_.local_endpoint().port(); }

  std::size_t drain() {
    std::size_t count = 0;
    std::vector<std::uint8_t> buffer(kMaxDatagramSize);
    while(socket_.available() > 0) {
      udp::endpoint from;
      auto got = socket_.receive_from(asio::buffer(buffer), from);
      auto message = decode_message(buffer.data(), got);
      if(message && std::holds_alternative<wire::Discovery>(*message)) ++count;
    }
    return count;
  }

private:
  asio::io_context io_;
  udp::socket socket_;
};

bool test_runtime_invisibility_silences_node(TestContext& ctx) {
  IoThread io;
  DiscoveryListener listener;
  auto port_a = free_udp_port();
  auto port_b = free_udp_port(port_a);
  auto settings_a = visible_settings("Alice", port_a);
  auto a = make_node(ctx, io.io(), "A", settings_a, listener.port(), 5001);
  auto b = make_node(ctx, io.io(), "B", visible_settings("Bob", port_b), port_a, 5002);
  a.service->start();
  b.service->start();

  std::size_t heard = 0;
  bool broadcasting = packmesh::test::wait_for_condition([&]{
    heard += listener.drain();
    return heard > 0;
  }, 2s);

  settings_a.visibility = Visibility::Invisible;
  a.service->update_settings(settings_a);
  std::this_thread::sleep_for(150ms);
  listener.drain();
  std::this_thread::sleep_for(400ms);
  bool silent = listener.drain() == 0;

  auto code = a.service->local_code();
  bool lookup_times_out = throws_code(MeshErrc::ConnectTimeout, [&]{ b.service->connect_by_code(code); });
  a.service->stop();
  b.service->stop();
  return broadcasting && silent && lookup_times_out;
}

bool test_runtime_block_drops_peer(TestContext& ctx) {
  IoThread io;
  auto port_a = free_udp_port();
  auto port_b = free_udp_port(port_a);
  auto settings_a = visible_settings("Alice", port_a);
  auto a = make_node(ctx, io.io(), "A", settings_a, port_b, 5001);
  auto b = make_node(ctx, io.io(), "B", visible_settings("Bob", port_b), port_a, 5002);
  a.service->start();
  b.service->start();

  auto id_b = b.service->local_peer_id();
  if(!packmesh::test::wait_for_condition([&]{ return a.directory->contains(id_b); }, 3s)) return false;

  settings_a.blocked_peers.insert(id_b);
  a.service->update_settings(settings_a);
  bool dropped = !a.directory->contains(id_b);
  std::this_thread::sleep_for(400ms);
  bool stays_out = !a.directory->contains(id_b);

  auto code = a.service->local_code();
  bool rejected = throws_code(MeshErrc::CodeRejected, [&]{ b.service->connect_by_code(code); });
  a.service->stop();
  b.service->stop();
  return dropped && stays_out && rejected && ctx.logs.contains("Removed blocked peer");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"symmetric_discovery", test_symmetric_discovery},
    {"invisible_peer_stays_silent", test_invisible_peer_stays_silent},
    {"blocked_peer_ignored", test_blocked_peer_ignored},
    {"stale_peer_evicted", test_stale_peer_evicted},
    {"connect_by_code", test_connect_by_code},
    {"connect_by_code_timeout", test_connect_by_code_timeout},
    {"connect_by_code_rejects_bad_input", test_connect_by_code_rejects_bad_input},
    {"busy_port_falls_back", test_busy_port_falls_back},
    {"status_ping_and_friend_requests", test_status_ping_and_friend_requests},
    {"runtime_invisibility_silences_node", test_runtime_invisibility_silences_node},
    {"runtime_block_drops_peer", test_runtime_block_drops_peer}
  };
  return packmesh::test::run_test_cases("discovery", tests, argc, argv);
}
