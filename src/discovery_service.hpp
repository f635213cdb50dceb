#pragma once

#include <asio.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "connect_settings.hpp"
#include "log.hpp"
#include "mesh_error.hpp"
#include "peer_directory.hpp"
#include "protocol.hpp"

inline constexpr std::uint16_t kTcpPortOffset = 1;
inline constexpr std::array<std::uint16_t, 4> kDiscoveryPortOffsets = {0, 10, 20, 30};

// LAN presence over UDP. Three loops run on the io_context once started:
// a periodic Discovery broadcast, the datagram receive loop and a stale peer
// sweep. All of them stop when stop() closes the socket and cancels the timers.
class DiscoveryService : public std::enable_shared_from_this<DiscoveryService> {
public:
  using udp = asio::ip::udp;
  using Clock = std::chrono::steady_clock;

  struct Options {
    std::string app_version;
    std::string bind_address = "0.0.0.0";
    // Empty means 255.255.255.255 on every candidate discovery port.
    std::vector<udp::endpoint> broadcast_targets;
    std::chrono::milliseconds broadcast_interval{5000};
    std::chrono::milliseconds sweep_interval{10000};
    std::chrono::milliseconds peer_timeout{30000};
    std::chrono::milliseconds connect_timeout{5000};
  };

  using ConnectHandler = std::function<void(std::optional<MeshError> error, std::optional<PeerInfo> peer)>;
  using FriendRequestHandler = std::function<void(const nlohmann::json& payload, const udp::endpoint& from)>;

  static std::shared_ptr<DiscoveryService> create(asio::io_context& io,
                                                  std::shared_ptr<PeerDirectory> directory,
                                                  ConnectSettings settings,
                                                  Options options,
                                                  std::shared_ptr<Logger> logger = nullptr);
  ~DiscoveryService();

  DiscoveryService(const DiscoveryService&) = delete;
  DiscoveryService& operator=(const DiscoveryService&) = delete;

  // Binds the discovery port or one of its fallbacks and starts the loops.
  // A no-op when visibility is Invisible. Throws MeshError{BindFailed}.
  void start();
  // Cancels all loops, closes the socket, fails pending code lookups and
  // empties the peer directory.
  void stop();

  bool is_running() const;
  std::uint16_t bound_port() const;
  std::uint16_t tcp_port() const;
  const std::string& local_peer_id() const { return peer_id_; }
  const std::string& local_code() const { return short_code_; }

  void set_tcp_port(std::uint16_t port);
  void set_local_status(PeerStatus status);
  void update_settings(ConnectSettings settings);
  ConnectSettings settings() const;
  void set_friend_request_handler(FriendRequestHandler handler);

  // Broadcasts a ConnectByCode lookup from an ephemeral socket and calls
  // handler exactly once: with the matched peer, MeshError{ConnectTimeout}
  // when nobody answers in time, or MeshError{CodeRejected} when the owner
  // refused. Accepts "PKM-ABCD-EFGH", "abcdefgh", "ABCD-EFGH".
  void async_connect_by_code(const std::string& code, ConnectHandler handler);

  // Blocking form of async_connect_by_code. Throws MeshError. Must not be
  // called from the io_context thread.
  PeerInfo connect_by_code(const std::string& code);

private:
  struct CodeRequest;

  DiscoveryService(asio::io_context& io,
                   std::shared_ptr<PeerDirectory> directory,
                   ConnectSettings settings,
                   Options options,
                   std::shared_ptr<Logger> logger);

  std::vector<udp::endpoint> broadcast_endpoints_locked() const;
  std::uint16_t tcp_port_locked() const;
  bool is_current(std::uint64_t generation) const;

  void schedule_broadcast_locked(std::chrono::milliseconds delay);
  void send_broadcast();
  void start_receive_locked();
  void schedule_sweep_locked();
  void send_to(const wire::Message& message, const udp::endpoint& target);

  void handle_datagram(const std::uint8_t* data, std::size_t size, const udp::endpoint& from);
  void on_message(const wire::Discovery& message, const udp::endpoint& from);
  void on_message(const wire::DiscoveryResponse& message, const udp::endpoint& from);
  void on_message(const wire::Ping& message, const udp::endpoint& from);
  void on_message(const wire::Pong& message, const udp::endpoint& from);
  void on_message(const wire::ConnectByCode& message, const udp::endpoint& from);
  void on_message(const wire::ConnectByCodeResponse& message, const udp::endpoint& from);
  void on_message(const wire::FriendRequest& message, const udp::endpoint& from);

  PeerInfo local_peer_info() const;
  void receive_code_response(const std::shared_ptr<CodeRequest>& request);
  void finish_request(const std::shared_ptr<CodeRequest>& request,
                      std::optional<MeshError> error,
                      std::optional<PeerInfo> peer);

  asio::io_context& io_;
  std::shared_ptr<PeerDirectory> directory_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  const std::string peer_id_;
  const std::string short_code_;

  mutable std::mutex mutex_;
  ConnectSettings settings_;
  PeerStatus local_status_ = PeerStatus::Online;
  std::unique_ptr<udp::socket> socket_;
  std::unique_ptr<asio::steady_timer> broadcast_timer_;
  std::unique_ptr<asio::steady_timer> sweep_timer_;
  std::set<std::shared_ptr<CodeRequest>> pending_requests_;
  FriendRequestHandler friend_request_handler_;
  bool running_ = false;
  std::uint64_t generation_ = 0;
  std::uint16_t bound_port_ = 0;
  std::uint16_t tcp_port_ = 0;

  std::array<std::uint8_t, kMaxDatagramSize> recv_buffer_{};
  udp::endpoint recv_from_;
};
