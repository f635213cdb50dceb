#include "discovery_service.hpp"

#include <future>
#include <stdexcept>

#include "utils.hpp"

namespace {

std::string endpoint_string(const asio::ip::udp::endpoint& ep) {
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

std::vector<std::uint16_t> candidate_ports(std::uint16_t base) {
  std::vector<std::uint16_t> ports;
  for(auto offset : kDiscoveryPortOffsets) {
    auto port = static_cast<unsigned>(base) + offset;
    if(port <= 65535) ports.push_back(static_cast<std::uint16_t>(port));
  }
  return ports;
}

} // namespace

struct DiscoveryService::CodeRequest {
  explicit CodeRequest(asio::io_context& io) : socket(io), timer(io) {}

  udp::socket socket;
  asio::steady_timer timer;
  std::string code;
  std::string body;
  ConnectHandler handler;
  std::array<std::uint8_t, kMaxDatagramSize> buffer{};
  udp::endpoint from;
  bool done = false;
};

std::shared_ptr<DiscoveryService> DiscoveryService::create(asio::io_context& io,
                                                           std::shared_ptr<PeerDirectory> directory,
                                                           ConnectSettings settings,
                                                           Options options,
                                                           std::shared_ptr<Logger> logger) {
  return std::shared_ptr<DiscoveryService>(
    new DiscoveryService(io, std::move(directory), std::move(settings), std::move(options), std::move(logger)));
}

DiscoveryService::DiscoveryService(asio::io_context& io,
                                   std::shared_ptr<PeerDirectory> directory,
                                   ConnectSettings settings,
                                   Options options,
                                   std::shared_ptr<Logger> logger)
  : io_(io),
    directory_(directory ? std::move(directory) : std::make_shared<PeerDirectory>()),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("discovery")),
    peer_id_(random_uuid()),
    short_code_(generate_short_code(kPeerCodePrefix)),
    settings_(std::move(settings)),
    broadcast_timer_(std::make_unique<asio::steady_timer>(io)),
    sweep_timer_(std::make_unique<asio::steady_timer>(io)) {
  logger_->info("Local peer {} uses short code {}", peer_id_, short_code_);
}

DiscoveryService::~DiscoveryService() {
  std::error_code ec;
  if(socket_) socket_->close(ec);
}

void DiscoveryService::start() {
  std::uint16_t bound = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(running_) return;
    if(!settings_.visible()) {
      logger_->info("Visibility is invisible, discovery stays silent");
      return;
    }

    asio::ip::address bind_address;
    try {
      bind_address = asio::ip::make_address(options_.bind_address);
    } catch(const std::system_error& e) {
      throw MeshError(MeshErrc::BindFailed,
                      "Invalid bind address '" + options_.bind_address + "': " + e.what());
    }

    auto socket = std::make_unique<udp::socket>(io_);
    auto ports = candidate_ports(settings_.discovery_port);
    std::string tried;
    for(auto port : ports) {
      std::error_code ec;
      socket->open(bind_address.is_v6() ? udp::v6() : udp::v4(), ec);
      if(!ec) socket->bind(udp::endpoint(bind_address, port), ec);
      if(!ec) {
        bound = port;
        break;
      }
      logger_->debug("UDP port {} unavailable: {}", port, ec.message());
      tried += (tried.empty() ? "" : ", ") + std::to_string(port);
      std::error_code close_ec;
      socket->close(close_ec);
    }
    if(bound == 0) {
      throw MeshError(MeshErrc::BindFailed,
                      "Failed to bind UDP socket: all ports busy (" + tried + ")");
    }

    std::error_code ec;
    socket->set_option(asio::socket_base::broadcast(true), ec);
    if(ec) {
      throw MeshError(MeshErrc::BindFailed, "Failed to enable broadcast: " + ec.message());
    }

    socket_ = std::move(socket);
    bound_port_ = bound;
    running_ = true;
    ++generation_;

    schedule_broadcast_locked(std::chrono::milliseconds(0));
    start_receive_locked();
    schedule_sweep_locked();
  }

  if(bound != settings().discovery_port) {
    logger_->warn("UDP port {} was busy, using alternative port {}", settings().discovery_port, bound);
  }
  logger_->info("Discovery started on UDP port {} (TCP {})", bound, tcp_port());
}

void DiscoveryService::stop() {
  std::vector<std::shared_ptr<CodeRequest>> aborted;
  bool was_running = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    was_running = running_;
    running_ = false;
    ++generation_;
    broadcast_timer_->cancel();
    sweep_timer_->cancel();
    std::error_code ec;
    if(socket_) socket_->close(ec);
    for(const auto& request : pending_requests_) {
      request->done = true;
      request->timer.cancel();
      request->socket.close(ec);
      aborted.push_back(request);
    }
    pending_requests_.clear();
  }

  for(const auto& request : aborted) {
    if(request->handler) {
      request->handler(MeshError(MeshErrc::NotInitialized, "Discovery stopped"), std::nullopt);
    }
  }
  directory_->clear();
  if(was_running) logger_->info("Discovery stopped");
}

bool DiscoveryService::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

std::uint16_t DiscoveryService::bound_port() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bound_port_;
}

std::uint16_t DiscoveryService::tcp_port() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tcp_port_locked();
}

std::uint16_t DiscoveryService::tcp_port_locked() const {
  if(tcp_port_ != 0) return tcp_port_;
  auto base = bound_port_ != 0 ? bound_port_ : settings_.discovery_port;
  return static_cast<std::uint16_t>(base + kTcpPortOffset);
}

void DiscoveryService::set_tcp_port(std::uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  tcp_port_ = port;
}

void DiscoveryService::set_local_status(PeerStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  local_status_ = status;
}

void DiscoveryService::update_settings(ConnectSettings settings) {
  std::set<std::string> blocked;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(settings);
    blocked = settings_.blocked_peers;
  }
  // Blocked peers are never listed, including ones already known.
  for(const auto& id : blocked) {
    if(directory_->remove(id)) {
      logger_->info("Removed blocked peer {}", id);
    }
  }
}

ConnectSettings DiscoveryService::settings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return settings_;
}

void DiscoveryService::set_friend_request_handler(FriendRequestHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  friend_request_handler_ = std::move(handler);
}

bool DiscoveryService::is_current(std::uint64_t generation) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_ && generation == generation_;
}

std::vector<DiscoveryService::udp::endpoint> DiscoveryService::broadcast_endpoints_locked() const {
  if(!options_.broadcast_targets.empty()) return options_.broadcast_targets;
  std::vector<udp::endpoint> out;
  for(auto port : candidate_ports(settings_.discovery_port)) {
    out.emplace_back(asio::ip::address_v4::broadcast(), port);
  }
  return out;
}

// ---- loops ----------------------------------------------------------------

void DiscoveryService::schedule_broadcast_locked(std::chrono::milliseconds delay) {
  auto self = shared_from_this();
  auto generation = generation_;
  broadcast_timer_->expires_after(delay);
  broadcast_timer_->async_wait([this, self, generation](const std::error_code& ec){
    if(ec || !is_current(generation)) return;
    send_broadcast();
    std::lock_guard<std::mutex> lock(mutex_);
    if(!running_ || generation != generation_) return;
    schedule_broadcast_locked(options_.broadcast_interval);
  });
}

void DiscoveryService::send_broadcast() {
  wire::Discovery message;
  std::vector<udp::endpoint> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!settings_.visible()) return;
    message.sender_id = peer_id_;
    message.protocol_version = kProtocolVersion;
    message.app_version = options_.app_version;
    message.listen_port = tcp_port_locked();
    targets = broadcast_endpoints_locked();
  }
  for(const auto& target : targets) send_to(message, target);
}

void DiscoveryService::start_receive_locked() {
  auto self = shared_from_this();
  auto generation = generation_;
  socket_->async_receive_from(asio::buffer(recv_buffer_), recv_from_,
    [this, self, generation](std::error_code ec, std::size_t bytes){
      if(ec == asio::error::operation_aborted || !is_current(generation)) return;
      if(ec) {
        logger_->warn("UDP receive error: {}", ec.message());
      } else {
        handle_datagram(recv_buffer_.data(), bytes, recv_from_);
      }
      std::lock_guard<std::mutex> lock(mutex_);
      if(!running_ || generation != generation_) return;
      start_receive_locked();
    });
}

void DiscoveryService::schedule_sweep_locked() {
  auto self = shared_from_this();
  auto generation = generation_;
  sweep_timer_->expires_after(options_.sweep_interval);
  sweep_timer_->async_wait([this, self, generation](const std::error_code& ec){
    if(ec || !is_current(generation)) return;
    for(const auto& id : directory_->sweep(Clock::now(), options_.peer_timeout)) {
      logger_->info("Peer {} timed out", id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if(!running_ || generation != generation_) return;
    schedule_sweep_locked();
  });
}

void DiscoveryService::send_to(const wire::Message& message, const udp::endpoint& target) {
  std::shared_ptr<std::vector<std::uint8_t>> bytes;
  try {
    bytes = std::make_shared<std::vector<std::uint8_t>>(encode_message(message));
  } catch(const std::length_error& e) {
    logger_->warn("Dropping {} for {}: {}", message_name(message), endpoint_string(target), e.what());
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if(!running_ || !socket_) return;
  auto self = shared_from_this();
  const char* name = message_name(message);
  socket_->async_send_to(asio::buffer(*bytes), target,
    [this, self, bytes, target, name](std::error_code ec, std::size_t){
      if(ec && ec != asio::error::operation_aborted) {
        logger_->warn("Failed to send {} to {}: {}", name, endpoint_string(target), ec.message());
      }
    });
}

// ---- dispatch -------------------------------------------------------------

void DiscoveryService::handle_datagram(const std::uint8_t* data,
                                       std::size_t size,
                                       const udp::endpoint& from) {
  auto message = decode_message(data, size);
  if(!message) {
    logger_->debug("Dropped malformed datagram ({} bytes) from {}", size, endpoint_string(from));
    return;
  }
  try {
    std::visit([&](const auto& m){ on_message(m, from); }, *message);
  } catch(const std::exception& e) {
    logger_->warn("Failed to handle {} from {}: {}", message_name(*message), endpoint_string(from), e.what());
  }
}

void DiscoveryService::on_message(const wire::Discovery& message, const udp::endpoint& from) {
  if(message.sender_id == peer_id_) return;
  if(message.protocol_version != kProtocolVersion) {
    logger_->debug("Ignoring discovery from {} with protocol {}", message.sender_id, message.protocol_version);
    return;
  }

  ConnectSettings settings;
  wire::DiscoveryResponse response;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    settings = settings_;
    response.peer_id = peer_id_;
    response.nickname = settings_.public_nickname();
    response.app_version = options_.app_version;
    response.status = local_status_;
    response.listen_port = tcp_port_locked();
  }
  if(settings.is_blocked(message.sender_id)) {
    logger_->debug("Ignoring discovery from blocked peer {}", message.sender_id);
    return;
  }

  logger_->debug("Discovery from {} at {}", message.sender_id, endpoint_string(from));
  if(settings.visible()) send_to(response, from);

  auto kind = directory_->sighted(message.sender_id, from.address().to_string(),
                                  message.listen_port, message.app_version, Clock::now());
  if(kind == PeerEventKind::Added) {
    logger_->info("Found peer {} at {}", message.sender_id, from.address().to_string());
  }
}

void DiscoveryService::on_message(const wire::DiscoveryResponse& message, const udp::endpoint& from) {
  if(message.peer_id == peer_id_) return;
  if(settings().is_blocked(message.peer_id)) {
    logger_->debug("Ignoring blocked peer {}", message.peer_id);
    return;
  }

  PeerInfo peer;
  peer.id = message.peer_id;
  peer.nickname = message.nickname;
  peer.address = from.address().to_string();
  peer.port = message.listen_port;
  peer.app_version = message.app_version;
  peer.status = message.status;
  peer.last_seen = Clock::now();
  if(directory_->upsert(std::move(peer)) == PeerEventKind::Added) {
    logger_->info("Found peer {} at {}", message.nickname.value_or(message.peer_id), from.address().to_string());
  }
}

void DiscoveryService::on_message(const wire::Ping& message, const udp::endpoint& from) {
  if(!settings().visible()) return;
  send_to(wire::Pong{message.timestamp, peer_id_}, from);
}

void DiscoveryService::on_message(const wire::Pong& message, const udp::endpoint& from) {
  auto now = unix_now_millis();
  logger_->debug("Pong from {} ({}), rtt {} ms", message.peer_id, endpoint_string(from),
                 now >= message.timestamp ? now - message.timestamp : 0);
}

void DiscoveryService::on_message(const wire::ConnectByCode& message, const udp::endpoint& from) {
  if(message.requester_id == peer_id_) return;
  if(!settings().visible()) return;

  // Silence on mismatch keeps our presence hidden from code guessing.
  auto requested = code_body(message.code, kPeerCodePrefix);
  if(!requested || requested != code_body(short_code_, kPeerCodePrefix)) return;

  wire::ConnectByCodeResponse response;
  response.code = short_code_;
  if(settings().is_blocked(message.requester_id)) {
    logger_->info("Rejected code lookup from blocked peer {}", message.requester_id);
    response.success = false;
    response.error = "Connection blocked";
    send_to(response, from);
    return;
  }

  logger_->info("Short code match, answering {}", message.requester_id);
  PeerInfo requester;
  requester.id = message.requester_id;
  requester.nickname = message.requester_nickname;
  requester.address = from.address().to_string();
  requester.port = message.listen_port != 0 ? message.listen_port : from.port();
  requester.last_seen = Clock::now();
  directory_->upsert(std::move(requester));

  response.success = true;
  response.peer = local_peer_info();
  send_to(response, from);
}

void DiscoveryService::on_message(const wire::ConnectByCodeResponse& message, const udp::endpoint& from) {
  auto body = code_body(message.code, kPeerCodePrefix);
  std::shared_ptr<CodeRequest> match;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& request : pending_requests_) {
      if(body && request->body == *body) {
        match = request;
        break;
      }
    }
  }
  if(!match) {
    logger_->debug("Unsolicited code response from {}", endpoint_string(from));
    return;
  }
  if(!message.success || !message.peer) {
    finish_request(match, MeshError(MeshErrc::CodeRejected, message.error.value_or("Code rejected by peer")), std::nullopt);
    return;
  }
  PeerInfo peer = *message.peer;
  peer.address = from.address().to_string();
  peer.last_seen = Clock::now();
  finish_request(match, std::nullopt, std::move(peer));
}

void DiscoveryService::on_message(const wire::FriendRequest& message, const udp::endpoint& from) {
  FriendRequestHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = friend_request_handler_;
  }
  if(handler) {
    handler(message.raw, from);
  } else {
    logger_->debug("Friend request from {} ignored: no handler", endpoint_string(from));
  }
}

PeerInfo DiscoveryService::local_peer_info() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PeerInfo self;
  self.id = peer_id_;
  self.nickname = settings_.public_nickname();
  self.port = tcp_port_locked();
  self.app_version = options_.app_version;
  self.status = local_status_;
  return self;
}

// ---- connect by code ------------------------------------------------------

void DiscoveryService::async_connect_by_code(const std::string& code, ConnectHandler handler) {
  auto post_error = [this](ConnectHandler h, MeshError error) {
    asio::post(io_, [h = std::move(h), error]() { h(error, std::nullopt); });
  };

  auto canonical = canonical_code(code, kPeerCodePrefix);
  if(!canonical) {
    post_error(std::move(handler), MeshError(MeshErrc::InvalidCode, "Invalid short code '" + code + "'"));
    return;
  }

  auto request = std::make_shared<CodeRequest>(io_);
  request->code = *canonical;
  request->body = *code_body(*canonical, kPeerCodePrefix);
  request->handler = std::move(handler);

  wire::ConnectByCode message;
  message.code = request->code;
  message.requester_id = peer_id_;

  std::shared_ptr<std::vector<std::uint8_t>> bytes;
  std::vector<udp::endpoint> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!running_) {
      post_error(std::move(request->handler), MeshError(MeshErrc::NotInitialized, "Discovery not running"));
      return;
    }
    message.requester_nickname = settings_.public_nickname();
    message.listen_port = tcp_port_locked();
    bytes = std::make_shared<std::vector<std::uint8_t>>(encode_message(message));

    std::error_code ec;
    request->socket.open(udp::v4(), ec);
    if(!ec) request->socket.set_option(asio::socket_base::broadcast(true), ec);
    if(!ec) request->socket.bind(udp::endpoint(udp::v4(), 0), ec);
    if(ec) {
      post_error(std::move(request->handler),
                 MeshError(MeshErrc::BindFailed, "Failed to open lookup socket: " + ec.message()));
      return;
    }
    pending_requests_.insert(request);
    targets = broadcast_endpoints_locked();

    auto self = shared_from_this();
    request->timer.expires_after(options_.connect_timeout);
    request->timer.async_wait([this, self, request](const std::error_code& timer_ec){
      if(timer_ec == asio::error::operation_aborted) return;
      finish_request(request,
                     MeshError(MeshErrc::ConnectTimeout, "Connection timeout - no peer with this code found"),
                     std::nullopt);
    });

    receive_code_response(request);
    for(const auto& target : targets) {
      request->socket.async_send_to(asio::buffer(*bytes), target,
        [this, self, bytes, target](std::error_code send_ec, std::size_t){
          if(send_ec && send_ec != asio::error::operation_aborted) {
            logger_->warn("Failed to send code lookup to {}: {}", endpoint_string(target), send_ec.message());
          }
        });
    }
  }
  logger_->info("Looking up peer with code {}", request->code);
}

// Called with mutex_ held.
void DiscoveryService::receive_code_response(const std::shared_ptr<CodeRequest>& request) {
  auto self = shared_from_this();
  request->socket.async_receive_from(asio::buffer(request->buffer), request->from,
    [this, self, request](std::error_code ec, std::size_t bytes){
      if(ec == asio::error::operation_aborted) return;
      if(ec) {
        logger_->warn("Code lookup receive error: {}", ec.message());
      } else if(auto message = decode_message(request->buffer.data(), bytes)) {
        const auto* response = std::get_if<wire::ConnectByCodeResponse>(&*message);
        if(response && code_body(response->code, kPeerCodePrefix) == request->body) {
          if(!response->success || !response->peer) {
            finish_request(request,
                           MeshError(MeshErrc::CodeRejected, response->error.value_or("Code rejected by peer")),
                           std::nullopt);
            return;
          }
          PeerInfo peer = *response->peer;
          peer.address = request->from.address().to_string();
          peer.last_seen = Clock::now();
          if(settings().is_blocked(peer.id)) {
            finish_request(request, MeshError(MeshErrc::PeerBlocked, "Peer " + peer.id + " is blocked"), std::nullopt);
            return;
          }
          finish_request(request, std::nullopt, std::move(peer));
          return;
        }
      }
      std::lock_guard<std::mutex> lock(mutex_);
      if(request->done) return;
      receive_code_response(request);
    });
}

void DiscoveryService::finish_request(const std::shared_ptr<CodeRequest>& request,
                                      std::optional<MeshError> error,
                                      std::optional<PeerInfo> peer) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(request->done) return;
    request->done = true;
    pending_requests_.erase(request);
    request->timer.cancel();
    std::error_code ec;
    request->socket.close(ec);
  }

  if(error) {
    logger_->info("Code lookup {} failed: {}", request->code, error->what());
  } else if(peer) {
    logger_->info("Connected to {} by code {}", peer->display_name(), request->code);
    directory_->upsert(*peer);
  }
  if(request->handler) request->handler(std::move(error), std::move(peer));
}

PeerInfo DiscoveryService::connect_by_code(const std::string& code) {
  auto promise = std::make_shared<std::promise<PeerInfo>>();
  auto future = promise->get_future();
  async_connect_by_code(code, [promise](std::optional<MeshError> error, std::optional<PeerInfo> peer){
    if(error) {
      promise->set_exception(std::make_exception_ptr(*error));
    } else {
      promise->set_value(std::move(*peer));
    }
  });

  // Grace period covers an io_context that is not being run at all.
  if(future.wait_for(options_.connect_timeout + std::chrono::seconds(2)) != std::future_status::ready) {
    throw MeshError(MeshErrc::ConnectTimeout, "Connection timeout - no peer with this code found");
  }
  return future.get();
}
