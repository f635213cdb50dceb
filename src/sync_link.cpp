#include "sync_link.hpp"

#include <future>
#include <istream>

#include "mesh_error.hpp"
#include "utils.hpp"

using json = nlohmann::json;

// ---- SyncLink ------------------------------------------------------------

std::shared_ptr<SyncLink> SyncLink::create(tcp::socket socket, std::shared_ptr<Logger> logger) {
  return std::shared_ptr<SyncLink>(new SyncLink(std::move(socket), std::move(logger)));
}

SyncLink::SyncLink(tcp::socket socket, std::shared_ptr<Logger> logger)
  : socket_(std::move(socket)),
    logger_(std::move(logger)),
    read_buf_(kMaxLineSize) {
  std::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  if(!ec) remote_address_ = endpoint.address().to_string();
}

SyncLink::~SyncLink() {
  std::error_code ec;
  socket_.close(ec);
}

void SyncLink::connect(asio::io_context& io,
                       const std::string& host,
                       std::uint16_t port,
                       std::shared_ptr<Logger> logger,
                       ConnectHandler handler) {
  auto resolver = std::make_shared<tcp::resolver>(io);
  resolver->async_resolve(host, std::to_string(port),
    [resolver, &io, logger, handler, host, port](std::error_code ec, tcp::resolver::results_type results){
      if(ec) {
        log_debug(logger.get(), "Resolve failed for {}:{}: {}", host, port, ec.message());
        handler(ec, nullptr);
        return;
      }
      auto socket = std::make_shared<tcp::socket>(io);
      asio::async_connect(*socket, results,
        [socket, logger, handler](std::error_code ec, const tcp::endpoint& endpoint){
          if(ec) {
            log_debug(logger.get(), "Connect failed: {}", ec.message());
            handler(ec, nullptr);
            return;
          }
          log_debug(logger.get(), "Connected to {}:{}", endpoint.address().to_string(), endpoint.port());
          handler(ec, SyncLink::create(std::move(*socket), logger));
        });
    });
}

void SyncLink::start(MessageHandler on_message, CloseHandler on_close) {
  on_message_ = std::move(on_message);
  on_close_ = std::move(on_close);
  do_read();
}

void SyncLink::do_read() {
  auto self = shared_from_this();
  asio::async_read_until(socket_, read_buf_, "\n",
    [this, self](std::error_code ec, std::size_t){
      if(ec) {
        do_close(ec == asio::error::eof ? "closed by peer" : ec.message());
        return;
      }
      std::istream is(&read_buf_);
      std::string line;
      std::getline(is, line);
      if(!line.empty() && line.back() == '\r') line.pop_back();
      if(!line.empty()) handle_line(line);
      if(!closed_) do_read();
    });
}

void SyncLink::handle_line(const std::string& line) {
  json message;
  try {
    message = json::parse(line);
  } catch(const json::exception& ex) {
    log_warn(logger_.get(), "Dropping malformed line from {}: {}", remote_address_, ex.what());
    return;
  }
  if(!message.is_object()) {
    log_warn(logger_.get(), "Dropping non-object message from {}", remote_address_);
    return;
  }
  if(on_message_) on_message_(shared_from_this(), message);
}

void SyncLink::send_json(const json& message) {
  auto self = shared_from_this();
  auto line = message.dump() + "\n";
  asio::post(socket_.get_executor(), [this, self, line = std::move(line)]() mutable {
    if(closed_) return;
    bool start_write = write_queue_.empty();
    write_queue_.push_back(std::move(line));
    if(start_write) do_write();
  });
}

void SyncLink::do_write() {
  if(write_queue_.empty()) return;
  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(write_queue_.front()),
    [this, self](std::error_code ec, std::size_t){
      if(ec) {
        do_close(ec.message());
        return;
      }
      write_queue_.pop_front();
      if(!write_queue_.empty()) do_write();
    });
}

void SyncLink::close() {
  auto self = shared_from_this();
  asio::post(socket_.get_executor(), [this, self](){ do_close("closed locally"); });
}

void SyncLink::do_close(const std::string& reason) {
  if(closed_) return;
  closed_ = true;
  std::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  socket_.close(ec);
  write_queue_.clear();
  auto handler = std::move(on_close_);
  on_close_ = nullptr;
  on_message_ = nullptr;
  if(handler) handler(reason);
}

// ---- TcpSyncBackend ------------------------------------------------------

struct TcpSyncBackend::Session {
  std::string id;
  std::string peer_id;
  SyncProgressCallback progress;
  std::shared_ptr<SyncLink> link;
  std::unique_ptr<asio::steady_timer> timer;
};

std::shared_ptr<TcpSyncBackend> TcpSyncBackend::create(asio::io_context& io,
                                                       ManifestProvider manifests,
                                                       Options options,
                                                       std::shared_ptr<Logger> logger) {
  return std::shared_ptr<TcpSyncBackend>(
    new TcpSyncBackend(io, std::move(manifests), std::move(options), std::move(logger)));
}

TcpSyncBackend::TcpSyncBackend(asio::io_context& io,
                               ManifestProvider manifests,
                               Options options,
                               std::shared_ptr<Logger> logger)
  : io_(io),
    manifests_(std::move(manifests)),
    options_(std::move(options)),
    logger_(std::move(logger)) {}

TcpSyncBackend::~TcpSyncBackend() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
}

void TcpSyncBackend::start(std::uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(acceptor_) return;

  std::error_code ec;
  auto address = asio::ip::make_address(options_.bind_address, ec);
  if(ec) {
    throw MeshError(MeshErrc::BindFailed, "Invalid bind address '" + options_.bind_address + "'");
  }
  tcp::endpoint endpoint(address, port);
  auto acceptor = std::make_unique<tcp::acceptor>(io_);
  acceptor->open(endpoint.protocol(), ec);
  if(!ec) acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor->bind(endpoint, ec);
  if(!ec) acceptor->listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    throw MeshError(MeshErrc::BindFailed,
                    "Failed to bind TCP sync port " + std::to_string(port) + ": " + ec.message());
  }
  listen_port_ = acceptor->local_endpoint().port();
  acceptor_ = std::move(acceptor);
  log_info(logger_.get(), "Sync listener on port {}", listen_port_);
  do_accept();
}

void TcpSyncBackend::stop() {
  std::map<std::string, std::shared_ptr<Session>> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(acceptor_) {
      std::error_code ec;
      acceptor_->close(ec);
    }
    acceptor_.reset();
    listen_port_ = 0;
    sessions.swap(sessions_);
  }
  for(auto& entry : sessions) {
    if(entry.second->timer) entry.second->timer->cancel();
    if(entry.second->link) entry.second->link->close();
  }
}

bool TcpSyncBackend::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return acceptor_ != nullptr;
}

std::uint16_t TcpSyncBackend::listen_port() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listen_port_;
}

void TcpSyncBackend::set_local_identity(std::string peer_id, std::optional<std::string> nickname) {
  std::lock_guard<std::mutex> lock(mutex_);
  local_peer_id_ = std::move(peer_id);
  local_nickname_ = std::move(nickname);
}

void TcpSyncBackend::set_offer_listener(OfferListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  offer_listener_ = std::move(listener);
}

void TcpSyncBackend::set_invite_authority(std::shared_ptr<InviteAuthority> authority) {
  std::lock_guard<std::mutex> lock(mutex_);
  invite_authority_ = std::move(authority);
}

void TcpSyncBackend::set_session_observer(std::weak_ptr<SessionObserver> observer) {
  std::lock_guard<std::mutex> lock(mutex_);
  observer_ = std::move(observer);
}

std::size_t TcpSyncBackend::active_sessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

void TcpSyncBackend::do_accept() {
  if(!acceptor_) return;
  std::weak_ptr<TcpSyncBackend> weak = shared_from_this();
  acceptor_->async_accept([weak](std::error_code ec, tcp::socket socket){
    auto self = weak.lock();
    if(!self) return;
    if(ec) {
      if(ec == asio::error::operation_aborted) return;
      log_error(self->logger_.get(), "Accept error: {}", ec.message());
    } else {
      auto link = SyncLink::create(std::move(socket), self->logger_);
      log_debug(self->logger_.get(), "Accepted sync link from {}", link->remote_address());
      link->start(
        [weak](const std::shared_ptr<SyncLink>& l, const json& message){
          if(auto s = weak.lock()) s->handle_incoming(l, message);
        },
        nullptr);
    }
    std::lock_guard<std::mutex> lock(self->mutex_);
    self->do_accept();
  });
}

void TcpSyncBackend::handle_incoming(const std::shared_ptr<SyncLink>& link, const json& message) {
  auto type = message.value("type", "");
  auto session_id = message.value("session_id", "");
  auto modpack = message.value("modpack", "");

  if(type == "sync_offer") {
    json ack = {{"type", "sync_ack"}, {"session_id", session_id}};
    IncomingOffer offer;
    try {
      offer.peer_id = message.at("peer_id").get<std::string>();
      if(message.contains("nickname") && message["nickname"].is_string()) {
        offer.peer_nickname = message["nickname"].get<std::string>();
      }
      offer.manifest = manifest_from_json(message.at("manifest"));
    } catch(const json::exception& ex) {
      log_warn(logger_.get(), "Malformed sync_offer from {}: {}", link->remote_address(), ex.what());
      ack["accepted"] = false;
      ack["error"] = "Malformed offer";
      link->send_json(ack);
      return;
    }
    offer.address = link->remote_address();

    OfferListener listener;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      listener = offer_listener_;
    }
    if(listener) listener(offer);

    std::optional<ModpackManifest> local;
    if(manifests_) local = manifests_(modpack);
    if(!local) {
      ack["accepted"] = false;
      ack["error"] = "Unknown modpack '" + modpack + "'";
    } else {
      auto diff = compute_diff(*local, offer.manifest);
      ack["accepted"] = true;
      ack["needed_files"] = diff.to_download.size();
      ack["needed_bytes"] = diff.download_bytes;
      log_info(logger_.get(), "Offer for {} from {}: {} files ({} bytes) differ",
               modpack, offer.peer_id, diff.to_download.size(), diff.download_bytes);
    }
    link->send_json(ack);
    return;
  }

  if(type == "sync_request") {
    json reply = {{"type", "sync_manifest"}, {"session_id", session_id}};
    std::optional<ModpackManifest> local;
    if(manifests_) local = manifests_(modpack);
    if(local) {
      reply["found"] = true;
      reply["manifest"] = manifest_to_json(*local);
    } else {
      reply["found"] = false;
      reply["error"] = "Unknown modpack '" + modpack + "'";
    }
    link->send_json(reply);
    return;
  }

  if(type == "invite_check") {
    json reply = {{"type", "invite_status"}, {"session_id", session_id}};
    std::shared_ptr<InviteAuthority> authority;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      authority = invite_authority_;
    }
    auto code = message.value("code", "");
    try {
      if(!authority) {
        throw MeshError(MeshErrc::InviteNotFound, "Invite not found");
      }
      auto invite = message.value("consume", false) ? authority->use_invite(code)
                                                    : authority->validate_invite(code);
      reply["ok"] = true;
      reply["invite"] = invite_to_json(invite);
    } catch(const MeshError& ex) {
      reply["ok"] = false;
      reply["reason"] = to_string(ex.code());
      reply["error"] = ex.what();
    }
    link->send_json(reply);
    return;
  }

  log_warn(logger_.get(), "Ignoring unknown sync message '{}' from {}", type, link->remote_address());
}

std::vector<SyncResult> TcpSyncBackend::broadcast_sync(const std::vector<PeerInfo>& peers,
                                                       const std::string& modpack_name,
                                                       const ModpackManifest& manifest,
                                                       SyncProgressCallback progress) {
  std::vector<SyncResult> results;
  std::string peer_id;
  std::optional<std::string> nickname;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    peer_id = local_peer_id_;
    nickname = local_nickname_;
  }

  json offer = {
    {"type", "sync_offer"},
    {"peer_id", peer_id},
    {"modpack", modpack_name},
    {"manifest", manifest_to_json(manifest)}
  };
  if(nickname) offer["nickname"] = *nickname;

  for(const auto& peer : peers) {
    SyncResult result;
    result.peer_id = peer.id;
    if(peer.address.empty() || peer.port == 0) {
      result.error = "Peer has no transfer endpoint";
      results.push_back(std::move(result));
      continue;
    }

    auto session = std::make_shared<Session>();
    session->id = random_uuid();
    session->peer_id = peer.id;
    session->progress = progress;
    session->timer = std::make_unique<asio::steady_timer>(io_);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      sessions_[session->id] = session;
    }

    auto session_offer = offer;
    session_offer["session_id"] = session->id;
    auto self = shared_from_this();
    asio::post(io_, [self, session, session_offer, address = peer.address, port = peer.port]() mutable {
      self->arm_session_timer(session);
      SyncLink::connect(self->io_, address, port, self->logger_,
        [self, session, session_offer](std::error_code ec, std::shared_ptr<SyncLink> link){
          if(ec) {
            self->finish_session(session->id, false, "Connect failed: " + ec.message(), 0, 0);
            return;
          }
          {
            std::lock_guard<std::mutex> lock(self->mutex_);
            if(!self->sessions_.count(session->id)) {
              link->close();
              return;
            }
            session->link = link;
          }
          auto id = session->id;
          link->start(
            [self, id](const std::shared_ptr<SyncLink>&, const json& message){
              if(message.value("type", "") != "sync_ack" || message.value("session_id", "") != id) return;
              if(message.value("accepted", false)) {
                self->finish_session(id, true, std::nullopt,
                                     message.value("needed_files", std::size_t{0}),
                                     message.value("needed_bytes", std::uint64_t{0}));
              } else {
                self->finish_session(id, false, message.value("error", std::string("Offer rejected")), 0, 0);
              }
            },
            [self, id](const std::string& reason){
              self->finish_session(id, false, "Connection closed: " + reason, 0, 0);
            });
          link->send_json(session_offer);
        });
    });

    result.session_id = session->id;
    results.push_back(std::move(result));
  }
  return results;
}

void TcpSyncBackend::arm_session_timer(const std::shared_ptr<Session>& session) {
  std::weak_ptr<TcpSyncBackend> weak = shared_from_this();
  auto id = session->id;
  session->timer->expires_after(options_.session_timeout);
  session->timer->async_wait([weak, id](const std::error_code& ec){
    if(ec) return;
    if(auto self = weak.lock()) self->finish_session(id, false, "Sync session timed out", 0, 0);
  });
}

bool TcpSyncBackend::cancel_session(const std::string& session_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!sessions_.count(session_id)) return false;
  }
  auto self = shared_from_this();
  asio::post(io_, [self, session_id](){
    self->finish_session(session_id, false, std::string("cancelled"), 0, 0);
  });
  return true;
}

void TcpSyncBackend::finish_session(const std::string& session_id,
                                    bool success,
                                    std::optional<std::string> error,
                                    std::size_t files,
                                    std::uint64_t bytes) {
  std::shared_ptr<Session> session;
  std::shared_ptr<SessionObserver> observer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if(it == sessions_.end()) return;
    session = it->second;
    sessions_.erase(it);
    observer = observer_.lock();
  }
  if(session->timer) session->timer->cancel();
  if(session->link) session->link->close();

  if(success) {
    log_info(logger_.get(), "Sync session {} with {} finished: {} files, {} bytes",
             session_id, session->peer_id, files, bytes);
    if(session->progress) {
      SyncProgress progress;
      progress.session_id = session_id;
      progress.peer_id = session->peer_id;
      progress.files_done = progress.files_total = files;
      progress.bytes_done = progress.bytes_total = bytes;
      session->progress(progress);
    }
  } else {
    log_warn(logger_.get(), "Sync session {} with {} failed: {}",
             session_id, session->peer_id, error.value_or("unknown error"));
  }

  if(observer) {
    SessionOutcome outcome;
    outcome.session_id = session_id;
    outcome.peer_id = session->peer_id;
    outcome.success = success;
    outcome.error = std::move(error);
    outcome.files = files;
    outcome.bytes = bytes;
    observer->on_session_finished(outcome);
  }
}

namespace {

struct ExchangeState {
  std::promise<std::optional<json>> promise;
  std::string error;
  bool done = false;
  std::shared_ptr<SyncLink> link;
  std::unique_ptr<asio::steady_timer> timer;

  void finish(std::optional<json> reply) {
    if(done) return;
    done = true;
    if(timer) timer->cancel();
    if(link) link->close();
    promise.set_value(std::move(reply));
  }

  void fail(std::string reason) {
    if(done) return;
    error = std::move(reason);
    finish(std::nullopt);
  }
};

} // namespace

std::optional<json> TcpSyncBackend::exchange(const PeerInfo& host,
                                             const json& request,
                                             const std::string& reply_type,
                                             std::string& error) {
  auto state = std::make_shared<ExchangeState>();
  auto future = state->promise.get_future();
  auto session_id = request.value("session_id", "");

  auto self = shared_from_this();
  asio::post(io_, [self, state, request, reply_type, session_id, host]() {
    state->timer = std::make_unique<asio::steady_timer>(self->io_);
    state->timer->expires_after(self->options_.session_timeout);
    state->timer->async_wait([state](const std::error_code& ec){
      if(!ec) state->fail("Timed out waiting for host");
    });

    SyncLink::connect(self->io_, host.address, host.port, self->logger_,
      [state, request, reply_type, session_id](std::error_code ec, std::shared_ptr<SyncLink> link){
        if(ec) {
          state->fail("Connect failed: " + ec.message());
          return;
        }
        if(state->done) {
          link->close();
          return;
        }
        state->link = link;
        link->start(
          [state, reply_type, session_id](const std::shared_ptr<SyncLink>&, const json& message){
            if(message.value("type", "") != reply_type || message.value("session_id", "") != session_id) return;
            state->finish(message);
          },
          [state](const std::string& reason){
            state->fail("Connection closed: " + reason);
          });
        link->send_json(request);
      });
  });

  if(future.wait_for(options_.session_timeout + std::chrono::seconds(2)) != std::future_status::ready) {
    error = "Timed out waiting for host";
    return std::nullopt;
  }
  auto reply = future.get();
  if(!reply) error = state->error;
  return reply;
}

PullResult TcpSyncBackend::pull_sync(const PeerInfo& host,
                                     const std::string& modpack_name,
                                     const ModpackManifest& local,
                                     SyncProgressCallback progress) {
  PullResult result;
  if(host.address.empty() || host.port == 0) {
    result.error = "Host has no transfer endpoint";
    return result;
  }

  auto session_id = random_uuid();
  json request = {
    {"type", "sync_request"},
    {"session_id", session_id},
    {"modpack", modpack_name},
    {"manifest", manifest_to_json(local)}
  };
  {
    std::lock_guard<std::mutex> lock(mutex_);
    request["peer_id"] = local_peer_id_;
  }

  std::string error;
  auto reply = exchange(host, request, "sync_manifest", error);
  if(!reply) {
    result.error = error;
    return result;
  }
  if(!reply->value("found", false)) {
    result.error = reply->value("error", std::string("Host does not have this modpack"));
    return result;
  }
  ModpackManifest remote;
  try {
    remote = manifest_from_json(reply->at("manifest"));
  } catch(const json::exception& ex) {
    result.error = std::string("Malformed manifest from host: ") + ex.what();
    return result;
  }

  auto diff = compute_diff(local, remote);
  SyncProgress step;
  step.session_id = session_id;
  step.peer_id = host.id;
  step.files_total = diff.to_download.size();
  step.bytes_total = diff.download_bytes;
  for(const auto& path : diff.to_download) {
    const auto* entry = remote.find(path);
    step.current_file = path;
    step.files_done += 1;
    step.bytes_done += entry ? entry->size : 0;
    if(progress) progress(step);
  }

  result.success = true;
  result.files = diff.to_download.size();
  result.bytes = diff.download_bytes;
  result.remote_version = remote.version_hash;
  log_info(logger_.get(), "Pulled manifest of {} from {}: {} files ({} bytes) to fetch",
           modpack_name, host.id, result.files, result.bytes);
  return result;
}

TcpSyncBackend::InviteAnswer TcpSyncBackend::query_invite(const PeerInfo& host,
                                                          const std::string& code,
                                                          bool consume) {
  InviteAnswer answer;
  if(host.address.empty() || host.port == 0) {
    answer.error = "Host has no transfer endpoint";
    return answer;
  }

  json request = {
    {"type", "invite_check"},
    {"session_id", random_uuid()},
    {"code", code},
    {"consume", consume}
  };
  auto reply = exchange(host, request, "invite_status", answer.error);
  if(!reply) return answer;

  answer.reached = true;
  if(reply->value("ok", false)) {
    try {
      answer.invite = invite_from_json(reply->at("invite"));
    } catch(const json::exception& ex) {
      answer.error = std::string("Malformed invite from host: ") + ex.what();
    }
    return answer;
  }
  answer.rejection = mesh_errc_from_string(reply->value("reason", ""));
  answer.error = reply->value("error", std::string("Invite not found"));
  return answer;
}
