#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "invite_manager.hpp"
#include "log.hpp"
#include "manifest.hpp"
#include "mesh_error.hpp"
#include "transfer_backend.hpp"

// One TCP connection speaking newline delimited JSON. Reads run until the
// peer closes; writes are queued and sent in order. All socket work happens
// on the io_context thread.
class SyncLink : public std::enable_shared_from_this<SyncLink> {
public:
  using tcp = asio::ip::tcp;
  using MessageHandler = std::function<void(const std::shared_ptr<SyncLink>& link, const nlohmann::json& message)>;
  using CloseHandler = std::function<void(const std::string& reason)>;
  using ConnectHandler = std::function<void(std::error_code ec, std::shared_ptr<SyncLink> link)>;

  static constexpr std::size_t kMaxLineSize = 8 * 1024 * 1024;

  static std::shared_ptr<SyncLink> create(tcp::socket socket, std::shared_ptr<Logger> logger);
  static void connect(asio::io_context& io,
                      const std::string& host,
                      std::uint16_t port,
                      std::shared_ptr<Logger> logger,
                      ConnectHandler handler);

  ~SyncLink();

  void start(MessageHandler on_message, CloseHandler on_close);
  void send_json(const nlohmann::json& message);
  void close();

  const std::string& remote_address() const { return remote_address_; }

private:
  SyncLink(tcp::socket socket, std::shared_ptr<Logger> logger);

  void do_read();
  void handle_line(const std::string& line);
  void do_write();
  void do_close(const std::string& reason);

  tcp::socket socket_;
  std::shared_ptr<Logger> logger_;
  std::string remote_address_;
  asio::streambuf read_buf_;
  std::deque<std::string> write_queue_;
  MessageHandler on_message_;
  CloseHandler on_close_;
  bool closed_ = false;
};

// Ships manifests to peers over SyncLink. The sender offers its manifest
// (sync_offer) and the receiver answers with what it would need (sync_ack).
// A joining client asks a host for its manifest (sync_request) and gets it
// back in sync_manifest. Invite codes are checked with the host that issued
// them through invite_check / invite_status.
class TcpSyncBackend : public TransferBackend,
                       public std::enable_shared_from_this<TcpSyncBackend> {
public:
  using tcp = asio::ip::tcp;

  struct Options {
    std::string bind_address = "0.0.0.0";
    std::chrono::milliseconds session_timeout{10000};
  };

  struct IncomingOffer {
    std::string peer_id;
    std::optional<std::string> peer_nickname;
    std::string address;
    ModpackManifest manifest;
  };
  using OfferListener = std::function<void(const IncomingOffer& offer)>;

  struct InviteAnswer {
    bool reached = false;                 // the host replied at all
    std::optional<ServerInvite> invite;   // the host accepted the code
    std::optional<MeshErrc> rejection;    // why the host refused it
    std::string error;
  };

  static std::shared_ptr<TcpSyncBackend> create(asio::io_context& io,
                                                ManifestProvider manifests,
                                                Options options,
                                                std::shared_ptr<Logger> logger = nullptr);
  ~TcpSyncBackend() override;

  // Port 0 picks an ephemeral port. Throws MeshError{BindFailed}.
  void start(std::uint16_t port);
  void stop();
  bool is_running() const;
  std::uint16_t listen_port() const;

  void set_local_identity(std::string peer_id, std::optional<std::string> nickname);
  void set_offer_listener(OfferListener listener);
  // Answers invite_check requests from joining peers. Without one every code is unknown.
  void set_invite_authority(std::shared_ptr<InviteAuthority> authority);

  // Blocking like pull_sync. consume=true spends one use on the host.
  InviteAnswer query_invite(const PeerInfo& host, const std::string& code, bool consume);

  std::vector<SyncResult> broadcast_sync(const std::vector<PeerInfo>& peers,
                                         const std::string& modpack_name,
                                         const ModpackManifest& manifest,
                                         SyncProgressCallback progress) override;
  bool cancel_session(const std::string& session_id) override;
  PullResult pull_sync(const PeerInfo& host,
                       const std::string& modpack_name,
                       const ModpackManifest& local,
                       SyncProgressCallback progress) override;
  void set_session_observer(std::weak_ptr<SessionObserver> observer) override;

  std::size_t active_sessions() const;

private:
  struct Session;

  TcpSyncBackend(asio::io_context& io, ManifestProvider manifests, Options options, std::shared_ptr<Logger> logger);

  void do_accept();
  void handle_incoming(const std::shared_ptr<SyncLink>& link, const nlohmann::json& message);
  void arm_session_timer(const std::shared_ptr<Session>& session);
  // Sends request (which carries a session_id) and waits for the reply of
  // reply_type with the same id. nullopt with error set on failure.
  std::optional<nlohmann::json> exchange(const PeerInfo& host,
                                         const nlohmann::json& request,
                                         const std::string& reply_type,
                                         std::string& error);
  void finish_session(const std::string& session_id,
                      bool success,
                      std::optional<std::string> error,
                      std::size_t files,
                      std::uint64_t bytes);

  asio::io_context& io_;
  ManifestProvider manifests_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::uint16_t listen_port_ = 0;
  std::string local_peer_id_;
  std::optional<std::string> local_nickname_;
  OfferListener offer_listener_;
  std::shared_ptr<InviteAuthority> invite_authority_;
  std::weak_ptr<SessionObserver> observer_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
};
