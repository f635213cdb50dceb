#include "invite_client.hpp"

#include <stdexcept>

#include "mesh_error.hpp"
#include "protocol.hpp"

PeerInviteAuthority::PeerInviteAuthority(std::shared_ptr<InviteManager> local,
                                         std::shared_ptr<PeerDirectory> directory,
                                         std::shared_ptr<TcpSyncBackend> backend,
                                         std::shared_ptr<Logger> logger)
  : local_(std::move(local)),
    directory_(std::move(directory)),
    backend_(std::move(backend)),
    logger_(std::move(logger)) {}

ServerInvite PeerInviteAuthority::validate_invite(const std::string& code) const {
  if(!canonical_code(code, kInvitePrefix)) {
    throw MeshError(MeshErrc::InviteNotFound, "Invite not found");
  }
  if(local_ && local_->get_invite(code)) {
    return local_->validate_invite(code);
  }

  for(const auto& peer : directory_->snapshot()) {
    auto answer = backend_->query_invite(peer, code, false);
    if(answer.invite) {
      log_debug(logger_.get(), "Invite {} issued by {}", code, peer.display_name());
      return *answer.invite;
    }
    if(!answer.reached) {
      log_debug(logger_.get(), "No invite answer from {}: {}", peer.display_name(), answer.error);
      continue;
    }
    if(answer.rejection && *answer.rejection != MeshErrc::InviteNotFound) {
      throw MeshError(*answer.rejection, answer.error);
    }
  }
  throw MeshError(MeshErrc::InviteNotFound, "Invite not found");
}

ServerInvite PeerInviteAuthority::use_invite(const std::string& code) {
  if(local_ && local_->get_invite(code)) {
    return local_->use_invite(code);
  }

  auto invite = validate_invite(code);
  auto host = directory_->get(invite.host_peer_id);
  if(!host) {
    throw MeshError(MeshErrc::PeerNotFound, "Host peer " + invite.host_peer_id + " is not reachable");
  }
  auto answer = backend_->query_invite(*host, code, true);
  if(answer.invite) return *answer.invite;
  if(answer.rejection) {
    throw MeshError(*answer.rejection, answer.error);
  }
  throw std::runtime_error("Unable to confirm invite with host: " + answer.error);
}
