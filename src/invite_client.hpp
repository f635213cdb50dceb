#pragma once

#include <memory>
#include <string>

#include "invite_manager.hpp"
#include "log.hpp"
#include "peer_directory.hpp"
#include "sync_link.hpp"

// Resolves invite codes with whoever issued them: the local InviteManager
// first, then every peer in the directory over the sync link. Consuming a
// use always goes to the issuing host, so its quota check stays atomic.
class PeerInviteAuthority : public InviteAuthority {
public:
  PeerInviteAuthority(std::shared_ptr<InviteManager> local,
                      std::shared_ptr<PeerDirectory> directory,
                      std::shared_ptr<TcpSyncBackend> backend,
                      std::shared_ptr<Logger> logger = nullptr);

  ServerInvite validate_invite(const std::string& code) const override;
  ServerInvite use_invite(const std::string& code) override;

private:
  std::shared_ptr<InviteManager> local_;
  std::shared_ptr<PeerDirectory> directory_;
  std::shared_ptr<TcpSyncBackend> backend_;
  std::shared_ptr<Logger> logger_;
};
