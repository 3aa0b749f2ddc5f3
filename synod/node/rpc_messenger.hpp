#pragma once

#include <synod/net/messenger.hpp>

#include <timber/logger.hpp>

#include <whirl/node/cluster/peer.hpp>

namespace synod::node {

// Fire-and-forget delivery via Synod.Deliver RPC
// Lost calls are message omissions, protocol retries recover from them

class RpcMessenger : public IMessenger {
 public:
  RpcMessenger();

  void Send(proto::Envelope envelope) override;

 private:
  whirl::node::cluster::Peer peer_;
  timber::Logger logger_;
};

}  // namespace synod::node
