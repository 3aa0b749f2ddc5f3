#include <synod/node/rpc_messenger.hpp>

#include <commute/rpc/call.hpp>

#include <timber/log.hpp>

#include <whirl/node/runtime/shortcuts.hpp>

namespace synod::node {

namespace rt = whirl::node::rt;

RpcMessenger::RpcMessenger()
    : peer_(rt::Config()),
      logger_("Synod.Messenger", rt::LoggerBackend()) {
}

void RpcMessenger::Send(proto::Envelope envelope) {
  auto to = envelope.to;
  auto kind = proto::KindName(envelope.message);

  commute::rpc::Call("Synod.Deliver")
      .Args(std::move(envelope))
      .Via(peer_.Channel(to))
      .AtMostOnce()
      .Start()
      .As<bool>()
      .Subscribe([this, to, kind](wheels::Result<bool>&& result) {
        if (result.HasError()) {
          LOG_DEBUG("{} to {} lost: {}", kind, to,
                    result.GetErrorCode().message());
        }
      });
}

}  // namespace synod::node
