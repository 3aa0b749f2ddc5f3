#include <synod/node/service.hpp>

#include <synod/core/errors.hpp>
#include <synod/core/quorum.hpp>

#include <await/fibers/sync/future.hpp>
#include <await/futures/core/future.hpp>

#include <timber/log.hpp>

#include <whirl/node/cluster/peer.hpp>
#include <whirl/node/runtime/shortcuts.hpp>

namespace synod::node {

namespace rt = whirl::node::rt;

static const InstanceId kSingleDecree = 1;

ProposerConfig ProposerConfigFromNodeConfig() {
  auto config = rt::Config();

  ProposerConfig proposer;
  proposer.round_deadline =
      config->GetInt<uint64_t>("synod.round_deadline");
  proposer.max_retries = config->GetInt<size_t>("synod.max_retries");
  proposer.backoff.init = config->GetInt<uint64_t>("synod.backoff.init");
  proposer.backoff.max = config->GetInt<uint64_t>("synod.backoff.max");
  proposer.backoff.factor = config->GetInt<uint64_t>("synod.backoff.factor");
  proposer.Validate();
  return proposer;
}

Synod::Synod()
    : runtime_(mutex_),
      events_(rt::LoggerBackend()),
      logger_("Synod.Node", rt::LoggerBackend()) {
  auto membership = MakeMembership();

  acceptor_ = std::make_unique<AcceptorActor>(MakeContext(), store_,
                                              membership.learners);
  learner_ = std::make_unique<LearnerActor>(
      MakeContext(), Majority(membership.acceptors.size()));
  proposer_ = std::make_unique<ProposerActor>(
      MakeContext(), membership, ProposerConfigFromNodeConfig());
  coordinator_ = std::make_unique<Coordinator>(
      *proposer_, CoordinatorConfig{}, rt::LoggerBackend());

  learner_->OnDecision([this](InstanceId instance, const Value& value) {
    coordinator_->ObserveDecision(instance, value);
  });
}

// Every node is acceptor and learner
Membership Synod::MakeMembership() const {
  whirl::node::cluster::Peer peer(rt::Config());

  Membership membership;
  for (const auto& name : peer.ListPeers().WithMe()) {
    membership.acceptors.push_back(name);
    membership.learners.push_back(name);
  }
  return membership;
}

Context Synod::MakeContext() {
  return Context{rt::HostName(), &runtime_, &messenger_, &events_};
}

bool Synod::Deliver(proto::Envelope envelope) {
  auto guard = mutex_.Guard();
  Route(envelope);
  return true;
}

// Actors ignore message kinds they do not handle
void Synod::Route(const proto::Envelope& envelope) {
  acceptor_->Handle(envelope);
  proposer_->Handle(envelope);
  learner_->Handle(envelope);
}

Value Synod::Propose(Value value) {
  auto [f, p] = await::futures::MakeContract<Value>();
  auto promise =
      std::make_shared<await::futures::Promise<Value>>(std::move(p));

  {
    auto guard = mutex_.Guard();

    if (auto decided = learner_->Decision(kSingleDecree)) {
      return *decided;
    }

    auto status = proposer_->Propose(
        kSingleDecree, std::move(value), [promise](const Outcome& outcome) {
          if (outcome.Decided()) {
            std::move(*promise).SetValue(*outcome.value);
          } else {
            std::move(*promise).SetError(outcome.error);
          }
        });
    status.ThrowIfError();
  }

  return await::fibers::Await(std::move(f)).ValueOrThrow();
}

InstanceId Synod::Append(Value value) {
  auto [f, p] = await::futures::MakeContract<InstanceId>();
  auto promise =
      std::make_shared<await::futures::Promise<InstanceId>>(std::move(p));

  {
    auto guard = mutex_.Guard();
    coordinator_->Submit(std::move(value),
                         [promise](InstanceId slot, const Outcome& outcome) {
                           if (outcome.Decided()) {
                             std::move(*promise).SetValue(slot);
                           } else {
                             std::move(*promise).SetError(outcome.error);
                           }
                         });
  }

  return await::fibers::Await(std::move(f)).ValueOrThrow();
}

void Synod::RegisterMethods() {
  COMMUTE_RPC_REGISTER_METHOD(Deliver);
  COMMUTE_RPC_REGISTER_METHOD(Propose);
  COMMUTE_RPC_REGISTER_METHOD(Append);
}

}  // namespace synod::node
