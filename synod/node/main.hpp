#pragma once

namespace synod::node {

// Entry point of a whirl node hosting acceptor, proposer and learner

void NodeMain();

}  // namespace synod::node
