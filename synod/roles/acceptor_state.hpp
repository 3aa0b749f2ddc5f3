#pragma once

#include <synod/core/proposal.hpp>

#include <muesli/serializable.hpp>

#include <cereal/types/optional.hpp>

#include <optional>

namespace synod {

struct AcceptorState {
  // Highest id ever promised, never decreases
  std::optional<ProposalId> promised{std::nullopt};
  // Highest proposal ever accepted, accepted->id <= promised
  std::optional<Proposal> accepted{std::nullopt};

  static AcceptorState Empty() {
    return {};
  }

  MUESLI_SERIALIZABLE(promised, accepted)
};

}  // namespace synod
