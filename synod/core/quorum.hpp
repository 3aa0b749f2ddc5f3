#pragma once

#include <synod/core/proposal.hpp>

#include <cstddef>
#include <map>
#include <utility>

namespace synod {

inline size_t Majority(size_t members) {
  return members / 2 + 1;
}

// Collects votes of distinct members until threshold is reached
// Repeated votes of the same member (duplicated messages) are not counted

template <typename Vote>
class QuorumCollector {
 public:
  explicit QuorumCollector(size_t threshold) : threshold_(threshold) {
  }

  // Returns false for a repeated vote
  bool Add(const NodeId& voter, Vote vote) {
    return votes_.try_emplace(voter, std::move(vote)).second;
  }

  bool Reached() const {
    return votes_.size() >= threshold_;
  }

  size_t Count() const {
    return votes_.size();
  }

  size_t Threshold() const {
    return threshold_;
  }

  const std::map<NodeId, Vote>& Votes() const {
    return votes_;
  }

  void Reset() {
    votes_.clear();
  }

 private:
  const size_t threshold_;
  std::map<NodeId, Vote> votes_;
};

}  // namespace synod
