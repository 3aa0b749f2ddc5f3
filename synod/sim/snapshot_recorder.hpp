#pragma once

#include <synod/metrics/snapshot.hpp>
#include <synod/sim/simulator.hpp>

#include <optional>
#include <ostream>
#include <vector>

namespace synod::sim {

struct SnapshotFrame {
  Millis time{0};
  std::vector<NodeSnapshot> nodes;
};

// Samples watched nodes every `interval` ms of virtual time

class SnapshotRecorder {
 public:
  SnapshotRecorder(Simulator& simulator, Millis interval);
  ~SnapshotRecorder();

  void Watch(const ISnapshotSource* source);

  // Takes a frame immediately and then periodically
  void Start();
  void Stop();

  void TakeFrame();

  const std::vector<SnapshotFrame>& Frames() const {
    return frames_;
  }

  // Header: time,node,role,round,state,last_message
  void WriteCsv(std::ostream& out) const;

 private:
  void Tick();

 private:
  Simulator& simulator_;
  const Millis interval_;
  std::vector<const ISnapshotSource*> sources_;
  std::vector<SnapshotFrame> frames_;
  std::optional<TimerId> timer_;
};

}  // namespace synod::sim
