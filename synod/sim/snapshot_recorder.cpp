#include <synod/sim/snapshot_recorder.hpp>

#include <synod/metrics/csv.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <stdexcept>

namespace synod::sim {

SnapshotRecorder::SnapshotRecorder(Simulator& simulator, Millis interval)
    : simulator_(simulator), interval_(interval) {
  if (interval_ == 0) {
    throw std::invalid_argument("snapshot interval must be positive");
  }
}

SnapshotRecorder::~SnapshotRecorder() {
  Stop();
}

void SnapshotRecorder::Watch(const ISnapshotSource* source) {
  sources_.push_back(source);
}

void SnapshotRecorder::Start() {
  TakeFrame();
  Tick();
}

void SnapshotRecorder::Stop() {
  if (timer_) {
    simulator_.Cancel(*timer_);
    timer_.reset();
  }
}

void SnapshotRecorder::Tick() {
  timer_ = simulator_.After(interval_, [this]() {
    TakeFrame();
    Tick();
  });
}

void SnapshotRecorder::TakeFrame() {
  SnapshotFrame frame;
  frame.time = simulator_.Now();
  frame.nodes.reserve(sources_.size());
  for (const auto* source : sources_) {
    frame.nodes.push_back(source->Snapshot());
  }
  frames_.push_back(std::move(frame));
}

void SnapshotRecorder::WriteCsv(std::ostream& out) const {
  fmt::print(out, "time,node,role,round,state,last_message\n");
  for (const auto& frame : frames_) {
    for (const auto& node : frame.nodes) {
      fmt::print(out, "{},{},{},{},{},{}\n", frame.time,
                 CsvField(node.node_id), RoleName(node.role),
                 node.current_round, CsvField(node.state),
                 CsvField(node.last_message_type));
    }
  }
}

}  // namespace synod::sim
