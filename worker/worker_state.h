#pragma once

#include <atomic>

namespace pdserve {

// Lifecycle shared by both worker roles.
enum class WorkerState { kCreated, kInitializing, kReady, kDraining, kStopped };

inline const char *WorkerStateName(WorkerState state) {
  switch (state) {
  case WorkerState::kCreated:
    return "created";
  case WorkerState::kInitializing:
    return "initializing";
  case WorkerState::kReady:
    return "ready";
  case WorkerState::kDraining:
    return "draining";
  case WorkerState::kStopped:
    return "stopped";
  }
  return "unknown";
}

// Read by the HTTP readiness probe.
class WorkerStatus {
 public:
  virtual ~WorkerStatus() = default;
  virtual WorkerState State() const = 0;
  bool Ready() const { return State() == WorkerState::kReady; }
};

}  // namespace pdserve
