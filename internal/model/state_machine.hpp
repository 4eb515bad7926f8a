#pragma once

#include <cstdint>
#include <string_view>

#include "internal/model/task.hpp"

namespace uploader::model {

enum class WorkerState : std::uint8_t {
  kIdle         = 0,
  kScanning     = 1,
  kTransferring = 2,
  kPaused       = 3,
  kCompleted    = 4,
  kCancelled    = 5,
  kFailed       = 6,
};

constexpr bool IsTerminal(WorkerState state) {
  return state == WorkerState::kCompleted || state == WorkerState::kCancelled || state == WorkerState::kFailed;
}

constexpr bool CanTransition(WorkerState from, WorkerState to) {
  if (from == to) {
    return true;
  }
  if (to == WorkerState::kFailed) {
    return from != WorkerState::kIdle && !IsTerminal(from);
  }

  switch (from) {
    case WorkerState::kIdle:
      return to == WorkerState::kScanning;
    case WorkerState::kScanning:
      return to == WorkerState::kTransferring || to == WorkerState::kCompleted || to == WorkerState::kCancelled;
    case WorkerState::kTransferring:
      return to == WorkerState::kPaused || to == WorkerState::kCompleted || to == WorkerState::kCancelled;
    case WorkerState::kPaused:
      return to == WorkerState::kTransferring || to == WorkerState::kCancelled;
    default:
      // terminal states only restart through a fresh Start()
      return to == WorkerState::kScanning;
  }
}

constexpr TaskStatus ToTaskStatus(WorkerState state) {
  switch (state) {
    case WorkerState::kIdle:
      return TaskStatus::kPending;
    case WorkerState::kScanning:
    case WorkerState::kTransferring:
      return TaskStatus::kRunning;
    case WorkerState::kPaused:
      return TaskStatus::kPaused;
    case WorkerState::kCompleted:
      return TaskStatus::kCompleted;
    case WorkerState::kCancelled:
      return TaskStatus::kCancelled;
    case WorkerState::kFailed:
    default:
      return TaskStatus::kFailed;
  }
}

constexpr std::string_view ToString(WorkerState state) {
  switch (state) {
    case WorkerState::kIdle:
      return "idle";
    case WorkerState::kScanning:
      return "scanning";
    case WorkerState::kTransferring:
      return "transferring";
    case WorkerState::kPaused:
      return "paused";
    case WorkerState::kCompleted:
      return "completed";
    case WorkerState::kCancelled:
      return "cancelled";
    case WorkerState::kFailed:
    default:
      return "failed";
  }
}

} // namespace uploader::model
