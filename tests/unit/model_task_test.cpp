#include "internal/model/task.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace {

using uploader::model::CanTransition;
using uploader::model::WorkerState;

void TestOrderPrefixLayout() {
  auto date = uploader::util::ParseDate("2024-03-07");
  assert(uploader::model::OrderPrefix("1234", date) == "2024/03-2024/07-03-2024/Order_1234");
}

void TestParseDateRejectsGarbage() {
  for (const char* bad : {"2024-13-01", "2024-02-30", "07.03.2024", "2024-03-07x", ""}) {
    bool threw = false;
    try {
      uploader::util::ParseDate(bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestWorkerTransitions() {
  assert(CanTransition(WorkerState::kIdle, WorkerState::kScanning));
  assert(!CanTransition(WorkerState::kIdle, WorkerState::kTransferring));
  assert(!CanTransition(WorkerState::kIdle, WorkerState::kFailed));

  assert(CanTransition(WorkerState::kScanning, WorkerState::kTransferring));
  assert(CanTransition(WorkerState::kScanning, WorkerState::kCompleted));
  assert(CanTransition(WorkerState::kScanning, WorkerState::kFailed));

  assert(CanTransition(WorkerState::kTransferring, WorkerState::kPaused));
  assert(CanTransition(WorkerState::kPaused, WorkerState::kTransferring));
  assert(CanTransition(WorkerState::kPaused, WorkerState::kCancelled));
  assert(!CanTransition(WorkerState::kPaused, WorkerState::kCompleted));

  assert(!CanTransition(WorkerState::kCompleted, WorkerState::kFailed));
  assert(!CanTransition(WorkerState::kCancelled, WorkerState::kTransferring));
  assert(CanTransition(WorkerState::kFailed, WorkerState::kScanning));
}

void TestTaskStatusMapping() {
  using uploader::model::TaskStatus;
  using uploader::model::ToTaskStatus;
  assert(ToTaskStatus(WorkerState::kIdle) == TaskStatus::kPending);
  assert(ToTaskStatus(WorkerState::kTransferring) == TaskStatus::kRunning);
  assert(ToTaskStatus(WorkerState::kPaused) == TaskStatus::kPaused);
  assert(ToTaskStatus(WorkerState::kCancelled) == TaskStatus::kCancelled);
  assert(uploader::model::ToString(TaskStatus::kCompleted) == "completed");
}

} // namespace

int main() {
  TestOrderPrefixLayout();
  TestParseDateRejectsGarbage();
  TestWorkerTransitions();
  TestTaskStatusMapping();

  std::cout << "order_uploader_unit_task: pass\n";
  return 0;
}
