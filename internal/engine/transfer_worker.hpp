#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "internal/checkpoint/state_store.hpp"
#include "internal/db/api/ledger_repository.hpp"
#include "internal/engine/progress_accumulator.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/task.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/object_store.hpp"

namespace uploader::engine {

struct WorkerOptions {
  // checkpoint (and ledger flush check) every N manifest entries
  uint32_t save_interval_entries = 10;

  uint32_t pause_poll_interval_ms = 250;

  // skip entries whose object already exists remotely
  bool verify_remote_existence = false;

  uint32_t completion_flush_threshold = 500;

  bool relocate_loose_files = true;

  ProgressOptions progress;
};

/*
  Outcome of one run. Always produced, whatever the final state.

  Counts cover the current pass over the manifest, which may span several
  runs when a run resumes from a checkpoint cursor.
*/
struct RunSummary {
  std::string        task_id;
  model::WorkerState final_state = model::WorkerState::kIdle;

  uint64_t total_files    = 0;
  uint64_t uploaded_files = 0;
  uint64_t skipped_files  = 0;
  uint64_t failed_files   = 0;

  uint64_t total_bytes    = 0;
  uint64_t uploaded_bytes = 0;

  // position reached in the manifest
  uint64_t cursor_index = 0;

  std::vector<std::string> failed_keys;

  bool        ledger_committed = false;
  std::string error;
};

using LogHandler      = std::function<void(const std::string&)>;
using FinishedHandler = std::function<void(const RunSummary&)>;

/*
  Drives one task from scan to a terminal state on a dedicated thread.

  Lifecycle:
      Idle → Scanning → Transferring ⇄ Paused → Completed | Cancelled | Failed

  - Pause(), Resume() and Cancel() may be called from any thread; they take
    effect at the next manifest entry boundary and never interrupt a file
    that is being written
  - the checkpoint is only touched by the worker thread
  - handlers run on the worker thread; register them before Start()
  - per-file errors are counted, only unusable preconditions fail the run
*/
class TransferWorker {
 public:
  TransferWorker(storage::ObjectStorePtr store, db::LedgerRepositoryPtr ledger, std::shared_ptr<checkpoint::StateStore> state_store,
                 WorkerOptions options);
  ~TransferWorker();

  TransferWorker(const TransferWorker&)            = delete;
  TransferWorker& operator=(const TransferWorker&) = delete;

  void OnLog(LogHandler handler);
  void OnProgress(ProgressHandler handler);
  // Runs on the worker thread while the run still counts as active:
  // Start() from inside the handler throws util::InvalidState.
  void OnFinished(FinishedHandler handler);

  // Throws util::InvalidState while a run is active, std::invalid_argument on a bad task id.
  void Start(const model::Task& task);

  // Start() + Wait().
  RunSummary Run(const model::Task& task);

  void Pause();
  void Resume();
  void Cancel();

  // Blocks until the current run finished; returns its summary.
  RunSummary Wait();

  ProgressSnapshot   Progress() const;
  model::WorkerState State() const;

 private:
  struct RunContext;

  void Execute(model::Task task);

  bool Prepare(RunContext& ctx);
  void Seed(RunContext& ctx, const std::optional<uploader::v1::Checkpoint>& loaded);
  void Transfer(RunContext& ctx);
  void TransferEntry(RunContext& ctx, std::size_t index);
  // Query the ledger, merge its keys, queue records it is missing. False when unreachable.
  bool Reconcile(RunContext& ctx);

  // false when cancelled while waiting
  bool WaitWhilePaused(RunContext& ctx);

  void Complete(RunContext& ctx);
  void Cancelled(RunContext& ctx);
  void Fail(RunContext& ctx, const std::string& error, bool persist_checkpoint);

  void SaveCheckpoint(RunContext& ctx, uploader::v1::RunStatus status);
  bool FinalizeLedger(RunContext& ctx, std::string_view status);

  void Transition(model::WorkerState to);
  void Emit(spdlog::level::level_enum level, std::string_view message, std::initializer_list<observability::LogField> fields = {});

  storage::ObjectStorePtr                  store_;
  db::LedgerRepositoryPtr                  ledger_;
  std::shared_ptr<checkpoint::StateStore>  state_store_;
  WorkerOptions                            options_;
  ProgressAccumulator                      progress_;

  std::thread                     thread_;
  std::atomic<model::WorkerState> state_{model::WorkerState::kIdle};
  std::atomic<bool>               running_{false};
  std::atomic<bool>               paused_{false};
  std::atomic<bool>               cancelled_{false};

  std::mutex              control_mutex_;
  std::condition_variable control_cv_;

  mutable std::mutex handlers_mutex_;
  LogHandler         log_handler_;
  FinishedHandler    finished_handler_;
  RunSummary         last_summary_;
};

} // namespace uploader::engine
