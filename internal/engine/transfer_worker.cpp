#include "internal/engine/transfer_worker.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <unordered_set>

#include "internal/ledger/completion_index.hpp"
#include "internal/ledger/completion_recorder.hpp"
#include "internal/scan/file_classifier.hpp"
#include "internal/scan/file_scanner.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace uploader::engine {

namespace fs = std::filesystem;

using model::WorkerState;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

int64_t AsInt(uint64_t value) {
  return static_cast<int64_t>(value);
}

} // namespace

/*
  Everything one run owns. Lives on the worker thread's stack.
*/
struct TransferWorker::RunContext {
  model::Task     task;
  model::Manifest manifest;

  std::unordered_set<std::string> manifest_keys;
  std::unordered_set<std::string> completed;

  // keys handed to the recorder during this run
  std::unordered_set<std::string> recorded;

  uploader::v1::Checkpoint checkpoint;
  bool                     seeded       = false;
  uint64_t                 start_cursor = 0;

  bool ledger_reachable = false;

  std::unique_ptr<ledger::RemoteCompletionIndex> index;
  std::unique_ptr<ledger::CompletionRecorder>    recorder;

  // this run only, merged into the ledger summary
  ledger::SessionSummary session;

  RunSummary summary;
};

TransferWorker::TransferWorker(storage::ObjectStorePtr store, db::LedgerRepositoryPtr ledger,
                               std::shared_ptr<checkpoint::StateStore> state_store, WorkerOptions options)
    : store_(std::move(store)),
      ledger_(std::move(ledger)),
      state_store_(std::move(state_store)),
      options_(options),
      progress_(options.progress) {
  if (!store_ || !state_store_) {
    throw std::invalid_argument("transfer worker requires an object store and a state store");
  }
  if (options_.save_interval_entries == 0) options_.save_interval_entries = 1;
  if (options_.pause_poll_interval_ms == 0) options_.pause_poll_interval_ms = 250;
}

TransferWorker::~TransferWorker() {
  Cancel();
  if (thread_.joinable()) thread_.join();
}

void TransferWorker::OnLog(LogHandler handler) {
  std::scoped_lock lock(handlers_mutex_);
  log_handler_ = std::move(handler);
}

void TransferWorker::OnProgress(ProgressHandler handler) {
  progress_.SetHandler(std::move(handler));
}

void TransferWorker::OnFinished(FinishedHandler handler) {
  std::scoped_lock lock(handlers_mutex_);
  finished_handler_ = std::move(handler);
}

// ---------------------------------------------------------------------
// Control plane
// ---------------------------------------------------------------------

void TransferWorker::Start(const model::Task& task) {
  storage::common::ValidateTaskId(task.task_id);

  if (running_.exchange(true)) {
    throw util::InvalidState("worker is already running a task");
  }
  if (thread_.joinable()) thread_.join();

  {
    std::scoped_lock lock(control_mutex_);
    paused_    = false;
    cancelled_ = false;
  }
  {
    std::scoped_lock lock(handlers_mutex_);
    last_summary_         = RunSummary{};
    last_summary_.task_id = task.task_id;
  }

  Transition(WorkerState::kScanning);
  thread_ = std::thread(&TransferWorker::Execute, this, task);
}

RunSummary TransferWorker::Run(const model::Task& task) {
  Start(task);
  return Wait();
}

void TransferWorker::Pause() {
  {
    std::scoped_lock lock(control_mutex_);
    paused_ = true;
  }
  control_cv_.notify_all();
}

void TransferWorker::Resume() {
  {
    std::scoped_lock lock(control_mutex_);
    paused_ = false;
  }
  control_cv_.notify_all();
}

void TransferWorker::Cancel() {
  {
    std::scoped_lock lock(control_mutex_);
    cancelled_ = true;
  }
  control_cv_.notify_all();
}

RunSummary TransferWorker::Wait() {
  if (thread_.joinable()) thread_.join();
  std::scoped_lock lock(handlers_mutex_);
  return last_summary_;
}

ProgressSnapshot TransferWorker::Progress() const {
  return progress_.Snapshot();
}

WorkerState TransferWorker::State() const {
  return state_.load();
}

void TransferWorker::Transition(WorkerState to) {
  const auto from = state_.load();
  if (!model::CanTransition(from, to)) {
    throw util::InvalidState("illegal worker transition " + std::string(model::ToString(from)) + " -> " + std::string(model::ToString(to)));
  }
  state_ = to;
  progress_.SetState(to);
}

void TransferWorker::Emit(spdlog::level::level_enum level, std::string_view message, std::initializer_list<observability::LogField> fields) {
  observability::Log(level, message, fields);

  LogHandler handler;
  {
    std::scoped_lock lock(handlers_mutex_);
    handler = log_handler_;
  }
  if (handler) handler(observability::FormatLine(message, fields));
}

// ---------------------------------------------------------------------
// Worker thread
// ---------------------------------------------------------------------

void TransferWorker::Execute(model::Task task) {
  RunContext ctx;
  ctx.task            = std::move(task);
  ctx.summary.task_id = ctx.task.task_id;
  ctx.index           = std::make_unique<ledger::RemoteCompletionIndex>(ledger_);
  ctx.recorder        = std::make_unique<ledger::CompletionRecorder>(ledger_, ctx.task.task_id, options_.completion_flush_threshold);

  try {
    if (Prepare(ctx)) {
      Transfer(ctx);
    }
  } catch (const std::exception& e) {
    if (!model::IsTerminal(state_.load())) {
      Fail(ctx, e.what(), ctx.seeded);
    } else {
      Emit(spdlog::level::err, "error after run finished", {StringField("task_id", ctx.task.task_id), StringField("error", e.what())});
    }
  }

  auto&       summary = ctx.summary;
  const auto& cp      = ctx.checkpoint;
  summary.final_state    = state_.load();
  summary.total_files    = ctx.manifest.size();
  summary.total_bytes    = model::TotalBytes(ctx.manifest);
  summary.uploaded_files = cp.uploaded_files();
  summary.skipped_files  = cp.skipped_files();
  summary.failed_files   = cp.failed_files();
  summary.uploaded_bytes = cp.uploaded_bytes();
  summary.cursor_index   = cp.cursor_index();

  FinishedHandler handler;
  {
    std::scoped_lock lock(handlers_mutex_);
    last_summary_ = summary;
    handler       = finished_handler_;
  }
  if (handler) handler(summary);

  running_ = false;
}

/*
  Scan → load checkpoint → check store reachability → seed → reconcile with ledger.

  Returns false when the run already reached a terminal state.
*/
bool TransferWorker::Prepare(RunContext& ctx) {
  scan::FileScanner scanner({ctx.task.remote_prefix, options_.relocate_loose_files});
  scan::ScanResult  scanned;
  try {
    scanned = scanner.Scan(ctx.task.local_root);
  } catch (const util::RunAborted& e) {
    Fail(ctx, e.what(), false);
    return false;
  }

  ctx.manifest = std::move(scanned.manifest);
  for (const auto& entry : ctx.manifest) {
    ctx.manifest_keys.insert(entry.remote_key);
  }
  progress_.Reset(ctx.manifest.size(), model::TotalBytes(ctx.manifest));

  Emit(spdlog::level::info, "manifest ready",
       {StringField("task_id", ctx.task.task_id), IntField("files", AsInt(ctx.manifest.size())),
        IntField("bytes", AsInt(model::TotalBytes(ctx.manifest))), IntField("relocated", AsInt(scanned.relocated_files))});

  auto loaded = state_store_->Load(ctx.task.task_id);

  if (ctx.manifest.empty()) {
    Seed(ctx, std::nullopt);
    Complete(ctx);
    return false;
  }

  try {
    store_->CheckReachable();
  } catch (const std::exception& e) {
    Seed(ctx, loaded);
    Fail(ctx, std::string("object store unreachable: ") + e.what(), true);
    return false;
  }

  Seed(ctx, loaded);
  Reconcile(ctx);

  SaveCheckpoint(ctx, uploader::v1::RUN_STATUS_TRANSFERRING);
  Transition(WorkerState::kTransferring);
  return true;
}

/*
  Resume from the loaded cursor only when the checkpoint describes the same
  manifest and an unfinished pass. Otherwise start a new pass at 0; the
  completed keys still spare every transferred file.
*/
void TransferWorker::Seed(RunContext& ctx, const std::optional<uploader::v1::Checkpoint>& loaded) {
  auto& cp = ctx.checkpoint;
  cp.Clear();
  cp.set_task_id(ctx.task.task_id);
  cp.set_total_files(ctx.manifest.size());
  cp.set_total_bytes(model::TotalBytes(ctx.manifest));
  cp.set_manifest_fingerprint(model::ManifestFingerprint(ctx.manifest));

  uint64_t cursor = 0;
  if (loaded) {
    std::size_t dropped = 0;
    for (const auto& key : loaded->completed_keys()) {
      if (ctx.manifest_keys.count(key) > 0) {
        ctx.completed.insert(key);
      } else {
        ++dropped;
      }
    }

    const bool same_manifest =
        loaded->manifest_fingerprint() == cp.manifest_fingerprint() && loaded->total_files() == ctx.manifest.size();
    const bool finished      = loaded->cursor_index() >= loaded->total_files();
    if (same_manifest && !finished) {
      cursor = loaded->cursor_index();
      cp.set_uploaded_files(loaded->uploaded_files());
      cp.set_skipped_files(loaded->skipped_files());
      cp.set_failed_files(loaded->failed_files());
      cp.set_uploaded_bytes(loaded->uploaded_bytes());
    }

    Emit(spdlog::level::info, "checkpoint loaded",
         {StringField("task_id", ctx.task.task_id), IntField("cursor", AsInt(cursor)), IntField("completed", AsInt(ctx.completed.size())),
          IntField("dropped_keys", AsInt(dropped)), BoolField("new_pass", !(same_manifest && !finished))});
  }

  cp.set_cursor_index(cursor);
  ctx.start_cursor = cursor;
  ctx.seeded       = true;

  if (cursor == 0) return;

  // the files before the cursor are settled; progress starts past them
  uint64_t settled_bytes = 0;
  for (uint64_t i = 0; i < cursor; ++i) {
    const auto& entry = ctx.manifest[i];
    if (ctx.completed.count(entry.remote_key) > 0) settled_bytes += entry.size_bytes;
  }

  ResumedWork done;
  done.files_processed = cursor;
  done.files_uploaded  = cp.uploaded_files();
  done.files_skipped   = cp.skipped_files();
  done.files_failed    = cp.failed_files();
  done.uploaded_bytes  = std::min<uint64_t>(cp.uploaded_bytes(), settled_bytes);
  done.skipped_bytes   = settled_bytes - done.uploaded_bytes;
  progress_.Restore(done);
}

bool TransferWorker::Reconcile(RunContext& ctx) {
  auto lookup = ctx.index->Lookup(ctx.task.task_id);
  if (!lookup.reachable) {
    ctx.ledger_reachable = false;
    return false;
  }

  std::size_t merged     = 0;
  std::size_t backfilled = 0;
  for (const auto& entry : ctx.manifest) {
    if (lookup.keys.count(entry.remote_key) > 0) {
      if (ctx.completed.insert(entry.remote_key).second) ++merged;
      continue;
    }
    if (ctx.completed.count(entry.remote_key) > 0 && ctx.recorded.insert(entry.remote_key).second) {
      ctx.recorder->Record(entry, ledger::kStatusUploaded);
      ++backfilled;
    }
  }

  if (!ctx.ledger_reachable && (merged > 0 || backfilled > 0)) {
    Emit(spdlog::level::info, "ledger reconciled",
         {StringField("task_id", ctx.task.task_id), IntField("merged", AsInt(merged)), IntField("backfilled", AsInt(backfilled))});
  }
  ctx.ledger_reachable = true;
  return true;
}

void TransferWorker::Transfer(RunContext& ctx) {
  const uint64_t total = ctx.manifest.size();

  for (uint64_t i = ctx.checkpoint.cursor_index(); i < total; ++i) {
    if (!WaitWhilePaused(ctx) || cancelled_) {
      Cancelled(ctx);
      return;
    }

    try {
      TransferEntry(ctx, static_cast<std::size_t>(i));
    } catch (const util::RunAborted& e) {
      Fail(ctx, e.what(), true);
      return;
    }

    ctx.checkpoint.set_cursor_index(i + 1);

    if ((i + 1 - ctx.start_cursor) % options_.save_interval_entries == 0) {
      if (!ctx.recorder->FlushIfFull()) {
        Emit(spdlog::level::warn, "ledger flush deferred", {IntField("pending", AsInt(ctx.recorder->Pending()))});
      }
      if (!ctx.ledger_reachable) {
        Reconcile(ctx);
      }
      SaveCheckpoint(ctx, uploader::v1::RUN_STATUS_TRANSFERRING);
    }
  }

  if (!ctx.ledger_reachable) {
    Reconcile(ctx);
  }
  Complete(ctx);
}

void TransferWorker::TransferEntry(RunContext& ctx, std::size_t index) {
  const auto& entry = ctx.manifest[index];
  auto&       cp    = ctx.checkpoint;

  if (ctx.completed.count(entry.remote_key) > 0) {
    cp.set_skipped_files(cp.skipped_files() + 1);
    ctx.session.skipped_files++;
    progress_.FileSkipped(entry);
    return;
  }

  if (options_.verify_remote_existence) {
    bool exists = false;
    try {
      exists = store_->Exists(entry.remote_key);
    } catch (const util::RemoteStoreUnreachable&) {
      throw;
    } catch (const std::exception& e) {
      Emit(spdlog::level::warn, "existence check failed, uploading", {StringField("key", entry.remote_key), StringField("error", e.what())});
    }

    if (exists) {
      ctx.completed.insert(entry.remote_key);
      cp.set_skipped_files(cp.skipped_files() + 1);
      ctx.session.skipped_files++;
      if (ctx.recorded.insert(entry.remote_key).second) {
        ctx.recorder->Record(entry, ledger::kStatusSkipped);
      }
      progress_.FileSkipped(entry);
      Emit(spdlog::level::info, "already stored, skipped", {StringField("key", entry.remote_key)});
      return;
    }
  }

  progress_.BeginFile(entry);
  try {
    store_->Upload(entry.remote_key, entry.local_path, std::string(scan::ContentTypeFor(entry.extension)),
                   [this](uint64_t sent, uint64_t size) { progress_.OnBytes(sent, size); });
  } catch (const util::RemoteStoreUnreachable&) {
    throw;
  } catch (const std::exception& e) {
    std::error_code ec;
    if (!fs::is_directory(ctx.task.local_root, ec)) {
      throw util::PathNotFound("task root vanished during transfer: " + ctx.task.local_root);
    }

    cp.set_failed_files(cp.failed_files() + 1);
    ctx.session.failed_files++;
    ctx.summary.failed_keys.push_back(entry.remote_key);
    progress_.FileFailed(entry);
    Emit(spdlog::level::err, "upload failed", {StringField("key", entry.remote_key), StringField("error", e.what())});
    return;
  }

  ctx.completed.insert(entry.remote_key);
  cp.set_uploaded_files(cp.uploaded_files() + 1);
  cp.set_uploaded_bytes(cp.uploaded_bytes() + entry.size_bytes);
  ctx.session.uploaded_files++;
  ctx.session.uploaded_bytes += entry.size_bytes;
  if (ctx.recorded.insert(entry.remote_key).second) {
    ctx.recorder->Record(entry, ledger::kStatusUploaded);
  }
  progress_.FileUploaded(entry);
}

bool TransferWorker::WaitWhilePaused(RunContext& ctx) {
  if (cancelled_) return false;
  if (!paused_) return true;

  Transition(WorkerState::kPaused);
  ctx.checkpoint.set_is_paused(true);
  SaveCheckpoint(ctx, uploader::v1::RUN_STATUS_PAUSED);
  Emit(spdlog::level::info, "paused", {StringField("task_id", ctx.task.task_id), IntField("cursor", AsInt(ctx.checkpoint.cursor_index()))});

  {
    std::unique_lock lock(control_mutex_);
    while (paused_ && !cancelled_) {
      control_cv_.wait_for(lock, std::chrono::milliseconds(options_.pause_poll_interval_ms));
    }
  }

  ctx.checkpoint.set_is_paused(false);
  if (cancelled_) return false;

  Transition(WorkerState::kTransferring);
  Emit(spdlog::level::info, "resumed", {StringField("task_id", ctx.task.task_id)});
  return true;
}

// ---------------------------------------------------------------------
// Terminal states
// ---------------------------------------------------------------------

void TransferWorker::Complete(RunContext& ctx) {
  Transition(WorkerState::kCompleted);
  ctx.checkpoint.set_cursor_index(ctx.manifest.size());

  ctx.summary.ledger_committed = FinalizeLedger(ctx, "completed");
  const bool durable           = ledger_ && ledger_->IsDurable();
  if (ctx.summary.ledger_committed && durable) {
    try {
      state_store_->Remove(ctx.task.task_id);
    } catch (const std::exception& e) {
      Emit(spdlog::level::warn, "could not remove checkpoint", {StringField("task_id", ctx.task.task_id), StringField("error", e.what())});
    }
  } else {
    // the ledger cannot answer for these keys on the next run; the checkpoint must
    SaveCheckpoint(ctx, uploader::v1::RUN_STATUS_COMPLETED);
  }

  const auto& cp = ctx.checkpoint;
  Emit(spdlog::level::info, "task completed",
       {StringField("task_id", ctx.task.task_id), IntField("uploaded", AsInt(cp.uploaded_files())), IntField("skipped", AsInt(cp.skipped_files())),
        IntField("failed", AsInt(cp.failed_files())), IntField("bytes", AsInt(cp.uploaded_bytes())),
        BoolField("ledger_committed", ctx.summary.ledger_committed)});
}

void TransferWorker::Cancelled(RunContext& ctx) {
  Transition(WorkerState::kCancelled);
  SaveCheckpoint(ctx, uploader::v1::RUN_STATUS_CANCELLED);
  ctx.summary.ledger_committed = FinalizeLedger(ctx, "cancelled");
  Emit(spdlog::level::warn, "task cancelled", {StringField("task_id", ctx.task.task_id), IntField("cursor", AsInt(ctx.checkpoint.cursor_index()))});
}

void TransferWorker::Fail(RunContext& ctx, const std::string& error, bool persist_checkpoint) {
  Transition(WorkerState::kFailed);
  ctx.summary.error = error;

  if (ctx.seeded) {
    if (persist_checkpoint) {
      SaveCheckpoint(ctx, uploader::v1::RUN_STATUS_FAILED);
    }
    ctx.summary.ledger_committed = FinalizeLedger(ctx, "failed");
  }
  Emit(spdlog::level::err, "task failed", {StringField("task_id", ctx.task.task_id), StringField("error", error)});
}

void TransferWorker::SaveCheckpoint(RunContext& ctx, uploader::v1::RunStatus status) {
  auto& cp = ctx.checkpoint;
  cp.set_status(status);
  cp.clear_completed_keys();
  for (const auto& key : ctx.completed) {
    cp.add_completed_keys(key);
  }

  try {
    state_store_->Save(cp);
  } catch (const std::exception& e) {
    Emit(spdlog::level::err, "checkpoint save failed", {StringField("task_id", ctx.task.task_id), StringField("error", e.what())});
  }
}

bool TransferWorker::FinalizeLedger(RunContext& ctx, std::string_view status) {
  ctx.session.status = std::string(status);
  return ctx.recorder->Finalize(ctx.session);
}

} // namespace uploader::engine
