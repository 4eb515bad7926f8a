#include "internal/ledger/completion_recorder.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace uploader::ledger {

using observability::IntField;
using observability::StringField;

CompletionRecorder::CompletionRecorder(db::LedgerRepositoryPtr repository, std::string task_id, std::size_t flush_threshold)
    : repository_(std::move(repository)), task_id_(std::move(task_id)), flush_threshold_(flush_threshold == 0 ? 1 : flush_threshold) {
}

void CompletionRecorder::Record(const model::ManifestEntry& entry, std::string_view status) {
  db::model::CompletionRecord record;
  record.task_id        = task_id_;
  record.remote_key     = entry.remote_key;
  record.file_name      = std::filesystem::path(entry.local_path).filename().string();
  record.file_size      = entry.size_bytes;
  record.file_type      = std::string(model::ToString(entry.category));
  record.status         = std::string(status);
  record.uploaded_at_ms = util::ToUnixMillis(util::Now());
  pending_.push_back(std::move(record));
}

bool CompletionRecorder::FlushIfFull() {
  if (pending_.size() < flush_threshold_) {
    return true;
  }
  return Flush();
}

bool CompletionRecorder::Flush() {
  if (pending_.empty()) {
    return true;
  }
  if (!repository_) {
    return false;
  }

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->InsertCompletions(*tx, pending_);
    if (!result) {
      UPLOADER_LOG_WARN("ledger batch rejected, keeping records buffered",
                        {StringField("task_id", task_id_), IntField("records", static_cast<int64_t>(pending_.size())),
                         StringField("code", db::ToString(result.code)), StringField("error", result.message)});
      return false;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    UPLOADER_LOG_WARN("ledger batch commit failed, keeping records buffered",
                      {StringField("task_id", task_id_), IntField("records", static_cast<int64_t>(pending_.size())),
                       StringField("error", e.what())});
    return false;
  }

  UPLOADER_LOG_INFO("ledger batch committed", {StringField("task_id", task_id_), IntField("records", static_cast<int64_t>(pending_.size()))});
  pending_.clear();
  return true;
}

bool CompletionRecorder::Finalize(const SessionSummary& summary) {
  if (!repository_) {
    return false;
  }

  try {
    auto tx = repository_->Begin();

    if (!pending_.empty()) {
      auto result = repository_->InsertCompletions(*tx, pending_);
      if (!result) {
        UPLOADER_LOG_WARN("ledger finalize rejected", {StringField("task_id", task_id_), StringField("code", db::ToString(result.code)),
                                                       StringField("error", result.message)});
        return false;
      }
    }

    db::model::TaskSummaryRecord record;
    record.task_id = task_id_;
    if (auto existing = repository_->GetTaskSummary(*tx, task_id_)) {
      record = *existing;
    }
    record.uploaded_files += summary.uploaded_files;
    record.skipped_files += summary.skipped_files;
    record.uploaded_bytes += summary.uploaded_bytes;
    record.failed_files  = summary.failed_files;
    record.status        = summary.status;
    record.updated_at_ms = util::ToUnixMillis(util::Now());

    auto result = repository_->UpsertTaskSummary(*tx, record);
    if (!result) {
      UPLOADER_LOG_WARN("ledger summary rejected", {StringField("task_id", task_id_), StringField("code", db::ToString(result.code)),
                                                    StringField("error", result.message)});
      return false;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    UPLOADER_LOG_WARN("ledger finalize failed", {StringField("task_id", task_id_), StringField("error", e.what())});
    return false;
  }

  pending_.clear();
  UPLOADER_LOG_INFO("ledger finalized", {StringField("task_id", task_id_), StringField("status", summary.status)});
  return true;
}

} // namespace uploader::ledger
