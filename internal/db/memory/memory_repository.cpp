#include "memory_repository.hpp"

#include <stdexcept>

#include "memory_tx.hpp"

namespace uploader::db::memory {

MemoryRepository::MemoryRepository(bool tables_present) {
  committed_.tables_present = tables_present;
}

void MemoryRepository::CreateTables() {
  std::scoped_lock lock(mutex_);
  committed_.tables_present = true;
  committed_version_++;
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static Result MissingTable(const char* table) {
  return Result::Err(ErrorCode::NotFound, std::string("no such table: ") + table);
}

bool MemoryRepository::TableExists(Transaction& t, const std::string& table) {
  const auto& s = TX(t).Snapshot();
  return s.tables_present && (table == kCompletionTable || table == kSummaryTable);
}

std::vector<std::string> MemoryRepository::ListCompletedKeys(Transaction& t, const std::string& task_id) {
  const auto& s = TX(t).Snapshot();
  if (!s.tables_present) throw std::runtime_error(MissingTable(kCompletionTable).message);

  std::vector<std::string> keys;
  auto                     it = s.completions.find(task_id);
  if (it == s.completions.end()) return keys;

  keys.reserve(it->second.size());
  for (const auto& [key, _] : it->second) {
    keys.push_back(key);
  }
  return keys;
}

Result MemoryRepository::InsertCompletions(Transaction& t, const std::vector<model::CompletionRecord>& records) {
  auto& s = TX(t).Writable();
  if (!s.tables_present) return MissingTable(kCompletionTable);

  for (const auto& r : records) {
    // first write wins, like ON CONFLICT DO NOTHING
    s.completions[r.task_id].emplace(r.remote_key, r);
  }
  return Result::Ok();
}

std::optional<model::TaskSummaryRecord> MemoryRepository::GetTaskSummary(Transaction& t, const std::string& task_id) {
  const auto& s = TX(t).Snapshot();
  if (!s.tables_present) throw std::runtime_error(MissingTable(kSummaryTable).message);

  auto it = s.summaries.find(task_id);
  if (it == s.summaries.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertTaskSummary(Transaction& t, const model::TaskSummaryRecord& r) {
  auto& s = TX(t).Writable();
  if (!s.tables_present) return MissingTable(kSummaryTable);

  s.summaries[r.task_id] = r;
  return Result::Ok();
}

} // namespace uploader::db::memory
