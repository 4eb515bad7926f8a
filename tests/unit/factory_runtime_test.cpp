#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/ledger/completion_index.hpp"
#include "tests/unit/support/test_fakes.hpp"

namespace {

namespace fs = std::filesystem;

using uploader::testing::MakeTempDir;
using uploader::testing::ReadFile;
using uploader::testing::WriteFile;

uploader::runtime::config::RuntimeConfig LocalConfig(const fs::path& base, bool with_sqlite) {
  std::string yaml = "object_storage:\n"
                     "  filesystem: FILE_SYSTEM_LOCAL\n"
                     "  root_path: \"" + (base / "bucket").string() + "\"\n"
                     "checkpoint:\n"
                     "  directory: \"" + (base / "state").string() + "\"\n"
                     "  save_interval_entries: 3\n"
                     "transfer:\n"
                     "  chunk_size_bytes: 4\n"
                     "  verify_remote_existence: true\n"
                     "progress:\n"
                     "  step_percent: 20\n";
  if (with_sqlite) {
    yaml += "ledger:\n"
            "  sqlite:\n"
            "    path: \"" + (base / "ledger.db").string() + "\"\n"
            "    bootstrap_schema: true\n";
  }
  return uploader::config::ConfigLoader::LoadFromYamlString(yaml);
}

void TestWorkerOptionsFollowConfig() {
  auto options = uploader::factory::MakeWorkerOptions(LocalConfig(MakeTempDir("factory_options"), false));
  assert(options.save_interval_entries == 3);
  assert(options.verify_remote_existence);
  assert(options.pause_poll_interval_ms == 250);
  assert(options.completion_flush_threshold == 500);
  assert(options.progress.step_percent == 20);
  assert(options.progress.small_file_threshold_bytes == 1024 * 1024);
}

void TestEndToEndUploadToLocalTarget() {
  const auto base = MakeTempDir("factory_end_to_end");
  const auto root = base / "order";
  WriteFile(root / "a.jpg", "jpeg-bytes");
  WriteFile(root / "RAW" / "b.nef", "raw-bytes-raw-bytes");
  WriteFile(root / "VIDEO" / "c.mov", "");
  WriteFile(root / "Archive" / "old.jpg", "old");

  const bool with_sqlite = UPLOADER_DB_SQLITE;
  auto       runtime     = uploader::factory::BuildRuntime(LocalConfig(base, with_sqlite));
  auto       worker      = uploader::factory::MakeWorker(runtime);

  uploader::model::Task task;
  task.task_id       = "order-1";
  task.remote_prefix = "2024/05-2024/01-05-2024/Order_1";
  task.local_root    = root.string();

  auto summary = worker->Run(task);
  assert(summary.final_state == uploader::model::WorkerState::kCompleted);
  assert(summary.total_files == 3);
  assert(summary.uploaded_files == 3);
  assert(summary.ledger_committed);

  const auto bucket = base / "bucket" / "2024" / "05-2024" / "01-05-2024" / "Order_1";
  assert(ReadFile(bucket / "IMAGE" / "a.jpg") == "jpeg-bytes");
  assert(ReadFile(bucket / "RAW" / "b.nef") == "raw-bytes-raw-bytes");
  assert(fs::exists(bucket / "VIDEO" / "c.mov"));
  assert(!fs::exists(bucket / "Archive"));

  // an in-process ledger forgets on exit, so the finished checkpoint stays
  const std::size_t kept_checkpoints = runtime.ledger->IsDurable() ? 0 : 1;
  assert(runtime.state_store->ListTasks().size() == kept_checkpoints);

  auto lookup = uploader::ledger::RemoteCompletionIndex(runtime.ledger).Lookup(task.task_id);
  assert(lookup.reachable);
  assert(lookup.keys.size() == 3);

  // second run with a fresh worker: ledger marks everything done
  auto again = uploader::factory::MakeWorker(runtime)->Run(task);
  assert(again.final_state == uploader::model::WorkerState::kCompleted);
  assert(again.skipped_files == 3);
  assert(again.uploaded_files == 0);
}

} // namespace

int main() {
  TestWorkerOptionsFollowConfig();
  TestEndToEndUploadToLocalTarget();

  std::cout << "order_uploader_unit_factory_runtime: pass\n";
  return 0;
}
