#include <arrow/filesystem/s3fs.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <thread>

#include "internal/checkpoint/state_store.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/task.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using uploader::model::WorkerState;
using uploader::observability::IntField;
using uploader::observability::PercentField;
using uploader::observability::StringField;

namespace {

constexpr int kExitCompleted = 0;
constexpr int kExitUsage     = 1;
constexpr int kExitFatal     = 2;
constexpr int kExitCancelled = 3;
constexpr int kExitFailed    = 4;

volatile std::sig_atomic_t g_cancel = 0;
volatile std::sig_atomic_t g_pause  = 0;
volatile std::sig_atomic_t g_resume = 0;

void HandleSignal(int signal) {
  switch (signal) {
    case SIGUSR1:
      g_pause = 1;
      break;
    case SIGUSR2:
      g_resume = 1;
      break;
    default:
      g_cancel = 1;
      break;
  }
}

void Usage() {
  std::cerr << "Usage:\n"
            << "  order-uploader <config.yaml> run --task <id> --root <dir> --prefix <remote prefix>\n"
            << "  order-uploader <config.yaml> run --task <id> --root <dir> --order <number> --date <YYYY-MM-DD>\n"
            << "  order-uploader <config.yaml> resumable\n"
            << "  order-uploader <config.yaml> discard --task <id>\n"
            << "\n"
            << "While running: SIGUSR1 pauses, SIGUSR2 resumes, SIGINT/SIGTERM cancel.\n";
}

// --key value pairs after the subcommand
std::optional<std::map<std::string, std::string>> ParseFlags(int argc, char** argv, int first) {
  std::map<std::string, std::string> flags;
  for (int i = first; i < argc; i += 2) {
    std::string key = argv[i];
    if (key.rfind("--", 0) != 0 || i + 1 >= argc) {
      return std::nullopt;
    }
    flags[key.substr(2)] = argv[i + 1];
  }
  return flags;
}

std::optional<uploader::model::Task> TaskFromFlags(const std::map<std::string, std::string>& flags) {
  auto get = [&flags](const char* key) -> std::string {
    auto it = flags.find(key);
    return it == flags.end() ? std::string() : it->second;
  };

  uploader::model::Task task;
  task.task_id    = get("task");
  task.local_root = get("root");
  task.created_at = uploader::util::Now();

  if (!get("prefix").empty()) {
    task.remote_prefix = get("prefix");
  } else if (!get("order").empty() && !get("date").empty()) {
    task.remote_prefix = uploader::model::OrderPrefix(get("order"), uploader::util::ParseDate(get("date")));
  }

  if (task.task_id.empty() || task.local_root.empty() || task.remote_prefix.empty()) {
    return std::nullopt;
  }
  return task;
}

int ExitCodeFor(WorkerState state) {
  switch (state) {
    case WorkerState::kCompleted:
      return kExitCompleted;
    case WorkerState::kCancelled:
      return kExitCancelled;
    default:
      return kExitFailed;
  }
}

/*
  The main thread is the control plane: it turns signals into
  Pause/Resume/Cancel and logs progress while the worker runs.
*/
int RunTask(const uploader::runtime::config::RuntimeConfig& config, const uploader::model::Task& task) {
  auto runtime = uploader::factory::BuildRuntime(config);
  auto worker  = uploader::factory::MakeWorker(runtime);

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
  std::signal(SIGUSR1, HandleSignal);
  std::signal(SIGUSR2, HandleSignal);

  worker->Start(task);
  UPLOADER_LOG_INFO("upload started", {StringField("task_id", task.task_id), StringField("prefix", task.remote_prefix)});

  auto last_report = std::chrono::steady_clock::now();
  while (!uploader::model::IsTerminal(worker->State())) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    if (g_cancel) {
      g_cancel = 0;
      worker->Cancel();
    }
    if (g_pause) {
      g_pause = 0;
      worker->Pause();
    }
    if (g_resume) {
      g_resume = 0;
      worker->Resume();
    }

    const auto now = std::chrono::steady_clock::now();
    if (now - last_report >= std::chrono::seconds(5)) {
      last_report   = now;
      auto progress = worker->Progress();
      UPLOADER_LOG_INFO("progress", {StringField("state", std::string(uploader::model::ToString(progress.state))),
                                     PercentField("percent", progress.Percent()),
                                     IntField("processed", static_cast<int64_t>(progress.files_processed)),
                                     IntField("total", static_cast<int64_t>(progress.total_files)),
                                     StringField("file", progress.current_file)});
    }
  }

  auto summary = worker->Wait();
  UPLOADER_LOG_INFO("upload finished", {StringField("task_id", summary.task_id),
                                        StringField("state", std::string(uploader::model::ToString(summary.final_state))),
                                        IntField("uploaded", static_cast<int64_t>(summary.uploaded_files)),
                                        IntField("skipped", static_cast<int64_t>(summary.skipped_files)),
                                        IntField("failed", static_cast<int64_t>(summary.failed_files)),
                                        IntField("bytes", static_cast<int64_t>(summary.uploaded_bytes)),
                                        StringField("error", summary.error)});
  return ExitCodeFor(summary.final_state);
}

int ListResumable(const uploader::runtime::config::RuntimeConfig& config) {
  uploader::checkpoint::StateStore store(config.checkpoint().directory());
  for (const auto& task_id : store.ListTasks()) {
    auto checkpoint = store.Load(task_id);
    if (!checkpoint) {
      continue;
    }
    std::cout << task_id << "\t" << checkpoint->cursor_index() << "/" << checkpoint->total_files() << "\t"
              << uploader::v1::RunStatus_Name(checkpoint->status()) << "\n";
  }
  return kExitCompleted;
}

int Discard(const uploader::runtime::config::RuntimeConfig& config, const std::string& task_id) {
  uploader::checkpoint::StateStore store(config.checkpoint().directory());
  store.Remove(task_id);
  UPLOADER_LOG_INFO("checkpoint discarded", {StringField("task_id", task_id)});
  return kExitCompleted;
}

void Shutdown() {
  auto status = arrow::fs::FinalizeS3();
  if (!status.ok()) {
    std::cerr << "S3 finalize failed: " << status.ToString() << std::endl;
  }
  uploader::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return kExitUsage;
  }

  const std::string config_path = argv[1];
  const std::string command     = argv[2];

  auto flags = ParseFlags(argc, argv, 3);
  if (!flags) {
    Usage();
    return kExitUsage;
  }

  int exit_code = kExitCompleted;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = uploader::config::ConfigLoader::LoadFromYaml(config_path);
    uploader::observability::InitializeLogging(config);

    if (command == "run") {
      auto task = TaskFromFlags(*flags);
      if (!task) {
        Usage();
        uploader::observability::ShutdownLogging();
        return kExitUsage;
      }
      exit_code = RunTask(config, *task);
    } else if (command == "resumable") {
      exit_code = ListResumable(config);
    } else if (command == "discard" && flags->count("task") > 0) {
      exit_code = Discard(config, flags->at("task"));
    } else {
      Usage();
      uploader::observability::ShutdownLogging();
      return kExitUsage;
    }
  } catch (const std::exception& e) {
    UPLOADER_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    Shutdown();
    return kExitFatal;
  }

  Shutdown();
  return exit_code;
}
