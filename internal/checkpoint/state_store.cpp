#include "internal/checkpoint/state_store.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/time.hpp"

namespace uploader::checkpoint {

namespace fs = std::filesystem;

using observability::IntField;
using observability::StringField;
using storage::common::CheckpointPath;

namespace {

constexpr const char* kFilePrefix = "task_state_";
constexpr const char* kFileSuffix = ".json";

constexpr std::array<const char*, 3> kRequiredFields = {"taskId", "cursorIndex", "totalFiles"};

std::string ErrnoMessage(const std::string& what, const fs::path& path) {
  return what + " " + path.string() + ": " + std::strerror(errno);
}

std::optional<std::string> ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

bool IsMissingOrEmpty(const fs::path& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return true;
  }
  auto size = fs::file_size(path, ec);
  return !ec && size == 0;
}

} // namespace

StateStore::StateStore(fs::path directory) : directory_(std::move(directory)) {
}

fs::path StateStore::PrimaryPath(const std::string& task_id) const {
  return CheckpointPath(directory_, task_id);
}

fs::path StateStore::BackupPath(const std::string& task_id) const {
  return CheckpointPath(directory_, task_id, ".bak");
}

fs::path StateStore::TempPath(const std::string& task_id) const {
  return CheckpointPath(directory_, task_id, ".tmp");
}

fs::path StateStore::QuarantinePath(const std::string& task_id) const {
  return CheckpointPath(directory_, task_id, ".corrupted");
}

void StateStore::Normalize(uploader::v1::Checkpoint* checkpoint) {
  if (checkpoint->cursor_index() > checkpoint->total_files()) {
    checkpoint->set_cursor_index(checkpoint->total_files());
  }
  if (checkpoint->uploaded_bytes() > checkpoint->total_bytes()) {
    checkpoint->set_uploaded_bytes(checkpoint->total_bytes());
  }

  auto* keys = checkpoint->mutable_completed_keys();
  std::sort(keys->begin(), keys->end());
  keys->erase(std::unique(keys->begin(), keys->end()), keys->end());
}

// ------------------------------------------------------------
// Save
// ------------------------------------------------------------

void StateStore::WriteDurably(const fs::path& path, const std::string& contents) const {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw std::runtime_error(ErrnoMessage("open", path));
  }

  const char* data      = contents.data();
  size_t      remaining = contents.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR) continue;
      auto msg = ErrnoMessage("write", path);
      ::close(fd);
      throw std::runtime_error(msg);
    }
    data += written;
    remaining -= static_cast<size_t>(written);
  }

  if (::fsync(fd) != 0) {
    auto msg = ErrnoMessage("fsync", path);
    ::close(fd);
    throw std::runtime_error(msg);
  }
  if (::close(fd) != 0) {
    throw std::runtime_error(ErrnoMessage("close", path));
  }
}

void StateStore::Save(uploader::v1::Checkpoint checkpoint) const {
  Normalize(&checkpoint);
  *checkpoint.mutable_saved_at() = util::ToProto(util::Now());

  const auto primary = PrimaryPath(checkpoint.task_id());
  const auto backup  = BackupPath(checkpoint.task_id());
  const auto temp    = TempPath(checkpoint.task_id());

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(checkpoint, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("serialize checkpoint: " + std::string(status.message()));
  }

  fs::create_directories(directory_);
  WriteDurably(temp, json);

  // the previous primary becomes the backup only when it has content
  if (!IsMissingOrEmpty(primary)) {
    fs::copy_file(primary, backup, fs::copy_options::overwrite_existing);
  }
  fs::rename(temp, primary);

  UPLOADER_LOG_DEBUG("checkpoint saved", {StringField("task_id", checkpoint.task_id()),
                                          IntField("cursor", static_cast<int64_t>(checkpoint.cursor_index()))});
}

// ------------------------------------------------------------
// Load
// ------------------------------------------------------------

std::optional<uploader::v1::Checkpoint> StateStore::Parse(const fs::path& path, const std::string& task_id) const {
  auto json = ReadFile(path);
  if (!json || json->empty()) {
    return std::nullopt;
  }

  // structural check first: the typed parser fills absent fields with zero
  google::protobuf::Struct raw;
  if (!google::protobuf::util::JsonStringToMessage(*json, &raw).ok()) {
    return std::nullopt;
  }
  for (const char* field : kRequiredFields) {
    if (raw.fields().count(field) == 0) {
      UPLOADER_LOG_WARN("checkpoint missing required field", {StringField("path", path.string()), StringField("field", field)});
      return std::nullopt;
    }
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  uploader::v1::Checkpoint checkpoint;
  if (!google::protobuf::util::JsonStringToMessage(*json, &checkpoint, options).ok()) {
    return std::nullopt;
  }
  if (checkpoint.task_id() != task_id) {
    UPLOADER_LOG_WARN("checkpoint belongs to another task",
                      {StringField("path", path.string()), StringField("expected", task_id), StringField("found", checkpoint.task_id())});
    return std::nullopt;
  }

  Normalize(&checkpoint);
  return checkpoint;
}

std::optional<uploader::v1::Checkpoint> StateStore::Load(const std::string& task_id) const {
  const auto primary = PrimaryPath(task_id);
  if (IsMissingOrEmpty(primary)) {
    return std::nullopt;
  }

  if (auto checkpoint = Parse(primary, task_id)) {
    return checkpoint;
  }

  UPLOADER_LOG_WARN("checkpoint corrupt, trying fallbacks", {StringField("task_id", task_id), StringField("path", primary.string())});

  std::error_code ec;
  fs::rename(primary, QuarantinePath(task_id), ec);
  if (ec) {
    UPLOADER_LOG_WARN("could not quarantine corrupt checkpoint", {StringField("path", primary.string()), StringField("error", ec.message())});
  }

  for (const auto& fallback : {BackupPath(task_id), TempPath(task_id)}) {
    auto checkpoint = Parse(fallback, task_id);
    if (!checkpoint) {
      continue;
    }

    try {
      auto contents = ReadFile(fallback);
      WriteDurably(primary, contents.value_or(""));
      UPLOADER_LOG_INFO("checkpoint restored", {StringField("task_id", task_id), StringField("from", fallback.string())});
    } catch (const std::exception& e) {
      UPLOADER_LOG_WARN("could not rewrite primary checkpoint", {StringField("task_id", task_id), StringField("error", e.what())});
    }
    return checkpoint;
  }

  UPLOADER_LOG_ERROR("no usable checkpoint, starting fresh", {StringField("task_id", task_id)});
  return std::nullopt;
}

// ------------------------------------------------------------
// Housekeeping
// ------------------------------------------------------------

void StateStore::Remove(const std::string& task_id) const {
  for (const auto& path : {PrimaryPath(task_id), BackupPath(task_id), TempPath(task_id), QuarantinePath(task_id)}) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
      throw std::runtime_error("remove " + path.string() + ": " + ec.message());
    }
  }
}

std::vector<std::string> StateStore::ListTasks() const {
  std::vector<std::string> tasks;

  std::error_code ec;
  if (!fs::is_directory(directory_, ec)) {
    return tasks;
  }

  const std::string prefix = kFilePrefix;
  const std::string suffix = kFileSuffix;

  for (const auto& entry : fs::directory_iterator(directory_)) {
    if (!entry.is_regular_file()) continue;

    const auto name = entry.path().filename().string();
    if (name.size() <= prefix.size() + suffix.size()) continue;
    if (name.compare(0, prefix.size(), prefix) != 0) continue;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) continue;
    if (entry.file_size() == 0) continue;

    tasks.push_back(name.substr(prefix.size(), name.size() - prefix.size() - suffix.size()));
  }

  std::sort(tasks.begin(), tasks.end());
  return tasks;
}

} // namespace uploader::checkpoint
