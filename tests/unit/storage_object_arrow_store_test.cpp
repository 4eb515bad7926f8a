#include "internal/storage/object/object_arrow_store.hpp"

#include <arrow/filesystem/localfs.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"
#include "tests/unit/support/test_fakes.hpp"

namespace {

namespace fs = std::filesystem;

using uploader::storage::ObjectArrowStore;
using uploader::testing::MakeTempDir;
using uploader::testing::ReadFile;
using uploader::testing::WriteFile;

struct Target {
  fs::path                          bucket;
  std::unique_ptr<ObjectArrowStore> store;
};

Target MakeTarget(const std::string& name, uint64_t chunk_size) {
  Target target;
  target.bucket = MakeTempDir(name) / "bucket";
  target.store  = std::make_unique<ObjectArrowStore>(std::make_shared<arrow::fs::LocalFileSystem>(), target.bucket.string(), chunk_size);
  return target;
}

void TestUploadStreamsInChunks() {
  auto source = MakeTempDir("arrow_store_source") / "a.jpg";
  WriteFile(source, std::string(1000, 'j'));

  auto target = MakeTarget("arrow_store_upload", 256);
  target.store->CheckReachable();
  assert(fs::is_directory(target.bucket));

  std::vector<std::pair<uint64_t, uint64_t>> calls;
  target.store->Upload("2024/Order_1/IMAGE/a.jpg", source.string(), "image/jpeg",
                       [&](uint64_t sent, uint64_t total) { calls.emplace_back(sent, total); });

  assert(calls.size() == 4);
  assert(calls[0].first == 256);
  assert(calls[3].first == 1000);
  assert(calls[3].second == 1000);

  auto stored = target.bucket / "2024" / "Order_1" / "IMAGE" / "a.jpg";
  assert(ReadFile(stored) == std::string(1000, 'j'));
  assert(target.store->Exists("2024/Order_1/IMAGE/a.jpg"));
  assert(!target.store->Exists("2024/Order_1/IMAGE/b.jpg"));
}

void TestEmptyFileReportsOnce() {
  auto source = MakeTempDir("arrow_store_empty_source") / "empty.mov";
  WriteFile(source, "");

  auto target = MakeTarget("arrow_store_empty", 256);
  target.store->CheckReachable();

  int calls = 0;
  target.store->Upload("VIDEO/empty.mov", source.string(), "video/quicktime", [&](uint64_t sent, uint64_t total) {
    assert(sent == 0 && total == 0);
    ++calls;
  });
  assert(calls == 1);
  assert(target.store->Exists("VIDEO/empty.mov"));
}

void TestMissingSourceIsPerFileError() {
  auto target = MakeTarget("arrow_store_missing", 256);
  target.store->CheckReachable();

  bool threw = false;
  try {
    target.store->Upload("IMAGE/x.jpg", "/nonexistent/order_uploader/x.jpg", "image/jpeg", nullptr);
  } catch (const uploader::util::RemoteStoreUnreachable&) {
    assert(false);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!target.store->Exists("IMAGE/x.jpg"));
}

void TestRejectsAbsoluteKeys() {
  auto target = MakeTarget("arrow_store_keys", 256);

  bool threw = false;
  try {
    target.store->Exists("/etc/passwd");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestAuthErrorDetection() {
  using uploader::storage::common::IsAuthError;
  assert(IsAuthError("IOError: AWS Error ACCESS_DENIED during PutObject: AccessDenied"));
  assert(IsAuthError("SignatureDoesNotMatch: The request signature we calculated does not match"));
  assert(IsAuthError("InvalidAccessKeyId"));
  assert(!IsAuthError("IOError: connection reset by peer"));
}

void TestResolveLocalFileSystem() {
  uploader::runtime::config::ObjectStorageConfig config;
  config.set_filesystem(uploader::runtime::config::FILE_SYSTEM_LOCAL);
  config.set_root_path((MakeTempDir("arrow_store_resolve") / "target").string());

  auto resolved = uploader::storage::common::ResolveFileSystem(config);
  assert(resolved.ok());
  assert(resolved->first->type_name() == "local");
  assert(fs::path(resolved->second).is_absolute());
}

} // namespace

int main() {
  TestUploadStreamsInChunks();
  TestEmptyFileReportsOnce();
  TestMissingSourceIsPerFileError();
  TestRejectsAbsoluteKeys();
  TestAuthErrorDetection();
  TestResolveLocalFileSystem();

  std::cout << "order_uploader_unit_object_arrow_store: pass\n";
  return 0;
}
