#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/checkpoint/state_store.hpp"
#include "internal/db/api/ledger_repository.hpp"
#include "internal/engine/transfer_worker.hpp"
#include "internal/storage/object_store.hpp"

namespace uploader::factory {

/*
  Runtime

  Long-lived collaborators shared by every TransferWorker of the process.
*/
struct Runtime {
  db::LedgerRepositoryPtr                 ledger;
  storage::ObjectStorePtr                 object_store;
  std::shared_ptr<checkpoint::StateStore> state_store;
  engine::WorkerOptions                   worker_options;
};

/*
  BuildRuntime

  Composition root: the only place that knows concrete ledger and object
  store types. The config must already have defaults applied.
*/
Runtime BuildRuntime(const uploader::runtime::config::RuntimeConfig& config);

engine::WorkerOptions MakeWorkerOptions(const uploader::runtime::config::RuntimeConfig& config);

std::unique_ptr<engine::TransferWorker> MakeWorker(const Runtime& runtime);

} // namespace uploader::factory
