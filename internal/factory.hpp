#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "docflow/runtime/config/config.pb.h"
#include "internal/core/quotation_service.hpp"
#include "internal/core/workflow_orchestrator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lock/lock_reaper.hpp"
#include "internal/lock/lock_service.hpp"
#include "internal/lock/lock_store.hpp"

namespace docflow::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>    repository;
  std::shared_ptr<lock::LockStore>   lock_store;
  std::shared_ptr<lock::LockService> locks;

  std::shared_ptr<core::QuotationService>     quotations;
  std::shared_ptr<core::WorkflowOrchestrator> orchestrator;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // started by Build(), stopped by its destructor
  std::shared_ptr<lock::LockReaper> lock_reaper;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const docflow::runtime::config::RuntimeConfig& config);

} // namespace docflow::factory
