#pragma once

#include <memory>

namespace docflow::core {
class WorkflowOrchestrator;
class QuotationService;
} // namespace docflow::core
namespace docflow::db {
class Repository;
}

namespace docflow::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<docflow::core::WorkflowOrchestrator> orchestrator;
  std::shared_ptr<docflow::core::QuotationService>     quotations;
  std::shared_ptr<docflow::db::Repository>             repository;
};

} // namespace docflow::service
