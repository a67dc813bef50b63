#pragma once

#include <chrono>

#include "docflow/runtime/config/config.pb.h"
#include "internal/core/workflow_types.hpp"
#include "internal/lock/lock_service.hpp"

namespace docflow::config {

inline constexpr char kDefaultBindAddress[] = "0.0.0.0:50051";

inline constexpr std::chrono::milliseconds kDefaultReaperInterval{60'000};

// Unset or zero durations keep the LockOptions defaults.
lock::LockOptions ToLockOptions(const docflow::runtime::config::LockConfig& config);

std::chrono::milliseconds ReaperInterval(const docflow::runtime::config::LockConfig& config);

// Throws std::runtime_error on a malformed or negative default_tax_rate.
core::WorkflowOptions ToWorkflowOptions(const docflow::runtime::config::WorkflowConfig& config);

} // namespace docflow::config
