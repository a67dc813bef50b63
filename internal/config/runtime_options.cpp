#include "runtime_options.hpp"

#include <google/protobuf/duration.pb.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace docflow::config {

namespace {

using docflow::runtime::config::InvoiceAuthorization;
using docflow::runtime::config::MovementGate;

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  const auto ms = std::chrono::seconds(d.seconds()) + std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds(d.nanos()));
  return ms.count() > 0 ? std::chrono::duration_cast<std::chrono::milliseconds>(ms) : fallback;
}

} // namespace

lock::LockOptions ToLockOptions(const docflow::runtime::config::LockConfig& config) {
  lock::LockOptions options;
  if (config.has_ttl()) options.ttl = ToMillis(config.ttl(), options.ttl);
  if (config.has_wait_timeout()) options.wait_timeout = ToMillis(config.wait_timeout(), options.wait_timeout);
  if (config.has_poll_interval()) options.poll_interval = ToMillis(config.poll_interval(), options.poll_interval);
  if (!config.namespace_().empty()) options.region = config.namespace_();
  return options;
}

std::chrono::milliseconds ReaperInterval(const docflow::runtime::config::LockConfig& config) {
  return config.has_reaper_interval() ? ToMillis(config.reaper_interval(), kDefaultReaperInterval) : kDefaultReaperInterval;
}

core::WorkflowOptions ToWorkflowOptions(const docflow::runtime::config::WorkflowConfig& config) {
  core::WorkflowOptions options;

  if (config.movement_gate() == MovementGate::MOVEMENT_GATE_ACCEPTED_ONLY) {
    options.movement_gate = model::MovementGate::kAcceptedOnly;
  }
  if (config.invoice_authorization() == InvoiceAuthorization::INVOICE_AUTHORIZATION_QUOTATION) {
    options.invoice_authorization = guard::InvoiceAuthorization::kQuotation;
  }

  if (!config.default_tax_rate().empty()) {
    try {
      options.default_tax_rate = util::Decimal::Parse(config.default_tax_rate());
    } catch (const util::InvalidArgument& e) {
      throw std::runtime_error("Invalid configuration: workflow.default_tax_rate: " + std::string(e.what()));
    }
    if (options.default_tax_rate.IsNegative()) {
      throw std::runtime_error("Invalid configuration: workflow.default_tax_rate must not be negative");
    }
  }
  return options;
}

} // namespace docflow::config
