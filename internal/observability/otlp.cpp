#include "internal/observability/otlp.hpp"

#ifdef DOCFLOW_ENABLE_OTEL

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "docflow/runtime/config/config.pb.h"

namespace docflow::observability {

OtlpTarget ResolveOtlpTarget(const docflow::runtime::config::RuntimeConfig& config, std::string_view signal) {
  const auto& observability = config.observability();

  OtlpTarget target;
  target.http = observability.transport() == docflow::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!observability.otlp_endpoint().empty()) {
    target.endpoint = observability.otlp_endpoint();
    return target;
  }

  std::string variable = "OTEL_EXPORTER_OTLP_" + std::string(signal) + "_ENDPOINT";
  std::transform(variable.begin(), variable.end(), variable.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (const char* endpoint = std::getenv(variable.c_str())) {
    target.endpoint = endpoint;
  } else if (const char* shared = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = shared;
  } else {
    target.endpoint = target.http ? "http://localhost:4318/v1/" + std::string(signal) : "localhost:4317";
  }
  return target;
}

} // namespace docflow::observability

#endif
