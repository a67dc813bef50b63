#pragma once

#include <string>
#include <string_view>

namespace docflow::runtime::config {
class RuntimeConfig;
}

namespace docflow::observability {

// Where one OTLP signal ("traces", "metrics") is exported to.
struct OtlpTarget {
  std::string endpoint;
  bool        http{false};
  bool        insecure{true};
};

/*
  Endpoint precedence:
    observability.otlp_endpoint
    OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT
    OTEL_EXPORTER_OTLP_ENDPOINT
    collector default for the transport
*/
OtlpTarget ResolveOtlpTarget(const docflow::runtime::config::RuntimeConfig& config, std::string_view signal);

inline constexpr char kServiceName[]    = "docflow";
inline constexpr char kServiceVersion[] = "0.1.0";

} // namespace docflow::observability
