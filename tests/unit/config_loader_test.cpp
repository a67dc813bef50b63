#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/runtime_options.hpp"

namespace {

using docflow::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "docflow_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool Rejects(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/docflow/docflow.db"
    wal_mode: true
logging:
  level: debug
locks:
  ttl: "45s"
  wait_timeout: "2.5s"
  poll_interval: "0.050s"
  reaper_interval: "10s"
  namespace: "TENANT_A"
workflow:
  movement_gate: MOVEMENT_GATE_ACCEPTED_ONLY
  invoice_authorization: INVOICE_AUTHORIZATION_QUOTATION
  default_tax_rate: "8.50"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/docflow/docflow.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");

  const auto locks = docflow::config::ToLockOptions(config.locks());
  assert(locks.ttl == std::chrono::seconds(45));
  assert(locks.wait_timeout == std::chrono::milliseconds(2500));
  assert(locks.poll_interval == std::chrono::milliseconds(50));
  assert(locks.region == "TENANT_A");
  assert(docflow::config::ReaperInterval(config.locks()) == std::chrono::seconds(10));

  const auto workflow = docflow::config::ToWorkflowOptions(config.workflow());
  assert(workflow.movement_gate == docflow::model::MovementGate::kAcceptedOnly);
  assert(workflow.invoice_authorization == docflow::guard::InvoiceAuthorization::kQuotation);
  assert(workflow.default_tax_rate == docflow::util::Decimal::Parse("8.5"));
}

void TestEmptyConfigKeepsDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());

  const auto locks = docflow::config::ToLockOptions(config.locks());
  assert(locks.ttl == std::chrono::seconds(30));
  assert(locks.wait_timeout == std::chrono::seconds(5));
  assert(locks.poll_interval == std::chrono::milliseconds(100));
  assert(locks.region == "DEFAULT");
  assert(docflow::config::ReaperInterval(config.locks()) == docflow::config::kDefaultReaperInterval);

  const auto workflow = docflow::config::ToWorkflowOptions(config.workflow());
  assert(workflow.movement_gate == docflow::model::MovementGate::kApprovedOrSent);
  assert(workflow.invoice_authorization == docflow::guard::InvoiceAuthorization::kDelivered);
  assert(workflow.default_tax_rate == docflow::util::Decimal::FromInteger(10));
}

void TestPostgresBackend() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://docflow@localhost/docflow"
    max_connections: 4
)");
  assert(config.database().has_postgres());
  assert(config.database().postgres().connection_uri() == "postgresql://docflow@localhost/docflow");
  assert(config.database().postgres().max_connections() == 4);
}

void TestScalarEscapingForQuotedValues() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\docflow\\\"quoted\"\\db.sqlite"
logging:
  pattern: "true"
)");
  assert(config.database().sqlite().path() == "C:\\docflow\\\"quoted\"\\db.sqlite");
  assert(config.logging().pattern() == "true");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  assert(Rejects([&] { (void)ConfigLoader::LoadFromYaml(yaml_path.string()); }) && "ConfigLoader must reject unknown fields.");
  assert(Rejects([] { (void)ConfigLoader::LoadFromYamlString("workflow:\n  movement_gate: MOVEMENT_GATE_SOMETIMES\n"); }));
}

void TestMissingFileIsRejected() {
  const auto missing = std::filesystem::temp_directory_path() / "docflow_config_loader_tests" / "does_not_exist.yaml";
  assert(Rejects([&] { (void)ConfigLoader::LoadFromYaml(missing.string()); }));
}

void TestBadTaxRateIsRejected() {
  docflow::runtime::config::WorkflowConfig workflow;

  workflow.set_default_tax_rate("ten");
  assert(Rejects([&] { (void)docflow::config::ToWorkflowOptions(workflow); }));

  workflow.set_default_tax_rate("-1.00");
  assert(Rejects([&] { (void)docflow::config::ToWorkflowOptions(workflow); }));

  workflow.set_default_tax_rate("0");
  assert(docflow::config::ToWorkflowOptions(workflow).default_tax_rate.IsZero());
}

} // namespace

int main() {
  TestFullConfig();
  TestEmptyConfigKeepsDefaults();
  TestPostgresBackend();
  TestScalarEscapingForQuotedValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();
  TestBadTaxRateIsRejected();

  std::cout << "docflow_unit_config_loader: pass\n";
  return 0;
}
