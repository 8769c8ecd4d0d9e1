#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using rentledger::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "rentledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullDocument() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/var/lib/rentledger/ledger.db"
    wal_mode: true
logging:
  level: debug
ledger:
  token_admin: treasury
  instance_ttl:
    threshold_seconds: 100
    extend_to_seconds: 1000
  persistent_ttl:
    threshold_seconds: 500000
    extend_to_seconds: 2000000
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/rentledger/ledger.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.ledger().token_admin() == "treasury");
  assert(config.ledger().instance_ttl().threshold_seconds() == 100);
  assert(config.ledger().instance_ttl().extend_to_seconds() == 1000);
  assert(config.ledger().persistent_ttl().extend_to_seconds() == 2000000);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\ledger\\\"quoted\"\\db.sqlite"
    wal_mode: false
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\ledger\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = ConfigLoader::LoadFromString(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestQuotedNumericPrincipalStaysString() {
  auto config = ConfigLoader::LoadFromString(R"(ledger:
  token_admin: "1234"
)");
  assert(config.ledger().token_admin() == "1234");
}

void TestServerIdentitySettings() {
  auto config = ConfigLoader::LoadFromString(R"(server:
  bind_address: "0.0.0.0:50061"
  trust_principal_metadata: true
  tls:
    cert_chain_path: /etc/rentledger/server.pem
    private_key_path: /etc/rentledger/server.key
    client_ca_path: /etc/rentledger/clients.pem
)");
  assert(config.server().trust_principal_metadata());
  assert(config.server().has_tls());
  assert(config.server().tls().cert_chain_path() == "/etc/rentledger/server.pem");
  assert(config.server().tls().private_key_path() == "/etc/rentledger/server.key");
  assert(config.server().tls().client_ca_path() == "/etc/rentledger/clients.pem");

  auto plain = ConfigLoader::LoadFromString("server:\n  bind_address: \"127.0.0.1:1\"\n");
  assert(!plain.server().trust_principal_metadata());
  assert(!plain.server().has_tls());
}

void TestMemoryBackendAndEmptyDocument() {
  auto memory = ConfigLoader::LoadFromString("database:\n  memory: {}\n");
  assert(memory.database().has_memory());

  auto empty = ConfigLoader::LoadFromString("");
  assert(!empty.has_database());
  assert(empty.server().bind_address().empty());
  assert(!empty.ledger().has_instance_ttl());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/rentledger.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullDocument();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestQuotedNumericPrincipalStaysString();
  TestServerIdentitySettings();
  TestMemoryBackendAndEmptyDocument();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "rentledger_unit_config_loader: pass\n";
  return 0;
}
