#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using ctxsync::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "ctxsync_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "/var/lib/ctxsync/ctx.db"
    wal_mode: true
cache:
  l1:
    max_entries: 5000
    ttl: "120s"
  l2:
    enabled: true
    endpoint: "cache.internal:7000"
    ttl: "3600s"
    timeout: "0.250s"
  l3:
    enabled: true
    ttl: "86400s"
    cleanup_interval: "60s"
  target_hit_rate: 0.9
sync:
  enabled: true
  interval: "5s"
  fetch_timeout: "2s"
  a_authoritative_fields: [owner, status]
  b_authoritative_fields: [budget]
  tracked_contexts: [ctx-1, ctx-2]
system_a:
  endpoint: "system-a:50051"
system_b:
  endpoint: "system-b:50051"
versions:
  retention: 50
logging:
  level: debug
  file: /var/log/ctxsync/ctxsyncd.log
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "/var/lib/ctxsync/ctx.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.cache().l1().max_entries() == 5000);
  assert(ctxsync::util::ToMillis(config.cache().l1().ttl(), std::chrono::seconds(300)) == std::chrono::seconds(120));
  assert(ctxsync::util::ToMillis(config.cache().l2().timeout(), std::chrono::seconds(1)) == std::chrono::milliseconds(250));
  assert(config.cache().l2().endpoint() == "cache.internal:7000");
  assert(config.cache().target_hit_rate() == 0.9);
  assert(config.sync().a_authoritative_fields_size() == 2);
  assert(config.sync().b_authoritative_fields(0) == "budget");
  assert(config.sync().tracked_contexts(1) == "ctx-2");
  assert(config.system_b().endpoint() == "system-b:50051");
  assert(config.versions().retention() == 50);
  assert(config.logging().level() == "debug");
  assert(config.logging().file() == "/var/log/ctxsync/ctxsyncd.log");
}

void TestAbsentDurationsFallBack() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
  assert(ctxsync::util::ToMillis(config.cache().l1().ttl(), std::chrono::seconds(300)) == std::chrono::seconds(300));
  assert(ctxsync::util::ToMillis(config.sync().interval(), std::chrono::seconds(5)) == std::chrono::seconds(5));
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\ctxsync\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\ctxsync\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
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

void TestFieldAuthoritativeForBothSystemsIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(R"(sync:
  a_authoritative_fields: [status, owner]
  b_authoritative_fields: [status]
)");
  } catch (const ctxsync::util::ValidationError&) {
    threw = true;
  }
  assert(threw && "a field cannot be owned by both systems");
}

void TestEnabledSectionsRequireEndpoints() {
  const char* cases[] = {
      "cache:\n  l2:\n    enabled: true\n",
      "index:\n  enabled: true\n  embedder_endpoint: \"embed:1\"\n",
      "sync:\n  enabled: true\nsystem_a:\n  endpoint: \"a:1\"\n",
      "database:\n  sqlite:\n    wal_mode: true\n",
      "cache:\n  target_hit_rate: 1.5\n",
  };

  for (const auto* yaml : cases) {
    bool threw = false;
    try {
      (void)ConfigLoader::LoadFromYamlString(yaml);
    } catch (const ctxsync::util::ValidationError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestMissingFileReportsPath() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/ctxsync/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestAbsentDurationsFallBack();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestFieldAuthoritativeForBothSystemsIsRejected();
  TestEnabledSectionsRequireEndpoints();
  TestMissingFileReportsPath();

  std::cout << "ctxsync_unit_config_loader: pass\n";
  return 0;
}
