#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "relcache_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrows(const std::filesystem::path& path) {
  try {
    (void)relcache::config::ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "/var/lib/relcache/cache.db"
    wal_mode: true
    busy_timeout_ms: 2500
    max_connections: 4
cache:
  reaper_initial_delay: "30s"
  reaper_interval: "10s"
  message_retention: "3600s"
  subscribe_poll_interval: "0.250s"
  subscribe_batch_size: 20
  subscribe_buffer_size: 50
  counter_max_attempts: 7
logging:
  level: "debug"
)");

  auto config = relcache::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/relcache/cache.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.database().sqlite().max_connections() == 4);
  assert(config.cache().reaper_interval().seconds() == 10);
  assert(config.cache().subscribe_batch_size() == 20);
  assert(config.cache().counter_max_attempts() == 7);
  assert(config.logging().level() == "debug");

  const auto reaper = relcache::factory::ReaperOptionsFrom(config.cache());
  assert(reaper.initial_delay == std::chrono::seconds(30));
  assert(reaper.interval == std::chrono::seconds(10));
  assert(reaper.message_retention == std::chrono::hours(1));

  const auto subscribe = relcache::factory::SubscriptionOptionsFrom(config.cache());
  assert(subscribe.poll_interval == std::chrono::milliseconds(250));
  assert(subscribe.batch_size == 20);
  assert(subscribe.buffer_size == 50);
}

void TestMissingCacheSectionUsesDefaults() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(database:
  memory: {}
)");

  auto config = relcache::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());

  const auto reaper = relcache::factory::ReaperOptionsFrom(config.cache());
  assert(reaper.initial_delay == std::chrono::minutes(5));
  assert(reaper.interval == std::chrono::minutes(1));
  assert(reaper.message_retention.count() == 0);

  const auto subscribe = relcache::factory::SubscriptionOptionsFrom(config.cache());
  assert(subscribe.poll_interval == std::chrono::milliseconds(100));
  assert(subscribe.batch_size == 10);
  assert(subscribe.buffer_size == 100);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\relcache\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = relcache::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\relcache\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumericScalarStaysString() {
  const auto yaml_path = WriteYaml("quoted_numeric",
                                   R"(database:
  sqlite:
    path: "12345"
logging:
  pattern: "1e3"
)");

  auto config = relcache::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "12345");
  assert(config.logging().pattern() == "1e3");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(unknown_field: 123
database:
  memory: {}
)");

  assert(LoadThrows(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestInMemorySqlitePathIsRejected() {
  const auto yaml_path = WriteYaml("sqlite_in_memory",
                                   R"(database:
  sqlite:
    path: ":memory:"
)");

  assert(LoadThrows(yaml_path));
}

void TestMissingRequiredBackendFieldsAreRejected() {
  assert(LoadThrows(WriteYaml("sqlite_no_path", R"(database:
  sqlite:
    wal_mode: true
)")));

  assert(LoadThrows(WriteYaml("postgres_no_uri", R"(database:
  postgres:
    max_connections: 4
)")));

  assert(LoadThrows(WriteYaml("negative_busy_timeout", R"(database:
  sqlite:
    path: "/tmp/relcache.db"
    busy_timeout_ms: -1
)")));
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestMissingCacheSectionUsesDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumericScalarStaysString();
  TestUnknownFieldsAreRejected();
  TestInMemorySqlitePathIsRejected();
  TestMissingRequiredBackendFieldsAreRejected();

  std::cout << "relcache_unit_config_loader: pass\n";
  return 0;
}
