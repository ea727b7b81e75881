#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using quotecast::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "quotecast_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrows(const std::filesystem::path& path) {
  try {
    (void)ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "/var/lib/quotecast/quotecast.db"
logging:
  level: debug
  pattern: "[%l] %v"
cache:
  capacity_per_partition: 128
scheduler:
  trigger_interval: "90s"
  time_zone: "+05:30"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/quotecast/quotecast.db");
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.cache().capacity_per_partition() == 128);
  assert(config.scheduler().trigger_interval().seconds() == 90);
  assert(config.scheduler().time_zone() == "+05:30");

  assert(quotecast::factory::ResolveTriggerInterval(config) == std::chrono::seconds{90});
  assert(quotecast::factory::ResolveCacheCapacity(config) == 128);
  assert(quotecast::factory::ResolveTimeZone(config).Name() == "+05:30");
}

void TestMinimalConfigFallsBackToDefaults() {
  const auto yaml_path = WriteYaml("minimal",
                                   R"(database:
  memory: {}
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(!config.scheduler().has_trigger_interval());

  assert(quotecast::factory::ResolveTriggerInterval(config) == quotecast::factory::kDefaultTriggerInterval);
  assert(quotecast::factory::ResolveCacheCapacity(config) == quotecast::cache::EntityCache::kDefaultCapacity);
  assert(quotecast::factory::ResolveTimeZone(config).Name() == "local");
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted_scalars",
                                   R"(database:
  sqlite:
    path: "12345"
scheduler:
  time_zone: "-0800"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "12345");
  assert(quotecast::factory::ResolveTimeZone(config).Name() == "-08:00");
}

void TestScalarEscapingForBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\quotecast\\\"quoted\"\\db.sqlite"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\quotecast\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  assert(LoadThrows(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestNonMappingDocumentIsRejected() {
  assert(LoadThrows(WriteYaml("sequence_root", "- a\n- b\n")));
  assert(LoadThrows(WriteYaml("scalar_root", "just text\n")));
  assert(LoadThrows(std::filesystem::temp_directory_path() / "quotecast_config_loader_tests" / "does_not_exist.yaml"));
}

void TestInvalidSchedulerValuesAreRejectedByFactory() {
  const auto bad_zone = WriteYaml("bad_zone",
                                  R"(scheduler:
  time_zone: "Mars/Olympus"
)");

  auto config = ConfigLoader::LoadFromYaml(bad_zone.string());

  bool threw = false;
  try {
    (void)quotecast::factory::ResolveTimeZone(config);
  } catch (const quotecast::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  const auto negative = WriteYaml("negative_interval",
                                  R"(scheduler:
  trigger_interval: "-5s"
)");

  config = ConfigLoader::LoadFromYaml(negative.string());
  threw  = false;
  try {
    (void)quotecast::factory::ResolveTriggerInterval(config);
  } catch (const quotecast::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestMinimalConfigFallsBackToDefaults();
  TestQuotedScalarsStayStrings();
  TestScalarEscapingForBackslashValues();
  TestUnknownFieldsAreRejected();
  TestNonMappingDocumentIsRejected();
  TestInvalidSchedulerValuesAreRejectedByFactory();

  std::cout << "quotecast_unit_config_loader: pass\n";
  return 0;
}
