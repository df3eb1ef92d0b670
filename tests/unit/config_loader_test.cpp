#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "jobq_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestDefaults() {
  auto config = jobq::config::ConfigLoader::Defaults();
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "~/.jobq/data/jobq.db");
  assert(config.workers().poll_interval_ms() == 1000);
  assert(config.job_defaults().max_retries() == 3);
  assert(config.job_defaults().timeout_seconds() == 20);
  assert(config.job_defaults().backoff_base() == 2);
  assert(config.job_defaults().priority() == 5);

  auto defaults = jobq::factory::JobDefaultsFromConfig(config);
  assert(defaults.max_retries == 3 && defaults.timeout == 20 && defaults.backoff_base == 2 && defaults.priority == 5);
}

void TestPartialFileMergesOntoDefaults() {
  const auto yaml_path = WriteYaml("partial",
                                   R"(database:
  sqlite:
    path: "/var/lib/jobq/queue.db"
workers:
  poll_interval_ms: 250
  worker_binary: /usr/local/bin/jobq-worker
job_defaults:
  max_retries: 5
  priority: -2
)");

  auto config = jobq::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "/var/lib/jobq/queue.db");
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(config.workers().poll_interval_ms() == 250);
  assert(config.workers().worker_binary() == "/usr/local/bin/jobq-worker");
  assert(config.workers().registry_path() == "~/.jobq/data/workers.json");
  assert(config.logging().level() == "info");

  auto defaults = jobq::factory::JobDefaultsFromConfig(config);
  assert(defaults.max_retries == 5);
  assert(defaults.priority == -2);
  assert(defaults.timeout == 20);
}

void TestMemoryBackendSelection() {
  const auto yaml_path = WriteYaml("memory",
                                   R"(database:
  memory:
logging:
  level: debug
)");

  auto config = jobq::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());
  assert(config.logging().level() == "debug");

  auto repository = jobq::factory::BuildRepository(config);
  assert(repository != nullptr);
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted",
                                   R"(workers:
  log_dir: "2024"
  config_path: 'C:\jobs\jobq.yaml'
)");

  auto config = jobq::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.workers().log_dir() == "2024");
  assert(config.workers().config_path() == "C:\\jobs\\jobq.yaml");
}

void TestEmptyFileYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");
  auto       config    = jobq::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.workers().kill_grace_ms() == 2000);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(workers:
  poll_interval_ms: 100
  threads: 4
)");

  bool threw = false;
  try {
    (void)jobq::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsAnError() {
  bool threw = false;
  try {
    (void)jobq::config::ConfigLoader::LoadFromYaml("/nonexistent/jobq/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaults();
  TestPartialFileMergesOntoDefaults();
  TestMemoryBackendSelection();
  TestQuotedNumbersStayStrings();
  TestEmptyFileYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsAnError();

  std::cout << "jobq_unit_config_loader: pass\n";
  return 0;
}
