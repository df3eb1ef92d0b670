#include <csignal>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"
#include "internal/worker/worker_runner.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage: jobq-worker [--config <config.yaml>] [--id <worker-id>]" << std::endl;
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string worker_id;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--id" && i + 1 < argc) {
      worker_id = argv[++i];
    } else {
      Usage();
      return 1;
    }
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? jobq::config::ConfigLoader::Defaults() : jobq::config::ConfigLoader::LoadFromYaml(config_path);

    jobq::observability::InitializeLogging(config);

    if (worker_id.empty()) {
      worker_id = jobq::util::GenerateWorkerId();
    }

    // Register signal handlers before the loop starts claiming.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    jobq::worker::RunWorker(config, worker_id, [] { return g_running != 0; });

    jobq::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    JOBQ_LOG_ERROR("Fatal error", {jobq::observability::StringField("error", e.what())});
    jobq::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
