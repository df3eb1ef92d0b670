#include "worker_runner.hpp"

#include <chrono>
#include <memory>
#include <thread>

#include "internal/core/job_store.hpp"
#include "internal/exec/command_executor.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/worker/worker_loop.hpp"

namespace jobq::worker {

void RunWorker(const jobq::runtime::config::RuntimeConfig& config, const std::string& worker_id, const std::function<bool()>& keep_running) {
  auto repository = factory::BuildRepository(config);
  auto store      = std::make_shared<core::JobStore>(repository);
  store->SeedDefaults(factory::JobDefaultsFromConfig(config));

  const auto grace    = config.workers().kill_grace_ms() == 0 ? 2000 : config.workers().kill_grace_ms();
  auto       executor = std::make_shared<exec::ShellCommandExecutor>(std::chrono::milliseconds(grace));

  WorkerLoopOptions options;
  options.worker_id     = worker_id;
  options.poll_interval = std::chrono::milliseconds(config.workers().poll_interval_ms() == 0 ? 1000 : config.workers().poll_interval_ms());
  options.settle_grace  = std::chrono::milliseconds(grace);

  WorkerLoop loop(store, executor, options);
  loop.Start();

  while (keep_running()) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  JOBQ_LOG_INFO("stop requested, finishing current job", {observability::StringField("worker_id", worker_id)});
  loop.Stop();
}

} // namespace jobq::worker
