#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/worker/process_supervisor.hpp"
#include "internal/worker/worker_registry.hpp"

namespace jobq::worker {

struct WorkerPoolOptions {
  std::string worker_binary;
  // forwarded to workers as --config when set
  std::string config_path;
  // per-worker log files <log_dir>/<worker_id>.log when set
  std::string log_dir;
};

/*
  Supervises detached worker processes through the persisted registry.

  Every operation drops registry entries whose process has died first, so
  stale entries left by crashed workers never accumulate.
*/
class WorkerPool {
 public:
  WorkerPool(std::shared_ptr<ProcessSupervisor> supervisor, std::shared_ptr<WorkerRegistry> registry, WorkerPoolOptions options);

  // Spawns `count` workers named worker-N and records them.
  std::vector<jobq::registry::WorkerEntry> Start(uint32_t count);

  // SIGTERM to every tracked worker; empties the registry. Returns the number signalled.
  uint32_t Stop();

  std::vector<jobq::registry::WorkerEntry> Active();

  // Returns the number of dead entries removed.
  uint32_t CleanupDead();

 private:
  uint32_t CleanupDeadLocked(jobq::registry::WorkerRegistry& registry);

  std::shared_ptr<ProcessSupervisor> supervisor_;
  std::shared_ptr<WorkerRegistry>    registry_;
  WorkerPoolOptions                  options_;

  std::mutex mutex_;
};

} // namespace jobq::worker
