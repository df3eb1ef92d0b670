#include "worker_pool.hpp"

#include <set>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/path_utils.hpp"
#include "internal/util/time.hpp"

namespace jobq::worker {

using observability::IntField;
using observability::StringField;

WorkerPool::WorkerPool(std::shared_ptr<ProcessSupervisor> supervisor, std::shared_ptr<WorkerRegistry> registry, WorkerPoolOptions options)
    : supervisor_(std::move(supervisor)), registry_(std::move(registry)), options_(std::move(options)) {
  if (!supervisor_ || !registry_) {
    throw std::invalid_argument("WorkerPool requires a supervisor and a registry");
  }
}

uint32_t WorkerPool::CleanupDeadLocked(jobq::registry::WorkerRegistry& registry) {
  jobq::registry::WorkerRegistry alive;
  uint32_t                       removed = 0;

  for (const auto& entry : registry.workers()) {
    if (supervisor_->IsAlive(entry.pid())) {
      *alive.add_workers() = entry;
    } else {
      removed++;
      JOBQ_LOG_INFO("dropping dead worker", {StringField("worker_id", entry.worker_id()), IntField("pid", entry.pid())});
    }
  }

  if (removed > 0) {
    registry = std::move(alive);
    registry_->Save(registry);
  }
  return removed;
}

uint32_t WorkerPool::CleanupDead() {
  std::lock_guard lock(mutex_);
  auto            registry = registry_->Load();
  return CleanupDeadLocked(registry);
}

std::vector<jobq::registry::WorkerEntry> WorkerPool::Start(uint32_t count) {
  std::lock_guard lock(mutex_);
  auto            registry = registry_->Load();
  CleanupDeadLocked(registry);

  std::set<std::string> taken;
  for (const auto& entry : registry.workers()) taken.insert(entry.worker_id());

  std::vector<jobq::registry::WorkerEntry> started;
  int64_t                                  next = registry.workers_size() + 1;

  for (uint32_t i = 0; i < count; ++i) {
    std::string worker_id;
    do {
      worker_id = "worker-" + std::to_string(next++);
    } while (taken.contains(worker_id));
    taken.insert(worker_id);

    WorkerLaunch launch;
    launch.binary = options_.worker_binary;
    launch.args   = {"--id", worker_id};
    if (!options_.config_path.empty()) {
      launch.args.push_back("--config");
      launch.args.push_back(options_.config_path);
    }
    if (!options_.log_dir.empty()) {
      const auto log_path = util::ExpandUserPath(options_.log_dir) / (worker_id + ".log");
      util::EnsureParentDirectory(log_path);
      launch.log_path = log_path.string();
    }

    ProcessId pid;
    try {
      pid = supervisor_->Spawn(launch);
    } catch (const std::exception& e) {
      // keep the workers that did start
      registry_->Save(registry);
      JOBQ_LOG_ERROR("failed to start worker", {StringField("worker_id", worker_id), StringField("error", e.what())});
      throw;
    }

    auto* entry = registry.add_workers();
    entry->set_worker_id(worker_id);
    entry->set_pid(pid);
    entry->set_started_at(util::ToIso8601(util::Now()));
    started.push_back(*entry);

    JOBQ_LOG_INFO("worker started", {StringField("worker_id", worker_id), IntField("pid", pid)});
  }

  registry_->Save(registry);
  return started;
}

uint32_t WorkerPool::Stop() {
  std::lock_guard lock(mutex_);
  auto            registry = registry_->Load();
  CleanupDeadLocked(registry);

  uint32_t signalled = 0;
  for (const auto& entry : registry.workers()) {
    if (supervisor_->Terminate(entry.pid())) {
      signalled++;
      JOBQ_LOG_INFO("worker signalled", {StringField("worker_id", entry.worker_id()), IntField("pid", entry.pid())});
    }
  }

  registry_->Save(jobq::registry::WorkerRegistry{});
  return signalled;
}

std::vector<jobq::registry::WorkerEntry> WorkerPool::Active() {
  std::lock_guard lock(mutex_);
  auto            registry = registry_->Load();
  CleanupDeadLocked(registry);
  return {registry.workers().begin(), registry.workers().end()};
}

} // namespace jobq::worker
