#include "internal/worker/worker_pool.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using jobq::worker::ProcessId;
using jobq::worker::WorkerLaunch;
using jobq::worker::WorkerPool;
using jobq::worker::WorkerPoolOptions;
using jobq::worker::WorkerRegistry;

class FakeSupervisor final : public jobq::worker::ProcessSupervisor {
 public:
  ProcessId Spawn(const WorkerLaunch& launch) override {
    if (fail_after >= 0 && static_cast<int>(launches.size()) >= fail_after) {
      throw jobq::util::LaunchError("spawn refused");
    }
    launches.push_back(launch);
    const ProcessId pid = next_pid++;
    alive.insert(pid);
    return pid;
  }

  bool Terminate(ProcessId pid) override {
    terminated.push_back(pid);
    return alive.erase(pid) > 0;
  }

  bool IsAlive(ProcessId pid) override {
    return alive.contains(pid);
  }

  std::vector<WorkerLaunch> launches;
  std::vector<ProcessId>    terminated;
  std::set<ProcessId>       alive;
  ProcessId                 next_pid   = 1000;
  int                       fail_after = -1;
};

std::filesystem::path TempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "jobq_worker_pool_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

struct Fixture {
  std::filesystem::path           dir;
  std::shared_ptr<FakeSupervisor> supervisor = std::make_shared<FakeSupervisor>();
  std::shared_ptr<WorkerRegistry> registry;
  std::unique_ptr<WorkerPool>     pool;

  explicit Fixture(const std::string& name, WorkerPoolOptions options = {.worker_binary = "/opt/jobq/bin/jobq-worker"}) : dir(TempDir(name)) {
    registry = std::make_shared<WorkerRegistry>(dir / "workers.json");
    pool     = std::make_unique<WorkerPool>(supervisor, registry, std::move(options));
  }
};

void TestStartAssignsSequentialIds() {
  Fixture f("start");
  auto    started = f.pool->Start(3);

  assert(started.size() == 3);
  assert(started[0].worker_id() == "worker-1");
  assert(started[2].worker_id() == "worker-3");
  assert(started[0].pid() == 1000);
  assert(!started[0].started_at().empty());

  const auto& launch = f.supervisor->launches.front();
  assert(launch.binary == "/opt/jobq/bin/jobq-worker");
  assert((launch.args == std::vector<std::string>{"--id", "worker-1"}));
  assert(launch.log_path.empty());

  // a second pool over the same file sees the same workers
  WorkerPool other(f.supervisor, std::make_shared<WorkerRegistry>(f.dir / "workers.json"), {.worker_binary = "unused"});
  assert(other.Active().size() == 3);

  auto more = f.pool->Start(1);
  assert(more.front().worker_id() == "worker-4");
}

void TestLaunchForwardsConfigAndLogDir() {
  Fixture f("forward", {.worker_binary = "jobq-worker", .config_path = "/etc/jobq.yaml", .log_dir = ""});
  f.pool->Start(1);
  assert((f.supervisor->launches.front().args == std::vector<std::string>{"--id", "worker-1", "--config", "/etc/jobq.yaml"}));

  const auto logs = TempDir("forward_logs") / "nested";
  Fixture    logged("forward_logged", {.worker_binary = "jobq-worker", .config_path = "", .log_dir = logs.string()});
  logged.pool->Start(1);
  assert(logged.supervisor->launches.front().log_path == (logs / "worker-1.log").string());
  assert(std::filesystem::exists(logs));
}

void TestStopSignalsEveryWorker() {
  Fixture f("stop");
  f.pool->Start(2);

  assert(f.pool->Stop() == 2);
  assert(f.supervisor->terminated.size() == 2);
  assert(f.pool->Active().empty());
  assert(f.registry->Load().workers_size() == 0);

  assert(f.pool->Stop() == 0);
}

void TestDeadWorkersAreDropped() {
  Fixture f("cleanup");
  auto    started = f.pool->Start(3);

  // worker-2 crashed
  f.supervisor->alive.erase(started[1].pid());
  assert(f.pool->CleanupDead() == 1);

  auto active = f.pool->Active();
  assert(active.size() == 2);
  assert(active[0].worker_id() == "worker-1");
  assert(active[1].worker_id() == "worker-3");

  // ids of live workers are never reused
  auto next = f.pool->Start(1);
  assert(next.front().worker_id() == "worker-4");
  assert(f.pool->Stop() == 3);
}

void TestPartialStartKeepsLaunchedWorkers() {
  Fixture f("partial");
  f.supervisor->fail_after = 2;

  bool threw = false;
  try {
    f.pool->Start(4);
  } catch (const jobq::util::LaunchError&) {
    threw = true;
  }
  assert(threw);
  assert(f.registry->Load().workers_size() == 2);
}

void TestCorruptRegistryReadsAsEmpty() {
  Fixture f("corrupt");
  {
    std::ofstream out(f.dir / "workers.json");
    out << "{ this is not json";
  }
  assert(f.registry->Load().workers_size() == 0);
  assert(f.pool->Active().empty());

  auto started = f.pool->Start(1);
  assert(started.front().worker_id() == "worker-1");
  assert(f.registry->Load().workers_size() == 1);
}

void TestPosixSupervisorLifecycle() {
  jobq::worker::PosixProcessSupervisor supervisor;

  const auto log = TempDir("posix") / "sleep.log";
  auto       pid = supervisor.Spawn(WorkerLaunch{.binary = "/bin/sleep", .args = {"30"}, .log_path = log.string()});
  assert(pid > 0);
  assert(supervisor.IsAlive(pid));
  assert(std::filesystem::exists(log));

  assert(supervisor.Terminate(pid));
  bool gone = false;
  for (int i = 0; i < 100 && !gone; ++i) {
    gone = !supervisor.IsAlive(pid);
    if (!gone) std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  assert(gone);

  bool threw = false;
  try {
    supervisor.Spawn(WorkerLaunch{.binary = "/nonexistent/jobq-worker"});
  } catch (const jobq::util::LaunchError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestStartAssignsSequentialIds();
  TestLaunchForwardsConfigAndLogDir();
  TestStopSignalsEveryWorker();
  TestDeadWorkersAreDropped();
  TestPartialStartKeepsLaunchedWorkers();
  TestCorruptRegistryReadsAsEmpty();
  TestPosixSupervisorLifecycle();

  std::cout << "jobq_unit_worker_pool: pass\n";
  return 0;
}
