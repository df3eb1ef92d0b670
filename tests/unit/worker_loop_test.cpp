#include "internal/worker/worker_loop.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/job_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/exec/command_executor.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

#if JOBQ_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#endif

namespace {

using jobq::core::JobSpec;
using jobq::core::JobStore;
using jobq::exec::ExecutionResult;
using jobq::model::JobState;
using jobq::worker::WorkerLoop;
using jobq::worker::WorkerLoopOptions;
using std::chrono::milliseconds;

// Interprets the job command as a scripted outcome.
class ScriptedExecutor final : public jobq::exec::CommandExecutor {
 public:
  ExecutionResult Run(const std::string& command, std::chrono::seconds timeout) override {
    runs++;
    last_timeout = timeout;
    if (on_run) on_run();

    ExecutionResult result;
    result.elapsed_seconds = 0.5;
    if (command == "ok") {
      result.stdout_text = "  done \n";
    } else if (command == "fail") {
      result.exit_code   = 2;
      result.stderr_text = "bad input\n";
    } else if (command == "fail-quiet") {
      result.exit_code = 1;
    } else if (command == "slow") {
      throw jobq::util::ExecutionTimeout("Timeout exceeded (" + std::to_string(timeout.count()) + "s)", 7.25);
    } else if (command == "unlaunchable") {
      throw jobq::util::LaunchError("fork: Resource temporarily unavailable");
    } else if (command == "oom") {
      throw std::bad_alloc();
    } else if (command == "busy") {
      std::this_thread::sleep_for(milliseconds(300));
      result.stdout_text = "finished";
    }
    return result;
  }

  std::atomic<int>      runs{0};
  std::chrono::seconds  last_timeout{0};
  std::function<void()> on_run;
};

// Memory repository whose next `fail_begins` write transactions fail to open.
class FlakyRepository final : public jobq::db::Repository {
 public:
  std::unique_ptr<jobq::db::Transaction> Begin() override {
    if (fail_begins.load() > 0) {
      fail_begins--;
      throw std::runtime_error("database is locked");
    }
    return inner_.Begin();
  }
  std::unique_ptr<jobq::db::Transaction> BeginRead() override {
    return inner_.BeginRead();
  }

  jobq::db::Result InsertJob(jobq::db::Transaction& tx, const jobq::db::model::JobRecord& job) override {
    return inner_.InsertJob(tx, job);
  }
  std::optional<jobq::db::model::JobRecord> GetJob(jobq::db::Transaction& tx, const std::string& id) override {
    return inner_.GetJob(tx, id);
  }
  std::vector<jobq::db::model::JobRecord> ListJobs(jobq::db::Transaction& tx, const jobq::db::JobFilter& filter) override {
    return inner_.ListJobs(tx, filter);
  }
  jobq::db::Result UpdateJob(jobq::db::Transaction& tx, const jobq::db::model::JobRecord& job) override {
    return inner_.UpdateJob(tx, job);
  }
  jobq::db::Result DeleteJob(jobq::db::Transaction& tx, const std::string& id) override {
    return inner_.DeleteJob(tx, id);
  }
  jobq::db::Result DeleteJobs(jobq::db::Transaction& tx, const jobq::db::JobFilter& filter, uint64_t& deleted) override {
    return inner_.DeleteJobs(tx, filter, deleted);
  }
  jobq::db::Result AgeWaitingJobs(jobq::db::Transaction& tx) override {
    return inner_.AgeWaitingJobs(tx);
  }
  std::optional<jobq::db::model::JobRecord> SelectNextClaimable(jobq::db::Transaction& tx, jobq::util::TimePoint now) override {
    return inner_.SelectNextClaimable(tx, now);
  }
  jobq::db::Result MarkClaimed(jobq::db::Transaction& tx, const std::string& id, const std::string& worker_id, jobq::util::TimePoint now) override {
    return inner_.MarkClaimed(tx, id, worker_id, now);
  }
  std::map<JobState, uint64_t> CountByState(jobq::db::Transaction& tx) override {
    return inner_.CountByState(tx);
  }
  std::optional<jobq::db::model::ConfigRecord> GetConfig(jobq::db::Transaction& tx, const std::string& key) override {
    return inner_.GetConfig(tx, key);
  }
  jobq::db::Result PutConfig(jobq::db::Transaction& tx, const jobq::db::model::ConfigRecord& record) override {
    return inner_.PutConfig(tx, record);
  }
  std::vector<jobq::db::model::ConfigRecord> ListConfig(jobq::db::Transaction& tx) override {
    return inner_.ListConfig(tx);
  }

  std::atomic<int> fail_begins{0};

 private:
  jobq::db::memory::MemoryRepository inner_;
};

struct Fixture {
  std::shared_ptr<JobStore>         store    = std::make_shared<JobStore>(std::make_shared<jobq::db::memory::MemoryRepository>());
  std::shared_ptr<ScriptedExecutor> executor = std::make_shared<ScriptedExecutor>();

  Fixture() {
    store->SeedDefaults(jobq::core::JobDefaults{});
  }

  void Enqueue(const std::string& id, const std::string& command, int64_t priority = 5) {
    store->Enqueue(JobSpec{.id = id, .command = command, .priority = priority, .timeout = 9});
  }

  std::unique_ptr<WorkerLoop> MakeLoop(milliseconds poll = milliseconds(20)) {
    return std::make_unique<WorkerLoop>(store, executor, WorkerLoopOptions{.worker_id = "worker-test", .poll_interval = poll});
  }
};

template <typename Pred>
bool WaitFor(Pred&& pred, milliseconds limit = milliseconds(5000)) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(milliseconds(10));
  }
  return pred();
}

void TestSuccessStoresTrimmedOutput() {
  Fixture f;
  f.Enqueue("job", "ok");
  auto loop = f.MakeLoop();

  assert(loop->RunOnce());
  assert(f.executor->last_timeout == std::chrono::seconds(9));

  auto job = f.store->Get("job");
  assert(job->state == JobState::kCompleted);
  assert(job->output == "done");
  assert(job->execution_time == 0.5);
  assert(loop->Stats().succeeded == 1);
  assert(!loop->RunOnce());
}

void TestNonZeroExitBecomesFailure() {
  Fixture f;
  f.Enqueue("loud", "fail", 9);
  f.Enqueue("quiet", "fail-quiet", 1);
  auto loop = f.MakeLoop();

  assert(loop->RunOnce());
  assert(loop->RunOnce());

  auto loud = f.store->Get("loud");
  assert(loud->state == JobState::kFailed);
  assert(loud->attempts == 1);
  assert(loud->error_message == "Exit code 2: bad input");
  assert(loud->next_retry_at.has_value());

  auto quiet = f.store->Get("quiet");
  assert(quiet->error_message == "Exit code 1");
  assert(loop->Stats().failed == 2);
}

void TestTimeoutAndLaunchFailures() {
  Fixture f;
  f.Enqueue("slow", "slow", 9);
  f.Enqueue("broken", "unlaunchable", 1);
  auto loop = f.MakeLoop();

  assert(loop->RunOnce());
  auto slow = f.store->Get("slow");
  assert(slow->state == JobState::kFailed);
  assert(slow->error_message == "Timeout exceeded (9s)");
  assert(slow->execution_time == 7.25);

  assert(loop->RunOnce());
  auto broken = f.store->Get("broken");
  assert(broken->state == JobState::kFailed);
  assert(broken->error_message == "Launch failed: fork: Resource temporarily unavailable");
  assert(!broken->execution_time);
}

void TestExecutorErrorBecomesFailure() {
  Fixture f;
  f.Enqueue("huge", "oom");
  auto loop = f.MakeLoop();

  assert(loop->RunOnce());
  auto job = f.store->Get("huge");
  assert(job->state == JobState::kFailed);
  assert(job->attempts == 1);
  assert(!job->locked_by);
  assert(job->error_message->rfind("Execution failed: ", 0) == 0);
  assert(loop->Stats().failed == 1);

  // listed under FAILED
  assert(f.store->List(jobq::db::JobFilter{JobState::kFailed}).size() == 1);
}

void TestSettleRetriesUntilStoreRecovers() {
  auto repo     = std::make_shared<FlakyRepository>();
  auto store    = std::make_shared<JobStore>(repo);
  auto executor = std::make_shared<ScriptedExecutor>();
  store->SeedDefaults(jobq::core::JobDefaults{});
  store->Enqueue(JobSpec{.id = "ok-job", .command = "ok", .timeout = 9});
  store->Enqueue(JobSpec{.id = "bad-job", .command = "fail", .priority = 0, .timeout = 9});

  // the store starts refusing writes once the job is claimed
  executor->on_run = [&] { repo->fail_begins = 3; };
  WorkerLoop loop(store, executor,
                  WorkerLoopOptions{.worker_id = "worker-flaky", .poll_interval = milliseconds(20), .settle_retry_interval = milliseconds(5)});

  assert(loop.RunOnce());
  auto ok_job = store->Get("ok-job");
  assert(ok_job->state == JobState::kCompleted);
  assert(!ok_job->locked_by);

  assert(loop.RunOnce());
  auto bad_job = store->Get("bad-job");
  assert(bad_job->state == JobState::kFailed);
  assert(bad_job->attempts == 1);
  assert(!bad_job->locked_by);

  assert(loop.Stats().errors == 6);
  assert(loop.Stats().succeeded == 1 && loop.Stats().failed == 1);
}

void TestSettleGivesUpAfterStopGrace() {
  auto repo     = std::make_shared<FlakyRepository>();
  auto store    = std::make_shared<JobStore>(repo);
  auto executor = std::make_shared<ScriptedExecutor>();
  store->SeedDefaults(jobq::core::JobDefaults{});
  store->Enqueue(JobSpec{.id = "stuck", .command = "ok", .timeout = 9});

  executor->on_run = [&] { repo->fail_begins = 1000000; };
  WorkerLoop loop(store, executor,
                  WorkerLoopOptions{.worker_id             = "worker-grace",
                                    .poll_interval         = milliseconds(20),
                                    .settle_retry_interval = milliseconds(5),
                                    .settle_grace          = milliseconds(100)});
  loop.Start();
  assert(WaitFor([&] { return loop.Stats().errors >= 3; }));

  const auto started = std::chrono::steady_clock::now();
  loop.Stop();
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(3));

  repo->fail_begins = 0;
  auto job = store->Get("stuck");
  assert(job->state == JobState::kProcessing);
  assert(job->locked_by == "worker-grace");
  assert(loop.Stats().succeeded == 0);
}

void TestDequeuedJobIsNotRetried() {
  Fixture f;
  f.Enqueue("gone", "ok");
  f.executor->on_run = [&] { f.store->Remove("gone"); };
  auto loop = f.MakeLoop();

  assert(loop->RunOnce());
  assert(!f.store->Get("gone"));
  assert(loop->Stats().succeeded == 0);
  assert(loop->Stats().errors == 0);
}

#if JOBQ_DB_SQLITE
void TestSettleWaitsOutLockedDatabase() {
  const auto db_path = std::filesystem::temp_directory_path() /
                       ("jobq_worker_locked_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".db");

  jobq::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(db_path.string());
  config.mutable_database()->mutable_sqlite()->set_busy_timeout_ms(50);

  auto store    = std::make_shared<JobStore>(jobq::factory::BuildRepository(config));
  auto executor = std::make_shared<ScriptedExecutor>();
  store->SeedDefaults(jobq::core::JobDefaults{});
  store->Enqueue(JobSpec{.id = "locked", .command = "ok", .timeout = 9});

  // a second connection holds the write lock well past busy_timeout
  auto        other = std::make_shared<jobq::db::sqlite::SqliteDB>(db_path.string(), 50);
  std::thread holder;
  executor->on_run = [&] {
    other->Exec("BEGIN IMMEDIATE;");
    holder = std::thread([other] {
      std::this_thread::sleep_for(milliseconds(600));
      other->Exec("COMMIT;");
    });
  };

  WorkerLoop loop(store, executor, WorkerLoopOptions{.worker_id = "worker-sqlite", .settle_retry_interval = milliseconds(20)});
  assert(loop.RunOnce());
  holder.join();

  auto job = store->Get("locked");
  assert(job->state == JobState::kCompleted);
  assert(!job->locked_by);
  assert(loop.Stats().succeeded == 1);

  other.reset();
  store.reset();
  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path.string() + "-wal");
  std::filesystem::remove(db_path.string() + "-shm");
}
#endif

void TestBackgroundLoopDrainsQueue() {
  Fixture f;
  for (int i = 0; i < 5; ++i) f.Enqueue("job-" + std::to_string(i), "ok");

  auto loop = f.MakeLoop();
  loop->Start();
  assert(WaitFor([&] { return loop->Stats().succeeded == 5; }));
  loop->Stop();

  assert(f.store->Status().completed == 5);
  assert(loop->Stats().errors == 0);
}

void TestStopInterruptsPollWait() {
  Fixture f;
  auto    loop = f.MakeLoop(milliseconds(60000));
  loop->Start();
  std::this_thread::sleep_for(milliseconds(50));

  const auto started = std::chrono::steady_clock::now();
  loop->Stop();
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
  assert(loop->StopRequested());
}

void TestStopLetsInFlightJobSettle() {
  Fixture f;
  f.Enqueue("first", "busy", 9);
  f.Enqueue("second", "ok", 1);

  auto loop = f.MakeLoop();
  loop->Start();
  assert(WaitFor([&] { return f.executor->runs.load() == 1; }));
  loop->Stop();

  auto first = f.store->Get("first");
  assert(first->state == JobState::kCompleted);
  assert(first->output == "finished");
  assert(f.store->Get("second")->state == JobState::kPending);
}

void TestRealShellEndToEnd() {
  Fixture f;
  f.store->Enqueue(JobSpec{.id = "echo", .command = "echo hi", .timeout = 5});
  f.store->Enqueue(JobSpec{.id = "false", .command = "echo nope >&2; exit 4", .priority = 0, .timeout = 5});

  WorkerLoop loop(f.store, std::make_shared<jobq::exec::ShellCommandExecutor>(), WorkerLoopOptions{.worker_id = "worker-shell"});
  assert(loop.RunOnce());
  assert(loop.RunOnce());

  auto echo = f.store->Get("echo");
  assert(echo->state == JobState::kCompleted);
  assert(echo->output == "hi");

  auto failed = f.store->Get("false");
  assert(failed->state == JobState::kFailed);
  assert(failed->error_message == "Exit code 4: nope");
}

void TestRejectsMissingDependencies() {
  Fixture f;
  bool    threw = false;
  try {
    WorkerLoop loop(f.store, f.executor, WorkerLoopOptions{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSuccessStoresTrimmedOutput();
  TestNonZeroExitBecomesFailure();
  TestTimeoutAndLaunchFailures();
  TestExecutorErrorBecomesFailure();
  TestSettleRetriesUntilStoreRecovers();
  TestSettleGivesUpAfterStopGrace();
  TestDequeuedJobIsNotRetried();
#if JOBQ_DB_SQLITE
  TestSettleWaitsOutLockedDatabase();
#endif
  TestBackgroundLoopDrainsQueue();
  TestStopInterruptsPollWait();
  TestStopLetsInFlightJobSettle();
  TestRealShellEndToEnd();
  TestRejectsMissingDependencies();

  std::cout << "jobq_unit_worker_loop: pass\n";
  return 0;
}
