#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/db/model/job_record.hpp"

namespace jobq::core {
class JobStore;
}

namespace jobq::exec {
class CommandExecutor;
}

namespace jobq::worker {

struct WorkerLoopOptions {
  std::string               worker_id;
  std::chrono::milliseconds poll_interval{1000};
  // Pause between attempts to record a job outcome the store rejected.
  std::chrono::milliseconds settle_retry_interval{200};
  // After a stop request, how long an unrecorded outcome keeps being retried.
  std::chrono::milliseconds settle_grace{2000};
};

struct WorkerStats {
  uint64_t claimed   = 0;
  uint64_t succeeded = 0;
  uint64_t failed    = 0;
  uint64_t errors    = 0;
};

/*
  Poll -> claim -> execute -> settle, for one worker identity.

  Runs either on the calling thread (Run) or on an owned background thread
  (Start/Stop). A stop request lets the in-flight job settle and ends the
  loop before the next claim; it also cuts the poll wait short.

  A claimed job is always settled: executor errors become failures, and a
  settle the store rejects (busy database, lost connection) is retried until
  it lands or settle_grace has passed since the stop request.
*/
class WorkerLoop {
 public:
  WorkerLoop(std::shared_ptr<core::JobStore> store, std::shared_ptr<exec::CommandExecutor> executor, WorkerLoopOptions options);
  ~WorkerLoop();

  WorkerLoop(const WorkerLoop&)            = delete;
  WorkerLoop& operator=(const WorkerLoop&) = delete;

  // Blocks until RequestStop().
  void Run();

  // One iteration without waiting. True if a job was claimed and settled.
  bool RunOnce();

  void Start();
  void Stop();

  void RequestStop();
  bool StopRequested() const {
    return stop_requested_;
  }

  const std::string& WorkerId() const {
    return options_.worker_id;
  }

  WorkerStats Stats() const;

 private:
  void Execute(const db::model::JobRecord& job);

  // False if the outcome could not be recorded.
  template <typename Fn>
  bool Settle(const std::string& job_id, const char* op, Fn&& fn);

  void WaitPollInterval();

  std::shared_ptr<core::JobStore>        store_;
  std::shared_ptr<exec::CommandExecutor> executor_;
  WorkerLoopOptions                      options_;

  std::atomic<bool>       stop_requested_{false};
  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;
  std::thread             thread_;

  std::atomic<uint64_t> claimed_{0};
  std::atomic<uint64_t> succeeded_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> errors_{0};
};

} // namespace jobq::worker
