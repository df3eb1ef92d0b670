#include "worker_loop.hpp"

#include <optional>
#include <stdexcept>

#include "internal/core/job_store.hpp"
#include "internal/exec/command_executor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace jobq::worker {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

std::string Trim(const std::string& text) {
  const auto* ws    = " \t\r\n\f\v";
  const auto  begin = text.find_first_not_of(ws);
  if (begin == std::string::npos) return {};
  const auto end = text.find_last_not_of(ws);
  return text.substr(begin, end - begin + 1);
}

} // namespace

WorkerLoop::WorkerLoop(std::shared_ptr<core::JobStore> store, std::shared_ptr<exec::CommandExecutor> executor, WorkerLoopOptions options)
    : store_(std::move(store)), executor_(std::move(executor)), options_(std::move(options)) {
  if (!store_ || !executor_) {
    throw std::invalid_argument("WorkerLoop requires a store and an executor");
  }
  if (options_.worker_id.empty()) {
    throw std::invalid_argument("WorkerLoop requires a worker id");
  }
}

WorkerLoop::~WorkerLoop() {
  Stop();
}

void WorkerLoop::Start() {
  stop_requested_ = false;
  thread_         = std::thread(&WorkerLoop::Run, this);
}

void WorkerLoop::Stop() {
  RequestStop();
  if (thread_.joinable()) thread_.join();
}

void WorkerLoop::RequestStop() {
  {
    std::lock_guard lock(wait_mutex_);
    stop_requested_ = true;
  }
  wait_cv_.notify_all();
}

WorkerStats WorkerLoop::Stats() const {
  return WorkerStats{claimed_.load(), succeeded_.load(), failed_.load(), errors_.load()};
}

void WorkerLoop::Run() {
  JOBQ_LOG_INFO("worker started", {StringField("worker_id", options_.worker_id), IntField("poll_interval_ms", options_.poll_interval.count())});

  while (!stop_requested_) {
    bool processed = false;
    try {
      processed = RunOnce();
    } catch (const std::exception& e) {
      errors_++;
      JOBQ_LOG_ERROR("worker iteration failed", {StringField("worker_id", options_.worker_id), StringField("error", e.what())});
    }

    if (!processed) {
      WaitPollInterval();
    }
  }

  JOBQ_LOG_INFO("worker stopped", {StringField("worker_id", options_.worker_id), IntField("succeeded", static_cast<int64_t>(succeeded_.load())),
                                   IntField("failed", static_cast<int64_t>(failed_.load()))});
}

bool WorkerLoop::RunOnce() {
  auto job = store_->Claim(options_.worker_id);
  if (!job) {
    return false;
  }

  claimed_++;
  JOBQ_LOG_INFO("job claimed", {StringField("worker_id", options_.worker_id), StringField("job_id", job->id), IntField("attempt", job->attempts + 1)});
  Execute(*job);
  return true;
}

template <typename Fn>
bool WorkerLoop::Settle(const std::string& job_id, const char* op, Fn&& fn) {
  std::optional<std::chrono::steady_clock::time_point> give_up_at;

  while (true) {
    try {
      fn();
      return true;
    } catch (const util::NotFound& e) {
      // dequeued while running
      JOBQ_LOG_WARN("job vanished before settle", {StringField("worker_id", options_.worker_id), StringField("job_id", job_id), StringField("error", e.what())});
      return false;
    } catch (const util::InvalidState& e) {
      JOBQ_LOG_WARN("job no longer processing", {StringField("worker_id", options_.worker_id), StringField("job_id", job_id), StringField("error", e.what())});
      return false;
    } catch (const std::exception& e) {
      errors_++;
      JOBQ_LOG_WARN("settle failed, retrying",
                    {StringField("worker_id", options_.worker_id), StringField("job_id", job_id), StringField("op", op), StringField("error", e.what())});
    }

    if (stop_requested_) {
      const auto now = std::chrono::steady_clock::now();
      if (!give_up_at) give_up_at = now + options_.settle_grace;
      if (now >= *give_up_at) {
        JOBQ_LOG_ERROR("giving up on settle, job left processing", {StringField("worker_id", options_.worker_id), StringField("job_id", job_id), StringField("op", op)});
        return false;
      }
    }
    std::this_thread::sleep_for(options_.settle_retry_interval);
  }
}

void WorkerLoop::Execute(const db::model::JobRecord& job) {
  std::string           failure;
  std::optional<double> elapsed;

  try {
    auto result = executor_->Run(job.command, std::chrono::seconds(job.timeout));
    elapsed     = result.elapsed_seconds;

    if (result.exit_code == 0) {
      const auto output = Trim(result.stdout_text);
      if (Settle(job.id, "settle_success", [&] { store_->SettleSuccess(job.id, output, result.elapsed_seconds); })) {
        succeeded_++;
        JOBQ_LOG_INFO("job completed", {StringField("worker_id", options_.worker_id), StringField("job_id", job.id), DoubleField("elapsed", result.elapsed_seconds)});
      }
      return;
    }

    failure         = "Exit code " + std::to_string(result.exit_code);
    const auto errs = Trim(result.stderr_text);
    if (!errs.empty()) failure += ": " + errs;
  } catch (const util::ExecutionTimeout& e) {
    failure = e.what();
    elapsed = e.elapsed_seconds();
  } catch (const util::LaunchError& e) {
    failure = std::string("Launch failed: ") + e.what();
  } catch (const std::exception& e) {
    failure = std::string("Execution failed: ") + e.what();
  }

  db::model::JobRecord settled;
  if (!Settle(job.id, "settle_failure", [&] { settled = store_->SettleFailure(job.id, failure, elapsed); })) {
    return;
  }
  failed_++;
  JOBQ_LOG_WARN("job failed", {StringField("worker_id", options_.worker_id), StringField("job_id", job.id), IntField("attempt", settled.attempts),
                               StringField("state", jobq::model::ToString(settled.state)), StringField("error", failure)});
}

void WorkerLoop::WaitPollInterval() {
  std::unique_lock lock(wait_mutex_);
  wait_cv_.wait_for(lock, options_.poll_interval, [this] { return stop_requested_.load(); });
}

} // namespace jobq::worker
