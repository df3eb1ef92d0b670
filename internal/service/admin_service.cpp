#include "admin_service.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/worker/worker_pool.hpp"

namespace jobq::service {

using jobq::model::JobState;

namespace {

AdminResult Fail(std::string message) {
  AdminResult result;
  result.ok      = false;
  result.message = std::move(message);
  return result;
}

AdminResult Ok(std::string message) {
  AdminResult result;
  result.message = std::move(message);
  return result;
}

std::string Plural(uint64_t n, const char* noun) {
  return std::to_string(n) + " " + noun + (n == 1 ? "" : "s");
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store) {
    throw std::invalid_argument("AdminService requires a job store");
  }
}

template <typename Fn>
AdminResult AdminService::Guard(const char* route, Fn&& fn) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    JOBQ_LOG_ERROR("admin operation failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    return Fail(ex.what());
  }
}

worker::WorkerPool& AdminService::Pool() {
  if (!ctx_.pool) {
    throw std::runtime_error("worker management is not configured");
  }
  return *ctx_.pool;
}

// ---------------------------------------------------------------------------
// Jobs
// ---------------------------------------------------------------------------

AdminResult AdminService::Enqueue(const core::JobSpec& spec) {
  return Guard("enqueue", [&] {
    auto job    = ctx_.store->Enqueue(spec);
    auto result = Ok("Enqueued job " + job.id);
    result.jobs.push_back(std::move(job));
    return result;
  });
}

AdminResult AdminService::List(std::optional<JobState> state) {
  return Guard("list", [&] {
    auto jobs   = ctx_.store->List(db::JobFilter{state});
    auto result = Ok(Plural(jobs.size(), "job"));
    result.jobs = std::move(jobs);
    return result;
  });
}

AdminResult AdminService::Show(const std::string& id) {
  return Guard("show", [&] {
    auto job = ctx_.store->Get(id);
    if (!job) {
      return Fail("Job " + id + " not found");
    }
    auto result = Ok("Job " + id);
    result.jobs.push_back(std::move(*job));
    return result;
  });
}

AdminResult AdminService::Status() {
  return Guard("status", [&] {
    auto summary = ctx_.store->Status();
    auto result  = Ok(Plural(summary.total, "job"));
    result.status = summary;
    if (ctx_.pool) {
      result.workers = ctx_.pool->Active();
    }
    return result;
  });
}

AdminResult AdminService::Dequeue(const std::string& id) {
  return Guard("dequeue", [&] {
    if (!ctx_.store->Remove(id)) {
      return Fail("Job " + id + " not found");
    }
    return Ok("Removed job " + id);
  });
}

AdminResult AdminService::ClearAll() {
  return Guard("clear", [&] {
    const auto removed = ctx_.store->Clear();
    return Ok("Cleared " + Plural(removed, "job"));
  });
}

// ---------------------------------------------------------------------------
// DLQ
// ---------------------------------------------------------------------------

AdminResult AdminService::DlqList() {
  return Guard("dlq_list", [&] {
    auto jobs   = ctx_.store->ListDeadLetters();
    auto result = Ok(Plural(jobs.size(), "job") + " in DLQ");
    result.jobs = std::move(jobs);
    return result;
  });
}

AdminResult AdminService::DlqRetry(const std::string& id) {
  return Guard("dlq_retry", [&] {
    if (!ctx_.store->RetryDeadLetter(id)) {
      return Fail("Job " + id + " is not in the DLQ");
    }
    return Ok("Job " + id + " moved back to pending");
  });
}

AdminResult AdminService::DlqClear() {
  return Guard("dlq_clear", [&] {
    const auto removed = ctx_.store->ClearDeadLetters();
    return Ok("Cleared " + Plural(removed, "job") + " from DLQ");
  });
}

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

AdminResult AdminService::ConfigGet(const std::string& key) {
  return Guard("config_get", [&] {
    auto value = ctx_.store->GetConfig(key);
    if (!value) {
      return Fail("Config key " + key + " not set");
    }
    auto result = Ok(key + " = " + *value);
    result.config.push_back({key, *value});
    return result;
  });
}

AdminResult AdminService::ConfigSet(const std::string& key, const std::string& value) {
  return Guard("config_set", [&] {
    ctx_.store->SetConfig(key, value);
    auto result = Ok("Set " + key + " = " + value);
    result.config.push_back({key, value});
    return result;
  });
}

AdminResult AdminService::ConfigList() {
  return Guard("config_list", [&] {
    auto records  = ctx_.store->ListConfig();
    auto result   = Ok(Plural(records.size(), "config key"));
    result.config = std::move(records);
    return result;
  });
}

// ---------------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------------

AdminResult AdminService::WorkerStart(uint32_t count) {
  return Guard("worker_start", [&] {
    if (count == 0) {
      return Fail("worker count must be at least 1");
    }
    auto started    = Pool().Start(count);
    auto result     = Ok("Started " + Plural(started.size(), "worker"));
    result.workers  = std::move(started);
    return result;
  });
}

AdminResult AdminService::WorkerStop() {
  return Guard("worker_stop", [&] {
    const auto stopped = Pool().Stop();
    if (stopped == 0) {
      return Ok("No running workers");
    }
    return Ok("Stopped " + Plural(stopped, "worker"));
  });
}

AdminResult AdminService::WorkerList() {
  return Guard("worker_list", [&] {
    auto active    = Pool().Active();
    auto result    = Ok(Plural(active.size(), "active worker"));
    result.workers = std::move(active);
    return result;
  });
}

} // namespace jobq::service
