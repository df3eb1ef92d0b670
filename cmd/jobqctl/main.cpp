#include <unistd.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/job_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/worker_runner.hpp"

#ifndef JOBQ_WORKER_BINARY
#define JOBQ_WORKER_BINARY "jobq-worker"
#endif

using jobq::service::AdminResult;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cout << "Usage: jobqctl [--config <config.yaml>] <command>\n"
            << "  enqueue --id <id> --command <cmd> [--priority N] [--max-retries N] [--timeout N] [--backoff-base N]\n"
            << "  list [--state pending|processing|completed|failed|dead]\n"
            << "  show <id>\n"
            << "  status\n"
            << "  dequeue <id>\n"
            << "  clear --yes\n"
            << "  dlq list | dlq retry <id> | dlq clear\n"
            << "  config get <key> | config set <key> <value> | config list\n"
            << "  worker start [--count N] [--foreground] | worker stop | worker list\n";
}

static std::optional<int64_t> ParseInt(const std::string& text) {
  try {
    std::size_t pos   = 0;
    auto        value = std::stoll(text, &pos);
    if (pos != text.size()) return std::nullopt;
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::string Field(const std::optional<std::string>& v) {
  return v ? *v : "-";
}

static std::string TimeField(const std::optional<jobq::util::TimePoint>& tp) {
  return tp ? jobq::util::ToIso8601(*tp) : "-";
}

static void PrintJobTable(const std::vector<jobq::db::model::JobRecord>& jobs) {
  std::cout << std::left << std::setw(20) << "ID" << std::setw(12) << "STATE" << std::setw(10) << "PRIORITY" << std::setw(10) << "WAITING"
            << std::setw(10) << "ATTEMPTS" << std::setw(28) << "CREATED" << "COMMAND\n";
  for (const auto& job : jobs) {
    std::cout << std::left << std::setw(20) << job.id << std::setw(12) << jobq::model::ToString(job.state) << std::setw(10) << job.priority
              << std::setw(10) << job.waiting_time << std::setw(10) << (std::to_string(job.attempts) + "/" + std::to_string(job.max_retries))
              << std::setw(28) << jobq::util::ToIso8601(job.created_at) << job.command << "\n";
  }
}

static void PrintJob(const jobq::db::model::JobRecord& job) {
  std::cout << "id:             " << job.id << "\n"
            << "command:        " << job.command << "\n"
            << "state:          " << jobq::model::ToString(job.state) << "\n"
            << "attempts:       " << job.attempts << "/" << job.max_retries << "\n"
            << "priority:       " << job.priority << " (effective " << job.priority + job.waiting_time << ")\n"
            << "waiting_time:   " << job.waiting_time << "\n"
            << "timeout:        " << job.timeout << "s\n"
            << "backoff_base:   " << job.backoff_base << "\n"
            << "created_at:     " << jobq::util::ToIso8601(job.created_at) << "\n"
            << "updated_at:     " << jobq::util::ToIso8601(job.updated_at) << "\n"
            << "next_retry_at:  " << TimeField(job.next_retry_at) << "\n"
            << "locked_by:      " << Field(job.locked_by) << "\n"
            << "locked_at:      " << TimeField(job.locked_at) << "\n"
            << "execution_time: " << (job.execution_time ? std::to_string(*job.execution_time) + "s" : "-") << "\n"
            << "output:         " << Field(job.output) << "\n"
            << "error:          " << Field(job.error_message) << "\n";
}

static void PrintWorkers(const std::vector<jobq::registry::WorkerEntry>& workers) {
  for (const auto& w : workers) {
    std::cout << "  " << w.worker_id() << "  pid=" << w.pid() << "  started=" << w.started_at() << "\n";
  }
}

// Prints the result and maps it to the process exit code.
static int Report(const AdminResult& result) {
  if (!result.ok) {
    std::cerr << "error: " << result.message << "\n";
    return 2;
  }
  std::cout << result.message << "\n";
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  std::string              config_path;

  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];
  const std::string sub = args.size() > 1 ? args[1] : "";

  try {
    // ------------------------------------------------------------
    // Configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? jobq::config::ConfigLoader::Defaults() : jobq::config::ConfigLoader::LoadFromYaml(config_path);

    // the CLI's own output is the report; keep store chatter out of it
    if (!std::getenv("JOBQ_LOG_LEVEL")) {
      config.mutable_logging()->set_level("warn");
    }
    jobq::observability::InitializeLogging(config);

    auto* workers = config.mutable_workers();
    if (workers->worker_binary().empty()) {
      workers->set_worker_binary(JOBQ_WORKER_BINARY);
    }
    if (workers->config_path().empty() && !config_path.empty()) {
      workers->set_config_path(std::filesystem::absolute(config_path).string());
    }

    // foreground worker: no pool, no registry
    if (cmd == "worker" && sub == "start" && std::find(args.begin(), args.end(), "--foreground") != args.end()) {
      std::signal(SIGINT, HandleSignal);
      std::signal(SIGTERM, HandleSignal);
      const std::string worker_id = "worker-fg-" + std::to_string(getpid());
      std::cout << "Running " << worker_id << " in the foreground, Ctrl-C to stop\n";
      jobq::worker::RunWorker(config, worker_id, [] { return g_running != 0; });
      jobq::observability::ShutdownLogging();
      return 0;
    }

    auto  app   = jobq::factory::Build(config);
    auto& admin = *app.admin;
    int   rc    = 0;

    // ------------------------------------------------------------
    // Jobs
    // ------------------------------------------------------------
    if (cmd == "enqueue") {
      jobq::core::JobSpec spec;
      for (std::size_t i = 1; i < args.size(); ++i) {
        const auto& flag = args[i];
        if (i + 1 >= args.size()) {
          Usage();
          return 1;
        }
        const auto& value = args[++i];
        if (flag == "--id") {
          spec.id = value;
        } else if (flag == "--command") {
          spec.command = value;
        } else {
          auto number = ParseInt(value);
          if (!number) {
            std::cerr << "invalid number for " << flag << ": " << value << "\n";
            return 1;
          }
          if (flag == "--priority") {
            spec.priority = *number;
          } else if (flag == "--max-retries") {
            spec.max_retries = *number;
          } else if (flag == "--timeout") {
            spec.timeout = *number;
          } else if (flag == "--backoff-base") {
            spec.backoff_base = *number;
          } else {
            Usage();
            return 1;
          }
        }
      }
      if (spec.id.empty() || spec.command.empty()) {
        Usage();
        return 1;
      }
      rc = Report(admin.Enqueue(spec));
    } else if (cmd == "list") {
      std::optional<jobq::model::JobState> state;
      if (args.size() == 3 && args[1] == "--state") {
        state = jobq::model::ParseJobState(args[2]);
        if (!state) {
          std::cerr << "unknown state: " << args[2] << "\n";
          return 1;
        }
      } else if (args.size() != 1) {
        Usage();
        return 1;
      }
      auto result = admin.List(state);
      if (result.ok) PrintJobTable(result.jobs);
      rc = Report(result);
    } else if (cmd == "show") {
      if (args.size() != 2) {
        Usage();
        return 1;
      }
      auto result = admin.Show(args[1]);
      if (result.ok) PrintJob(result.jobs.front());
      rc = result.ok ? 0 : Report(result);
    } else if (cmd == "status") {
      auto result = admin.Status();
      if (result.ok && result.status) {
        const auto& s = *result.status;
        std::cout << "pending:    " << s.pending << "\n"
                  << "processing: " << s.processing << "\n"
                  << "completed:  " << s.completed << "\n"
                  << "failed:     " << s.failed << "\n"
                  << "dead:       " << s.dead << "\n"
                  << "total:      " << s.total << "\n"
                  << "workers:    " << result.workers.size() << "\n";
        PrintWorkers(result.workers);
        rc = 0;
      } else {
        rc = Report(result);
      }
    } else if (cmd == "dequeue") {
      if (args.size() != 2) {
        Usage();
        return 1;
      }
      rc = Report(admin.Dequeue(args[1]));
    } else if (cmd == "clear") {
      if (args.size() != 2 || args[1] != "--yes") {
        std::cerr << "refusing to delete every job without --yes\n";
        return 1;
      }
      rc = Report(admin.ClearAll());

      // ------------------------------------------------------------
      // DLQ
      // ------------------------------------------------------------
    } else if (cmd == "dlq") {
      if (sub == "list" && args.size() == 2) {
        auto result = admin.DlqList();
        if (result.ok) PrintJobTable(result.jobs);
        rc = Report(result);
      } else if (sub == "retry" && args.size() == 3) {
        rc = Report(admin.DlqRetry(args[2]));
      } else if (sub == "clear" && args.size() == 2) {
        rc = Report(admin.DlqClear());
      } else {
        Usage();
        return 1;
      }

      // ------------------------------------------------------------
      // Config
      // ------------------------------------------------------------
    } else if (cmd == "config") {
      if (sub == "get" && args.size() == 3) {
        auto result = admin.ConfigGet(args[2]);
        if (result.ok) std::cout << result.config.front().value << "\n";
        rc = result.ok ? 0 : Report(result);
      } else if (sub == "set" && args.size() == 4) {
        rc = Report(admin.ConfigSet(args[2], args[3]));
      } else if (sub == "list" && args.size() == 2) {
        auto result = admin.ConfigList();
        for (const auto& record : result.config) std::cout << record.key << " = " << record.value << "\n";
        rc = result.ok ? 0 : Report(result);
      } else {
        Usage();
        return 1;
      }

      // ------------------------------------------------------------
      // Workers
      // ------------------------------------------------------------
    } else if (cmd == "worker") {
      if (sub == "start") {
        int64_t count = 1;
        for (std::size_t i = 2; i < args.size(); ++i) {
          if (args[i] == "--count" && i + 1 < args.size()) {
            auto parsed = ParseInt(args[++i]);
            if (!parsed || *parsed < 1) {
              std::cerr << "--count must be a positive integer\n";
              return 1;
            }
            count = *parsed;
          } else {
            Usage();
            return 1;
          }
        }
        auto result = admin.WorkerStart(static_cast<uint32_t>(count));
        rc          = Report(result);
        PrintWorkers(result.workers);
      } else if (sub == "stop" && args.size() == 2) {
        rc = Report(admin.WorkerStop());
      } else if (sub == "list" && args.size() == 2) {
        auto result = admin.WorkerList();
        rc          = Report(result);
        PrintWorkers(result.workers);
      } else {
        Usage();
        return 1;
      }
    } else {
      Usage();
      return 1;
    }

    jobq::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    jobq::observability::ShutdownLogging();
    return 2;
  }
}
