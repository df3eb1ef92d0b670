#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/job_store.hpp"
#include "registry/worker_registry.pb.h"
#include "service_context.hpp"

namespace jobq::service {

struct AdminResult {
  bool        ok = true;
  std::string message;

  std::vector<db::model::JobRecord>        jobs;
  std::vector<db::model::ConfigRecord>     config;
  std::optional<core::StatusSummary>       status;
  std::vector<jobq::registry::WorkerEntry> workers;
};

/*
  Administrative surface. Each call maps onto one store or pool operation and
  never throws: failures come back as ok=false with a readable message.
*/
class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  AdminResult Enqueue(const core::JobSpec& spec);
  AdminResult List(std::optional<model::JobState> state = std::nullopt);
  AdminResult Show(const std::string& id);
  AdminResult Status();
  AdminResult Dequeue(const std::string& id);
  AdminResult ClearAll();

  AdminResult DlqList();
  AdminResult DlqRetry(const std::string& id);
  AdminResult DlqClear();

  AdminResult ConfigGet(const std::string& key);
  AdminResult ConfigSet(const std::string& key, const std::string& value);
  AdminResult ConfigList();

  AdminResult WorkerStart(uint32_t count);
  AdminResult WorkerStop();
  AdminResult WorkerList();

private:
  template <typename Fn>
  AdminResult Guard(const char* route, Fn&& fn);

  worker::WorkerPool& Pool();

  ServiceContext ctx_;
};

}
