#pragma once

#include <memory>

namespace jobq::core { class JobStore; }
namespace jobq::worker { class WorkerPool; }

namespace jobq::service {

/*
  Dependency container shared by all services.
  `pool` may be null where worker management is not available.
*/
struct ServiceContext {
  std::shared_ptr<jobq::core::JobStore> store;
  std::shared_ptr<jobq::worker::WorkerPool> pool;
};

}
