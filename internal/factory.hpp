#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/job_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/worker/worker_pool.hpp"

namespace jobq::factory {

/*
  Application

  Owns all long-lived objects of one process.
*/
struct Application {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<core::JobStore>        store;
  std::shared_ptr<worker::WorkerPool>    pool;
  std::shared_ptr<service::AdminService> admin;
};

/*
  Opens the configured backend and bootstraps its schema
  (CREATE TABLE IF NOT EXISTS + sanity selects).

  NOTE:
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const jobq::runtime::config::RuntimeConfig& config);

core::JobDefaults JobDefaultsFromConfig(const jobq::runtime::config::RuntimeConfig& config);

/*
  Composition root: repository, job store (with config defaults seeded),
  worker pool and admin service.
*/
Application Build(const jobq::runtime::config::RuntimeConfig& config);

} // namespace jobq::factory
