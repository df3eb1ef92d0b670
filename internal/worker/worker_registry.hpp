#pragma once

#include <filesystem>

#include "registry/worker_registry.pb.h"

namespace jobq::worker {

/*
  worker_id -> pid table persisted as JSON, so one CLI invocation can stop
  the workers another one started.

  A missing file reads as empty. A corrupt file is logged and read as empty.
  Save() writes a temp file and renames it over the old one.
*/
class WorkerRegistry {
 public:
  explicit WorkerRegistry(std::filesystem::path path);

  jobq::registry::WorkerRegistry Load() const;
  void                           Save(const jobq::registry::WorkerRegistry& registry) const;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

} // namespace jobq::worker
