#pragma once

#include <functional>
#include <string>

#include "config/config.pb.h"

namespace jobq::worker {

/*
  Foreground worker process body shared by jobq-worker and
  `jobqctl worker start --foreground`.

  Opens the configured store, runs one WorkerLoop on a background thread and
  polls `keep_running` (typically a signal flag). When it turns false the loop
  is asked to stop; the in-flight job settles before this returns.
*/
void RunWorker(const jobq::runtime::config::RuntimeConfig& config, const std::string& worker_id, const std::function<bool()>& keep_running);

} // namespace jobq::worker
