#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace jobq::worker {

using ProcessId = int64_t;

struct WorkerLaunch {
  std::string              binary;
  std::vector<std::string> args;
  // stdout/stderr destination; empty means /dev/null
  std::string              log_path;
};

/*
  Starts and signals worker processes. The pool manager only ever deals in
  process ids, so a fake supervisor is enough to test it.
*/
class ProcessSupervisor {
 public:
  virtual ~ProcessSupervisor() = default;

  // Throws util::LaunchError.
  virtual ProcessId Spawn(const WorkerLaunch& launch) = 0;

  // Sends SIGTERM. False if the process no longer exists.
  virtual bool Terminate(ProcessId pid) = 0;

  virtual bool IsAlive(ProcessId pid) = 0;
};

/*
  fork + setsid + execv. The child runs in its own session so it outlives
  the launching CLI and never receives the terminal's signals.
*/
class PosixProcessSupervisor final : public ProcessSupervisor {
 public:
  ProcessId Spawn(const WorkerLaunch& launch) override;
  bool      Terminate(ProcessId pid) override;
  bool      IsAlive(ProcessId pid) override;
};

} // namespace jobq::worker
