#pragma once

#include <chrono>
#include <string>

namespace jobq::exec {

struct ExecutionResult {
  int         exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  double      elapsed_seconds = 0.0;
};

/*
  Runs one job command to completion.

  Throws util::ExecutionTimeout when `timeout` elapses (the process has been
  terminated by then) and util::LaunchError when the command can't be started.
  A nonzero exit is a normal result, not an exception.
*/
class CommandExecutor {
 public:
  virtual ~CommandExecutor() = default;

  virtual ExecutionResult Run(const std::string& command, std::chrono::seconds timeout) = 0;
};

/*
  POSIX executor: `/bin/sh -c <command>` in its own process group, stdin from
  /dev/null, stdout/stderr captured through pipes. On timeout the whole group
  gets SIGTERM, then SIGKILL after `kill_grace`.
*/
class ShellCommandExecutor final : public CommandExecutor {
 public:
  explicit ShellCommandExecutor(std::chrono::milliseconds kill_grace = std::chrono::milliseconds(2000));

  ExecutionResult Run(const std::string& command, std::chrono::seconds timeout) override;

 private:
  std::chrono::milliseconds kill_grace_;
};

} // namespace jobq::exec
