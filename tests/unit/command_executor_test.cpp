#include "internal/exec/command_executor.hpp"

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using jobq::exec::ShellCommandExecutor;
using std::chrono::milliseconds;
using std::chrono::seconds;

bool ProcessGone(long pid) {
  for (int i = 0; i < 50; ++i) {
    if (kill(static_cast<pid_t>(pid), 0) != 0 && errno == ESRCH) return true;

    // reparented children may linger as zombies where nothing reaps them
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string   line;
    if (!std::getline(stat, line)) return true;
    const auto close_paren = line.rfind(')');
    if (close_paren != std::string::npos && close_paren + 2 < line.size() && line[close_paren + 2] == 'Z') return true;

    std::this_thread::sleep_for(milliseconds(20));
  }
  return false;
}

void TestCapturesStdoutAndExitCode() {
  ShellCommandExecutor executor;
  auto                 result = executor.Run("echo hello; echo oops 1>&2", seconds(5));
  assert(result.exit_code == 0);
  assert(result.stdout_text == "hello\n");
  assert(result.stderr_text == "oops\n");
  assert(result.elapsed_seconds >= 0.0);
}

void TestNonZeroExitIsAResult() {
  ShellCommandExecutor executor;
  auto                 result = executor.Run("echo partial; exit 3", seconds(5));
  assert(result.exit_code == 3);
  assert(result.stdout_text == "partial\n");

  auto missing = executor.Run("definitely_not_a_command_jobq", seconds(5));
  assert(missing.exit_code == 127);
  assert(!missing.stderr_text.empty());
}

void TestShellFeaturesAreAvailable() {
  ShellCommandExecutor executor;
  auto                 result = executor.Run("for i in 1 2 3; do printf $i; done | tr 1 x && test -z \"$(cat)\"", seconds(5));
  assert(result.exit_code == 0);
  assert(result.stdout_text == "x23");
}

void TestLargeOutputDoesNotDeadlock() {
  ShellCommandExecutor executor;
  auto                 result = executor.Run("head -c 1000000 /dev/zero | tr '\\0' a", seconds(10));
  assert(result.exit_code == 0);
  assert(result.stdout_text.size() == 1000000);
}

void TestSignalledCommandReportsShellStyleCode() {
  ShellCommandExecutor executor;
  auto                 result = executor.Run("kill -9 $$", seconds(5));
  assert(result.exit_code == 128 + SIGKILL);
}

void TestTimeoutKillsProcessGroup() {
  const auto pid_file = std::filesystem::temp_directory_path() / ("jobq_executor_pid_" + std::to_string(getpid()));
  std::filesystem::remove(pid_file);

  ShellCommandExecutor executor(milliseconds(200));
  const auto           started = std::chrono::steady_clock::now();
  bool                 timed_out = false;
  try {
    executor.Run("sleep 30 & echo $! > " + pid_file.string() + "; wait", seconds(1));
  } catch (const jobq::util::ExecutionTimeout& e) {
    timed_out = true;
    assert(std::string(e.what()) == "Timeout exceeded (1s)");
    assert(e.elapsed_seconds() >= 1.0);
  }
  assert(timed_out);
  assert(std::chrono::steady_clock::now() - started < seconds(10));

  std::ifstream in(pid_file);
  long          grandchild = 0;
  in >> grandchild;
  assert(grandchild > 0);
  assert(ProcessGone(grandchild));
  std::filesystem::remove(pid_file);
}

void TestTermIgnoringCommandIsKilled() {
  ShellCommandExecutor executor(milliseconds(300));
  bool                 timed_out = false;
  try {
    executor.Run("trap '' TERM; sleep 30", seconds(1));
  } catch (const jobq::util::ExecutionTimeout& e) {
    timed_out = true;
    assert(e.elapsed_seconds() >= 1.2);
    assert(e.elapsed_seconds() < 10.0);
  }
  assert(timed_out);
}

// Short commands launched while other threads keep long-lived children
// running must not wait on pipe ends those children picked up.
void TestConcurrentLaunchesDoNotShareDescriptors() {
  ShellCommandExecutor executor;

  std::vector<std::thread> sleepers;
  for (int i = 0; i < 2; ++i) {
    sleepers.emplace_back([&] {
      for (int j = 0; j < 4; ++j) executor.Run("sleep 1", seconds(10));
    });
  }

  std::vector<std::thread> launchers;
  std::atomic<int>         slow{0};
  for (int i = 0; i < 3; ++i) {
    launchers.emplace_back([&] {
      for (int j = 0; j < 40; ++j) {
        const auto started = std::chrono::steady_clock::now();
        auto       result  = executor.Run("echo quick", seconds(10));
        if (result.stdout_text != "quick\n" || std::chrono::steady_clock::now() - started > milliseconds(800)) slow++;
      }
    });
  }

  for (auto& t : launchers) t.join();
  for (auto& t : sleepers) t.join();
  assert(slow.load() == 0);
}

} // namespace

int main() {
  TestCapturesStdoutAndExitCode();
  TestNonZeroExitIsAResult();
  TestShellFeaturesAreAvailable();
  TestLargeOutputDoesNotDeadlock();
  TestSignalledCommandReportsShellStyleCode();
  TestTimeoutKillsProcessGroup();
  TestTermIgnoringCommandIsKilled();
  TestConcurrentLaunchesDoNotShareDescriptors();

  std::cout << "jobq_unit_command_executor: pass\n";
  return 0;
}
