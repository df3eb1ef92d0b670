#include "process_supervisor.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace jobq::worker {

namespace {

// A zombie still answers kill(pid, 0); /proc tells it apart.
bool IsZombie(pid_t pid) {
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  if (!stat) return false;

  std::string line;
  std::getline(stat, line);
  const auto close_paren = line.rfind(')');
  if (close_paren == std::string::npos || close_paren + 2 >= line.size()) return false;
  return line[close_paren + 2] == 'Z';
}

} // namespace

ProcessId PosixProcessSupervisor::Spawn(const WorkerLaunch& launch) {
  if (launch.binary.empty()) {
    throw util::LaunchError("worker binary not configured");
  }

  std::vector<std::string> storage;
  storage.reserve(launch.args.size() + 1);
  storage.push_back(launch.binary);
  storage.insert(storage.end(), launch.args.begin(), launch.args.end());

  std::vector<char*> argv;
  argv.reserve(storage.size() + 1);
  for (auto& arg : storage) argv.push_back(arg.data());
  argv.push_back(nullptr);

  const char* output = launch.log_path.empty() ? "/dev/null" : launch.log_path.c_str();

  int exec_pipe[2];
  if (pipe(exec_pipe) == -1) {
    throw util::LaunchError(std::string("pipe: ") + std::strerror(errno));
  }
  fcntl(exec_pipe[0], F_SETFD, FD_CLOEXEC);
  fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

  pid_t pid = fork();
  if (pid < 0) {
    int saved = errno;
    close(exec_pipe[0]);
    close(exec_pipe[1]);
    throw util::LaunchError(std::string("fork: ") + std::strerror(saved));
  }

  if (pid == 0) {
    setsid();
    int in = open("/dev/null", O_RDONLY);
    if (in >= 0) {
      dup2(in, STDIN_FILENO);
      close(in);
    }
    int out = open(output, O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (out >= 0) {
      dup2(out, STDOUT_FILENO);
      dup2(out, STDERR_FILENO);
      close(out);
    }
    execv(argv[0], argv.data());
    int err = errno;
    ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  close(exec_pipe[1]);
  int     exec_errno = 0;
  ssize_t n;
  while ((n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR) {
  }
  close(exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    waitpid(pid, &status, 0);
    throw util::LaunchError("exec " + launch.binary + ": " + std::strerror(exec_errno));
  }

  JOBQ_LOG_INFO("worker process spawned", {observability::IntField("pid", pid), observability::StringField("binary", launch.binary)});
  return pid;
}

bool PosixProcessSupervisor::Terminate(ProcessId pid) {
  if (pid <= 0) return false;
  if (kill(static_cast<pid_t>(pid), SIGTERM) == 0) {
    return true;
  }
  if (errno != ESRCH) {
    JOBQ_LOG_WARN("failed to signal worker", {observability::IntField("pid", pid), observability::StringField("error", std::strerror(errno))});
  }
  return false;
}

bool PosixProcessSupervisor::IsAlive(ProcessId pid) {
  if (pid <= 0) return false;

  // our own child: reap it if it has exited
  int   status = 0;
  pid_t rc     = waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
  if (rc == static_cast<pid_t>(pid)) return false;

  if (kill(static_cast<pid_t>(pid), 0) != 0) {
    // EPERM means it exists but belongs to someone else
    return errno == EPERM;
  }
  return !IsZombie(static_cast<pid_t>(pid));
}

} // namespace jobq::worker
