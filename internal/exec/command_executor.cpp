#include "command_executor.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace jobq::exec {

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr auto kPollTick = std::chrono::milliseconds(50);

// Both ends are close-on-exec from creation, so a fork+exec on another
// thread never inherits them.
int OpenPipe(int fds[2]) {
  return pipe2(fds, O_CLOEXEC);
}

void CloseFd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Reads whatever is available on `fd`; closes it on EOF or error.
void Drain(int& fd, std::string& out) {
  char buf[4096];
  for (;;) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      out.append(buf, static_cast<std::size_t>(n));
      if (static_cast<std::size_t>(n) < sizeof(buf)) return;
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
    CloseFd(fd);
    return;
  }
}

// Waits up to `timeout` for readable data on the open pipes.
void PollPipes(int& out_fd, std::string& out, int& err_fd, std::string& err, std::chrono::milliseconds timeout) {
  pollfd fds[2];
  nfds_t n = 0;
  if (out_fd >= 0) fds[n++] = {out_fd, POLLIN, 0};
  if (err_fd >= 0) fds[n++] = {err_fd, POLLIN, 0};
  if (n == 0) {
    std::this_thread::sleep_for(timeout);
    return;
  }

  int ready = poll(fds, n, static_cast<int>(timeout.count()));
  if (ready <= 0) return; // timeout or EINTR

  for (nfds_t i = 0; i < n; ++i) {
    if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
    if (fds[i].fd == out_fd) {
      Drain(out_fd, out);
    } else if (fds[i].fd == err_fd) {
      Drain(err_fd, err);
    }
  }
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

bool TryReap(pid_t pid, int& status) {
  for (;;) {
    pid_t rc = waitpid(pid, &status, WNOHANG);
    if (rc == pid) return true;
    if (rc == 0) return false;
    if (errno == EINTR) continue;
    // ECHILD: nothing left to wait for
    status = 0;
    return true;
  }
}

void ReapBlocking(pid_t pid, int& status) {
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

double SecondsSince(SteadyClock::time_point start) {
  return std::chrono::duration<double>(SteadyClock::now() - start).count();
}

} // namespace

ShellCommandExecutor::ShellCommandExecutor(std::chrono::milliseconds kill_grace) : kill_grace_(kill_grace) {
}

ExecutionResult ShellCommandExecutor::Run(const std::string& command, std::chrono::seconds timeout) {
  int out_pipe[2];
  int err_pipe[2];
  int exec_pipe[2];
  if (OpenPipe(out_pipe) == -1) {
    throw util::LaunchError(std::string("pipe: ") + std::strerror(errno));
  }
  if (OpenPipe(err_pipe) == -1) {
    int saved = errno;
    close(out_pipe[0]);
    close(out_pipe[1]);
    throw util::LaunchError(std::string("pipe: ") + std::strerror(saved));
  }
  if (OpenPipe(exec_pipe) == -1) {
    int saved = errno;
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
    throw util::LaunchError(std::string("pipe: ") + std::strerror(saved));
  }

  const char* cmd   = command.c_str();
  const auto  start = SteadyClock::now();

  pid_t pid = fork();
  if (pid < 0) {
    int saved = errno;
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]}) close(fd);
    throw util::LaunchError(std::string("fork: ") + std::strerror(saved));
  }

  if (pid == 0) {
    // child: async-signal-safe calls only
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execl("/bin/sh", "sh", "-c", cmd, static_cast<char*>(nullptr));
    int err = errno;
    ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  // parent: also set the group here so a kill(-pid) right after fork can't miss
  setpgid(pid, pid);
  close(out_pipe[1]);
  close(err_pipe[1]);
  close(exec_pipe[1]);

  int     exec_errno = 0;
  ssize_t n;
  while ((n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR) {
  }
  close(exec_pipe[0]);

  int out_fd = out_pipe[0];
  int err_fd = err_pipe[0];
  fcntl(out_fd, F_SETFL, fcntl(out_fd, F_GETFL, 0) | O_NONBLOCK);
  fcntl(err_fd, F_SETFL, fcntl(err_fd, F_GETFL, 0) | O_NONBLOCK);

  int status = 0;
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    CloseFd(out_fd);
    CloseFd(err_fd);
    ReapBlocking(pid, status);
    throw util::LaunchError(std::string("exec /bin/sh: ") + std::strerror(exec_errno));
  }

  ExecutionResult result;
  const auto      deadline = start + timeout;
  bool            exited   = false;

  while (!exited) {
    const auto now = SteadyClock::now();
    if (now >= deadline) break;
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    PollPipes(out_fd, result.stdout_text, err_fd, result.stderr_text, std::min<std::chrono::milliseconds>(kPollTick, remaining + std::chrono::milliseconds(1)));
    exited = TryReap(pid, status);
  }

  if (!exited) {
    JOBQ_LOG_WARN("command timed out, terminating process group", {observability::IntField("pid", pid), observability::IntField("timeout_s", timeout.count())});
    kill(-pid, SIGTERM);

    const auto grace_deadline = SteadyClock::now() + kill_grace_;
    while (!(exited = TryReap(pid, status)) && SteadyClock::now() < grace_deadline) {
      PollPipes(out_fd, result.stdout_text, err_fd, result.stderr_text, std::chrono::milliseconds(10));
    }
    if (!exited) {
      kill(-pid, SIGKILL);
      ReapBlocking(pid, status);
    }
    // stray members of the group still holding the pipes
    kill(-pid, SIGKILL);
    CloseFd(out_fd);
    CloseFd(err_fd);

    const double elapsed = SecondsSince(start);
    throw util::ExecutionTimeout("Timeout exceeded (" + std::to_string(timeout.count()) + "s)", elapsed);
  }

  // collect what the shell wrote before exiting; background children may keep
  // the pipes open, so stop as soon as nothing is immediately readable
  while (out_fd >= 0 || err_fd >= 0) {
    const auto before      = result.stdout_text.size() + result.stderr_text.size();
    const int  open_before = (out_fd >= 0) + (err_fd >= 0);
    PollPipes(out_fd, result.stdout_text, err_fd, result.stderr_text, std::chrono::milliseconds(0));
    const int open_after = (out_fd >= 0) + (err_fd >= 0);
    if (result.stdout_text.size() + result.stderr_text.size() == before && open_after == open_before) break;
  }
  CloseFd(out_fd);
  CloseFd(err_fd);

  result.exit_code       = DecodeStatus(status);
  result.elapsed_seconds = SecondsSince(start);
  return result;
}

} // namespace jobq::exec
