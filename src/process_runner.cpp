/**
 * @file process_runner.cpp
 * @brief fork/exec tool runner implementation
 *
 * @details Launch sequence:
 *
 *          1. Three O_CLOEXEC pipes: stdout, stderr and an exec-status pipe
 *
 *          2. fork; the child wires the pipes to fds 1/2 and execvp()s
 *
 *          3. A failed exec writes errno to the status pipe; a successful one
 *             closes it, so the parent learns the outcome from one read
 *
 *          4. The parent drains stdout/stderr with poll() until both close,
 *             checking the deadline and the cancellation flag between slices
 */

#include "stillcap/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "stillcap/errors.hpp"
#include "stillcap/logging.hpp"

namespace stillcap {

// **---- Internal Helpers ----**

namespace {

volatile std::sig_atomic_t g_cancel_requested = 0;

void on_termination_signal(int) { g_cancel_requested = 1; }

/// Poll slice; bounds how late a timeout or cancellation is noticed
constexpr int POLL_SLICE_MS = 100;

/// Owns one file descriptor
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  int get() const { return fd_; }
  void reset(int fd = -1) {
    if (fd_ != -1)
      close(fd_);
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

struct Pipe {
  UniqueFd read_end;
  UniqueFd write_end;
};

void open_pipe(Pipe &p, const std::string &command) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {
    throw ToolExecutionError(command, -1,
                             fmt::format("pipe2 failed: {}",
                                         std::strerror(errno)));
  }
  p.read_end.reset(fds[0]);
  p.write_end.reset(fds[1]);
}

/// Wait for the child, retrying on EINTR, and decode its status
int reap(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      return -1;
  }
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

/// Read whatever is available; returns false on EOF
bool drain(int fd, std::string &sink) {
  char buf[8192];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      sink.append(buf, static_cast<size_t>(n));
      return true;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    /// Treat read errors like EOF; the exit status tells the real story
    return false;
  }
}

} // anonymous namespace

// **---- Cancellation ----**

void install_cancellation_handlers() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_termination_signal;
  sigemptyset(&sa.sa_mask);
  for (int sig : {SIGINT, SIGTERM}) {
    if (sigaction(sig, &sa, nullptr) != 0)
      LOG_WARN("Could not install handler for signal {}: {}", sig,
               std::strerror(errno));
  }
}

bool cancellation_requested() { return g_cancel_requested != 0; }

// **---- Command Formatting ----**

std::string quote_command(const std::vector<std::string> &argv) {
  std::string out;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      out += ' ';
    const std::string &arg = argv[i];
    bool safe = !arg.empty() &&
                arg.find_first_not_of("abcdefghijklmnopqrstuvwxyz"
                                      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                      "0123456789@%+=:,./-_") ==
                    std::string::npos;
    if (safe) {
      out += arg;
      continue;
    }
    out += '\'';
    for (char c : arg) {
      if (c == '\'')
        out += "'\"'\"'";
      else
        out += c;
    }
    out += '\'';
  }
  return out;
}

// **---- ProcessRunner ----**

ProcessRunner::ProcessRunner(double timeout_sec, bool verbose)
    : timeout_sec_(timeout_sec), verbose_(verbose) {}

CommandResult ProcessRunner::run(const std::vector<std::string> &argv) {
  const std::string command = quote_command(argv);
  if (argv.empty())
    throw ToolExecutionError(command, -1, "empty command");
  if (cancellation_requested())
    throw CancelledError();

  if (verbose_)
    LOG_INFO("$ {}", command);

  Pipe out_pipe, err_pipe, exec_pipe;
  open_pipe(out_pipe, command);
  open_pipe(err_pipe, command);
  open_pipe(exec_pipe, command);

  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  c_argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    throw ToolExecutionError(command, -1,
                             fmt::format("fork failed: {}",
                                         std::strerror(errno)));
  }

  if (pid == 0) {
    /// Child: only async-signal-safe calls from here on
    dup2(out_pipe.write_end.get(), STDOUT_FILENO);
    dup2(err_pipe.write_end.get(), STDERR_FILENO);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull != -1)
      dup2(devnull, STDIN_FILENO);
    execvp(c_argv[0], c_argv.data());
    int exec_errno = errno;
    ssize_t ignored =
        write(exec_pipe.write_end.get(), &exec_errno, sizeof(exec_errno));
    (void)ignored;
    _exit(127);
  }

  out_pipe.write_end.reset();
  err_pipe.write_end.reset();
  exec_pipe.write_end.reset();

  /// Blocks until exec succeeds (pipe closed) or the child reports errno
  int exec_errno = 0;
  ssize_t got;
  do {
    got = read(exec_pipe.read_end.get(), &exec_errno, sizeof(exec_errno));
  } while (got < 0 && errno == EINTR);
  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    reap(pid);
    throw ToolExecutionError(command, -1,
                             fmt::format("failed to launch '{}': {}", argv[0],
                                         std::strerror(exec_errno)));
  }

  CommandResult result;
  const auto start = std::chrono::steady_clock::now();
  bool out_open = true;
  bool err_open = true;

  while (out_open || err_open) {
    if (cancellation_requested()) {
      kill(pid, SIGKILL);
      reap(pid);
      throw CancelledError();
    }
    if (timeout_sec_ > 0) {
      double elapsed = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - start)
                           .count();
      if (elapsed > timeout_sec_) {
        kill(pid, SIGKILL);
        reap(pid);
        throw ToolExecutionError(
            command, -1,
            fmt::format("timed out after {:.1f}s\n{}", timeout_sec_,
                        result.err));
      }
    }

    pollfd fds[2];
    nfds_t count = 0;
    if (out_open)
      fds[count++] = {out_pipe.read_end.get(), POLLIN, 0};
    if (err_open)
      fds[count++] = {err_pipe.read_end.get(), POLLIN, 0};

    int ready = poll(fds, count, POLL_SLICE_MS);
    if (ready < 0) {
      int poll_errno = errno;
      if (poll_errno == EINTR)
        continue;
      kill(pid, SIGKILL);
      reap(pid);
      throw ToolExecutionError(command, -1,
                               fmt::format("poll failed: {}",
                                           std::strerror(poll_errno)));
    }
    if (ready == 0)
      continue;

    for (nfds_t i = 0; i < count; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;
      if (fds[i].fd == out_pipe.read_end.get()) {
        out_open = drain(fds[i].fd, result.out);
      } else {
        err_open = drain(fds[i].fd, result.err);
      }
    }
  }

  result.exit_code = reap(pid);
  return result;
}

// **---- Checked Execution ----**

CommandResult run_checked(CommandRunner &runner,
                          const std::vector<std::string> &argv) {
  CommandResult result = runner.run(argv);
  if (result.exit_code != 0) {
    throw ToolExecutionError(quote_command(argv), result.exit_code,
                             result.err);
  }
  return result;
}

} // namespace stillcap
