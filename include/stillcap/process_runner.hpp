/**
 * @file process_runner.hpp
 * @brief Blocking execution of the external probing and encoding tools
 *
 * @details Every ffprobe/ffmpeg call in stillcap goes through a
 *          CommandRunner. The production ProcessRunner forks and execs the
 *          tool directly (no shell), captures stdout and stderr, enforces an
 *          optional timeout and reacts to SIGINT/SIGTERM by killing the child
 *          and throwing CancelledError so that RAII cleanup runs.
 *
 * @note Tests substitute a scripted CommandRunner.
 */

#ifndef STILLCAP_PROCESS_RUNNER_HPP
#define STILLCAP_PROCESS_RUNNER_HPP

#include <string>
#include <vector>

namespace stillcap {

/**
 * @struct CommandResult
 * @brief Exit status and captured output of one tool invocation.
 */
struct CommandResult {
  int exit_code = 0;    //< Exit status, 128 + signal when killed
  std::string out;      //< Captured stdout
  std::string err;      //< Captured stderr
};

/**
 * @class CommandRunner
 * @brief Runs one command to completion.
 */
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /**
   * @brief Run argv[0] with the given arguments and wait for it.
   * @return Exit code and captured streams, whatever the exit code is
   * @throws ToolExecutionError if the tool cannot be started or times out
   * @throws CancelledError if a termination signal arrived
   */
  virtual CommandResult run(const std::vector<std::string> &argv) = 0;
};

/**
 * @class ProcessRunner
 * @brief fork/exec implementation of CommandRunner.
 */
class ProcessRunner : public CommandRunner {
public:
  /**
   * @param timeout_sec Per-invocation limit, 0 or negative = unbounded
   * @param verbose Log every command line before running it
   */
  explicit ProcessRunner(double timeout_sec = 0.0, bool verbose = false);

  CommandResult run(const std::vector<std::string> &argv) override;

private:
  double timeout_sec_;
  bool verbose_;
};

/**
 * @brief Run a command and require exit status 0.
 * @throws ToolExecutionError carrying the command and stderr otherwise
 */
CommandResult run_checked(CommandRunner &runner,
                          const std::vector<std::string> &argv);

/**
 * @brief Render argv as a copy-pasteable shell command line.
 */
std::string quote_command(const std::vector<std::string> &argv);

// **---- Cancellation ----**

/**
 * @brief Install SIGINT/SIGTERM handlers that request cancellation.
 */
void install_cancellation_handlers();

/**
 * @brief True once a termination signal has been received.
 */
bool cancellation_requested();

} // namespace stillcap

#endif // STILLCAP_PROCESS_RUNNER_HPP
