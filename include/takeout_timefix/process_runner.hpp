/**
 * @file process_runner.hpp
 * @brief Child process execution with timeout and output capture
 *
 * @details The executor only needs "run this argv, give me exit code and
 *          stderr, give up after N seconds". ProcessRunner is that seam;
 *          PosixProcessRunner is the real implementation and tests swap in a
 *          scripted one.
 */

#ifndef TAKEOUT_TIMEFIX_PROCESS_RUNNER_HPP
#define TAKEOUT_TIMEFIX_PROCESS_RUNNER_HPP

#include <chrono>
#include <string>
#include <vector>

namespace takeout_timefix {

/**
 * @struct ProcessResult
 * @brief Exit status and captured output of one child process.
 */
struct ProcessResult {
  int exit_code = -1;      //< Exit status, or -1 if killed / not exited
  bool timed_out = false;  //< Child was killed after the timeout
  std::string stdout_text; //< Captured standard output
  std::string stderr_text; //< Captured standard error
};

/**
 * @class ProcessRunner
 * @brief Runs a command line synchronously.
 */
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;

  /**
   * @brief Run argv[0] with argv, blocking until exit or timeout.
   * @throws std::system_error if the child cannot be started
   */
  virtual ProcessResult run(const std::vector<std::string> &argv,
                            std::chrono::seconds timeout) = 0;
};

/**
 * @class PosixProcessRunner
 * @brief fork/execvp runner with pipes, poll-based timeout and SIGKILL.
 *
 * @note stdin is /dev/null so the child can never wait on a prompt.
 *       argv is passed as-is (no shell), so file names need no quoting.
 */
class PosixProcessRunner : public ProcessRunner {
public:
  ProcessResult run(const std::vector<std::string> &argv,
                    std::chrono::seconds timeout) override;
};

} // namespace takeout_timefix

#endif // TAKEOUT_TIMEFIX_PROCESS_RUNNER_HPP
