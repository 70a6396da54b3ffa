// Exercises the POSIX runner against /bin/sh: exit codes, captured streams,
// the timeout kill and a missing executable.
#include <chrono>
#include <iostream>
#include <string>
#include <system_error>

#include "takeout_timefix/process_runner.hpp"
#include "test_utils.hpp"

using namespace takeout_timefix;
using namespace std::chrono_literals;
using test_utils::check;

namespace {

bool test_exit_and_capture() {
  PosixProcessRunner runner;
  ProcessResult r = runner.run(
      {"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, 10s);
  bool ok = check(!r.timed_out, "quick command does not time out");
  ok &= check(r.exit_code == 3, "exit code propagated");
  ok &= check(r.stdout_text == "out\n", "stdout captured");
  ok &= check(r.stderr_text == "err\n", "stderr captured");
  return ok;
}

bool test_large_output() {
  PosixProcessRunner runner;
  // Larger than a pipe buffer on both streams.
  ProcessResult r = runner.run(
      {"/bin/sh", "-c",
       "i=0; while [ $i -lt 20000 ]; do echo 0123456789; echo x 1>&2; "
       "i=$((i+1)); done"},
      30s);
  bool ok = check(r.exit_code == 0, "large output command succeeds");
  ok &= check(r.stdout_text.size() == 20000u * 11u, "all stdout drained");
  ok &= check(r.stderr_text.size() == 20000u * 2u, "all stderr drained");
  return ok;
}

bool test_stdin_is_closed() {
  PosixProcessRunner runner;
  ProcessResult r = runner.run({"/bin/sh", "-c", "cat; echo done"}, 10s);
  return check(!r.timed_out && r.stdout_text == "done\n",
               "child reads EOF from stdin instead of blocking");
}

bool test_timeout_kills_child() {
  PosixProcessRunner runner;
  auto start = std::chrono::steady_clock::now();
  ProcessResult r = runner.run({"/bin/sh", "-c", "sleep 30"}, 1s);
  auto elapsed = std::chrono::steady_clock::now() - start;
  bool ok = check(r.timed_out, "hung child reported as timed out");
  ok &= check(r.exit_code == -1, "no exit code after kill");
  ok &= check(elapsed < 10s, "runner returns shortly after the deadline");
  return ok;
}

bool test_missing_executable() {
  PosixProcessRunner runner;
  ProcessResult r = runner.run({"/nonexistent/exiftool-xyz", "-ver"}, 10s);
  bool ok = check(r.exit_code == 127, "exec failure exits 127");
  ok &= check(r.stderr_text.find("exec failed") != std::string::npos,
              "exec failure reported on stderr");

  bool threw = false;
  try {
    runner.run({}, 1s);
  } catch (const std::system_error &) {
    threw = true;
  }
  ok &= check(threw, "empty command line rejected");
  return ok;
}

} // namespace

int main() {
  bool ok = true;
  ok &= test_exit_and_capture();
  ok &= test_large_output();
  ok &= test_stdin_is_closed();
  ok &= test_timeout_kills_child();
  ok &= test_missing_executable();
  if (ok) {
    std::cout << "[process_runner_unit] all checks passed\n";
  }
  return ok ? 0 : 1;
}
