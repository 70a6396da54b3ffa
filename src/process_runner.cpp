/**
 * @file process_runner.cpp
 * @brief POSIX child process execution
 *
 * @details Lifecycle of one run:
 *
 *          1. Two pipes (stdout, stderr), both O_CLOEXEC in the parent
 *
 *          2. fork; the child moves into its own process group, wires the
 *             pipes and /dev/null, then execvp
 *
 *          3. The parent drains both pipes with poll() until EOF or deadline
 *
 *          4. On deadline the whole process group gets SIGKILL
 *
 *          5. waitpid reaps the child in every path
 */

#include "takeout_timefix/process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace takeout_timefix {

namespace {

std::system_error last_error(const char *what) {
  return std::system_error(errno, std::generic_category(), what);
}

/// Owns a file descriptor; closes it on scope exit
class Fd {
public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd() { reset(); }
  Fd(const Fd &) = delete;
  Fd &operator=(const Fd &) = delete;

  int get() const { return fd_; }
  void reset(int fd = -1) {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

void make_pipe(Fd &read_end, Fd &write_end) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0)
    throw last_error("pipe2");
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
}

/// Read whatever is available; returns false on EOF
bool drain(int fd, std::string &sink) {
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      sink.append(buf, static_cast<size_t>(n));
      if (static_cast<size_t>(n) < sizeof(buf))
        return true;
      continue;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

} // anonymous namespace

ProcessResult PosixProcessRunner::run(const std::vector<std::string> &argv,
                                      std::chrono::seconds timeout) {
  if (argv.empty())
    throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                            "empty command line");

  /// Build the exec array before fork; nothing may allocate in the child
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &a : argv)
    cargv.push_back(const_cast<char *>(a.c_str()));
  cargv.push_back(nullptr);

  Fd out_r, out_w, err_r, err_w;
  make_pipe(out_r, out_w);
  make_pipe(err_r, err_w);

  pid_t pid = ::fork();
  if (pid < 0)
    throw last_error("fork");

  if (pid == 0) {
    // **----- CHILD -----**
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0)
      ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_w.get(), STDOUT_FILENO);
    ::dup2(err_w.get(), STDERR_FILENO);
    ::execvp(cargv[0], cargv.data());

    const char *msg = "exec failed: ";
    (void)!::write(STDERR_FILENO, msg, std::strlen(msg));
    const char *reason = std::strerror(errno);
    (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
    ::_exit(127);
  }

  // **----- PARENT -----**

  out_w.reset();
  err_w.reset();
  ::fcntl(out_r.get(), F_SETFL, O_NONBLOCK);
  ::fcntl(err_r.get(), F_SETFL, O_NONBLOCK);

  ProcessResult result;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  bool out_open = true;
  bool err_open = true;

  while (out_open || err_open) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      result.timed_out = true;
      break;
    }

    pollfd fds[2];
    nfds_t count = 0;
    if (out_open)
      fds[count++] = {out_r.get(), POLLIN, 0};
    if (err_open)
      fds[count++] = {err_r.get(), POLLIN, 0};

    int ready = ::poll(fds, count, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      int saved = errno;
      ::kill(-pid, SIGKILL);
      ::waitpid(pid, nullptr, 0);
      throw std::system_error(saved, std::generic_category(), "poll");
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0)
        continue;
      if (fds[i].fd == out_r.get()) {
        out_open = drain(out_r.get(), result.stdout_text);
      } else {
        err_open = drain(err_r.get(), result.stderr_text);
      }
    }
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw last_error("waitpid");
  }

  if (!result.timed_out && WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  }
  return result;
}

} // namespace takeout_timefix
