/**
 * @file process.cpp
 * @brief fork/execvp subprocess runner implementation
 *
 * @details stdout and stderr are read through two pipes drained with poll()
 *          so a chatty child can never block on a full pipe while we wait
 *          on the other one.
 */

#include "clip_unify/process.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace clip_unify {

namespace {

/// Cap on retained stderr; ffmpeg can be very verbose on broken input
constexpr size_t MAX_DIAGNOSTIC_BYTES = 64 * 1024;

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

/// Read whatever is available on fd into sink. Returns false on EOF/error.
bool drain_once(int fd, std::string &sink, size_t limit) {
  char buffer[4096];
  ssize_t n = read(fd, buffer, sizeof(buffer));
  if (n < 0 && (errno == EINTR || errno == EAGAIN))
    return true;
  if (n <= 0)
    return false;
  sink.append(buffer, static_cast<size_t>(n));
  if (limit > 0 && sink.size() > limit)
    sink.erase(0, sink.size() - limit);
  return true;
}

int wait_for_child(pid_t pid) {
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

} // anonymous namespace

std::string ProcessOutcome::last_diagnostic_line() const {
  size_t end = diagnostics.find_last_not_of(" \t\r\n");
  if (end == std::string::npos)
    return {};
  size_t begin = diagnostics.find_last_of('\n', end);
  begin = (begin == std::string::npos) ? 0 : begin + 1;
  return diagnostics.substr(begin, end - begin + 1);
}

std::string format_command(const std::vector<std::string> &argv) {
  std::string cmd;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      cmd += " ";
    const std::string &a = argv[i];
    if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos) {
      cmd += fmt::format("\"{}\"", a);
    } else {
      cmd += a;
    }
  }
  return cmd;
}

ProcessOutcome SubprocessRunner::run(const std::vector<std::string> &argv) {
  ProcessOutcome outcome;
  if (argv.empty()) {
    outcome.diagnostics = "empty command";
    return outcome;
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
    outcome.diagnostics = fmt::format("pipe failed: {}", std::strerror(errno));
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    return outcome;
  }

  /// Build the argv array before forking; only async-signal-safe calls
  /// are allowed in the child
  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &a : argv)
    c_argv.push_back(const_cast<char *>(a.c_str()));
  c_argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    outcome.diagnostics = fmt::format("fork failed: {}", std::strerror(errno));
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    return outcome;
  }

  if (pid == 0) {
    // **---- CHILD ----**
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    execvp(c_argv[0], c_argv.data());

    /// exec failed: report through stderr and exit like a shell would
    static const char msg[] = ": cannot execute\n";
    ssize_t ignored = write(STDERR_FILENO, c_argv[0], std::strlen(c_argv[0]));
    ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    _exit(127);
  }

  // **---- PARENT ----**
  outcome.spawned = true;
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);

  pollfd fds[2];
  fds[0] = {out_pipe[0], POLLIN, 0};
  fds[1] = {err_pipe[0], POLLIN, 0};
  int open_fds = 2;

  while (open_fds > 0) {
    int ready = poll(fds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      std::string &sink = (i == 0) ? outcome.output : outcome.diagnostics;
      size_t limit = (i == 0) ? 0 : MAX_DIAGNOSTIC_BYTES;
      if (!drain_once(fds[i].fd, sink, limit)) {
        close(fds[i].fd);
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }

  /// poll() failure leaves descriptors open; close them so the child sees
  /// EPIPE instead of blocking forever
  for (auto &p : fds) {
    if (p.fd >= 0)
      close(p.fd);
  }

  outcome.exit_code = wait_for_child(pid);
  return outcome;
}

} // namespace clip_unify
