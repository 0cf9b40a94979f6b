#include "Process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace psm {

namespace {

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout) {
  if (args.empty()) throw std::runtime_error("run_process: empty command");

  // O_CLOEXEC keeps children spawned from other worker threads from holding
  // our write ends open, which would delay EOF.
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    int saved = errno;
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(saved));
  }

  std::vector<char*> c_args;
  c_args.reserve(args.size() + 1);
  for (const auto& a : args) c_args.push_back(const_cast<char*>(a.c_str()));
  c_args.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    int saved = errno;
    close_fd(out_pipe[0]); close_fd(out_pipe[1]);
    close_fd(err_pipe[0]); close_fd(err_pipe[1]);
    throw std::runtime_error(std::string("fork failed: ") + std::strerror(saved));
  }

  if (pid == 0) {
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execvp(c_args[0], c_args.data());
    _exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);

  ProcessResult result;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
  std::string* sinks[2] = {&result.stdout_str, &result.stderr_str};
  int open_count = 2;
  int poll_errno = 0;
  char buf[4096];

  while (open_count > 0) {
    int wait_ms = -1;
    if (timeout.count() > 0) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(remaining.count());
    }

    int rc = ::poll(fds, 2, wait_ms);
    if (rc < 0) {
      if (errno == EINTR) continue;
      poll_errno = errno;
      break;
    }
    if (rc == 0) {
      result.timed_out = true;
      break;
    }

    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) continue;
      ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
      if (n > 0) {
        sinks[i]->append(buf, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        ::close(fds[i].fd);
        fds[i].fd = -1;
        --open_count;
      }
    }
  }

  // Any early exit from the loop leaves a child that may never finish.
  if (result.timed_out || poll_errno != 0) ::kill(pid, SIGKILL);
  for (auto& f : fds) close_fd(f.fd);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
  if (poll_errno != 0) {
    throw std::runtime_error(std::string("poll failed: ") + std::strerror(poll_errno));
  }
  if (!result.timed_out && WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  }
  return result;
}

} // namespace psm
