/**
 * @file subprocess.cpp
 * @brief Child process implementation (posix_spawnp + stderr pipe)
 */

#include "transcode_queue/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

extern char **environ;

namespace transcode_queue {

Subprocess::~Subprocess() {
  {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (pid_ > 0 && !reaped_) {
      kill(pid_, SIGKILL);
      int status;
      while (waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
      }
      reaped_ = true;
    }
  }
  close_pipe();
}

void Subprocess::close_pipe() {
  if (err_fd_ >= 0) {
    close(err_fd_);
    err_fd_ = -1;
  }
}

bool Subprocess::spawn(const std::vector<std::string> &argv,
                       std::string &error) {
  if (argv.empty()) {
    error = "Empty command";
    return false;
  }
  if (pid_ > 0) {
    error = "Process already started";
    return false;
  }

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {
    error = fmt::format("pipe2 failed: {}", std::strerror(errno));
    return false;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null",
                                   O_WRONLY, 0);
  /// dup2 clears FD_CLOEXEC on the target descriptor
  posix_spawn_file_actions_adddup2(&actions, fds[1], STDERR_FILENO);

  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  pid_t pid;
  int rc = posix_spawnp(&pid, c_argv[0], &actions, nullptr, c_argv.data(),
                        environ);
  posix_spawn_file_actions_destroy(&actions);
  close(fds[1]);

  if (rc != 0) {
    close(fds[0]);
    error = fmt::format("Failed to start {}: {}", argv[0], std::strerror(rc));
    return false;
  }

  pid_ = pid;
  err_fd_ = fds[0];
  return true;
}

bool Subprocess::read_line(std::string &line) {
  while (true) {
    size_t pos = buffer_.find_first_of("\r\n");
    while (pos != std::string::npos) {
      line = buffer_.substr(0, pos);
      buffer_.erase(0, pos + 1);
      if (!line.empty())
        return true;
      pos = buffer_.find_first_of("\r\n");
    }

    if (eof_ || err_fd_ < 0) {
      if (buffer_.empty())
        return false;
      line.swap(buffer_);
      buffer_.clear();
      return true;
    }

    char chunk[4096];
    ssize_t n = read(err_fd_, chunk, sizeof(chunk));
    if (n > 0) {
      buffer_.append(chunk, static_cast<size_t>(n));
    } else if (n == 0) {
      eof_ = true;
    } else if (errno != EINTR) {
      eof_ = true;
    }
  }
}

int Subprocess::wait() {
  if (pid_ <= 0)
    return -1;

  /// Block until the child exits but leave it unreaped, so terminate() can
  /// still safely target its PID
  siginfo_t info;
  std::memset(&info, 0, sizeof(info));
  while (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) ==
         -1) {
    if (errno != EINTR)
      break;
  }

  std::lock_guard<std::mutex> lock(reap_mutex_);
  if (reaped_)
    return exit_code_;

  int status = 0;
  pid_t r;
  do {
    r = waitpid(pid_, &status, 0);
  } while (r == -1 && errno == EINTR);
  reaped_ = true;

  if (r == -1) {
    exit_code_ = -1;
  } else if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  } else {
    exit_code_ = -1;
  }
  close_pipe();
  return exit_code_;
}

void Subprocess::terminate() {
  std::lock_guard<std::mutex> lock(reap_mutex_);
  if (pid_ > 0 && !reaped_) {
    kill(pid_, SIGTERM);
  }
}

} // namespace transcode_queue
