/**
 * @file subprocess.hpp
 * @brief Child process with a captured diagnostic (stderr) stream
 *
 * @details Launches the transcoder with posix_spawnp:
 *
 *          - stdin and stdout go to /dev/null
 *
 *          - stderr is a pipe read line by line by the owning worker
 *
 *          - '\r' and '\n' both end a line (FFmpeg rewrites its status line
 *            with carriage returns)
 *
 * @note terminate() may be called from any thread while another thread is
 *       blocked in read_line() or wait(). The child is never signalled after
 *       it has been reaped, so a recycled PID can't be hit.
 */

#ifndef TRANSCODE_QUEUE_SUBPROCESS_HPP
#define TRANSCODE_QUEUE_SUBPROCESS_HPP

#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

namespace transcode_queue {

/**
 * @class Subprocess
 * @brief RAII owner of one child process and its stderr pipe.
 * @note Not copyable or movable; the destructor kills and reaps a child that
 *       is still running.
 */
class Subprocess {
public:
  Subprocess() = default;
  ~Subprocess();

  Subprocess(const Subprocess &) = delete;
  Subprocess &operator=(const Subprocess &) = delete;

  /**
   * @brief Start the child.
   * @param argv Program (resolved through PATH) and its arguments
   * @param error Output: reason on failure (e.g. "No such file or directory")
   * @return true if the child was started
   */
  bool spawn(const std::vector<std::string> &argv, std::string &error);

  /**
   * @brief Read the next non-empty stderr line (blocking).
   * @param line Output: line without its terminator
   * @return false at end of stream
   */
  bool read_line(std::string &line);

  /**
   * @brief Wait for the child to exit and reap it.
   * @return Exit status, 128 + signal number if killed, -1 on error
   */
  int wait();

  /**
   * @brief Ask the child to stop (SIGTERM). Does not wait.
   * @note No-op if the child was never started or is already reaped.
   */
  void terminate();

  pid_t pid() const { return pid_; }

private:
  void close_pipe();

  pid_t pid_ = -1;
  int err_fd_ = -1;
  bool reaped_ = false;
  int exit_code_ = -1;
  std::mutex reap_mutex_;

  std::string buffer_; //< Unconsumed bytes from the pipe
  bool eof_ = false;
};

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_SUBPROCESS_HPP
