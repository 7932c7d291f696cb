/**
 * @file executor.hpp
 * @brief Transcoder execution for a single conversion job
 *
 * @details Runs on a worker-pool thread. One call to
 *          ExecutionEngine::execute():
 *
 *          - Ensures the output directory exists
 *
 *          - Probes the input duration (progress denominator)
 *
 *          - Spawns the transcoder and feeds its stderr to a ProgressMonitor
 *
 *          - Waits for exit and classifies the outcome into a JobResult
 *
 *          - Retries failed runs with exponential backoff when configured
 *
 * @note execute() never throws; every fault becomes a failed JobResult.
 */

#ifndef TRANSCODE_QUEUE_EXECUTOR_HPP
#define TRANSCODE_QUEUE_EXECUTOR_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>

#include "progress_monitor.hpp"
#include "types.hpp"

namespace transcode_queue {

class Subprocess;

/// Error codes attached to failed results
namespace ErrorCode {
constexpr const char *CONVERSION_ERROR = "CONVERSION_ERROR";
constexpr const char *OUTPUT_MISSING = "OUTPUT_MISSING";
constexpr const char *LAUNCH_ERROR = "LAUNCH_ERROR";
constexpr const char *IO_ERROR = "IO_ERROR";
constexpr const char *UNKNOWN_ERROR = "UNKNOWN_ERROR";
} // namespace ErrorCode

/**
 * @class ExecutionControl
 * @brief Cancellation handle shared by the Scheduler and one execution.
 *
 * @note cancel() is non-blocking: it flags the execution and sends SIGTERM
 *       to the attached transcoder, if any. Cancelling before the process is
 *       attached terminates it as soon as it is.
 */
class ExecutionControl {
public:
  void cancel();
  bool is_cancelled() const;

  /**
   * @brief Sleep up to @p delay unless cancelled.
   * @return true if cancelled (possibly during the wait)
   */
  bool wait_cancelled_for(std::chrono::milliseconds delay);

  void attach(Subprocess *proc);
  void detach();

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;
  Subprocess *proc_ = nullptr;
};

/**
 * @struct ExecutionRequest
 * @brief What the engine needs to know about one job.
 */
struct ExecutionRequest {
  std::string job_id;
  std::string input_path;
  std::string output_path;
  ConversionParams params;
};

/// Returns the media duration in seconds (0 = unknown)
using DurationProbe = std::function<double(const std::string &)>;

/**
 * @brief Duration the transcoder will actually produce.
 * @note Narrows @p media_duration to the [start_time, end_time] trim window.
 */
double effective_duration(double media_duration,
                          const ConversionParams &params);

/**
 * @class ExecutionEngine
 * @brief Runs the transcoder for one job and classifies the outcome.
 */
class ExecutionEngine {
public:
  /**
   * @param transcoder Transcoder executable
   * @param retry_attempts Extra attempts after a failed run
   * @param retry_backoff_sec Base delay; retry N waits base * 2^(N-1)
   * @param probe Duration source (defaults to probe_duration)
   */
  ExecutionEngine(std::string transcoder, int retry_attempts = 0,
                  double retry_backoff_sec = 2.0, DurationProbe probe = {});

  /**
   * @brief Execute one job (blocking).
   * @param request Job description
   * @param sink Receives progress fractions
   * @param control Cancellation handle
   * @return Outcome; success only for exit 0 with a non-empty output file
   */
  JobResult execute(const ExecutionRequest &request, const ProgressSink &sink,
                    ExecutionControl &control) const;

  /**
   * @brief Check that the transcoder runs ("<transcoder> -version").
   * @param error Output: reason on failure
   */
  bool check_transcoder(std::string &error) const;

  const std::string &transcoder() const { return transcoder_; }

private:
  JobResult run_once(const ExecutionRequest &request, const ProgressSink &sink,
                     ExecutionControl &control) const;

  std::string transcoder_;
  int retry_attempts_;
  double retry_backoff_sec_;
  DurationProbe probe_;
};

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_EXECUTOR_HPP
