/**
 * @file job.hpp
 * @brief Conversion job record and its state machine
 *
 * @details Valid transitions:
 *
 *          QUEUED -> RUNNING -> COMPLETED | FAILED | CANCELLED
 *
 *          QUEUED -> CANCELLED
 *
 *          SKIPPED is assigned at creation only.
 *
 * @note Job carries no lock of its own. The Scheduler mutates its jobs only
 *       while holding the registry lock and hands out copies.
 */

#ifndef TRANSCODE_QUEUE_JOB_HPP
#define TRANSCODE_QUEUE_JOB_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "events.hpp"
#include "types.hpp"

namespace transcode_queue {

using Clock = std::chrono::system_clock;

/**
 * @class Job
 * @brief One source-to-target conversion request.
 */
class Job {
public:
  Job(std::string id, std::string input_path, std::string output_path,
      ConversionParams params);

  /// Build a job that is SKIPPED from the start
  static Job skipped(std::string id, std::string input_path,
                     std::string output_path, ConversionParams params,
                     std::string reason);

  // **---- Transitions (compare-and-set) ----**

  /**
   * @brief QUEUED -> RUNNING; stamps started_at.
   * @return false if the job was not QUEUED
   */
  bool start(Clock::time_point now = Clock::now());

  /**
   * @brief RUNNING -> COMPLETED or FAILED depending on result.success.
   * @note Stamps completed_at, attaches the result, and on success sets
   *       progress to 1.0.
   * @return false if the job was not RUNNING
   */
  bool finish(JobResult result, Clock::time_point now = Clock::now());

  /**
   * @brief QUEUED or RUNNING -> CANCELLED; stamps completed_at.
   * @return false if the job was already terminal
   */
  bool cancel(Clock::time_point now = Clock::now());

  /**
   * @brief Advance progress while RUNNING.
   * @return false if not RUNNING or @p fraction does not move forward
   */
  bool update_progress(double fraction);

  /**
   * @brief Record that an event kind was delivered for this job.
   * @return false if this kind was already recorded
   */
  bool mark_emitted(EventKind kind);

  bool was_emitted(EventKind kind) const;

  // **---- Accessors ----**

  const std::string &id() const { return id_; }
  const std::string &input_path() const { return input_path_; }
  const std::string &output_path() const { return output_path_; }
  const ConversionParams &params() const { return params_; }
  JobStatus status() const { return status_; }
  double progress() const { return progress_; }
  const std::optional<JobResult> &result() const { return result_; }
  const std::optional<Clock::time_point> &started_at() const {
    return started_at_;
  }
  const std::optional<Clock::time_point> &completed_at() const {
    return completed_at_;
  }
  const std::string &error_message() const { return error_message_; }

  /**
   * @brief Seconds between start and completion (or @p now if still running).
   * @return 0 if the job never started
   */
  double elapsed_seconds(Clock::time_point now = Clock::now()) const;

  /**
   * @brief Estimated seconds remaining, extrapolated from progress.
   * @return empty unless RUNNING with progress > 0
   */
  std::optional<double> eta_seconds(Clock::time_point now = Clock::now()) const;

private:
  std::string id_;
  std::string input_path_;
  std::string output_path_;
  ConversionParams params_;
  JobStatus status_ = JobStatus::QUEUED;
  double progress_ = 0.0;
  std::optional<JobResult> result_;
  std::optional<Clock::time_point> started_at_;
  std::optional<Clock::time_point> completed_at_;
  std::string error_message_;
  uint32_t emitted_ = 0; //< Bit per EventKind
};

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_JOB_HPP
