/**
 * @file scheduler.hpp
 * @brief Conversion job registry, FIFO admission queue and control loop
 *
 * @details The Scheduler class orchestrates concurrent conversions:
 *
 *          - Callers register jobs (add_job / add_batch_jobs); the output path
 *            is resolved against the overwrite policy at that moment
 *
 *          - A control-loop thread admits queued jobs in FIFO order while
 *            fewer than max_concurrent_jobs are in flight
 *
 *          - Each admitted job runs on a WorkerPool thread through the
 *            ExecutionEngine; its future is reaped by the control loop
 *
 *          - Lifecycle events go out through events(), at most once per kind
 *            per job
 *
 * @attention LOCKING:
 *
 *   - One recursive mutex guards the registry, the queue and the in-flight
 *     table; it is never held across process I/O or event delivery
 *
 *   - add/remove/cancel/query calls from any thread only take that lock
 *
 *   - Jobs handed to callers are copies
 */

#ifndef TRANSCODE_QUEUE_SCHEDULER_HPP
#define TRANSCODE_QUEUE_SCHEDULER_HPP

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "events.hpp"
#include "executor.hpp"
#include "job.hpp"
#include "types.hpp"

namespace transcode_queue {

/**
 * @class Scheduler
 * @brief Bounded worker pool over a registry of conversion jobs.
 */
class Scheduler {
public:
  /**
   * @brief Construct an idle scheduler.
   * @param config Concurrency, retry, policy and transcoder settings
   * @param probe Duration source for progress (defaults to probe_duration)
   */
  explicit Scheduler(SchedulerConfig config = SchedulerConfig{},
                     DurationProbe probe = {});

  /// Stops processing with a bounded wait
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  /// Lifecycle notification channel
  EventBus &events();

  /**
   * @brief Locate and verify the transcoder.
   * @note On failure a WORKER_ERROR event is published and no job is
   *       admitted until a later initialize() succeeds.
   * @return true if the transcoder is usable
   */
  bool initialize();

  // **---- Job admission ----**

  /**
   * @brief Register one job.
   *
   * @details Fails (returns false, logs) when the id is empty or already
   *          used, the input does not exist, a trim timestamp is malformed,
   *          or no unique output name is available. A job whose output
   *          exists under SKIP policy is registered as SKIPPED.
   *
   * @param policy Overwrite policy (config default when empty)
   */
  bool add_job(const std::string &id, const std::string &input_path,
               const std::string &output_path, const ConversionParams &params,
               std::optional<OverwritePolicy> policy = std::nullopt);

  /// add_job with a policy given by name; unknown names are rejected
  bool add_job(const std::string &id, const std::string &input_path,
               const std::string &output_path, const ConversionParams &params,
               const std::string &policy);

  /**
   * @brief Register one job per input.
   * @param output_dir Shared output directory; each input's own directory
   *                   when empty
   * @return Generated job id -> add_job outcome
   */
  std::map<std::string, bool>
  add_batch_jobs(const std::vector<std::string> &inputs,
                 const std::optional<std::string> &output_dir,
                 const ConversionParams &params,
                 std::optional<OverwritePolicy> policy = std::nullopt);

  // **---- Job control ----**

  /**
   * @brief Remove a job.
   * @note RUNNING jobs are cancelled instead (and stay registered); QUEUED
   *       jobs leave the queue without running; terminal jobs are dropped.
   */
  bool remove_job(const std::string &id);

  /**
   * @brief Cancel a QUEUED or RUNNING job.
   * @note Returns immediately; a running transcoder is sent SIGTERM.
   * @return false if the job is unknown or already terminal
   */
  bool cancel_job(const std::string &id);

  void cancel_all_jobs();

  /**
   * @brief Drop every job in a terminal state.
   * @return Number of jobs removed
   */
  size_t clear_completed_jobs();

  // **---- Control loop lifecycle ----**

  /**
   * @brief Start the control loop and worker pool.
   * @return false if the transcoder is unavailable
   */
  bool start_processing();

  /**
   * @brief Cancel in-flight jobs and stop the control loop.
   * @param timeout Longest wait for threads; they are detached after that
   */
  void stop_processing(
      std::chrono::milliseconds timeout = std::chrono::seconds(30));

  /// Hold the control loop: nothing is admitted and finished executions
  /// are not collected until resume_processing()
  void pause_processing();
  void resume_processing();

  bool is_running() const;
  bool is_paused() const;

  // **---- Queries ----**

  QueueStats get_queue_stats() const;

  /// Copies of all jobs in registration order
  std::vector<Job> get_all_jobs() const;

  std::optional<Job> get_job(const std::string &id) const;

  const SchedulerConfig &config() const;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_SCHEDULER_HPP
