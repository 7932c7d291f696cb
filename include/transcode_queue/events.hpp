/**
 * @file events.hpp
 * @brief Lifecycle notifications and an in-process publish/subscribe bus
 *
 * @details The Scheduler publishes typed JobEvent values; any number of
 *          subscribers receive them. Handlers run synchronously on the
 *          publishing thread (caller, control loop or worker), never while the
 *          Scheduler's registry lock is held. A presentation layer marshals
 *          them onto its own thread.
 */

#ifndef TRANSCODE_QUEUE_EVENTS_HPP
#define TRANSCODE_QUEUE_EVENTS_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "types.hpp"

namespace transcode_queue {

/**
 * @enum EventKind
 * @brief Kind of notification.
 * @note Per-job kinds other than JOB_PROGRESS are delivered at most once.
 */
enum class EventKind {
  JOB_STARTED,
  JOB_PROGRESS,
  JOB_COMPLETED,
  JOB_FAILED,
  JOB_CANCELLED,
  JOB_SKIPPED,
  QUEUE_UPDATED,
  ALL_COMPLETED,
  WORKER_ERROR,
};

const char *to_string(EventKind kind);

/**
 * @struct JobEvent
 * @brief One notification. Unused fields are left empty.
 */
struct JobEvent {
  EventKind kind;
  std::string job_id;              //< Empty for queue-level events
  double progress = 0.0;           //< JOB_PROGRESS
  std::optional<JobResult> result; //< JOB_COMPLETED, JOB_FAILED
  std::string message;             //< Failure, skip reason or worker error
  std::optional<QueueStats> stats; //< ALL_COMPLETED summary
};

using EventHandler = std::function<void(const JobEvent &)>;

/**
 * @class EventBus
 * @brief Thread-safe subscriber list.
 *
 * @note Handlers may subscribe/unsubscribe from inside a callback; the change
 *       applies to the next publish. A handler that throws is logged and does
 *       not stop delivery to the others.
 */
class EventBus {
public:
  /**
   * @brief Register a handler.
   * @return Token for unsubscribe()
   */
  size_t subscribe(EventHandler handler);

  /**
   * @brief Remove a handler.
   * @return false if the token is unknown
   */
  bool unsubscribe(size_t token);

  /**
   * @brief Deliver an event to every handler registered at call time.
   */
  void publish(const JobEvent &event) const;

  size_t subscriber_count() const;

private:
  mutable std::mutex mutex_;
  std::map<size_t, EventHandler> handlers_;
  size_t next_token_ = 1;
};

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_EVENTS_HPP
