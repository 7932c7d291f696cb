/**
 * @file events.cpp
 * @brief Event bus implementation
 */

#include "transcode_queue/events.hpp"

#include <utility>
#include <vector>

#include "transcode_queue/logging.hpp"

namespace transcode_queue {

const char *to_string(EventKind kind) {
  switch (kind) {
  case EventKind::JOB_STARTED:
    return "job_started";
  case EventKind::JOB_PROGRESS:
    return "job_progress";
  case EventKind::JOB_COMPLETED:
    return "job_completed";
  case EventKind::JOB_FAILED:
    return "job_failed";
  case EventKind::JOB_CANCELLED:
    return "job_cancelled";
  case EventKind::JOB_SKIPPED:
    return "job_skipped";
  case EventKind::QUEUE_UPDATED:
    return "queue_updated";
  case EventKind::ALL_COMPLETED:
    return "all_completed";
  case EventKind::WORKER_ERROR:
    return "worker_error";
  }
  return "unknown";
}

size_t EventBus::subscribe(EventHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t token = next_token_++;
  handlers_.emplace(token, std::move(handler));
  return token;
}

bool EventBus::unsubscribe(size_t token) {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.erase(token) > 0;
}

void EventBus::publish(const JobEvent &event) const {
  /// Copy so handlers run unlocked and may re-enter the bus
  std::vector<EventHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers.reserve(handlers_.size());
    for (const auto &entry : handlers_) {
      handlers.push_back(entry.second);
    }
  }

  for (const auto &handler : handlers) {
    try {
      handler(event);
    } catch (const std::exception &e) {
      LOG_ERROR("Event handler failed on {}: {}", to_string(event.kind),
                e.what());
    }
  }
}

size_t EventBus::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.size();
}

} // namespace transcode_queue
