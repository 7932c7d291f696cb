/**
 * @file job.cpp
 * @brief Job state machine implementation
 */

#include "transcode_queue/job.hpp"

#include <algorithm>
#include <utility>

namespace transcode_queue {

namespace {

uint32_t event_bit(EventKind kind) {
  return 1u << static_cast<uint32_t>(kind);
}

} // anonymous namespace

Job::Job(std::string id, std::string input_path, std::string output_path,
         ConversionParams params)
    : id_(std::move(id)), input_path_(std::move(input_path)),
      output_path_(std::move(output_path)), params_(std::move(params)) {}

Job Job::skipped(std::string id, std::string input_path,
                 std::string output_path, ConversionParams params,
                 std::string reason) {
  Job job(std::move(id), std::move(input_path), std::move(output_path),
          std::move(params));
  job.status_ = JobStatus::SKIPPED;
  job.completed_at_ = Clock::now();
  job.error_message_ = std::move(reason);
  return job;
}

bool Job::start(Clock::time_point now) {
  if (status_ != JobStatus::QUEUED)
    return false;
  status_ = JobStatus::RUNNING;
  started_at_ = now;
  return true;
}

bool Job::finish(JobResult result, Clock::time_point now) {
  if (status_ != JobStatus::RUNNING)
    return false;

  if (result.success) {
    status_ = JobStatus::COMPLETED;
    progress_ = 1.0;
  } else {
    status_ = JobStatus::FAILED;
    error_message_ = result.message;
  }
  completed_at_ = now;
  result_ = std::move(result);
  return true;
}

bool Job::cancel(Clock::time_point now) {
  if (status_ != JobStatus::QUEUED && status_ != JobStatus::RUNNING)
    return false;
  status_ = JobStatus::CANCELLED;
  completed_at_ = now;
  return true;
}

bool Job::update_progress(double fraction) {
  if (status_ != JobStatus::RUNNING)
    return false;
  fraction = std::clamp(fraction, 0.0, 1.0);
  if (fraction <= progress_)
    return false;
  progress_ = fraction;
  return true;
}

bool Job::mark_emitted(EventKind kind) {
  if (emitted_ & event_bit(kind))
    return false;
  emitted_ |= event_bit(kind);
  return true;
}

bool Job::was_emitted(EventKind kind) const {
  return (emitted_ & event_bit(kind)) != 0;
}

double Job::elapsed_seconds(Clock::time_point now) const {
  if (!started_at_)
    return 0.0;
  Clock::time_point end = completed_at_.value_or(now);
  return std::chrono::duration<double>(end - *started_at_).count();
}

std::optional<double> Job::eta_seconds(Clock::time_point now) const {
  if (status_ != JobStatus::RUNNING || progress_ <= 0)
    return std::nullopt;

  double elapsed = elapsed_seconds(now);
  if (elapsed <= 0)
    return std::nullopt;

  double estimated_total = elapsed / progress_;
  return std::max(0.0, estimated_total - elapsed);
}

} // namespace transcode_queue
