/**
 * @file scheduler.cpp
 * @brief Scheduler implementation
 *
 * @details Implements:
 *
 *          - Job admission with output path resolution
 *
 *          - The polling control loop (reap, admit, drain detection)
 *
 *          - Cancellation, removal and housekeeping
 *
 *          - Exactly-once event emission, published outside the lock
 */

#include "transcode_queue/scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

#include <fmt/core.h>

#include "transcode_queue/command_builder.hpp"
#include "transcode_queue/logging.hpp"
#include "transcode_queue/path_resolver.hpp"
#include "transcode_queue/system.hpp"
#include "transcode_queue/worker_pool.hpp"

namespace transcode_queue {

namespace fs = std::filesystem;

using Events = std::vector<JobEvent>;

// **----- Shared state -----**

struct Scheduler::Impl : std::enable_shared_from_this<Scheduler::Impl> {
  struct InFlight {
    std::future<JobResult> future;
    std::shared_ptr<ExecutionControl> control;
  };

  SchedulerConfig config;
  DurationProbe probe;
  EventBus bus;

  /// Registry, queue and in-flight table
  mutable std::recursive_mutex mutex;
  std::unordered_map<std::string, Job> jobs;
  std::vector<std::string> order; //< Registration order
  std::deque<std::string> queue;  //< FIFO of job ids awaiting admission
  std::unordered_map<std::string, InFlight> in_flight;
  std::shared_ptr<WorkerPool> pool;
  std::shared_ptr<ExecutionEngine> engine;
  bool worker_failed = false;
  bool completion_signaled = true; //< Reset by every add
  uint64_t batch_seq = 0;

  std::atomic<bool> running{false};
  std::atomic<bool> paused{false};
  /// Stop flag of the current loop generation; a detached loop keeps its own
  std::shared_ptr<std::atomic<bool>> loop_stop;

  /// Control loop wake-up
  std::mutex wake_mutex;
  std::condition_variable wake_cv;
  bool wake_pending = false;

  std::thread loop_thread;
  std::future<void> loop_exited;

  Impl(SchedulerConfig cfg, DurationProbe p)
      : config(std::move(cfg)), probe(std::move(p)) {
    config.max_concurrent_jobs = std::max(1, config.max_concurrent_jobs);
  }

  void publish(const Events &events) {
    for (const auto &e : events) {
      bus.publish(e);
    }
  }

  void wake() {
    {
      std::lock_guard<std::mutex> lock(wake_mutex);
      wake_pending = true;
    }
    wake_cv.notify_all();
  }

  QueueStats stats_locked() const {
    QueueStats stats;
    stats.total = jobs.size();
    for (const auto &entry : jobs) {
      switch (entry.second.status()) {
      case JobStatus::QUEUED:
        stats.queued++;
        break;
      case JobStatus::RUNNING:
        stats.running++;
        break;
      case JobStatus::COMPLETED:
        stats.completed++;
        break;
      case JobStatus::FAILED:
        stats.failed++;
        break;
      case JobStatus::CANCELLED:
        stats.cancelled++;
        break;
      case JobStatus::SKIPPED:
        stats.skipped++;
        break;
      }
    }
    return stats;
  }

  void erase_locked(const std::string &id) {
    jobs.erase(id);
    order.erase(std::remove(order.begin(), order.end(), id), order.end());
    queue.erase(std::remove(queue.begin(), queue.end(), id), queue.end());
  }

  /// Transition to CANCELLED and signal the execution, if any
  bool cancel_locked(const std::string &id, Events &events) {
    auto it = jobs.find(id);
    if (it == jobs.end())
      return false;

    Job &job = it->second;
    bool was_running = job.status() == JobStatus::RUNNING;
    if (!job.cancel())
      return false;

    if (was_running) {
      auto flight = in_flight.find(id);
      if (flight != in_flight.end() && flight->second.control) {
        flight->second.control->cancel();
      }
    } else {
      queue.erase(std::remove(queue.begin(), queue.end(), id), queue.end());
    }

    if (job.mark_emitted(EventKind::JOB_CANCELLED)) {
      events.push_back({EventKind::JOB_CANCELLED, id});
    }
    LOG_INFO("[Job {}] Cancelled", id);
    return true;
  }

  void on_progress(const std::string &id, double fraction) {
    bool advanced = false;
    double stored = 0.0;
    {
      std::lock_guard<std::recursive_mutex> lock(mutex);
      auto it = jobs.find(id);
      if (it != jobs.end()) {
        advanced = it->second.update_progress(fraction);
        stored = it->second.progress();
      }
    }
    if (advanced) {
      JobEvent e{EventKind::JOB_PROGRESS, id};
      e.progress = stored;
      bus.publish(e);
    }
  }

  // **---- Control loop steps (lock held) ----**

  void reap_locked(Events &events) {
    bool reaped_any = false;

    for (auto it = in_flight.begin(); it != in_flight.end();) {
      if (!it->second.future.valid() ||
          it->second.future.wait_for(std::chrono::seconds(0)) !=
              std::future_status::ready) {
        ++it;
        continue;
      }

      const std::string id = it->first;
      JobResult result;
      try {
        result = it->second.future.get();
      } catch (const std::exception &e) {
        result.success = false;
        result.message = fmt::format("Unexpected error: {}", e.what());
        result.error_code = ErrorCode::UNKNOWN_ERROR;
      }
      it = in_flight.erase(it);
      reaped_any = true;

      auto job_it = jobs.find(id);
      if (job_it == jobs.end())
        continue;

      Job &job = job_it->second;
      /// Already CANCELLED jobs keep their status
      if (!job.finish(result))
        continue;

      TimingCollector::record(id, to_string(job.status()),
                              static_cast<long>(result.duration * 1e6));

      if (result.success) {
        LOG_SUCCESS("[Job {}] Completed: {} ({:.1f}s)", id,
                    fs::path(job.output_path()).filename().string(),
                    result.duration);
        if (job.mark_emitted(EventKind::JOB_COMPLETED)) {
          JobEvent e{EventKind::JOB_COMPLETED, id};
          e.result = result;
          events.push_back(std::move(e));
        }
      } else {
        LOG_ERROR("[Job {}] Failed: {}", id, result.message);
        if (job.mark_emitted(EventKind::JOB_FAILED)) {
          JobEvent e{EventKind::JOB_FAILED, id};
          e.result = result;
          e.message = result.message;
          events.push_back(std::move(e));
        }
      }
    }

    if (reaped_any) {
      events.push_back({EventKind::QUEUE_UPDATED});
    }
  }

  void admit_locked(Events &events) {
    if (!pool || !engine || worker_failed)
      return;

    bool admitted_any = false;
    while (in_flight.size() < static_cast<size_t>(config.max_concurrent_jobs) &&
           !queue.empty()) {
      std::string id = queue.front();
      queue.pop_front();

      auto it = jobs.find(id);
      /// Removed or cancelled while waiting
      if (it == jobs.end() || it->second.status() != JobStatus::QUEUED)
        continue;

      Job &job = it->second;
      job.start();

      ExecutionRequest request{id, job.input_path(), job.output_path(),
                               job.params()};
      auto control = std::make_shared<ExecutionControl>();
      std::weak_ptr<Impl> weak = shared_from_this();
      ProgressSink sink = [weak, id](double fraction) {
        if (auto self = weak.lock()) {
          self->on_progress(id, fraction);
        }
      };
      std::shared_ptr<ExecutionEngine> exec = engine;

      std::future<JobResult> future =
          pool->submit([exec, request, sink, control]() {
            return exec->execute(request, sink, *control);
          });

      if (!future.valid()) {
        JobResult result;
        result.message = "Worker pool is not accepting work";
        result.error_code = ErrorCode::UNKNOWN_ERROR;
        job.finish(result);
        if (job.mark_emitted(EventKind::JOB_FAILED)) {
          JobEvent e{EventKind::JOB_FAILED, id};
          e.result = result;
          e.message = result.message;
          events.push_back(std::move(e));
        }
        continue;
      }

      in_flight[id] = InFlight{std::move(future), control};
      admitted_any = true;

      LOG_INFO("[Job {}] Started: {} -> {}", id,
               fs::path(job.input_path()).filename().string(),
               fs::path(job.output_path()).filename().string());
      if (job.mark_emitted(EventKind::JOB_STARTED)) {
        events.push_back({EventKind::JOB_STARTED, id});
      }
    }

    if (admitted_any) {
      events.push_back({EventKind::QUEUE_UPDATED});
    }
  }

  void check_drained_locked(Events &events) {
    if (completion_signaled || !queue.empty() || !in_flight.empty())
      return;

    QueueStats stats = stats_locked();
    if (stats.queued != 0 || stats.running != 0)
      return;

    completion_signaled = true;
    LOG_PHASE("All jobs finished: {} completed, {} failed, {} cancelled, {} "
              "skipped",
              stats.completed, stats.failed, stats.cancelled, stats.skipped);
    JobEvent e{EventKind::ALL_COMPLETED};
    e.stats = stats;
    events.push_back(std::move(e));
  }

  void tick(const std::atomic<bool> &stop) {
    Events events;
    {
      std::lock_guard<std::recursive_mutex> lock(mutex);
      if (stop.load())
        return;
      reap_locked(events);
      admit_locked(events);
      check_drained_locked(events);
    }
    publish(events);
  }

  /// A paused loop neither admits nor reaps; finished executions wait in
  /// the in-flight table until resume
  void run_loop(std::shared_ptr<std::atomic<bool>> stop) {
    LOG_DEBUG("Control loop started");
    try {
      while (!stop->load()) {
        if (!paused.load())
          tick(*stop);

        std::unique_lock<std::mutex> lock(wake_mutex);
        wake_cv.wait_for(lock, config.poll_interval, [this, &stop] {
          return wake_pending || stop->load();
        });
        wake_pending = false;
      }
    } catch (const std::exception &e) {
      LOG_ERROR("Control loop error: {}", e.what());
      {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        worker_failed = true;
      }
      JobEvent event{EventKind::WORKER_ERROR};
      event.message = fmt::format("Worker error: {}", e.what());
      bus.publish(event);
    }
    LOG_DEBUG("Control loop stopped");
  }
};

// **----- Construction -----**

Scheduler::Scheduler(SchedulerConfig config, DurationProbe probe)
    : impl_(std::make_shared<Impl>(std::move(config), std::move(probe))) {}

Scheduler::~Scheduler() { stop_processing(std::chrono::seconds(5)); }

EventBus &Scheduler::events() { return impl_->bus; }

const SchedulerConfig &Scheduler::config() const { return impl_->config; }

bool Scheduler::initialize() {
  std::string path = impl_->config.transcoder_path.empty()
                         ? find_transcoder("ffmpeg")
                         : impl_->config.transcoder_path;

  auto engine = std::make_shared<ExecutionEngine>(
      path, impl_->config.retry_attempts, impl_->config.retry_backoff_sec,
      impl_->probe);

  std::string error;
  if (!engine->check_transcoder(error)) {
    {
      std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
      impl_->engine.reset();
      impl_->worker_failed = true;
    }
    std::string message = fmt::format("Transcoder not available: {}", error);
    LOG_ERROR("{}", message);
    JobEvent event{EventKind::WORKER_ERROR};
    event.message = message;
    impl_->bus.publish(event);
    return false;
  }

  {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    impl_->engine = std::move(engine);
    impl_->worker_failed = false;
  }
  LOG_INFO("Transcoder initialized: {}", path);
  impl_->wake();
  return true;
}

// **----- Job admission -----**

bool Scheduler::add_job(const std::string &id, const std::string &input_path,
                        const std::string &output_path,
                        const ConversionParams &params,
                        std::optional<OverwritePolicy> policy) {
  if (id.empty()) {
    LOG_ERROR("Rejected job with empty id");
    return false;
  }

  {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    if (impl_->jobs.count(id)) {
      LOG_ERROR("[Job {}] Duplicate job id", id);
      return false;
    }
  }

  std::error_code ec;
  if (!fs::exists(input_path, ec)) {
    LOG_ERROR("[Job {}] Input file not found: {}", id, input_path);
    return false;
  }

  for (const auto &trim : {params.start_time, params.end_time}) {
    if (trim && !validate_time_format(*trim)) {
      LOG_ERROR("[Job {}] Invalid trim timestamp: {}", id, *trim);
      return false;
    }
  }

  OverwritePolicy effective = policy.value_or(impl_->config.default_policy);
  ResolvedPath resolved;
  try {
    resolved = resolve_output_path(output_path, effective);
  } catch (const PathExhaustionError &e) {
    LOG_ERROR("[Job {}] {}", id, e.what());
    return false;
  } catch (const fs::filesystem_error &e) {
    LOG_ERROR("[Job {}] Cannot resolve output path: {}", id, e.what());
    return false;
  }

  Events events;
  {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    if (impl_->jobs.count(id)) {
      LOG_ERROR("[Job {}] Duplicate job id", id);
      return false;
    }

    if (resolved.should_skip) {
      std::string reason =
          fmt::format("File already exists: {}", resolved.path);
      Job job = Job::skipped(id, input_path, resolved.path, params, reason);
      job.mark_emitted(EventKind::JOB_SKIPPED);
      impl_->jobs.emplace(id, std::move(job));
      impl_->order.push_back(id);
      impl_->completion_signaled = false;

      LOG_INFO("[Job {}] Skipped: {}", id, reason);
      JobEvent e{EventKind::JOB_SKIPPED, id};
      e.message = reason;
      events.push_back(std::move(e));
    } else {
      impl_->jobs.emplace(id, Job(id, input_path, resolved.path, params));
      impl_->order.push_back(id);
      impl_->queue.push_back(id);
      impl_->completion_signaled = false;
      LOG_INFO("[Job {}] Added: {} -> {}", id, input_path, resolved.path);
    }
    events.push_back({EventKind::QUEUE_UPDATED});
  }

  impl_->publish(events);
  impl_->wake();
  return true;
}

bool Scheduler::add_job(const std::string &id, const std::string &input_path,
                        const std::string &output_path,
                        const ConversionParams &params,
                        const std::string &policy) {
  OverwritePolicy parsed;
  if (!parse_overwrite_policy(policy, parsed)) {
    LOG_ERROR("[Job {}] Unknown overwrite policy: {}", id, policy);
    return false;
  }
  return add_job(id, input_path, output_path, params, parsed);
}

std::map<std::string, bool>
Scheduler::add_batch_jobs(const std::vector<std::string> &inputs,
                          const std::optional<std::string> &output_dir,
                          const ConversionParams &params,
                          std::optional<OverwritePolicy> policy) {
  std::map<std::string, bool> results;
  auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
                   Clock::now().time_since_epoch())
                   .count();

  for (const auto &input : inputs) {
    uint64_t seq;
    {
      std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
      seq = impl_->batch_seq++;
    }
    std::string id = fmt::format("job_{}_{}", epoch, seq);

    fs::path input_path(input);
    fs::path dir = output_dir && !output_dir->empty() ? fs::path(*output_dir)
                                                      : input_path.parent_path();
    fs::path output =
        dir / (input_path.stem().string() + "." + params.output_format);

    results[id] = add_job(id, input, output.string(), params, policy);
  }
  return results;
}

// **----- Job control -----**

bool Scheduler::remove_job(const std::string &id) {
  Events events;
  {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    auto it = impl_->jobs.find(id);
    if (it == impl_->jobs.end())
      return false;

    if (it->second.status() == JobStatus::RUNNING) {
      if (!impl_->cancel_locked(id, events))
        return false;
    } else {
      impl_->erase_locked(id);
      LOG_INFO("[Job {}] Removed", id);
    }
    events.push_back({EventKind::QUEUE_UPDATED});
  }
  impl_->publish(events);
  return true;
}

bool Scheduler::cancel_job(const std::string &id) {
  Events events;
  {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    if (!impl_->cancel_locked(id, events))
      return false;
    events.push_back({EventKind::QUEUE_UPDATED});
  }
  impl_->publish(events);
  return true;
}

void Scheduler::cancel_all_jobs() {
  Events events;
  {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    for (const auto &id : impl_->order) {
      impl_->cancel_locked(id, events);
    }
    if (!events.empty())
      events.push_back({EventKind::QUEUE_UPDATED});
  }
  impl_->publish(events);
}

size_t Scheduler::clear_completed_jobs() {
  size_t removed = 0;
  {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    std::vector<std::string> finished;
    for (const auto &id : impl_->order) {
      if (is_terminal(impl_->jobs.at(id).status()))
        finished.push_back(id);
    }
    for (const auto &id : finished) {
      impl_->erase_locked(id);
    }
    removed = finished.size();
  }
  LOG_INFO("Cleared {} completed jobs", removed);
  impl_->bus.publish({EventKind::QUEUE_UPDATED});
  return removed;
}

// **----- Control loop lifecycle -----**

bool Scheduler::start_processing() {
  if (impl_->running.load())
    return true;

  bool ready;
  {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    ready = impl_->engine && !impl_->worker_failed;
  }
  if (!ready && !initialize())
    return false;

  {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    impl_->pool =
        std::make_shared<WorkerPool>(impl_->config.max_concurrent_jobs);
  }

  auto stop = std::make_shared<std::atomic<bool>>(false);
  {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    impl_->loop_stop = stop;
  }
  impl_->paused.store(false);
  impl_->running.store(true);

  auto self = impl_;
  std::promise<void> exited;
  impl_->loop_exited = exited.get_future();
  impl_->loop_thread =
      std::thread([self, stop, exited = std::move(exited)]() mutable {
        self->run_loop(stop);
        exited.set_value();
      });

  LOG_INFO("Scheduler started ({} concurrent jobs)",
           impl_->config.max_concurrent_jobs);
  return true;
}

void Scheduler::stop_processing(std::chrono::milliseconds timeout) {
  if (!impl_->running.load())
    return;

  LOG_INFO("Stopping scheduler...");
  auto deadline = std::chrono::steady_clock::now() + timeout;

  /// Stop admitting, then cancel everything in flight; queued jobs stay
  /// queued for a restart
  Events events;
  {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    if (impl_->loop_stop)
      impl_->loop_stop->store(true);
    std::vector<std::string> flying;
    for (const auto &entry : impl_->in_flight) {
      flying.push_back(entry.first);
    }
    for (const auto &id : flying) {
      impl_->cancel_locked(id, events);
    }
    if (!events.empty())
      events.push_back({EventKind::QUEUE_UPDATED});
  }
  impl_->publish(events);
  impl_->wake();

  if (impl_->loop_thread.joinable()) {
    if (impl_->loop_exited.valid() &&
        impl_->loop_exited.wait_until(deadline) == std::future_status::ready) {
      impl_->loop_thread.join();
    } else {
      LOG_WARN("Control loop did not stop in time, detaching");
      impl_->loop_thread.detach();
    }
  }

  std::shared_ptr<WorkerPool> pool;
  {
    std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
    impl_->in_flight.clear();
    pool = std::move(impl_->pool);
  }
  if (pool) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    pool->shutdown(std::max(remaining, std::chrono::milliseconds(0)));
  }

  impl_->running.store(false);
  impl_->paused.store(false);
  LOG_INFO("Scheduler stopped");
}

void Scheduler::pause_processing() {
  impl_->paused.store(true);
  LOG_INFO("Scheduler paused");
}

void Scheduler::resume_processing() {
  impl_->paused.store(false);
  impl_->wake();
  LOG_INFO("Scheduler resumed");
}

bool Scheduler::is_running() const { return impl_->running.load(); }

bool Scheduler::is_paused() const { return impl_->paused.load(); }

// **----- Queries -----**

QueueStats Scheduler::get_queue_stats() const {
  std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
  return impl_->stats_locked();
}

std::vector<Job> Scheduler::get_all_jobs() const {
  std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
  std::vector<Job> snapshot;
  snapshot.reserve(impl_->order.size());
  for (const auto &id : impl_->order) {
    snapshot.push_back(impl_->jobs.at(id));
  }
  return snapshot;
}

std::optional<Job> Scheduler::get_job(const std::string &id) const {
  std::lock_guard<std::recursive_mutex> lock(impl_->mutex);
  auto it = impl_->jobs.find(id);
  if (it == impl_->jobs.end())
    return std::nullopt;
  return it->second;
}

} // namespace transcode_queue
