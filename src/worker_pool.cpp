/**
 * @file worker_pool.cpp
 * @brief Worker pool implementation
 */

#include "transcode_queue/worker_pool.hpp"

#include <algorithm>

#include "transcode_queue/logging.hpp"

namespace transcode_queue {

WorkerPool::WorkerPool(int num_workers)
    : num_workers_(std::max(1, num_workers)),
      state_(std::make_shared<State>()) {
  state_->alive = num_workers_;
  threads_.reserve(num_workers_);
  for (int i = 0; i < num_workers_; ++i) {
    threads_.emplace_back(&WorkerPool::worker_loop, state_, i);
  }
  LOG_DEBUG("Worker pool started with {} threads", num_workers_);
}

WorkerPool::~WorkerPool() { shutdown(std::chrono::milliseconds(-1)); }

std::future<JobResult> WorkerPool::submit(JobTask task) {
  std::packaged_task<JobResult()> packaged(std::move(task));
  std::future<JobResult> future = packaged.get_future();
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->done) {
      return {};
    }
    state_->tasks.push(std::move(packaged));
  }
  state_->cv.notify_one();
  return future;
}

bool WorkerPool::shutdown(std::chrono::milliseconds timeout) {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->done && threads_.empty())
      return true;
    state_->done = true;
    /// Queued tasks never run; their futures report broken_promise
    std::queue<std::packaged_task<JobResult()>> dropped;
    std::swap(dropped, state_->tasks);
  }
  state_->cv.notify_all();

  bool all_exited = true;
  {
    std::unique_lock<std::mutex> lock(state_->mutex);
    auto exited = [this] { return state_->alive == 0; };
    if (timeout.count() < 0) {
      state_->exit_cv.wait(lock, exited);
    } else {
      all_exited = state_->exit_cv.wait_for(lock, timeout, exited);
    }
  }

  for (auto &thread : threads_) {
    if (!thread.joinable())
      continue;
    if (all_exited) {
      thread.join();
    } else {
      thread.detach();
    }
  }
  threads_.clear();

  if (!all_exited) {
    LOG_WARN("Worker pool shutdown timed out, detached busy workers");
  }
  return all_exited;
}

size_t WorkerPool::pending() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->tasks.size();
}

size_t WorkerPool::active() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->active;
}

void WorkerPool::worker_loop(std::shared_ptr<State> state, int worker_id) {
  while (true) {
    std::packaged_task<JobResult()> task;
    {
      std::unique_lock<std::mutex> lock(state->mutex);
      state->cv.wait(lock,
                     [&state] { return !state->tasks.empty() || state->done; });
      if (state->done)
        break;
      task = std::move(state->tasks.front());
      state->tasks.pop();
      ++state->active;
    }

    /// Exceptions land in the task's future
    task();

    std::lock_guard<std::mutex> lock(state->mutex);
    --state->active;
  }

  LOG_DEBUG("Worker {} stopped", worker_id);
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    --state->alive;
  }
  state->exit_cv.notify_all();
}

} // namespace transcode_queue
