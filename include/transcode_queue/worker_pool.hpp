/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool returning futures of JobResult
 *
 * @details Producer-consumer queue in the shape of the batch job queue:
 *
 *          - The control loop (producer) submits one task per admitted job
 *
 *          - Worker threads (consumers) pop tasks and run them to completion
 *
 *          - The returned future is polled by the control loop for reaping
 *
 * @note Queue state lives in a shared block owned jointly by the pool and its
 *       threads, so a shutdown that times out can detach the stragglers
 *       without leaving them pointing at freed memory.
 */

#ifndef TRANSCODE_QUEUE_WORKER_POOL_HPP
#define TRANSCODE_QUEUE_WORKER_POOL_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "types.hpp"

namespace transcode_queue {

using JobTask = std::function<JobResult()>;

/**
 * @class WorkerPool
 * @brief Bounded set of worker threads executing JobTask items in FIFO order.
 *
 * @attention USAGE:
 *
 *   - submit() returns a future that becomes ready when the task finishes
 *
 *   - An exception thrown by a task is stored in its future
 *
 *   - shutdown() stops accepting work, drops queued tasks and waits a
 *     bounded time for running ones
 */
class WorkerPool {
public:
  /**
   * @brief Start the worker threads.
   * @param num_workers Thread count (clamped to at least 1)
   */
  explicit WorkerPool(int num_workers);

  /// Equivalent to shutdown() with an unbounded wait
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @brief Queue a task.
   * @return Future for the task's result; invalid if the pool is shut down
   */
  std::future<JobResult> submit(JobTask task);

  /**
   * @brief Stop the pool.
   * @param timeout Longest wait for running tasks (negative = no limit)
   * @return true if every thread was joined, false if some were detached
   */
  bool shutdown(std::chrono::milliseconds timeout);

  /// Tasks waiting for a free worker
  size_t pending() const;

  /// Tasks currently executing
  size_t active() const;

  int size() const { return num_workers_; }

private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;      //< Signals new work or shutdown
    std::condition_variable exit_cv; //< Signals a thread leaving
    std::queue<std::packaged_task<JobResult()>> tasks;
    bool done = false;
    size_t active = 0;
    int alive = 0;
  };

  static void worker_loop(std::shared_ptr<State> state, int worker_id);

  int num_workers_;
  std::shared_ptr<State> state_;
  std::vector<std::thread> threads_;
};

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_WORKER_POOL_HPP
