/**
 * @file main.cpp
 * @brief Entry point for the transcode_queue batch converter
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Single file mode: queue one input
 *
 *          - Directory mode: queue every supported media file
 *
 *          - Waiting for the batch to drain and printing the summary
 *
 * @note Concurrency, retries, overwrite policy and output format come from
 *       the environment (see config.hpp). Set MAX_CONCURRENT_JOBS to control
 *       parallelism.
 */

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "transcode_queue/command_builder.hpp"
#include "transcode_queue/config.hpp"
#include "transcode_queue/logging.hpp"
#include "transcode_queue/scheduler.hpp"
#include "transcode_queue/system.hpp"

using namespace transcode_queue;

namespace {

/// Waits for the ALL_COMPLETED or WORKER_ERROR event
struct BatchWaiter {
  std::mutex mutex;
  std::condition_variable cv;
  bool done = false;
  bool worker_error = false;
  QueueStats stats;
  std::map<std::string, int> logged_decile; //< Per job, guarded by mutex

  /// True the first time a job crosses each 10% step
  bool next_decile(const std::string &job_id, double progress) {
    int decile = static_cast<int>(progress * 10.0);
    std::lock_guard<std::mutex> lock(mutex);
    auto it = logged_decile.find(job_id);
    if (it != logged_decile.end() && it->second >= decile)
      return false;
    logged_decile[job_id] = decile;
    return true;
  }

  void finish(const QueueStats *summary, bool error) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      done = true;
      worker_error = error;
      if (summary)
        stats = *summary;
    }
    cv.notify_all();
  }

  void wait() {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [this] { return done; });
  }
};

void print_batch_summary(const Scheduler &scheduler, const QueueStats &stats,
                         double wall_clock_sec) {
  double sum_time_sec = 0.0;
  std::vector<Job> jobs = scheduler.get_all_jobs();
  for (const auto &job : jobs) {
    if (job.result())
      sum_time_sec += job.result()->duration;
  }
  double speedup = (wall_clock_sec > 0) ? sum_time_sec / wall_clock_sec : 1.0;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============== CONVERSION BATCH SUMMARY ==============\n");
  fmt::print("{:<25} {:>25}\n", "Total jobs:", stats.total);
  fmt::print("{:<25} {:>25}\n", "Completed:", stats.completed);
  fmt::print("{:<25} {:>25}\n", "Failed:", stats.failed);
  fmt::print("{:<25} {:>25}\n", "Cancelled:", stats.cancelled);
  fmt::print("{:<25} {:>25}\n", "Skipped:", stats.skipped);
  fmt::print("{:<25} {:>25}\n", "Concurrent jobs:",
             scheduler.config().max_concurrent_jobs);
  fmt::print("{:<25} {:>25}\n", "Wall-clock time:",
             format_time(wall_clock_sec));
  fmt::print("{:<25} {:>22.2f}x\n", "Speedup:", speedup);
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");

  if (stats.failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed jobs:\n");
    for (const auto &job : jobs) {
      if (job.status() == JobStatus::FAILED) {
        fmt::print(fg(fmt::color::red), "  - {}: {}\n",
                   std::filesystem::path(job.input_path()).filename().string(),
                   job.error_message());
      }
    }
  }
  std::fflush(stdout);
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 3) {
    LOG_WARN("Usage: ./transcode_queue <input file|dir> <output dir>");
    return 1;
  }

  namespace fs = std::filesystem;
  std::string input_arg = argv[1];
  std::string output_arg = argv[2];

  std::error_code ec;
  if (!fs::exists(input_arg, ec)) {
    LOG_ERROR("Input not found: {}", input_arg);
    return 1;
  }

  /// Collect media files
  std::vector<std::string> files;
  if (fs::is_directory(input_arg, ec)) {
    for (const auto &entry : fs::directory_iterator(input_arg, ec)) {
      if (entry.is_regular_file() && is_supported_input(entry.path().string()))
        files.push_back(entry.path().string());
    }
    if (ec) {
      LOG_ERROR("Cannot scan {}: {}", input_arg, ec.message());
      return 1;
    }
    std::sort(files.begin(), files.end());
  } else {
    files.push_back(input_arg);
  }

  if (files.empty()) {
    LOG_WARN("No supported media files found in {}", input_arg);
    return 0;
  }

  fs::create_directories(output_arg, ec);
  if (ec) {
    LOG_ERROR("Cannot create output directory {}: {}", output_arg,
              ec.message());
    return 1;
  }

  SchedulerConfig config = SchedulerConfig::from_env();
  ConversionParams params = conversion_params_from_env();

  LOG_PHASE("================== CONVERSION BATCH ==================");
  LOG_INFO("Input: {}", input_arg);
  LOG_INFO("Output directory: {}", output_arg);
  LOG_INFO("Files to convert: {}", files.size());
  LOG_INFO("Concurrent jobs: {}", config.max_concurrent_jobs);
  LOG_INFO("Output format: {} ({})", params.output_format, params.codec);
  LOG_INFO("Overwrite policy: {}", to_string(config.default_policy));
  LOG_PHASE("======================================================");

  BatchWaiter waiter;
  Scheduler scheduler(config);

  scheduler.events().subscribe([&waiter](const JobEvent &event) {
    switch (event.kind) {
    case EventKind::JOB_PROGRESS:
      if (waiter.next_decile(event.job_id, event.progress))
        LOG_INFO("[Job {}] {:.0f}%", event.job_id, event.progress * 100.0);
      break;
    case EventKind::ALL_COMPLETED:
      waiter.finish(event.stats ? &*event.stats : nullptr, false);
      break;
    case EventKind::WORKER_ERROR:
      LOG_ERROR("{}", event.message);
      waiter.finish(nullptr, true);
      break;
    default:
      break;
    }
  });

  if (!scheduler.initialize()) {
    return 1;
  }

  auto start = std::chrono::steady_clock::now();

  auto added = scheduler.add_batch_jobs(files, output_arg, params);
  size_t accepted = std::count_if(added.begin(), added.end(),
                                  [](const auto &kv) { return kv.second; });
  if (accepted == 0) {
    LOG_ERROR("No job could be queued");
    return 1;
  }

  if (!scheduler.start_processing()) {
    return 1;
  }

  waiter.wait();
  double elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  scheduler.stop_processing();

  if (waiter.worker_error) {
    return 1;
  }

  print_batch_summary(scheduler, waiter.stats, elapsed);
  TimingCollector::print_summary();

  size_t rejected = added.size() - accepted;
  return static_cast<int>(waiter.stats.failed + rejected);
}
