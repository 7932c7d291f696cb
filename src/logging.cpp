/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex shared by the LOG_* macros, so lines from the
 *            control loop, worker threads and event subscribers never
 *            interleave
 *
 *          - TimingCollector, which keeps one row per finished job (id,
 *            terminal state, wall time) and prints the JOB TIMINGS table
 *            after a CLI batch drains
 */

#include "transcode_queue/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace transcode_queue {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, const std::string &state,
                             long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, state, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "==================== JOB TIMINGS ====================\n");
  fmt::print("{:<28} {:<10} {:>12}\n", "Job", "State", "Time [sec]");
  fmt::print("{:-<28} {:-<10} {:-<12}\n", "", "", "");

  for (const auto &e : entries) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print("{:<28} {:<10} {:>11.2f}s\n", e.name, e.state, seconds);
  }
  fmt::print(fg(fmt::color::cyan),
             "=====================================================\n");
  std::fflush(stdout);
}

size_t TimingCollector::size() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries.size();
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace transcode_queue
