/**
 * @file logging.hpp
 * @brief Logging macros and per-job timing collection
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Thread-safe TimingCollector for aggregating job durations
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately. Worker threads, the control loop and caller threads all
 *       log through the same mutex so lines never interleave.
 *
 */

#ifndef TRANSCODE_QUEUE_LOGGING_HPP
#define TRANSCODE_QUEUE_LOGGING_HPP

#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace transcode_queue {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 * @note ENABLE_DEBUG_LOGGING additionally enables LOG_DEBUG (per-line
 *       transcoder output, admission decisions).
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_DEBUG_LOGGING
#define ENABLE_DEBUG_LOGGING 0
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(transcode_queue::log_mutex);              \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(transcode_queue::log_mutex);              \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(transcode_queue::log_mutex);              \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(transcode_queue::log_mutex);              \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(transcode_queue::log_mutex);              \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

#if ENABLE_LOGGING && ENABLE_DEBUG_LOGGING
#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(transcode_queue::log_mutex);              \
    fmt::print(fg(fmt::color::gray), "[DEBUG] " format_str "\n",               \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_DEBUG(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: wall time of one finished job.
 */
struct TimingEntry {
  std::string name;  //< Job ID
  std::string state; //< Terminal status name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe singleton for collecting job durations.
 * @note The scheduler records every job that ran; the CLI prints the table
 *       once the batch has drained.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Job ID
   * @param state Terminal status name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, const std::string &state,
                     long us);

  /**
   * @brief Print all collected timings as a formatted table.
   */
  static void print_summary();

  /**
   * @brief Number of recorded entries.
   */
  static size_t size();

  /**
   * @brief Clear all collected timings.
   */
  static void clear();
};

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_LOGGING_HPP
