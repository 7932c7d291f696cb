/**
 * @file progress_monitor.hpp
 * @brief Progress extraction from the transcoder's diagnostic stream
 */

#ifndef TRANSCODE_QUEUE_PROGRESS_MONITOR_HPP
#define TRANSCODE_QUEUE_PROGRESS_MONITOR_HPP

#include <functional>
#include <string>

namespace transcode_queue {

/// Receives a progress fraction in [0, 1]
using ProgressSink = std::function<void(double)>;

/**
 * @brief Extract the elapsed position from a "time=HH:MM:SS[.ff]" marker.
 * @param line One diagnostic line
 * @param seconds Output: elapsed seconds
 * @return false if the line carries no parseable marker
 */
bool parse_time_marker(const std::string &line, double &seconds);

/**
 * @class ProgressMonitor
 * @brief Converts diagnostic lines into progress reports for one execution.
 *
 * @note Lines without a marker are ignored. With an unknown (<= 0) total
 *       duration nothing is ever reported. Reports never go backwards: a
 *       fraction below the last reported one is dropped.
 */
class ProgressMonitor {
public:
  /**
   * @param total_duration Known media duration in seconds (<= 0 = unknown)
   * @param sink Callback invoked with each new fraction
   */
  ProgressMonitor(double total_duration, ProgressSink sink);

  /**
   * @brief Feed one diagnostic line.
   * @return true if a progress report was emitted
   */
  bool feed(const std::string &line);

  /// Last reported fraction (0 before any report)
  double last_progress() const { return last_progress_; }

private:
  double total_duration_;
  ProgressSink sink_;
  double last_progress_ = 0.0;
  bool reported_ = false;
};

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_PROGRESS_MONITOR_HPP
