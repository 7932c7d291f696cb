/**
 * @file progress_monitor.cpp
 * @brief Progress extraction implementation
 */

#include "transcode_queue/progress_monitor.hpp"

#include <algorithm>
#include <regex>
#include <utility>

namespace transcode_queue {

bool parse_time_marker(const std::string &line, double &seconds) {
  static const std::regex marker(R"(time=(\d{2}):(\d{2}):(\d{2}(?:\.\d*)?))");

  std::smatch match;
  if (!std::regex_search(line, match, marker))
    return false;

  try {
    int hours = std::stoi(match[1].str());
    int minutes = std::stoi(match[2].str());
    double secs = std::stod(match[3].str());
    seconds = hours * 3600.0 + minutes * 60.0 + secs;
  } catch (const std::exception &) {
    return false;
  }
  return true;
}

ProgressMonitor::ProgressMonitor(double total_duration, ProgressSink sink)
    : total_duration_(total_duration), sink_(std::move(sink)) {}

bool ProgressMonitor::feed(const std::string &line) {
  if (total_duration_ <= 0 || !sink_)
    return false;

  double elapsed = 0;
  if (!parse_time_marker(line, elapsed))
    return false;

  double progress = std::clamp(elapsed / total_duration_, 0.0, 1.0);
  if (reported_ && progress < last_progress_)
    return false;

  last_progress_ = progress;
  reported_ = true;
  sink_(progress);
  return true;
}

} // namespace transcode_queue
