/**
 * @file types.cpp
 * @brief Enumeration name conversions
 */

#include "transcode_queue/types.hpp"

#include <algorithm>
#include <cctype>

namespace transcode_queue {

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::QUEUED:
    return "queued";
  case JobStatus::RUNNING:
    return "running";
  case JobStatus::COMPLETED:
    return "completed";
  case JobStatus::FAILED:
    return "failed";
  case JobStatus::CANCELLED:
    return "cancelled";
  case JobStatus::SKIPPED:
    return "skipped";
  }
  return "unknown";
}

const char *to_string(OverwritePolicy policy) {
  switch (policy) {
  case OverwritePolicy::SKIP:
    return "skip";
  case OverwritePolicy::REPLACE:
    return "replace";
  case OverwritePolicy::UNIQUE:
    return "unique";
  }
  return "unknown";
}

bool parse_overwrite_policy(const std::string &name, OverwritePolicy &policy) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "skip") {
    policy = OverwritePolicy::SKIP;
  } else if (lower == "replace") {
    policy = OverwritePolicy::REPLACE;
  } else if (lower == "unique") {
    policy = OverwritePolicy::UNIQUE;
  } else {
    return false;
  }
  return true;
}

} // namespace transcode_queue
