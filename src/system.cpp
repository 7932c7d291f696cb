/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Transcoder executable discovery
 *
 *          - Time formatting utilities
 */

#include "transcode_queue/system.hpp"

#include <cstdlib>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

namespace transcode_queue {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Helper to count CPUs in a cpuset string like "0,2,4,6" or "0-3"
int count_cpuset_string(const std::string &line) {
  int count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find_first_of(",-", pos);
    if (end == std::string::npos)
      end = line.size();

    int start_cpu = std::stoi(line.substr(pos, end - pos));

    if (end < line.size() && line[end] == '-') {
      /// Range like "0-3"
      pos = end + 1;
      end = line.find(',', pos);
      if (end == std::string::npos)
        end = line.size();
      int end_cpu = std::stoi(line.substr(pos, end - pos));
      count += end_cpu - start_cpu + 1;
    } else {
      ++count;
    }

    pos = (end < line.size()) ? end + 1 : line.size();
  }
  return count;
}

/// Helper to count CPUs from a cpuset file
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  if (line.empty())
    return -1;
  try {
    int count = count_cpuset_string(line);
    return count > 0 ? count : -1;
  } catch (const std::exception &) {
    return -1;
  }
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !quota_str.empty() && !period_str.empty()) {
        long quota = std::strtol(quota_str.c_str(), nullptr, 10);
        long period = std::strtol(period_str.c_str(), nullptr, 10);
        if (quota > 0 && period > 0) {
          limit = static_cast<int>((quota + period - 1) / period);
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

// **---- Executable Discovery ----**

bool is_executable(const std::string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0)
    return false;
  return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::string find_transcoder(const std::string &name) {
  /// A path with a separator is taken as-is
  if (name.find('/') != std::string::npos) {
    return name;
  }

  if (const char *path_env = std::getenv("PATH")) {
    std::string paths = path_env;
    size_t pos = 0;
    while (pos <= paths.size()) {
      size_t end = paths.find(':', pos);
      if (end == std::string::npos)
        end = paths.size();
      std::string dir = paths.substr(pos, end - pos);
      if (!dir.empty()) {
        std::string candidate = fmt::format("{}/{}", dir, name);
        if (is_executable(candidate))
          return candidate;
      }
      pos = end + 1;
    }
  }

  std::vector<std::string> common = {"/usr/bin", "/usr/local/bin",
                                     "/snap/bin"};
  if (const char *home = std::getenv("HOME")) {
    common.push_back(fmt::format("{}/.local/bin", home));
    common.push_back(fmt::format("{}/bin", home));
  }
  for (const auto &dir : common) {
    std::string candidate = fmt::format("{}/{}", dir, name);
    if (is_executable(candidate))
      return candidate;
  }

  return name;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace transcode_queue
