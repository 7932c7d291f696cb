/**
 * @file system.hpp
 * @brief System utilities: CPU detection, executable discovery, formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Transcoder executable discovery
 *
 *          - Time formatting utilities
 */

#ifndef TRANSCODE_QUEUE_SYSTEM_HPP
#define TRANSCODE_QUEUE_SYSTEM_HPP

#include <string>

namespace transcode_queue {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

// **---- Executable Discovery ----**

/**
 * @brief Check whether a path names an executable regular file.
 */
bool is_executable(const std::string &path);

/**
 * @brief Locate the transcoder binary.
 *
 * @note Search order: every directory on PATH, then common install locations
 *       (/usr/bin, /usr/local/bin, /snap/bin, ~/.local/bin, ~/bin).
 *
 * @param name Executable name to look for (default "ffmpeg")
 * @return Absolute path if found, otherwise @p name unchanged so that the
 *         spawn itself reports the failure
 */
std::string find_transcoder(const std::string &name = "ffmpeg");

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_SYSTEM_HPP
