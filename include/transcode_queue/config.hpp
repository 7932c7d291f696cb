/**
 * @file config.hpp
 * @brief Configuration via environment variables
 *
 * @details Provides the Config namespace with environment helpers and the
 *          SchedulerConfig object handed to a Scheduler at construction.
 *          Every setting has a default, so an empty environment yields a
 *          working configuration.
 *
 */

#ifndef TRANSCODE_QUEUE_CONFIG_HPP
#define TRANSCODE_QUEUE_CONFIG_HPP

#include <chrono>
#include <cstdlib>
#include <string>

#include "types.hpp"

namespace transcode_queue {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Value or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/// Transcoder binary (empty = search PATH and common install locations)
inline std::string transcoder_path() {
  return get_env_string("TRANSCODER_PATH", "");
}

/**
 * @brief Maximum number of concurrent conversions
 * @note 0 = auto-detect from the cgroup-aware CPU limit
 */
inline int max_concurrent_jobs() { return get_env_int("MAX_CONCURRENT_JOBS", 0); }

/// How many times a failed conversion is retried
inline int retry_attempts() { return get_env_int("RETRY_ATTEMPTS", 0); }

/// Base delay for exponential retry backoff
inline double retry_backoff_sec() {
  return get_env_double("RETRY_BACKOFF_SEC", 2.0);
}

/// Control loop poll interval
inline int poll_interval_ms() { return get_env_int("POLL_INTERVAL_MS", 100); }

/// Default overwrite policy name (skip, replace, unique)
inline std::string overwrite_policy() {
  return get_env_string("OVERWRITE_POLICY", "unique");
}

// **---- CONVERSION DEFAULTS ----**

inline std::string output_format() {
  return get_env_string("OUTPUT_FORMAT", "mp3");
}

inline std::string audio_bitrate() {
  return get_env_string("AUDIO_BITRATE", "192k");
}

inline int sample_rate() { return get_env_int("SAMPLE_RATE", 44100); }

inline int channels() { return get_env_int("CHANNELS", 2); }

inline bool normalize_loudness() {
  return get_env_int("NORMALIZE_LOUDNESS", 0) != 0;
}

} // namespace Config

/**
 * @struct SchedulerConfig
 * @brief Explicit configuration object for a Scheduler instance.
 */
struct SchedulerConfig {
  int max_concurrent_jobs = 4;  //< Worker pool size (>= 1)
  int retry_attempts = 0;       //< Extra attempts after a failed run
  double retry_backoff_sec = 2.0; //< Delay before retry N is base * 2^(N-1)
  std::chrono::milliseconds poll_interval{100}; //< Control loop period
  OverwritePolicy default_policy = OverwritePolicy::UNIQUE;
  std::string transcoder_path; //< Empty = discover at initialize()

  /**
   * @brief Build a configuration from the environment.
   * @note Unknown OVERWRITE_POLICY values fall back to UNIQUE with a warning.
   */
  static SchedulerConfig from_env();
};

/**
 * @brief Build default ConversionParams from the environment.
 * @note The codec is derived from OUTPUT_FORMAT.
 */
ConversionParams conversion_params_from_env();

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_CONFIG_HPP
