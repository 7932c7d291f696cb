/**
 * @file config.cpp
 * @brief Environment-backed configuration objects
 */

#include "transcode_queue/config.hpp"

#include <algorithm>

#include "transcode_queue/command_builder.hpp"
#include "transcode_queue/logging.hpp"
#include "transcode_queue/system.hpp"

namespace transcode_queue {

SchedulerConfig SchedulerConfig::from_env() {
  SchedulerConfig cfg;

  int configured = Config::max_concurrent_jobs();
  cfg.max_concurrent_jobs =
      configured > 0 ? configured : std::max(1, detect_cpu_limit());

  cfg.retry_attempts = std::max(0, Config::retry_attempts());
  cfg.retry_backoff_sec = std::max(0.0, Config::retry_backoff_sec());
  cfg.poll_interval =
      std::chrono::milliseconds(std::max(1, Config::poll_interval_ms()));

  std::string policy = Config::overwrite_policy();
  if (!parse_overwrite_policy(policy, cfg.default_policy)) {
    LOG_WARN("Unknown OVERWRITE_POLICY '{}', using unique", policy);
    cfg.default_policy = OverwritePolicy::UNIQUE;
  }

  cfg.transcoder_path = Config::transcoder_path();
  return cfg;
}

ConversionParams conversion_params_from_env() {
  ConversionParams params;
  params.output_format = Config::output_format();
  params.codec = default_codec(params.output_format);
  params.bitrate = Config::audio_bitrate();
  params.sample_rate = Config::sample_rate();
  params.channels = Config::channels();
  params.normalize_loudness = Config::normalize_loudness();
  return params;
}

} // namespace transcode_queue
