// Environment configuration tests

#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "transcode_queue/config.hpp"

namespace transcode_queue {
namespace {

/// Sets environment variables for one test and restores them afterwards
class EnvGuard {
public:
  void set(const char *name, const char *value) {
    const char *old = std::getenv(name);
    saved_.emplace_back(name, old ? std::optional<std::string>(old)
                                  : std::nullopt);
    setenv(name, value, 1);
  }

  ~EnvGuard() {
    for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
      if (it->second) {
        setenv(it->first.c_str(), it->second->c_str(), 1);
      } else {
        unsetenv(it->first.c_str());
      }
    }
  }

private:
  std::vector<std::pair<std::string, std::optional<std::string>>> saved_;
};

TEST(ConfigTest, SchedulerConfigFromEnvironment) {
  EnvGuard env;
  env.set("MAX_CONCURRENT_JOBS", "3");
  env.set("RETRY_ATTEMPTS", "2");
  env.set("RETRY_BACKOFF_SEC", "0.5");
  env.set("POLL_INTERVAL_MS", "25");
  env.set("OVERWRITE_POLICY", "Skip");
  env.set("TRANSCODER_PATH", "/opt/ffmpeg/bin/ffmpeg");

  SchedulerConfig cfg = SchedulerConfig::from_env();
  EXPECT_EQ(cfg.max_concurrent_jobs, 3);
  EXPECT_EQ(cfg.retry_attempts, 2);
  EXPECT_DOUBLE_EQ(cfg.retry_backoff_sec, 0.5);
  EXPECT_EQ(cfg.poll_interval, std::chrono::milliseconds(25));
  EXPECT_EQ(cfg.default_policy, OverwritePolicy::SKIP);
  EXPECT_EQ(cfg.transcoder_path, "/opt/ffmpeg/bin/ffmpeg");
}

TEST(ConfigTest, AutoConcurrencyAndPolicyFallback) {
  EnvGuard env;
  env.set("MAX_CONCURRENT_JOBS", "0");
  env.set("OVERWRITE_POLICY", "clobber");

  SchedulerConfig cfg = SchedulerConfig::from_env();
  EXPECT_GE(cfg.max_concurrent_jobs, 1);
  EXPECT_EQ(cfg.default_policy, OverwritePolicy::UNIQUE);
}

TEST(ConfigTest, ConversionParamsDeriveCodecFromFormat) {
  EnvGuard env;
  env.set("OUTPUT_FORMAT", "flac");
  env.set("SAMPLE_RATE", "48000");
  env.set("CHANNELS", "1");
  env.set("NORMALIZE_LOUDNESS", "1");

  ConversionParams params = conversion_params_from_env();
  EXPECT_EQ(params.output_format, "flac");
  EXPECT_EQ(params.codec, "flac");
  EXPECT_EQ(params.sample_rate, 48000);
  EXPECT_EQ(params.channels, 1);
  EXPECT_TRUE(params.normalize_loudness);
}

TEST(ConfigTest, PolicyNames) {
  OverwritePolicy policy = OverwritePolicy::UNIQUE;
  EXPECT_TRUE(parse_overwrite_policy("REPLACE", policy));
  EXPECT_EQ(policy, OverwritePolicy::REPLACE);
  EXPECT_FALSE(parse_overwrite_policy("merge", policy));
  EXPECT_EQ(policy, OverwritePolicy::REPLACE);
  EXPECT_STREQ(to_string(OverwritePolicy::SKIP), "skip");
}

} // namespace
} // namespace transcode_queue
