/**
 * @file command_builder.cpp
 * @brief Transcoder argument vector construction
 */

#include "transcode_queue/command_builder.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <regex>
#include <set>

#include <fmt/core.h>

namespace transcode_queue {

namespace {

const std::map<std::string, std::string> &codec_map() {
  static const std::map<std::string, std::string> map = {
      {"mp3", "libmp3lame"}, {"wav", "pcm_s16le"}, {"m4a", "aac"},
      {"flac", "flac"},      {"aac", "aac"},       {"ogg", "libvorbis"},
  };
  return map;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // anonymous namespace

std::vector<std::string> build_command(const std::string &transcoder,
                                       const std::string &input_path,
                                       const std::string &output_path,
                                       const ConversionParams &params) {
  std::vector<std::string> cmd = {transcoder, "-y", "-i", input_path};

  /// Time trimming
  if (params.start_time && !params.start_time->empty()) {
    cmd.insert(cmd.end(), {"-ss", *params.start_time});
  }
  if (params.end_time && !params.end_time->empty()) {
    cmd.insert(cmd.end(), {"-to", *params.end_time});
  }

  /// Audio stream selection (first audio stream by default)
  int stream = params.stream_index.value_or(0);
  cmd.insert(cmd.end(), {"-map", fmt::format("0:a:{}", stream)});

  cmd.insert(cmd.end(), {"-c:a", params.codec});

  /// LAME gets highest-quality VBR on top of the requested bitrate
  if (params.codec == "libmp3lame") {
    cmd.insert(cmd.end(), {"-q:a", "0"});
  }
  if (!params.bitrate.empty()) {
    cmd.insert(cmd.end(), {"-b:a", params.bitrate});
  }

  cmd.insert(cmd.end(), {"-ar", std::to_string(params.sample_rate)});
  cmd.insert(cmd.end(), {"-ac", std::to_string(params.channels)});

  std::string filters = build_filter_chain(params);
  if (!filters.empty()) {
    cmd.insert(cmd.end(), {"-af", filters});
  }

  cmd.insert(cmd.end(), {"-map_metadata", "0"});
  cmd.push_back(output_path);
  return cmd;
}

std::string build_filter_chain(const ConversionParams &params) {
  std::vector<std::string> filters;

  if (params.normalize_loudness) {
    /// EBU R128, deliberately gentle
    filters.emplace_back("loudnorm=I=-18:LRA=7:TP=-2");
  } else if (params.normalize_peak) {
    filters.push_back(fmt::format("volume={}dB", params.peak_target));
  }

  std::string chain;
  for (size_t i = 0; i < filters.size(); ++i) {
    if (i > 0)
      chain += ",";
    chain += filters[i];
  }
  return chain;
}

std::string default_codec(const std::string &output_format) {
  auto it = codec_map().find(to_lower(output_format));
  return it != codec_map().end() ? it->second : "libmp3lame";
}

bool validate_time_format(const std::string &time_str) {
  static const std::regex pattern(R"(^\d{1,2}:\d{2}:\d{2}(\.\d{1,3})?$)");
  return std::regex_match(time_str, pattern);
}

bool time_to_seconds(const std::string &time_str, double &seconds) {
  if (!validate_time_format(time_str))
    return false;

  size_t first = time_str.find(':');
  size_t second = time_str.find(':', first + 1);
  int hours = std::stoi(time_str.substr(0, first));
  int minutes = std::stoi(time_str.substr(first + 1, second - first - 1));
  double secs = std::stod(time_str.substr(second + 1));

  seconds = hours * 3600.0 + minutes * 60.0 + secs;
  return true;
}

bool is_supported_input(const std::string &path) {
  static const std::set<std::string> extensions = {
      /// Video containers
      ".mp4", ".mkv", ".mov", ".avi", ".wmv", ".flv", ".webm", ".m4v", ".3gp",
      ".ts",
      /// Audio containers
      ".mp3", ".wav", ".m4a", ".flac", ".aac", ".ogg", ".wma"};

  std::string ext = to_lower(std::filesystem::path(path).extension().string());
  return extensions.count(ext) > 0;
}

std::string join_command(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &arg : args) {
    if (!out.empty())
      out += ' ';
    if (arg.find(' ') != std::string::npos) {
      out += fmt::format("\"{}\"", arg);
    } else {
      out += arg;
    }
  }
  return out;
}

} // namespace transcode_queue
