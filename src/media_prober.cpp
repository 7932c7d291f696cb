/**
 * @file media_prober.cpp
 * @brief Media inspection via libavformat
 *
 * @details Opens the file through avformat_open_input, lets
 *          avformat_find_stream_info read enough packets to fill in the
 *          codec parameters, then copies out duration, streams and tags.
 *          Nothing is decoded.
 */

#include "transcode_queue/media_prober.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

#include <fmt/core.h>

#include "transcode_queue/logging.hpp"

namespace transcode_queue {

namespace {

/// Keep libav's own logging off our stdout
void quiet_libav() {
  static std::once_flag once;
  std::call_once(once, [] { av_log_set_level(AV_LOG_QUIET); });
}

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

std::map<std::string, std::string> copy_tags(const AVDictionary *dict) {
  std::map<std::string, std::string> tags;
  const AVDictionaryEntry *tag = nullptr;
  while ((tag = av_dict_get(dict, "", tag, AV_DICT_IGNORE_SUFFIX))) {
    tags[tag->key] = tag->value;
  }
  return tags;
}

} // anonymous namespace

bool probe_media(const std::string &path, MediaInfo &info, std::string &error) {
  quiet_libav();

  AVFormatContext *fmt_ctx = nullptr;
  int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    error = fmt::format("avformat_open_input failed: {}", av_error_string(ret));
    return false;
  }

  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    error = fmt::format("avformat_find_stream_info failed: {}",
                        av_error_string(ret));
    avformat_close_input(&fmt_ctx);
    return false;
  }

  info = MediaInfo{};
  if (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0) {
    info.duration = static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;
  }
  if (fmt_ctx->iformat && fmt_ctx->iformat->name) {
    info.format_name = fmt_ctx->iformat->name;
  }
  info.metadata = copy_tags(fmt_ctx->metadata);

  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    const AVStream *st = fmt_ctx->streams[i];
    const AVCodecParameters *par = st->codecpar;

    StreamInfo stream;
    stream.index = static_cast<int>(i);
    const char *kind = av_get_media_type_string(par->codec_type);
    stream.media_kind = kind ? kind : "unknown";
    stream.codec_name = avcodec_get_name(par->codec_id);
    if (par->codec_type == AVMEDIA_TYPE_AUDIO) {
      stream.sample_rate = par->sample_rate;
#if LIBAVCODEC_VERSION_INT >= AV_VERSION_INT(59, 24, 100)
      stream.channels = par->ch_layout.nb_channels;
#else
      stream.channels = par->channels;
#endif
    }
    stream.tags = copy_tags(st->metadata);
    info.streams.push_back(std::move(stream));
  }

  avformat_close_input(&fmt_ctx);
  return true;
}

double probe_duration(const std::string &path) {
  MediaInfo info;
  std::string error;
  if (!probe_media(path, info, error)) {
    LOG_WARN("Probe failed for {}: {}", path, error);
    return 0.0;
  }
  return info.duration;
}

std::vector<StreamInfo> audio_streams(const MediaInfo &info) {
  std::vector<StreamInfo> audio;
  for (const auto &s : info.streams) {
    if (s.media_kind == "audio")
      audio.push_back(s);
  }
  return audio;
}

std::map<std::string, std::string> audio_metadata(const MediaInfo &info) {
  static const std::pair<const char *, const char *> key_map[] = {
      {"title", "title"},   {"artist", "artist"},
      {"album", "album"},   {"date", "date"},
      {"genre", "genre"},   {"track", "track"},
      {"albumartist", "album_artist"}, {"album_artist", "album_artist"},
      {"composer", "composer"}, {"comment", "comment"},
  };

  /// Vorbis comments arrive upper-case
  std::map<std::string, std::string> lowered;
  for (const auto &[key, value] : info.metadata) {
    std::string k = key;
    std::transform(k.begin(), k.end(), k.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    lowered.emplace(k, value);
  }

  std::map<std::string, std::string> out;
  for (const auto &[from, to] : key_map) {
    auto it = lowered.find(from);
    if (it != lowered.end())
      out[to] = it->second;
  }
  return out;
}

} // namespace transcode_queue
