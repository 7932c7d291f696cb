/**
 * @file media_prober.hpp
 * @brief Media inspection (duration, streams, container tags)
 *
 * @details Opens the container with libavformat, reads stream info and
 *          reports what the conversion needs: the total duration as progress
 *          denominator, the stream list for audio-track selection and the
 *          container metadata carried over with -map_metadata.
 *
 *          Inspection runs in-process and never invokes the configured
 *          transcoder binary, so a custom TRANSCODER_PATH does not affect
 *          it. Callers that need a different source of durations inject
 *          their own DurationProbe into ExecutionEngine or Scheduler.
 */

#ifndef TRANSCODE_QUEUE_MEDIA_PROBER_HPP
#define TRANSCODE_QUEUE_MEDIA_PROBER_HPP

#include <map>
#include <string>
#include <vector>

namespace transcode_queue {

/**
 * @struct StreamInfo
 * @brief One elementary stream of a probed file.
 */
struct StreamInfo {
  int index = -1;          //< Container stream index
  std::string media_kind;  //< "audio", "video", "subtitle", ...
  std::string codec_name;  //< Decoder name, e.g. "aac"
  int sample_rate = 0;     //< Audio only
  int channels = 0;        //< Audio only
  std::map<std::string, std::string> tags; //< Stream tags (language, ...)
};

/**
 * @struct MediaInfo
 * @brief Result of probe_media().
 */
struct MediaInfo {
  double duration = 0.0;                       //< Seconds, 0 if unknown
  std::string format_name;                     //< Container short name
  std::vector<StreamInfo> streams;             //< All streams in order
  std::map<std::string, std::string> metadata; //< Container tags
};

/**
 * @brief Inspect a media file.
 * @param path File to open
 * @param info Output: probed information
 * @param error Output: reason on failure
 * @return true on success
 */
bool probe_media(const std::string &path, MediaInfo &info, std::string &error);

/**
 * @brief Duration of a media file in seconds.
 * @return 0 if the file cannot be probed or has no known duration
 */
double probe_duration(const std::string &path);

/**
 * @brief Audio streams of a probed file, in container order.
 */
std::vector<StreamInfo> audio_streams(const MediaInfo &info);

/**
 * @brief Container tags that map onto audio-file tags.
 * @note title, artist, album, date, genre, track, composer, comment are kept;
 *       albumartist is renamed album_artist; everything else is dropped.
 */
std::map<std::string, std::string> audio_metadata(const MediaInfo &info);

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_MEDIA_PROBER_HPP
