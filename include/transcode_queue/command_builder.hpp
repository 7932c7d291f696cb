/**
 * @file command_builder.hpp
 * @brief Transcoder argument vector construction
 *
 * @details Pure functions, no state. The produced vector is passed directly
 *          to Subprocess::spawn (no shell involved, so paths need no quoting).
 */

#ifndef TRANSCODE_QUEUE_COMMAND_BUILDER_HPP
#define TRANSCODE_QUEUE_COMMAND_BUILDER_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace transcode_queue {

/**
 * @brief Build the transcoder command for one conversion.
 *
 * @details Layout:
 *          <transcoder> -y -i <input> [-ss start] [-to end]
 *          -map 0:a:<n> -c:a <codec> [-q:a 0] -b:a <bitrate>
 *          -ar <rate> -ac <channels> [-af <filters>] -map_metadata 0 <output>
 *
 * @param transcoder Path to the transcoder executable (argv[0])
 * @param input_path Source media file
 * @param output_path Destination file
 * @param params Conversion parameters
 * @return Argument vector including argv[0]
 */
std::vector<std::string> build_command(const std::string &transcoder,
                                       const std::string &input_path,
                                       const std::string &output_path,
                                       const ConversionParams &params);

/**
 * @brief Audio filter chain for the normalization options.
 * @return Comma-joined filter list, empty when no filter applies
 */
std::string build_filter_chain(const ConversionParams &params);

/**
 * @brief Default codec for an output format ("mp3" -> "libmp3lame", ...).
 * @note Unknown formats map to libmp3lame.
 */
std::string default_codec(const std::string &output_format);

/**
 * @brief Validate a trim timestamp (H:MM:SS or HH:MM:SS, optional .mmm).
 */
bool validate_time_format(const std::string &time_str);

/**
 * @brief Convert a trim timestamp to seconds.
 * @param time_str Timestamp accepted by validate_time_format
 * @param seconds Output: parsed value
 * @return false if the timestamp is malformed
 */
bool time_to_seconds(const std::string &time_str, double &seconds);

/**
 * @brief Check whether a file extension is a supported conversion input.
 * @note Case-insensitive; covers common video and audio containers.
 */
bool is_supported_input(const std::string &path);

/**
 * @brief Render an argument vector for logging.
 */
std::string join_command(const std::vector<std::string> &args);

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_COMMAND_BUILDER_HPP
