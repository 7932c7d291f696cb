/**
 * @file types.hpp
 * @brief Core data types for the conversion queue
 *
 * @details Contains the value types shared by every module:
 *          - ConversionParams for a single conversion request
 *
 *          - JobStatus and OverwritePolicy enumerations
 *
 *          - JobResult for terminal outcomes
 *
 *          - QueueStats for aggregate counters
 */

#ifndef TRANSCODE_QUEUE_TYPES_HPP
#define TRANSCODE_QUEUE_TYPES_HPP

#include <cstddef>
#include <optional>
#include <string>

namespace transcode_queue {

// **----- CONSTANTS -----**

/// Number of trailing diagnostic lines kept for a failed conversion
constexpr size_t ERROR_TAIL_LINES = 10;

/// Highest counter tried when generating "name (N).ext" variants
constexpr int MAX_UNIQUE_SUFFIX = 9999;

/// Longest filename (bytes) accepted by the target filesystem
constexpr size_t MAX_FILENAME_LENGTH = 255;

// **----- ENUMERATIONS -----**

/**
 * @enum JobStatus
 * @brief Lifecycle state of a conversion job.
 * @note COMPLETED, FAILED, CANCELLED and SKIPPED are terminal.
 */
enum class JobStatus { QUEUED, RUNNING, COMPLETED, FAILED, CANCELLED, SKIPPED };

/**
 * @enum OverwritePolicy
 * @brief How an already existing output file is handled at admission.
 */
enum class OverwritePolicy { SKIP, REPLACE, UNIQUE };

/// True for states from which no further transition exists
inline bool is_terminal(JobStatus status) {
  return status == JobStatus::COMPLETED || status == JobStatus::FAILED ||
         status == JobStatus::CANCELLED || status == JobStatus::SKIPPED;
}

/// Lower-case name of a status ("queued", "running", ...)
const char *to_string(JobStatus status);

/// Lower-case name of a policy ("skip", "replace", "unique")
const char *to_string(OverwritePolicy policy);

/**
 * @brief Parse a policy name.
 * @param name "skip", "replace" or "unique" (case-insensitive)
 * @param policy Output: parsed policy
 * @return false if the name is not a known policy
 */
bool parse_overwrite_policy(const std::string &name, OverwritePolicy &policy);

// **----- DATA STRUCTURES -----**

/**
 * @struct ConversionParams
 * @brief Parameters for one audio conversion, copied by value into each job.
 */
struct ConversionParams {
  std::string output_format = "mp3";     //< Output container / extension
  std::string codec = "libmp3lame";      //< Audio codec passed to -c:a
  std::string bitrate = "192k";          //< Target bitrate (-b:a)
  int sample_rate = 44100;               //< Output sample rate (-ar)
  int channels = 2;                      //< Output channel count (-ac)
  std::optional<std::string> start_time; //< Trim start (HH:MM:SS[.mmm])
  std::optional<std::string> end_time;   //< Trim end (HH:MM:SS[.mmm])
  std::optional<int> stream_index;       //< Source audio stream (0:a:N)
  bool normalize_loudness = false;       //< EBU R128 loudnorm filter
  bool normalize_peak = false;           //< Fixed volume adjustment
  double peak_target = -1.0;             //< Volume adjustment in dB
};

/**
 * @struct JobResult
 * @brief Terminal outcome of a job, attached once at its final transition.
 */
struct JobResult {
  bool success = false;                   //< Conversion produced an output
  std::string message;                    //< Human-readable summary
  std::optional<std::string> output_path; //< Materialized output file
  std::optional<std::string> error_code;  //< Machine-readable failure class
  std::optional<int> exit_code;           //< Transcoder exit code, if any
  double duration = 0.0;                  //< Wall-clock seconds spent
};

/**
 * @struct QueueStats
 * @brief Count of registered jobs per status.
 */
struct QueueStats {
  size_t total = 0;
  size_t queued = 0;
  size_t running = 0;
  size_t completed = 0;
  size_t failed = 0;
  size_t cancelled = 0;
  size_t skipped = 0;
};

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_TYPES_HPP
