/**
 * @file path_resolver.hpp
 * @brief Output path resolution under an overwrite policy
 *
 * @details Decides, at admission time, whether a job writes to its natural
 *          output path, to a numbered "name (N).ext" variant, or is skipped
 *          because the output already exists. Filenames are sanitized before
 *          any decision is made.
 */

#ifndef TRANSCODE_QUEUE_PATH_RESOLVER_HPP
#define TRANSCODE_QUEUE_PATH_RESOLVER_HPP

#include <stdexcept>
#include <string>

#include "types.hpp"

namespace transcode_queue {

/**
 * @class PathExhaustionError
 * @brief Every "name (1..9999).ext" candidate already exists.
 */
class PathExhaustionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @struct ResolvedPath
 * @brief Outcome of resolve_output_path().
 */
struct ResolvedPath {
  std::string path;         //< Final output path
  bool should_skip = false; //< Job must be registered as SKIPPED
};

/**
 * @brief Replace characters that are illegal in filenames.
 *
 * @note `< > : " / \ | ? *` and control characters become '_'. Leading and
 *       trailing spaces/dots are trimmed, an empty result becomes
 *       "converted_file", and names over MAX_FILENAME_LENGTH bytes are
 *       truncated with the extension preserved.
 */
std::string sanitize_filename(const std::string &filename);

/**
 * @brief First non-existing "<base>.<ext>", "<base> (1)<ext>", ... in a dir.
 * @param directory Target directory
 * @param base_name Filename stem (sanitized here)
 * @param extension Extension including the leading dot (may be empty)
 * @throws PathExhaustionError past MAX_UNIQUE_SUFFIX candidates
 */
std::string unique_filename(const std::string &directory,
                            const std::string &base_name,
                            const std::string &extension);

/**
 * @brief Resolve the output path of a job.
 *
 * @attention POLICIES:
 *
 * - SKIP: existing target -> same path, should_skip = true
 *
 * - REPLACE: same path, caller overwrites
 *
 * - UNIQUE: same path if free, otherwise the first free numbered variant
 *
 * @throws PathExhaustionError from UNIQUE resolution
 */
ResolvedPath resolve_output_path(const std::string &desired_path,
                                 OverwritePolicy policy);

} // namespace transcode_queue

#endif // TRANSCODE_QUEUE_PATH_RESOLVER_HPP
