/**
 * @file config.hpp
 * @brief Run configuration loaded from environment variables
 *
 * @details RunConfig is built once at process start by load_config() and
 *          passed by const reference into every component. See
 *          config/clip_unify.env for documentation of each variable.
 */

#ifndef CLIP_UNIFY_CONFIG_HPP
#define CLIP_UNIFY_CONFIG_HPP

#include <cstdlib>
#include <string>
#include <vector>

#include "types.hpp"

namespace clip_unify {

/**
 * @brief Backend used to read the width/height of a source clip.
 */
enum class ProbeBackend {
  Ffprobe, //< External ffprobe invocation (default)
  Libav    //< In-process libavformat
};

/**
 * @struct RunConfig
 * @brief Immutable configuration for one batch run.
 */
struct RunConfig {
  std::string input_dir = ".";
  std::string scratch_dir = "processed_temp";
  std::string output_file = "final_merged_video.mp4";
  std::string list_file_name = "file_list.txt";

  /// Recognized extensions, lowercase, without the dot, in scan order
  std::vector<std::string> extensions = {"mp4", "mov", "avi",
                                         "mkv", "flv", "ts"};

  TargetCanvas canvas;

  std::string ffmpeg_bin = "ffmpeg";
  std::string ffprobe_bin = "ffprobe";
  ProbeBackend probe_backend = ProbeBackend::Ffprobe;

  /// Raw mode selection (empty = not given, prompt or default)
  std::string mode;

  /// Concurrent normalizations (1 = sequential, 0 = auto-detect)
  int parallel_jobs = 1;

  /// Upper bound on concurrent hardware encoder sessions
  int hw_max_sessions = 3;

  /// Path of the concat list inside the scratch directory
  std::string list_path() const;
};

namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or not a number
 * @return Parsed integer value or default
 */
int get_env_int(const char *name, int default_val);

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
std::string get_env_string(const char *name, const std::string &default_val);

/**
 * @brief Split a comma separated extension list.
 * @note Entries are trimmed, lowercased and stripped of a leading dot;
 *       empty entries and duplicates are dropped, first occurrence wins.
 */
std::vector<std::string> parse_extension_list(const std::string &csv);

/**
 * @brief Map a backend name to ProbeBackend ("libav" or anything else).
 */
ProbeBackend parse_probe_backend(const std::string &name);

} // namespace Config

/**
 * @brief Build the run configuration from defaults and the environment.
 * @return Fully populated configuration
 */
RunConfig load_config();

} // namespace clip_unify

#endif // CLIP_UNIFY_CONFIG_HPP
