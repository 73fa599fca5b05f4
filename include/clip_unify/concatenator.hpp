/**
 * @file concatenator.hpp
 * @brief Stream-copy merge of normalized clips
 *
 * @details Runs the concat demuxer over the manifest with `-c copy`. No
 *          re-encoding happens here; it relies on every clip sharing the
 *          same codec, frame rate, timescale and audio parameters.
 *
 * @note Any existing file at the final output path is deleted first. A
 *       failure is terminal for the run and the merged file must be treated
 *       as absent.
 */

#ifndef CLIP_UNIFY_CONCATENATOR_HPP
#define CLIP_UNIFY_CONCATENATOR_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "process.hpp"

namespace clip_unify {

/**
 * @class Concatenator
 * @brief Produces the merged artifact from a concat list.
 */
class Concatenator {
public:
  Concatenator(const RunConfig &cfg, CommandRunner &runner);

  /**
   * @brief Merge every clip in the list into one file.
   *
   * @param list_path Concat list written by ConcatManifest
   * @param output_path Final merged file
   * @return true if the engine exited zero
   */
  bool concat(const std::string &list_path, const std::string &output_path);

  /**
   * @brief Build the ffmpeg argv for the merge.
   */
  std::vector<std::string> build_command(const std::string &list_path,
                                         const std::string &output_path) const;

private:
  const RunConfig &cfg_;
  CommandRunner &runner_;
};

} // namespace clip_unify

#endif // CLIP_UNIFY_CONCATENATOR_HPP
