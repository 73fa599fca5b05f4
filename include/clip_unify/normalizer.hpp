/**
 * @file normalizer.hpp
 * @brief Single clip normalization
 *
 * @details The FileNormalizer turns one source clip into one canvas-sized,
 *          constant frame rate file:
 *
 *          1. Probe dimensions (skip the engine entirely on ProbeFailed)
 *
 *          2. Plan the filter chain for the canvas
 *
 *          3. Run ffmpeg once with the chain and the active profile,
 *             overwriting any existing output
 *
 * @note Every per-file error is absorbed here and reported through
 *       NormalizationResult; nothing is retried and nothing throws.
 *       When worker_id >= 0 log lines are prefixed with [Worker N].
 */

#ifndef CLIP_UNIFY_NORMALIZER_HPP
#define CLIP_UNIFY_NORMALIZER_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "encoder_profile.hpp"
#include "process.hpp"
#include "prober.hpp"
#include "types.hpp"

namespace clip_unify {

/**
 * @class FileNormalizer
 * @brief Orchestrates prober, planner and profile for one clip.
 * @note Holds references only; cfg, prober and runner must outlive it.
 */
class FileNormalizer {
public:
  FileNormalizer(const RunConfig &cfg, DimensionProber &prober,
                 CommandRunner &runner);

  /**
   * @brief Normalize one clip.
   *
   * @param source_path Input clip
   * @param output_path Destination in the scratch directory
   * @param profile Active encoding profile
   * @param worker_id Worker ID for log prefixing (-1 = no prefix)
   * @return Result with success = engine exited zero
   */
  NormalizationResult normalize(const std::string &source_path,
                                const std::string &output_path,
                                const EncodingProfile &profile,
                                int worker_id = -1);

  /**
   * @brief Build the ffmpeg argv for one transcode.
   */
  std::vector<std::string>
  build_transcode_command(const std::string &source_path,
                          const std::string &output_path,
                          const FilterChain &chain,
                          const EncodingProfile &profile) const;

private:
  const RunConfig &cfg_;
  DimensionProber &prober_;
  CommandRunner &runner_;
};

} // namespace clip_unify

#endif // CLIP_UNIFY_NORMALIZER_HPP
