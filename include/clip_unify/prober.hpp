/**
 * @file prober.hpp
 * @brief Width/height detection for source clips
 *
 * @details Two backends share the DimensionProber interface:
 *
 *          - FfprobeProber asks the external ffprobe tool for the first
 *            video stream's size as a single "WxH" line
 *
 *          - LibavProber opens the container in-process with libavformat
 *
 * @note Probing never throws. Any failure (tool missing, non-zero exit,
 *       malformed output, no video stream) is reported as ProbeFailed and
 *       is the only signal downstream uses to skip a file. No retry.
 */

#ifndef CLIP_UNIFY_PROBER_HPP
#define CLIP_UNIFY_PROBER_HPP

#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "process.hpp"
#include "types.hpp"

namespace clip_unify {

/**
 * @class DimensionProber
 * @brief Reads the pixel size of a clip's first video stream.
 */
class DimensionProber {
public:
  virtual ~DimensionProber() = default;

  /**
   * @brief Probe a file.
   * @param path Path to the source clip
   * @return Dimensions on success, ProbeFailed otherwise
   */
  virtual ProbeResult probe(const std::string &path) = 0;
};

/**
 * @class FfprobeProber
 * @brief Probes through `ffprobe -show_entries stream=width,height`.
 */
class FfprobeProber : public DimensionProber {
public:
  FfprobeProber(std::string ffprobe_bin, CommandRunner &runner);

  ProbeResult probe(const std::string &path) override;

  /**
   * @brief Build the ffprobe argv used for path.
   */
  std::vector<std::string> build_command(const std::string &path) const;

private:
  std::string ffprobe_bin_;
  CommandRunner &runner_;
};

/**
 * @class LibavProber
 * @brief Probes in-process with libavformat.
 * @note Each call opens and closes its own AVFormatContext, so a single
 *       instance can be shared by normalization workers.
 */
class LibavProber : public DimensionProber {
public:
  ProbeResult probe(const std::string &path) override;
};

/**
 * @brief Parse ffprobe's "WxH" output.
 * @note Only the first non-empty line is considered. Both sides must be
 *       positive decimal integers.
 */
ProbeResult parse_dimensions(const std::string &text);

/**
 * @brief Create the prober selected by cfg.probe_backend.
 * @param runner Runner used by the ffprobe backend (must outlive the prober)
 */
std::unique_ptr<DimensionProber> make_prober(const RunConfig &cfg,
                                             CommandRunner &runner);

} // namespace clip_unify

#endif // CLIP_UNIFY_PROBER_HPP
