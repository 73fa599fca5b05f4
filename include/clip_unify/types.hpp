/**
 * @file types.hpp
 * @brief Core data types shared by every clip_unify component
 *
 * @details Contains the value types that flow through the pipeline:
 *          - TargetCanvas for the fixed output resolution
 *
 *          - Dimensions / ProbeFailed / ProbeResult for probing
 *
 *          - FilterChain for the per-clip transformation list
 *
 *          - NormalizationResult for per-file outcomes
 */

#ifndef CLIP_UNIFY_TYPES_HPP
#define CLIP_UNIFY_TYPES_HPP

#include <string>
#include <variant>
#include <vector>

namespace clip_unify {

// **----- CONSTANTS -----**

/// Default canvas every clip is scaled and padded to
constexpr int DEFAULT_CANVAS_WIDTH = 1920;
constexpr int DEFAULT_CANVAS_HEIGHT = 1080;

// **----- DATA STRUCTURES -----**

/**
 * @struct TargetCanvas
 * @brief Output resolution shared by every normalized clip.
 * @note Both sides are positive; fixed for the whole run.
 */
struct TargetCanvas {
  int width = DEFAULT_CANVAS_WIDTH;   //< Canvas width in pixels
  int height = DEFAULT_CANVAS_HEIGHT; //< Canvas height in pixels
};

/**
 * @struct Dimensions
 * @brief Pixel size of the first video stream of a file.
 */
struct Dimensions {
  int width = 0;
  int height = 0;

  bool is_portrait() const { return height > width; }
};

/**
 * @struct ProbeFailed
 * @brief The file could not be inspected (missing tool, bad output, no
 *        video stream, unreadable container).
 */
struct ProbeFailed {
  std::string reason;
};

/// Either the detected size or the reason probing failed
using ProbeResult = std::variant<Dimensions, ProbeFailed>;

/// Ordered filter specs; rotation, when present, precedes scale/pad
using FilterChain = std::vector<std::string>;

/**
 * @struct NormalizationResult
 * @brief Outcome of normalizing one source clip.
 * @note A failed result may leave a partial file at output_path; callers
 *       must not reference it.
 */
struct NormalizationResult {
  std::string source_path; //< Input clip
  std::string output_path; //< Normalized file in the scratch directory
  bool success = false;    //< Engine exited zero
  std::string reason;      //< Failure notice (empty on success)
  long processing_time_us = 0;
};

} // namespace clip_unify

#endif // CLIP_UNIFY_TYPES_HPP
