/**
 * @file filter_planner.hpp
 * @brief Video filter chain construction
 *
 * @details Derives the ordered filters that bring a clip onto the canvas:
 *
 *          1. Portrait input (height > width) is rotated 90 degrees
 *             counter-clockwise. Fixed policy, no rotation metadata check.
 *
 *          2. Every clip is scaled to fit inside the canvas with its aspect
 *             ratio preserved, padded (centered) to exactly the canvas, and
 *             given a square sample aspect ratio.
 */

#ifndef CLIP_UNIFY_FILTER_PLANNER_HPP
#define CLIP_UNIFY_FILTER_PLANNER_HPP

#include <string>

#include "types.hpp"

namespace clip_unify {

/// Counter-clockwise 90 degree rotation
constexpr const char *ROTATE_CCW_FILTER = "transpose=2";

/**
 * @brief Build the scale+pad+setsar filter for a canvas.
 */
std::string scale_pad_filter(const TargetCanvas &canvas);

/**
 * @brief Plan the filter chain for one clip.
 * @param dims Probed size; both sides must be positive
 * @param canvas Target canvas
 * @return Rotation (portrait only) followed by exactly one scale+pad entry
 */
FilterChain plan_filters(const Dimensions &dims, const TargetCanvas &canvas);

/**
 * @brief Join a chain into a single -vf expression.
 */
std::string join_filters(const FilterChain &chain);

} // namespace clip_unify

#endif // CLIP_UNIFY_FILTER_PLANNER_HPP
