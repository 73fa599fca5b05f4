/**
 * @file filter_planner.cpp
 * @brief Video filter chain construction implementation
 */

#include "clip_unify/filter_planner.hpp"

#include <fmt/core.h>

namespace clip_unify {

std::string scale_pad_filter(const TargetCanvas &canvas) {
  /// decrease-only fit, then centered pad; setsar forces square pixels
  return fmt::format("scale={0}:{1}:force_original_aspect_ratio=decrease,"
                     "pad={0}:{1}:(ow-iw)/2:(oh-ih)/2,"
                     "setsar=1",
                     canvas.width, canvas.height);
}

FilterChain plan_filters(const Dimensions &dims, const TargetCanvas &canvas) {
  FilterChain chain;
  chain.reserve(2);

  if (dims.is_portrait())
    chain.emplace_back(ROTATE_CCW_FILTER);

  chain.push_back(scale_pad_filter(canvas));
  return chain;
}

std::string join_filters(const FilterChain &chain) {
  std::string joined;
  for (size_t i = 0; i < chain.size(); ++i) {
    if (i > 0)
      joined += ",";
    joined += chain[i];
  }
  return joined;
}

} // namespace clip_unify
