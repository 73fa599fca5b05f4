/**
 * @file concatenator.cpp
 * @brief Stream-copy merge implementation
 */

#include "clip_unify/concatenator.hpp"

#include <filesystem>

#include "clip_unify/logging.hpp"

namespace clip_unify {

namespace fs = std::filesystem;

Concatenator::Concatenator(const RunConfig &cfg, CommandRunner &runner)
    : cfg_(cfg), runner_(runner) {}

std::vector<std::string>
Concatenator::build_command(const std::string &list_path,
                            const std::string &output_path) const {
  return {cfg_.ffmpeg_bin, "-hide_banner", "-loglevel", "error",
          "-f",            "concat",       "-safe",     "0",
          "-i",            list_path,      "-c",        "copy",
          output_path};
}

bool Concatenator::concat(const std::string &list_path,
                          const std::string &output_path) {
  LOG_PHASE("Merging all clips into {} ...", output_path);

  /// Remove a previous run's artifact
  std::error_code ec;
  fs::remove(output_path, ec);
  if (ec) {
    LOG_ERROR("Cannot remove existing output {}: {}", output_path,
              ec.message());
    return false;
  }

  ProcessOutcome outcome = runner_.run(build_command(list_path, output_path));
  if (!outcome.ok()) {
    std::string detail = outcome.spawned ? outcome.last_diagnostic_line()
                                         : outcome.diagnostics;
    LOG_ERROR("Merge failed (status {}){}{}", outcome.exit_code,
              detail.empty() ? "" : ": ", detail);
    return false;
  }

  return true;
}

} // namespace clip_unify
