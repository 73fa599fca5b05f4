/**
 * @file normalizer.cpp
 * @brief Single clip normalization implementation
 */

#include "clip_unify/normalizer.hpp"

#include <chrono>
#include <filesystem>
#include <variant>

#include <fmt/core.h>

#include "clip_unify/filter_planner.hpp"
#include "clip_unify/logging.hpp"

namespace clip_unify {

namespace {

std::string prefix(int worker_id) {
  return worker_id >= 0 ? fmt::format("[Worker {}] ", worker_id)
                        : std::string();
}

} // anonymous namespace

FileNormalizer::FileNormalizer(const RunConfig &cfg, DimensionProber &prober,
                               CommandRunner &runner)
    : cfg_(cfg), prober_(prober), runner_(runner) {}

std::vector<std::string> FileNormalizer::build_transcode_command(
    const std::string &source_path, const std::string &output_path,
    const FilterChain &chain, const EncodingProfile &profile) const {
  std::vector<std::string> cmd = {cfg_.ffmpeg_bin, "-hide_banner", "-loglevel",
                                  "error",         "-i",           source_path,
                                  "-vf",           join_filters(chain)};
  auto profile_args = profile.to_args();
  cmd.insert(cmd.end(), profile_args.begin(), profile_args.end());
  cmd.push_back("-y");
  cmd.push_back(output_path);
  return cmd;
}

NormalizationResult FileNormalizer::normalize(const std::string &source_path,
                                              const std::string &output_path,
                                              const EncodingProfile &profile,
                                              int worker_id) {
  NormalizationResult result;
  result.source_path = source_path;
  result.output_path = output_path;

  auto start_time = std::chrono::high_resolution_clock::now();
  std::string name = std::filesystem::path(source_path).filename().string();
  std::string tag = prefix(worker_id);

  // **----- PROBE -----**

  ProbeResult probed = prober_.probe(source_path);
  if (const auto *failed = std::get_if<ProbeFailed>(&probed)) {
    result.reason = fmt::format("cannot read file info ({})", failed->reason);
    LOG_WARN("{}Cannot read file info: {} ({})", tag, name, failed->reason);
    return result;
  }
  const Dimensions dims = std::get<Dimensions>(probed);

  LOG_INFO("{}Processing: {} ({}x{})", tag, name, dims.width, dims.height);

  // **----- PLAN -----**

  FilterChain chain = plan_filters(dims, cfg_.canvas);
  if (dims.is_portrait()) {
    LOG_INFO("{}  Portrait input, rotating 90 degrees counter-clockwise", tag);
  }

  // **----- TRANSCODE -----**

  std::vector<std::string> cmd =
      build_transcode_command(source_path, output_path, chain, profile);
  ProcessOutcome outcome = runner_.run(cmd);

  auto end_time = std::chrono::high_resolution_clock::now();
  result.processing_time_us =
      std::chrono::duration_cast<std::chrono::microseconds>(end_time -
                                                            start_time)
          .count();

  if (!outcome.ok()) {
    std::string detail = outcome.last_diagnostic_line();
    if (!outcome.spawned) {
      result.reason = fmt::format("could not start {}: {}", cfg_.ffmpeg_bin,
                                  outcome.diagnostics);
    } else if (detail.empty()) {
      result.reason = fmt::format("ffmpeg exited with status {}",
                                  outcome.exit_code);
    } else {
      result.reason = fmt::format("ffmpeg exited with status {}: {}",
                                  outcome.exit_code, detail);
    }
    LOG_ERROR("{}Failed: {} ({}); check the file or the GPU driver", tag, name,
              result.reason);
    LOG_INFO("{}  Command: {}", tag, format_command(cmd));
    return result;
  }

  result.success = true;
  LOG_SUCCESS("{}  Transcoded: {} ({:.1f}s)", tag, name,
              result.processing_time_us / 1000000.0);
  return result;
}

} // namespace clip_unify
