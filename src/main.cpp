/**
 * @file main.cpp
 * @brief Entry point for clip_unify
 *
 * @details Main entry point that handles:
 *
 *          - Configuration (environment, then command-line positionals)
 *
 *          - Encoding mode selection (argument, ENCODE_MODE, or prompt)
 *
 *          - Running the batch and mapping its outcome to an exit code
 *
 * @note Usage: clip_unify [input_dir] [mode]
 *       mode is 1/software (default) or 2/hardware. See
 *       config/clip_unify.env for the environment variables.
 */

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>

#include <unistd.h>

#include "clip_unify/batch_processor.hpp"
#include "clip_unify/concatenator.hpp"
#include "clip_unify/config.hpp"
#include "clip_unify/encoder_profile.hpp"
#include "clip_unify/logging.hpp"
#include "clip_unify/normalizer.hpp"
#include "clip_unify/process.hpp"
#include "clip_unify/prober.hpp"

using namespace clip_unify;

namespace {

/// Ask once on an interactive terminal; empty answer means software
std::string prompt_mode() {
  fmt::print("Choose an encoding mode:\n");
  fmt::print(" [1] CPU (libx264)    - default, most compatible, slower\n");
  fmt::print(" [2] GPU (h264_nvenc) - needs an NVIDIA card, much faster\n");
  fmt::print("\nEnter 1 or 2 (Enter = 1): ");
  std::fflush(stdout);

  std::string choice;
  if (!std::getline(std::cin, choice))
    return {};
  return choice;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc > 3 || (argc > 1 && (std::string(argv[1]) == "-h" ||
                                std::string(argv[1]) == "--help"))) {
    LOG_WARN("Usage: ./clip_unify [input_dir] [mode: 1=cpu | 2=gpu]");
    return argc > 3 ? 1 : 0;
  }

  const RunConfig cfg = [&]() {
    RunConfig c = load_config();
    if (argc > 1)
      c.input_dir = argv[1];
    if (argc > 2)
      c.mode = argv[2];
    else if (c.mode.empty() && isatty(STDIN_FILENO))
      c.mode = prompt_mode();
    return c;
  }();

  LOG_PHASE("clip_unify - normalize and merge video clips");
  LOG_INFO("Input directory: {}", cfg.input_dir);
  LOG_INFO("Scratch directory: {}", cfg.scratch_dir);
  LOG_INFO("Output file: {}", cfg.output_file);

  /// Selected once, before any file is processed
  const EncodingProfile profile = select_profile(cfg.mode);
  LOG_INFO("Encoding with {}", profile.describe());

  SubprocessRunner runner;
  auto prober = make_prober(cfg, runner);
  FileNormalizer normalizer(cfg, *prober, runner);
  Concatenator concatenator(cfg, runner);
  BatchProcessor processor(cfg, normalizer, concatenator);

  BatchOutcome outcome = processor.run(profile);

  switch (outcome.status) {
  case BatchStatus::Merged: {
    std::error_code ec;
    auto abs = std::filesystem::absolute(cfg.output_file, ec);
    LOG_SUCCESS("Done! Merged {} clips into {}", outcome.manifest.size(),
                ec ? cfg.output_file : abs.string());
    break;
  }
  case BatchStatus::NoInputs:
    LOG_WARN("No video files found.");
    break;
  case BatchStatus::NothingNormalized:
    LOG_WARN("No video files could be normalized.");
    break;
  case BatchStatus::WorkspaceError:
    LOG_ERROR("Run aborted: scratch workspace could not be prepared.");
    break;
  case BatchStatus::ConcatFailed:
    LOG_ERROR("Merge step failed; {} is not valid.", cfg.output_file);
    break;
  }

  TimingCollector::print_summary();
  return exit_code_for(outcome.status);
}
