/**
 * @file encoder_profile.cpp
 * @brief Encoder profile selection implementation
 */

#include "clip_unify/encoder_profile.hpp"

#include <cctype>

#include <fmt/core.h>

namespace clip_unify {

namespace {

std::string normalize_choice(const std::string &choice) {
  std::string s;
  s.reserve(choice.size());
  for (unsigned char c : choice) {
    if (!std::isspace(c))
      s.push_back(static_cast<char>(std::tolower(c)));
  }
  return s;
}

} // anonymous namespace

std::vector<std::string> EncodingProfile::to_args() const {
  std::vector<std::string> args = {"-c:v", video_codec, "-preset", preset,
                                   quality_flag, std::to_string(quality)};
  if (!rate_control.empty()) {
    args.push_back("-rc");
    args.push_back(rate_control);
  }

  /// Shared parameters: identical across profiles for stream-copy concat
  const std::vector<std::string> common = {
      "-r",
      std::to_string(frame_rate),
      "-video_track_timescale",
      std::to_string(video_track_timescale),
      "-c:a",
      audio_codec,
      "-ar",
      std::to_string(audio_sample_rate),
      "-ac",
      std::to_string(audio_channels),
      "-b:a",
      audio_bitrate};
  args.insert(args.end(), common.begin(), common.end());
  return args;
}

std::string EncodingProfile::describe() const {
  if (mode == EncodeMode::Hardware)
    return fmt::format("NVIDIA GPU ({}, preset {}, cq {})", video_codec,
                       preset, quality);
  return fmt::format("CPU ({}, preset {}, crf {})", video_codec, preset,
                     quality);
}

bool EncodingProfile::operator==(const EncodingProfile &other) const {
  return mode == other.mode && to_args() == other.to_args();
}

EncodeMode parse_mode(const std::string &choice) {
  static const char *const hardware_names[] = {"2", "hardware", "gpu", "nvenc",
                                               "h264_nvenc"};
  std::string key = normalize_choice(choice);
  for (const char *name : hardware_names) {
    if (key == name)
      return EncodeMode::Hardware;
  }
  return EncodeMode::Software;
}

EncodingProfile select_profile(EncodeMode mode) {
  EncodingProfile profile;
  profile.mode = mode;

  if (mode == EncodeMode::Hardware) {
    /// NVENC has no crf; cq 26 is roughly x264 crf 23
    profile.video_codec = "h264_nvenc";
    profile.preset = "p4";
    profile.quality_flag = "-cq";
    profile.quality = 26;
    profile.rate_control = "vbr";
  } else {
    profile.video_codec = "libx264";
    profile.preset = "fast";
    profile.quality_flag = "-crf";
    profile.quality = 23;
  }
  return profile;
}

EncodingProfile select_profile(const std::string &choice) {
  return select_profile(parse_mode(choice));
}

} // namespace clip_unify
