/**
 * @file encoder_profile.hpp
 * @brief Encoder parameter sets for software and hardware modes
 *
 * @details Both profiles force the same frame rate, container timescale and
 *          audio parameters so that every normalized clip can be joined with
 *          the concat demuxer in stream-copy mode.
 *
 *          - Software: libx264, preset fast, crf 23
 *
 *          - Hardware: h264_nvenc, preset p4, cq 26, vbr rate control
 *
 * @note Mode parsing fails open: anything not recognized as hardware
 *       selects the software profile.
 */

#ifndef CLIP_UNIFY_ENCODER_PROFILE_HPP
#define CLIP_UNIFY_ENCODER_PROFILE_HPP

#include <string>
#include <vector>

namespace clip_unify {

enum class EncodeMode { Software, Hardware };

/**
 * @struct EncodingProfile
 * @brief Complete parameter set for one encoding mode.
 */
struct EncodingProfile {
  EncodeMode mode = EncodeMode::Software;

  std::string video_codec;  //< -c:v
  std::string preset;       //< -preset
  std::string quality_flag; //< -crf (x264) or -cq (nvenc)
  int quality = 0;          //< Constant-quality value for quality_flag
  std::string rate_control; //< -rc value, empty when not used

  int frame_rate = 30;
  int video_track_timescale = 15360; //< Keeps concat durations consistent

  std::string audio_codec = "aac";
  int audio_sample_rate = 44100;
  int audio_channels = 2;
  std::string audio_bitrate = "192k";

  /**
   * @brief Render the ffmpeg arguments for this profile, in order.
   */
  std::vector<std::string> to_args() const;

  /// Human readable label for log lines
  std::string describe() const;

  bool operator==(const EncodingProfile &other) const;
  bool operator!=(const EncodingProfile &other) const {
    return !(*this == other);
  }
};

/**
 * @brief Map a user choice to a mode.
 * @note "2", "hardware", "gpu", "nvenc" and "h264_nvenc" (any case, any
 *       surrounding whitespace) select Hardware; everything else, including
 *       the empty string, selects Software.
 */
EncodeMode parse_mode(const std::string &choice);

/**
 * @brief Profile for a mode.
 */
EncodingProfile select_profile(EncodeMode mode);

/**
 * @brief Profile for a raw user choice (parse_mode + select_profile).
 */
EncodingProfile select_profile(const std::string &choice);

} // namespace clip_unify

#endif // CLIP_UNIFY_ENCODER_PROFILE_HPP
