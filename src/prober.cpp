/**
 * @file prober.cpp
 * @brief Dimension probing implementation
 */

#include "clip_unify/prober.hpp"

#include <cctype>
#include <climits>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

#include <fmt/core.h>

namespace clip_unify {

namespace {

/// Parse a positive decimal integer occupying all of s
bool parse_positive(const std::string &s, int &out) {
  if (s.empty() || s.size() > 9)
    return false;
  long val = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
    val = val * 10 + (c - '0');
  }
  if (val <= 0 || val > INT_MAX)
    return false;
  out = static_cast<int>(val);
  return true;
}

std::string av_error_text(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

} // anonymous namespace

// **---- Parsing ----**

ProbeResult parse_dimensions(const std::string &text) {
  /// First non-empty line, surrounding whitespace stripped
  size_t pos = 0;
  std::string line;
  while (pos < text.size()) {
    size_t end = text.find('\n', pos);
    if (end == std::string::npos)
      end = text.size();
    std::string candidate = text.substr(pos, end - pos);
    size_t first = candidate.find_first_not_of(" \t\r");
    if (first != std::string::npos) {
      size_t last = candidate.find_last_not_of(" \t\r");
      line = candidate.substr(first, last - first + 1);
      break;
    }
    pos = end + 1;
  }

  if (line.empty())
    return ProbeFailed{"no video stream reported"};

  /// Streams with side data may end the row with an extra separator
  size_t x = line.find('x');
  if (x == std::string::npos)
    return ProbeFailed{fmt::format("unparsable size '{}'", line)};
  size_t height_end = line.find('x', x + 1);
  if (height_end == std::string::npos)
    height_end = line.size();

  Dimensions dims;
  if (!parse_positive(line.substr(0, x), dims.width) ||
      !parse_positive(line.substr(x + 1, height_end - x - 1), dims.height)) {
    return ProbeFailed{fmt::format("unparsable size '{}'", line)};
  }
  return dims;
}

// **---- ffprobe backend ----**

FfprobeProber::FfprobeProber(std::string ffprobe_bin, CommandRunner &runner)
    : ffprobe_bin_(std::move(ffprobe_bin)), runner_(runner) {}

std::vector<std::string>
FfprobeProber::build_command(const std::string &path) const {
  return {ffprobe_bin_,
          "-v",
          "error",
          "-select_streams",
          "v:0",
          "-show_entries",
          "stream=width,height",
          "-of",
          "csv=s=x:p=0",
          path};
}

ProbeResult FfprobeProber::probe(const std::string &path) {
  ProcessOutcome outcome = runner_.run(build_command(path));
  if (!outcome.spawned)
    return ProbeFailed{outcome.diagnostics};
  if (outcome.exit_code != 0) {
    std::string detail = outcome.last_diagnostic_line();
    return ProbeFailed{
        detail.empty()
            ? fmt::format("ffprobe exited with status {}", outcome.exit_code)
            : detail};
  }
  return parse_dimensions(outcome.output);
}

// **---- libav backend ----**

ProbeResult LibavProber::probe(const std::string &path) {
  AVFormatContext *fmt_ctx = nullptr;

  int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0)
    return ProbeFailed{fmt::format("avformat_open_input: {}", av_error_text(ret))};

  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    avformat_close_input(&fmt_ctx);
    return ProbeFailed{
        fmt::format("avformat_find_stream_info: {}", av_error_text(ret))};
  }

  /// First video stream, matching ffprobe's v:0 selector
  const AVCodecParameters *param = nullptr;
  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (fmt_ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
      param = fmt_ctx->streams[i]->codecpar;
      break;
    }
  }

  if (!param) {
    avformat_close_input(&fmt_ctx);
    return ProbeFailed{"no video stream"};
  }

  Dimensions dims{param->width, param->height};
  avformat_close_input(&fmt_ctx);

  if (dims.width <= 0 || dims.height <= 0)
    return ProbeFailed{"video stream has no size"};
  return dims;
}

// **---- Factory ----**

std::unique_ptr<DimensionProber> make_prober(const RunConfig &cfg,
                                             CommandRunner &runner) {
  if (cfg.probe_backend == ProbeBackend::Libav) {
    av_log_set_level(AV_LOG_ERROR);
    return std::make_unique<LibavProber>();
  }
  return std::make_unique<FfprobeProber>(cfg.ffprobe_bin, runner);
}

} // namespace clip_unify
