/**
 * @file config.cpp
 * @brief Run configuration implementation
 */

#include "clip_unify/config.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

#include "clip_unify/logging.hpp"

namespace clip_unify {

namespace {

std::string trim(const std::string &s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(begin, end - begin);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // anonymous namespace

std::string RunConfig::list_path() const {
  return (std::filesystem::path(scratch_dir) / list_file_name).string();
}

namespace Config {

int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  try {
    return std::stoi(val);
  } catch (const std::exception &) {
    LOG_WARN("Ignoring non-numeric {}={}", name, val);
    return default_val;
  }
}

std::string get_env_string(const char *name, const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

std::vector<std::string> parse_extension_list(const std::string &csv) {
  std::vector<std::string> exts;
  size_t pos = 0;
  while (pos <= csv.size()) {
    size_t end = csv.find(',', pos);
    if (end == std::string::npos)
      end = csv.size();

    std::string ext = to_lower(trim(csv.substr(pos, end - pos)));
    if (!ext.empty() && ext.front() == '.')
      ext.erase(0, 1);
    if (!ext.empty() && std::find(exts.begin(), exts.end(), ext) == exts.end())
      exts.push_back(ext);

    pos = end + 1;
  }
  return exts;
}

ProbeBackend parse_probe_backend(const std::string &name) {
  return to_lower(trim(name)) == "libav" ? ProbeBackend::Libav
                                         : ProbeBackend::Ffprobe;
}

} // namespace Config

RunConfig load_config() {
  RunConfig cfg;

  cfg.input_dir = Config::get_env_string("INPUT_DIR", cfg.input_dir);
  cfg.scratch_dir = Config::get_env_string("SCRATCH_DIR", cfg.scratch_dir);
  cfg.output_file = Config::get_env_string("OUTPUT_FILE", cfg.output_file);

  auto exts = Config::parse_extension_list(Config::get_env_string("VIDEO_EXTS", ""));
  if (!exts.empty())
    cfg.extensions = std::move(exts);

  /// Non-positive canvas sides fall back to the defaults
  int width = Config::get_env_int("TARGET_WIDTH", DEFAULT_CANVAS_WIDTH);
  int height = Config::get_env_int("TARGET_HEIGHT", DEFAULT_CANVAS_HEIGHT);
  cfg.canvas.width = width > 0 ? width : DEFAULT_CANVAS_WIDTH;
  cfg.canvas.height = height > 0 ? height : DEFAULT_CANVAS_HEIGHT;

  cfg.ffmpeg_bin = Config::get_env_string("FFMPEG_BIN", cfg.ffmpeg_bin);
  cfg.ffprobe_bin = Config::get_env_string("FFPROBE_BIN", cfg.ffprobe_bin);
  cfg.probe_backend =
      Config::parse_probe_backend(Config::get_env_string("PROBE_BACKEND", ""));

  cfg.mode = Config::get_env_string("ENCODE_MODE", "");

  cfg.parallel_jobs = std::max(0, Config::get_env_int("PARALLEL_JOBS", 1));
  cfg.hw_max_sessions =
      std::max(1, Config::get_env_int("HW_MAX_SESSIONS", cfg.hw_max_sessions));

  return cfg;
}

} // namespace clip_unify
