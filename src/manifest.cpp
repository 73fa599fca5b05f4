/**
 * @file manifest.cpp
 * @brief Concat demuxer list implementation
 */

#include "clip_unify/manifest.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <fmt/core.h>

namespace clip_unify {

namespace fs = std::filesystem;

std::string format_entry(const std::string &path) {
  std::error_code ec;
  fs::path abs = fs::absolute(path, ec);
  std::string text = ec ? path : abs.lexically_normal().string();
  std::replace(text.begin(), text.end(), '\\', '/');

  std::string quoted;
  quoted.reserve(text.size() + 2);
  for (char c : text) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  return fmt::format("file '{}'", quoted);
}

std::string scratch_file_name(size_t index, const char *stem) {
  return fmt::format("{}_{:04d}.mp4", stem, index);
}

void ConcatManifest::add(const std::string &normalized_path) {
  entries_.push_back(format_entry(normalized_path));
}

std::string ConcatManifest::render() const {
  std::string content;
  for (size_t i = 0; i < entries_.size(); ++i) {
    if (i > 0)
      content += "\n";
    content += entries_[i];
  }
  return content;
}

bool ConcatManifest::write(const std::string &list_path) const {
  std::ofstream out(list_path, std::ios::binary | std::ios::trunc);
  if (!out)
    return false;
  std::string content = render();
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.close();
  return !out.fail();
}

} // namespace clip_unify
