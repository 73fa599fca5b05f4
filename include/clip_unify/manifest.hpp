/**
 * @file manifest.hpp
 * @brief Concat demuxer list construction
 *
 * @details One line per normalized clip, in processing order:
 *
 *            file '/abs/path/processed_0000.mp4'
 *
 *          Paths are absolute with forward slashes; embedded single quotes
 *          are written as '\'' so the demuxer reads them back verbatim.
 *          Lines are joined with '\n' and no trailing newline is written.
 */

#ifndef CLIP_UNIFY_MANIFEST_HPP
#define CLIP_UNIFY_MANIFEST_HPP

#include <string>
#include <vector>

namespace clip_unify {

/**
 * @brief Format one manifest line for a normalized file.
 */
std::string format_entry(const std::string &path);

/**
 * @brief Name of the scratch file for the given sequence number.
 * @return e.g. processed_0007.mp4
 */
std::string scratch_file_name(size_t index, const char *stem = "processed");

/**
 * @class ConcatManifest
 * @brief Ordered list of normalized outputs for the merge step.
 * @note Insertion order is the final video order and is never changed.
 */
class ConcatManifest {
public:
  /// Append a successfully normalized file
  void add(const std::string &normalized_path);

  bool empty() const { return entries_.empty(); }
  size_t size() const { return entries_.size(); }

  /// Formatted lines in insertion order
  const std::vector<std::string> &entries() const { return entries_; }

  /// Newline-joined list contents
  std::string render() const;

  /**
   * @brief Persist the list as UTF-8 text.
   * @return true on success
   */
  bool write(const std::string &list_path) const;

private:
  std::vector<std::string> entries_;
};

} // namespace clip_unify

#endif // CLIP_UNIFY_MANIFEST_HPP
