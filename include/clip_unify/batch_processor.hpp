/**
 * @file batch_processor.hpp
 * @brief Two-phase batch workflow: normalize every clip, then merge
 *
 * @details The BatchProcessor drives one run:
 *
 *          1. Remove and recreate the scratch directory
 *
 *          2. Collect candidate clips (extension order, then name order),
 *             skipping the final output file itself
 *
 *          3. Normalize each clip into processed_NNNN.mp4, numbered by the
 *             count of successes so far
 *
 *          4. Write the concat list (successful clips, scan order)
 *
 *          5. Merge with the Concatenator
 *
 * @note Per-file failures never abort the batch. Only a workspace error or
 *       a failed merge is fatal.
 *
 * @attention PARALLEL MODE (PARALLEL_JOBS > 1):
 *
 *   - Workers pull clips from a TaskQueue and write pending_NNNN.mp4
 *     keyed by scan index
 *
 *   - After every worker joins, successes are renamed to contiguous
 *     processed_NNNN.mp4 in scan order, so the manifest never depends on
 *     completion order
 *
 *   - Hardware mode caps the pool at HW_MAX_SESSIONS
 */

#ifndef CLIP_UNIFY_BATCH_PROCESSOR_HPP
#define CLIP_UNIFY_BATCH_PROCESSOR_HPP

#include <string>
#include <vector>

#include "concatenator.hpp"
#include "config.hpp"
#include "encoder_profile.hpp"
#include "manifest.hpp"
#include "normalizer.hpp"
#include "types.hpp"

namespace clip_unify {

/**
 * @brief Terminal state of a batch run.
 */
enum class BatchStatus {
  Merged,            //< Merged artifact written
  NoInputs,          //< No matching clips found
  NothingNormalized, //< Clips found but none normalized
  WorkspaceError,    //< Scratch directory or list file could not be written
  ConcatFailed       //< Merge step failed
};

/**
 * @struct BatchOutcome
 * @brief Everything a caller needs to report on a run.
 */
struct BatchOutcome {
  BatchStatus status = BatchStatus::NoInputs;
  std::vector<NormalizationResult> results; //< One per candidate, scan order
  std::vector<std::string> manifest;        //< Concat list lines
  std::string list_path;                    //< Written concat list (if any)
  double wall_clock_sec = 0;

  size_t succeeded() const;
  size_t failed() const { return results.size() - succeeded(); }
};

/**
 * @brief Process exit code for a batch status.
 * @return 0 for reported outcomes, 1 for fatal ones
 */
int exit_code_for(BatchStatus status);

/**
 * @brief Remove and recreate a directory.
 * @return true if the directory exists and is empty afterwards
 */
bool reset_scratch_dir(const std::string &dir);

/**
 * @brief Collect candidate clips from cfg.input_dir.
 *
 * @note Order: cfg.extensions order, then file name within an extension.
 *       Extension matching ignores case. Files resolving to the same
 *       absolute path as cfg.output_file are excluded.
 */
std::vector<std::string> collect_inputs(const RunConfig &cfg);

/**
 * @class BatchProcessor
 * @brief Drives normalization over all clips, then the merge.
 */
class BatchProcessor {
public:
  /**
   * @brief Construct a batch processor.
   * @note Holds references; all arguments must outlive the processor.
   */
  BatchProcessor(const RunConfig &cfg, FileNormalizer &normalizer,
                 Concatenator &concatenator);

  /**
   * @brief Run the full workflow with the given profile.
   */
  BatchOutcome run(const EncodingProfile &profile);

  /**
   * @brief Number of concurrent normalizations for this profile.
   * @param num_files Candidate count (the pool never exceeds it)
   */
  int job_count(const EncodingProfile &profile, size_t num_files) const;

private:
  const RunConfig &cfg_;
  FileNormalizer &normalizer_;
  Concatenator &concatenator_;

  /// Sequential path: numbering follows successes as they happen
  std::vector<NormalizationResult>
  normalize_sequential(const std::vector<std::string> &files,
                       const EncodingProfile &profile,
                       ConcatManifest &manifest);

  /// Worker pool path: numbering assigned after all workers join
  std::vector<NormalizationResult>
  normalize_parallel(const std::vector<std::string> &files,
                     const EncodingProfile &profile, ConcatManifest &manifest,
                     int jobs);

  /**
   * @brief Print final batch summary.
   */
  void print_batch_summary(const BatchOutcome &outcome) const;
};

} // namespace clip_unify

#endif // CLIP_UNIFY_BATCH_PROCESSOR_HPP
