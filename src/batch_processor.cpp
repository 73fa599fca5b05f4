/**
 * @file batch_processor.cpp
 * @brief Two-phase batch workflow implementation
 *
 * @details Implements the BatchProcessor class:
 *
 *          - Scratch directory reset and candidate collection
 *
 *          - Sequential or worker-pool normalization
 *
 *          - Manifest persistence and the merge step
 *
 *          - Final summary output
 */

#include "clip_unify/batch_processor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>

#include "clip_unify/logging.hpp"
#include "clip_unify/system.hpp"
#include "clip_unify/task_queue.hpp"

namespace clip_unify {

namespace fs = std::filesystem;

namespace {

std::string lower_extension(const fs::path &p) {
  std::string ext = p.extension().string();
  if (!ext.empty() && ext.front() == '.')
    ext.erase(0, 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

/// Absolute, symlink-resolved form used to recognize the output file
fs::path resolved(const fs::path &p) {
  std::error_code ec;
  fs::path abs = fs::absolute(p, ec);
  if (ec)
    return p.lexically_normal();
  fs::path canon = fs::weakly_canonical(abs, ec);
  return ec ? abs.lexically_normal() : canon;
}

} // anonymous namespace

// **---- Free helpers ----**

size_t BatchOutcome::succeeded() const {
  return static_cast<size_t>(
      std::count_if(results.begin(), results.end(),
                     [](const NormalizationResult &r) { return r.success; }));
}

int exit_code_for(BatchStatus status) {
  switch (status) {
  case BatchStatus::Merged:
  case BatchStatus::NoInputs:
  case BatchStatus::NothingNormalized:
    return 0;
  case BatchStatus::WorkspaceError:
  case BatchStatus::ConcatFailed:
    return 1;
  }
  return 1;
}

bool reset_scratch_dir(const std::string &dir) {
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) {
    LOG_ERROR("Cannot remove scratch directory {}: {}", dir, ec.message());
    return false;
  }
  fs::create_directories(dir, ec);
  if (ec) {
    LOG_ERROR("Cannot create scratch directory {}: {}", dir, ec.message());
    return false;
  }
  return true;
}

std::vector<std::string> collect_inputs(const RunConfig &cfg) {
  std::vector<std::string> files;
  const fs::path output = resolved(cfg.output_file);

  /// Bucket by extension in one directory pass
  std::vector<std::vector<fs::path>> buckets(cfg.extensions.size());

  std::error_code ec;
  fs::directory_iterator it(cfg.input_dir, ec);
  if (ec) {
    LOG_ERROR("Cannot scan input directory {}: {}", cfg.input_dir,
              ec.message());
    return files;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      LOG_ERROR("Error while scanning {}: {}", cfg.input_dir, ec.message());
      break;
    }
    const fs::directory_entry &entry = *it;
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec))
      continue;

    /// Hidden files are partial downloads or editor leftovers
    const std::string name = entry.path().filename().string();
    if (!name.empty() && name.front() == '.')
      continue;

    std::string ext = lower_extension(entry.path());
    auto pos = std::find(cfg.extensions.begin(), cfg.extensions.end(), ext);
    if (pos == cfg.extensions.end())
      continue;

    if (resolved(entry.path()) == output) {
      LOG_INFO("Skipping previous output: {}",
               entry.path().filename().string());
      continue;
    }

    buckets[static_cast<size_t>(pos - cfg.extensions.begin())].push_back(
        entry.path());
  }

  /// Directory iteration order is filesystem dependent; sort for stability
  for (auto &bucket : buckets) {
    std::sort(bucket.begin(), bucket.end());
    for (const auto &p : bucket)
      files.push_back(p.string());
  }
  return files;
}

// **---- BatchProcessor ----**

BatchProcessor::BatchProcessor(const RunConfig &cfg, FileNormalizer &normalizer,
                               Concatenator &concatenator)
    : cfg_(cfg), normalizer_(normalizer), concatenator_(concatenator) {}

int BatchProcessor::job_count(const EncodingProfile &profile,
                              size_t num_files) const {
  int jobs = cfg_.parallel_jobs > 0 ? cfg_.parallel_jobs : detect_cpu_limit();

  /// Hardware encoders support far fewer sessions than CPU threads
  if (profile.mode == EncodeMode::Hardware)
    jobs = std::min(jobs, cfg_.hw_max_sessions);

  jobs = std::min(jobs, static_cast<int>(std::max<size_t>(num_files, 1)));
  return std::max(1, jobs);
}

BatchOutcome BatchProcessor::run(const EncodingProfile &profile) {
  BatchOutcome outcome;
  auto batch_start = std::chrono::high_resolution_clock::now();

  // **----- PHASE 0: RESET SCRATCH -----**

  if (!reset_scratch_dir(cfg_.scratch_dir)) {
    outcome.status = BatchStatus::WorkspaceError;
    return outcome;
  }

  // **----- PHASE 1: COLLECT -----**

  std::vector<std::string> files = collect_inputs(cfg_);
  if (files.empty()) {
    LOG_WARN("No video files found in {}", cfg_.input_dir);
    outcome.status = BatchStatus::NoInputs;
    return outcome;
  }

  int jobs = job_count(profile, files.size());

  LOG_PHASE("================== NORMALIZING ==================");
  LOG_INFO("Files to process: {}", files.size());
  LOG_INFO("Target canvas: {}x{}", cfg_.canvas.width, cfg_.canvas.height);
  LOG_INFO("Encoder: {}", profile.describe());
  LOG_INFO("Parallel jobs: {}", jobs);
  LOG_PHASE("==================================================");

  // **----- PHASE 2: NORMALIZE -----**

  ConcatManifest manifest;
  outcome.results = (jobs > 1)
                        ? normalize_parallel(files, profile, manifest, jobs)
                        : normalize_sequential(files, profile, manifest);
  outcome.manifest = manifest.entries();

  for (const auto &r : outcome.results) {
    TimingCollector::record(fs::path(r.source_path).filename().string(),
                            r.processing_time_us);
  }

  auto finish = [&]() {
    auto batch_end = std::chrono::high_resolution_clock::now();
    outcome.wall_clock_sec =
        std::chrono::duration<double>(batch_end - batch_start).count();
    print_batch_summary(outcome);
  };

  if (manifest.empty()) {
    LOG_WARN("No clip could be normalized; nothing to merge");
    outcome.status = BatchStatus::NothingNormalized;
    finish();
    return outcome;
  }

  // **----- PHASE 3: WRITE LIST -----**

  outcome.list_path = cfg_.list_path();
  if (!manifest.write(outcome.list_path)) {
    LOG_ERROR("Cannot write concat list {}", outcome.list_path);
    outcome.status = BatchStatus::WorkspaceError;
    finish();
    return outcome;
  }

  // **----- PHASE 4: MERGE -----**

  auto merge_start = std::chrono::high_resolution_clock::now();
  bool merged = concatenator_.concat(outcome.list_path, cfg_.output_file);
  auto merge_end = std::chrono::high_resolution_clock::now();
  TimingCollector::record(
      "concat", std::chrono::duration_cast<std::chrono::microseconds>(
                    merge_end - merge_start)
                    .count());

  outcome.status = merged ? BatchStatus::Merged : BatchStatus::ConcatFailed;
  finish();
  return outcome;
}

std::vector<NormalizationResult>
BatchProcessor::normalize_sequential(const std::vector<std::string> &files,
                                     const EncodingProfile &profile,
                                     ConcatManifest &manifest) {
  std::vector<NormalizationResult> results;
  results.reserve(files.size());

  for (size_t i = 0; i < files.size(); ++i) {
    LOG_INFO("Progress: {}/{}", i + 1, files.size());

    /// Named after the success count so outputs stay contiguous
    std::string output_path =
        (fs::path(cfg_.scratch_dir) / scratch_file_name(manifest.size()))
            .string();

    NormalizationResult result =
        normalizer_.normalize(files[i], output_path, profile);
    if (result.success)
      manifest.add(result.output_path);
    results.push_back(std::move(result));
  }
  return results;
}

std::vector<NormalizationResult>
BatchProcessor::normalize_parallel(const std::vector<std::string> &files,
                                   const EncodingProfile &profile,
                                   ConcatManifest &manifest, int jobs) {
  TaskQueue task_queue;
  ResultCollector collector(files.size());

  for (size_t i = 0; i < files.size(); ++i) {
    task_queue.push(
        {i, files[i],
         (fs::path(cfg_.scratch_dir) / scratch_file_name(i, "pending"))
             .string()});
  }
  task_queue.finish();

  std::vector<std::thread> workers;
  for (int w = 0; w < jobs; ++w) {
    workers.emplace_back([this, w, &task_queue, &collector, &profile]() {
      NormalizeTask task;
      while (task_queue.pop(task)) {
        collector.place(task.index,
                        normalizer_.normalize(task.source_path,
                                              task.output_path, profile, w));
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }

  std::vector<NormalizationResult> results = collector.extract();

  /// Renumber successes in scan order
  for (auto &result : results) {
    if (!result.success)
      continue;

    std::string final_path =
        (fs::path(cfg_.scratch_dir) / scratch_file_name(manifest.size()))
            .string();
    std::error_code ec;
    fs::rename(result.output_path, final_path, ec);
    if (ec) {
      result.success = false;
      result.reason = fmt::format("cannot rename {}: {}", result.output_path,
                                  ec.message());
      LOG_ERROR("{}", result.reason);
      continue;
    }
    result.output_path = final_path;
    manifest.add(final_path);
  }
  return results;
}

void BatchProcessor::print_batch_summary(const BatchOutcome &outcome) const {
  std::lock_guard<std::mutex> lock(log_mutex);

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=================== BATCH SUMMARY ===================\n");
  fmt::print("{:<25} {:>25}\n", "Total files:", outcome.results.size());
  fmt::print("{:<25} {:>25}\n", "Normalized:", outcome.succeeded());
  fmt::print("{:<25} {:>25}\n", "Failed:", outcome.failed());
  fmt::print("{:<25} {:>25}\n", "Wall-clock time:",
             format_time(outcome.wall_clock_sec));
  fmt::print(fg(fmt::color::cyan),
             "=====================================================\n");

  if (outcome.failed() > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &result : outcome.results) {
      if (!result.success) {
        fmt::print(fg(fmt::color::red), "  - {} ({})\n",
                   fs::path(result.source_path).filename().string(),
                   result.reason);
      }
    }
  }

  fmt::print("\nScratch files are kept in '{}'\n", cfg_.scratch_dir);
  std::fflush(stdout);
}

} // namespace clip_unify
