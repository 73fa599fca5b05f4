/**
 * @file system.hpp
 * @brief System utilities: CPU limit detection and time formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection, used to size the
 *            normalization worker pool when PARALLEL_JOBS=0
 *
 *          - Time formatting for the run summary
 */

#ifndef CLIP_UNIFY_SYSTEM_HPP
#define CLIP_UNIFY_SYSTEM_HPP

#include <string>

namespace clip_unify {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the cgroup limit. This function reads
 *       cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace clip_unify

#endif // CLIP_UNIFY_SYSTEM_HPP
