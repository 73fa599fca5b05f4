/**
 * @file system.cpp
 * @brief System utilities implementation
 */

#include "clip_unify/system.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>

namespace clip_unify {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Helper to parse cpuset string like "0,2,4,6,8" or "0-3" into CPU list
std::vector<int> parse_cpuset_string(const std::string &line) {
  std::vector<int> cpus;
  size_t pos = 0;
  try {
    while (pos < line.size()) {
      size_t end = line.find_first_of(",-", pos);
      if (end == std::string::npos)
        end = line.size();

      int start_cpu = std::stoi(line.substr(pos, end - pos));

      if (end < line.size() && line[end] == '-') {
        /// Range like "0-3"
        pos = end + 1;
        end = line.find(',', pos);
        if (end == std::string::npos)
          end = line.size();
        int end_cpu = std::stoi(line.substr(pos, end - pos));
        for (int cpu = start_cpu; cpu <= end_cpu; ++cpu) {
          cpus.push_back(cpu);
        }
      } else {
        cpus.push_back(start_cpu);
      }

      pos = (end < line.size()) ? end + 1 : line.size();
    }
  } catch (const std::exception &) {
    /// Malformed cgroup file: treat as unavailable
    cpus.clear();
  }
  return cpus;
}

/// Helper to count CPUs from cpuset string
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  auto cpus = parse_cpuset_string(line);
  return cpus.empty() ? -1 : static_cast<int>(cpus.size());
}

/// Cgroup v2 cpu.max: "<quota> <period>" or "max <period>"
int read_cpu_max(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string quota_str, period_str;
  f >> quota_str >> period_str;
  if (quota_str == "max" || period_str.empty())
    return -1;
  try {
    long quota = std::stol(quota_str);
    long period = std::stol(period_str);
    if (quota > 0 && period > 0)
      return static_cast<int>((quota + period - 1) / period);
  } catch (const std::exception &) {
  }
  return -1;
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  /// Try cgroup v2 first (unified hierarchy)
  int limit = read_cpu_max("/sys/fs/cgroup/cpu.max");

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace clip_unify
