/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Encoder thread count resolution
 *
 *          - PATH lookup for the external tools
 *
 *          - Time formatting utilities
 */

#include "stillcap/system.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <string>
#include <thread>

#include <unistd.h>

#include <fmt/core.h>

namespace stillcap {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.fail() ? -1 : val;
}

/// Parse a non-negative decimal, -1 on anything else
int parse_cpu_id(const std::string &text) {
  if (text.empty() || text.size() > 6)
    return -1;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return -1;
  }
  return std::atoi(text.c_str());
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

} // anonymous namespace

std::vector<int> parse_cpuset_string(const std::string &line) {
  std::vector<int> cpus;
  std::string text = line;
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    text.pop_back();
  if (text.empty())
    return cpus;

  size_t pos = 0;
  while (pos <= text.size()) {
    size_t end = text.find(',', pos);
    if (end == std::string::npos)
      end = text.size();
    std::string item = text.substr(pos, end - pos);

    size_t dash = item.find('-');
    if (dash == std::string::npos) {
      /// Single CPU
      int cpu = parse_cpu_id(item);
      if (cpu < 0)
        return {};
      cpus.push_back(cpu);
    } else {
      /// Range like "0-3"
      int first = parse_cpu_id(item.substr(0, dash));
      int last = parse_cpu_id(item.substr(dash + 1));
      if (first < 0 || last < first)
        return {};
      for (int cpu = first; cpu <= last; ++cpu)
        cpus.push_back(cpu);
    }

    if (end == text.size())
      break;
    pos = end + 1;
  }
  return cpus;
}

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        long quota = std::strtol(quota_str.c_str(), nullptr, 10);
        long period = std::strtol(period_str.c_str(), nullptr, 10);
        if (quota > 0 && period > 0) {
          limit = static_cast<int>((quota + period - 1) / period);
        }
      }
    }
  }

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

int resolve_thread_count(int configured) {
  if (configured > 0)
    return configured;
  return detect_cpu_limit();
}

// **---- Tool Lookup ----**

std::optional<std::string> find_executable(const std::string &name) {
  if (name.empty())
    return std::nullopt;

  if (name.find('/') != std::string::npos) {
    if (::access(name.c_str(), X_OK) == 0)
      return name;
    return std::nullopt;
  }

  const char *path_env = std::getenv("PATH");
  std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

  size_t pos = 0;
  while (pos <= path.size()) {
    size_t end = path.find(':', pos);
    if (end == std::string::npos)
      end = path.size();
    std::string dir = path.substr(pos, end - pos);
    if (dir.empty())
      dir = ".";
    std::string candidate = dir + "/" + name;
    if (::access(candidate.c_str(), X_OK) == 0)
      return candidate;
    pos = end + 1;
  }
  return std::nullopt;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  if (seconds < 0)
    seconds = 0;
  long total_ms = std::lround(seconds * 1000.0);
  long h = total_ms / 3600000;
  long m = (total_ms % 3600000) / 60000;
  long s = (total_ms % 60000) / 1000;
  long ms = total_ms % 1000;
  return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", h, m, s, ms);
}

} // namespace stillcap
