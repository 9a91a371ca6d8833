/**
 * @file system.hpp
 * @brief System utilities, CPU detection and tool lookup
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

#ifndef STILLCAP_SYSTEM_HPP
#define STILLCAP_SYSTEM_HPP

#include <optional>
#include <string>
#include <vector>

namespace stillcap {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
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

/**
 * @brief Parse a cpuset list such as "0-3,8,10-11".
 * @return CPU ids, empty on malformed input
 */
std::vector<int> parse_cpuset_string(const std::string &line);

/**
 * @brief Encoder thread count for one invocation.
 * @param configured STILLCAP_THREADS / --threads value, 0 = auto-detect
 * @return configured when positive, otherwise detect_cpu_limit()
 */
int resolve_thread_count(int configured);

// **---- Tool Lookup ----**

/**
 * @brief Resolve a tool name against PATH.
 * @note Names containing '/' are checked as given.
 * @return Absolute path of an executable file, or std::nullopt
 */
std::optional<std::string> find_executable(const std::string &name);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS.mmm string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS.mmm format
 */
std::string format_time(double seconds);

} // namespace stillcap

#endif // STILLCAP_SYSTEM_HPP
