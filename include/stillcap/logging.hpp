/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - TimingCollector holding the phase timings of one append run
 *
 * @note Every line carries the "[stillcap]" tool prefix. Informational output
 *       goes to stdout, warnings and errors go to stderr so that a failing
 *       run always ends with exactly one diagnostic line on stderr.
 */

#ifndef STILLCAP_LOGGING_HPP
#define STILLCAP_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace stillcap {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(stillcap::log_mutex);                     \
    fmt::print("[stillcap] " format_str "\n", ##__VA_ARGS__);                  \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(stillcap::log_mutex);                     \
    fmt::print(stderr, fg(fmt::color::yellow),                                 \
               "[stillcap] WARN: " format_str "\n", ##__VA_ARGS__);            \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(stillcap::log_mutex);                     \
    fmt::print(stderr, fg(fmt::color::red),                                    \
               "[stillcap] ERROR: " format_str "\n", ##__VA_ARGS__);           \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(stillcap::log_mutex);                     \
    fmt::print(fg(fmt::color::cyan), "[stillcap] " format_str "\n",            \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(stillcap::log_mutex);                     \
    fmt::print(fg(fmt::color::green), "[stillcap] " format_str "\n",           \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: One timed phase of an append run.
 */
struct TimingEntry {
  std::string name;  //< Phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Phase timings of a single append run, kept in the order recorded.
 * @note The phase named "total" is the whole run; shares are relative to it.
 */
class TimingCollector {
public:
  void record(const std::string &name, long us);

  std::vector<TimingEntry> entries() const;

  /**
   * @brief Duration of the "total" phase, or the sum of all phases if the
   *        run did not record one.
   */
  long total_microseconds() const;

  /**
   * @brief Print the phases with their share of the run.
   * @param path_taken "stream copy" or "re-encode"
   */
  void print_summary(const std::string &path_taken) const;

private:
  mutable std::mutex mutex_;
  std::vector<TimingEntry> entries_;
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(collector, name)                                             \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    (collector).record(#name, static_cast<long>(timer_duration_##name));       \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(collector, name) ((void)0)
#endif

} // namespace stillcap

#endif // STILLCAP_LOGGING_HPP
