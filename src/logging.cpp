/**
 * @file logging.cpp
 * @brief Log mutex and per-run phase timings
 */

#include "stillcap/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace stillcap {

std::mutex log_mutex;

// **---- TimingCollector ----**

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back({name, us});
}

std::vector<TimingEntry> TimingCollector::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

long TimingCollector::total_microseconds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  long sum = 0;
  for (const auto &e : entries_) {
    if (e.name == "total")
      return e.microseconds;
    sum += e.microseconds;
  }
  return sum;
}

void TimingCollector::print_summary(const std::string &path_taken) const {
  const long total = total_microseconds();
  const std::vector<TimingEntry> phases = entries();
  if (phases.empty())
    return;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan), "============ PHASE TIMINGS ({}) ============\n",
             path_taken);
  fmt::print("{:<12} {:>12} {:>8}\n", "Phase", "Seconds", "Share");
  fmt::print("{:-<12} {:-<12} {:-<8}\n", "", "", "");

  for (const auto &e : phases) {
    if (e.name == "total")
      continue;
    double share = (total > 0) ? 100.0 * e.microseconds / total : 0.0;
    fmt::print("{:<12} {:>12.3f} {:>7.1f}%\n", e.name,
               e.microseconds / 1000000.0, share);
  }
  fmt::print("{:<12} {:>12.3f}\n", "total", total / 1000000.0);
  std::fflush(stdout);
}

} // namespace stillcap
