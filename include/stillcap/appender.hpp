/**
 * @file appender.hpp
 * @brief Append orchestration: probe, gate, concat or re-encode, commit
 *
 * @details The ThumbnailAppender runs one append strictly in order:
 *
 *          1. Validate parameters and container extensions
 *
 *          2. Probe the source
 *
 *          3. Evaluate the compatibility gate (once)
 *
 *          4. Stage the output next to the destination
 *
 *          5. Fast path: synthesize the still, stream-copy concat
 *             Fallback: one filter-graph re-encode
 *
 *          6. Verify the staged file
 *
 *          7. Rename it over the destination
 *
 * @note Any failure before step 7 discards the staged file and the work
 *       directory; the destination is never opened for writing.
 */

#ifndef STILLCAP_APPENDER_HPP
#define STILLCAP_APPENDER_HPP

#include <string>

#include "config.hpp"
#include "process_runner.hpp"
#include "types.hpp"

namespace stillcap {

/**
 * @struct AppendRequest
 * @brief One (video, image) pair and where the result goes.
 */
struct AppendRequest {
  std::string video;     //< Source video
  std::string image;     //< Still image
  std::string output;    //< Destination, ignored when in_place
  bool in_place = false; //< Replace the source itself
};

/**
 * @struct AppendReport
 * @brief Outcome of a successful append.
 */
struct AppendReport {
  AppendPath path = AppendPath::FastCopy;
  std::string output;             //< Final destination
  double source_duration = 0.0;   //< Probed, 0 when unknown
  double still_duration = 0.0;    //< Frame-aligned still length
  double expected_duration = 0.0; //< source + still
  std::string reason;             //< Why this path was taken
};

/// "stream copy" / "re-encode"
const char *append_path_name(AppendPath path);

/// Print the path taken and the durations as a table
void print_append_summary(const AppendReport &report);

/**
 * @class ThumbnailAppender
 * @brief Orchestrates one append invocation.
 */
class ThumbnailAppender {
public:
  ThumbnailAppender(AppendOptions options, CommandRunner &runner);

  /**
   * @brief Append the still and atomically publish the result.
   * @throws ValidationError, ProbeError, UnsupportedCodecError,
   *         ToolExecutionError, CancelledError
   */
  AppendReport run(const AppendRequest &req);

private:
  /// Parameter and extension checks, before any tool runs
  void validate(const AppendRequest &req, const std::string &dest) const;

  /// Apply the path policy to the gate decision
  AppendPath choose_path(const ProbeResult &probe,
                         const CompatibilityDecision &decision) const;

  AppendOptions options_;
  CommandRunner &runner_;
};

} // namespace stillcap

#endif // STILLCAP_APPENDER_HPP
