/**
 * @file verify.hpp
 * @brief Read-back check of a staged output with libavformat
 *
 * @details The staged file is opened in-process (no extra tool call) and
 *          compared against what the append should have produced: source
 *          geometry, and source duration plus the still, within one frame
 *          interval and a configurable slack.
 */

#ifndef STILLCAP_VERIFY_HPP
#define STILLCAP_VERIFY_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace stillcap {

/**
 * @struct MediaSummary
 * @brief What the verifier reads back from a container.
 */
struct MediaSummary {
  int width = 0;
  int height = 0;
  double duration = 0.0; //< Container duration, 0 when unknown
};

/**
 * @brief Open a media file with libavformat and summarize its video stream.
 * @return std::nullopt if the file cannot be opened or has no video stream
 */
std::optional<MediaSummary> read_media_summary(const std::string &path);

/**
 * @brief Compare a summary against the expected append result.
 * @param source Probe of the source video (geometry and frame rate)
 * @param source_duration Container duration of the source, the longest track
 * @param still_duration Frame-aligned still length
 * @param slack Seconds tolerated beyond one frame interval
 * @return Empty string when consistent, otherwise the mismatch
 */
std::string check_output_summary(const MediaSummary &summary,
                                 const VideoInfo &source,
                                 double source_duration,
                                 double still_duration, double slack);

/**
 * @brief Verify a staged output against the source it was built from.
 * @note The source is read back with libavformat so both sides are measured
 *       as container durations. The probed video duration is used when the
 *       source cannot be opened; the duration check is skipped when neither
 *       is known.
 * @throws ValidationError on any mismatch or if the output is unreadable
 */
void verify_output(const std::string &path, const std::string &source_path,
                   const VideoInfo &source, double still_duration,
                   double slack);

/**
 * @brief "libavformat X.Y.Z, libavcodec ..., libavutil ..." for --info.
 */
std::string libav_versions();

} // namespace stillcap

#endif // STILLCAP_VERIFY_HPP
