/**
 * @file probe.hpp
 * @brief Source metadata extraction through ffprobe
 *
 * @details The MetadataProber issues up to three read-only queries per file:
 *
 *          1. Video stream fields of v:0 (always)
 *
 *          2. Container duration (only when the stream has none)
 *
 *          3. Audio stream fields of a:0 (independent, failure = no audio)
 *
 *          Every query uses the key=value writer and is parsed into typed
 *          fields with explicit fallbacks; see VideoInfo for the invariants.
 */

#ifndef STILLCAP_PROBE_HPP
#define STILLCAP_PROBE_HPP

#include <map>
#include <optional>
#include <string>

#include "config.hpp"
#include "process_runner.hpp"
#include "types.hpp"

namespace stillcap {

/// Parsed "key=value" lines of one ffprobe section
using ProbeFields = std::map<std::string, std::string>;

/**
 * @brief Parse ffprobe default-writer output (noprint_wrappers=1).
 * @note Values reported as "N/A" or "unknown" are dropped, so a missing key
 *       and an unavailable value look the same to callers.
 */
ProbeFields parse_probe_fields(const std::string &text);

/**
 * @brief Parse "N/D" (or a bare "N") into a Rational.
 * @return Rational with den == 0 when the text is not a rational
 */
Rational parse_rational(const std::string &text);

/**
 * @brief Pick the frame rate from avg_frame_rate, then r_frame_rate.
 * @param fields Parsed stream fields
 * @param expr_out Receives the rational text that won, "30" on fallback
 * @return Frame rate within [MIN_FPS, MAX_FPS], DEFAULT_FPS otherwise
 */
double resolve_frame_rate(const ProbeFields &fields, std::string &expr_out);

/**
 * @class MetadataProber
 * @brief Builds VideoInfo/AudioInfo snapshots for one source file.
 */
class MetadataProber {
public:
  MetadataProber(CommandRunner &runner, ToolPaths tools);

  /**
   * @brief Probe video and audio of a file.
   * @throws ProbeError if the file is missing, has no video stream or the
   *         video query returns malformed output
   */
  ProbeResult probe(const std::string &path);

  /**
   * @brief Probe the first video stream only.
   * @throws ProbeError as for probe()
   */
  VideoInfo probe_video(const std::string &path);

  /**
   * @brief Probe the first audio stream.
   * @return std::nullopt when the file has no audio or the query fails
   */
  std::optional<AudioInfo> probe_audio(const std::string &path);

private:
  /// Container duration, 0.0 when unavailable
  double probe_container_duration(const std::string &path);

  CommandRunner &runner_;
  ToolPaths tools_;
};

} // namespace stillcap

#endif // STILLCAP_PROBE_HPP
