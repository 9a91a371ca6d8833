/**
 * @file still_clip.hpp
 * @brief Still clip synthesis matched to a source video
 *
 * @details The still clip is the only thing the fast path encodes. It must be
 *          indistinguishable from the source at the stream-parameter level:
 *
 *          - same geometry, sample aspect ratio and pixel format
 *
 *          - same codec family, profile and level
 *
 *          - same color tags
 *
 *          - same track timescale when the source time base is 1/N
 *
 *          - a single closed GOP spanning the whole clip
 *
 *          - silent audio with the source codec, rate and layout when the
 *            source has audio
 */

#ifndef STILLCAP_STILL_CLIP_HPP
#define STILLCAP_STILL_CLIP_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "process_runner.hpp"
#include "types.hpp"

namespace stillcap {

/**
 * @brief Number of frames a still of the requested length occupies.
 * @return round(fps * duration), clamped to [1, INT_MAX]
 */
int compute_frame_count(double fps, double duration);

/**
 * @brief Normalize ffprobe "N:D" sample aspect ratio to a setsar argument.
 * @return "1" for square, missing or malformed values, "N/D" otherwise
 */
std::string normalize_sar(const std::string &probe_sar);

/**
 * @brief Channel layout for anullsrc, from the layout name or channel count.
 */
std::string resolve_channel_layout(const AudioInfo &audio);

/**
 * @brief Derive the still clip parameters from a probe.
 * @param probe Source probe
 * @param options Run options (duration, quality, preset, audio bitrate)
 * @param container_path Path whose extension names the clip's container
 * @param threads Encoder threads, 0 leaves the encoder default
 * @throws UnsupportedCodecError if the source codecs cannot be reproduced
 */
StillClipSpec make_still_clip_spec(const ProbeResult &probe,
                                   const AppendOptions &options,
                                   const std::string &container_path,
                                   int threads);

/**
 * @brief ffmpeg argv that renders the still clip.
 */
std::vector<std::string> build_still_clip_command(const std::string &ffmpeg,
                                                  const std::string &image,
                                                  const StillClipSpec &spec,
                                                  const std::string &out_path);

/**
 * @class StillClipSynthesizer
 * @brief Runs the still clip encode.
 */
class StillClipSynthesizer {
public:
  StillClipSynthesizer(CommandRunner &runner, ToolPaths tools);

  /**
   * @brief Encode the still clip into out_path.
   * @throws ValidationError if the image is missing or nothing was written
   * @throws ToolExecutionError if ffmpeg fails
   */
  void synthesize(const std::string &image, const StillClipSpec &spec,
                  const std::string &out_path);

private:
  CommandRunner &runner_;
  ToolPaths tools_;
};

} // namespace stillcap

#endif // STILLCAP_STILL_CLIP_HPP
