/**
 * @file compat_gate.hpp
 * @brief Fast-path (stream-copy) compatibility gate
 *
 * @details Stream copy is allowed only when:
 *
 *          - the source video codec is h264 or hevc, AND
 *
 *          - the source has no audio, or its audio codec is aac
 *
 *          Everything else takes the full re-encode. The allow-list is
 *          explicit and deliberately small.
 */

#ifndef STILLCAP_COMPAT_GATE_HPP
#define STILLCAP_COMPAT_GATE_HPP

#include <string>

#include "types.hpp"

namespace stillcap {

/// True if the synthesizer reproduces this video codec bit-compatibly
bool is_fast_path_video_codec(const std::string &codec);

/// True if this audio codec concatenates cleanly with a synthesized track
bool is_fast_path_audio_codec(const std::string &codec);

/**
 * @brief Decide whether the source may be stream-copied.
 * @note Pure function; computed once per run.
 */
CompatibilityDecision evaluate_fast_path(const ProbeResult &probe);

} // namespace stillcap

#endif // STILLCAP_COMPAT_GATE_HPP
