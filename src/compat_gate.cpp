/**
 * @file compat_gate.cpp
 * @brief Fast-path compatibility gate implementation
 */

#include "stillcap/compat_gate.hpp"

#include <algorithm>
#include <array>

#include <fmt/core.h>

namespace stillcap {

namespace {

constexpr std::array<const char *, 2> FAST_PATH_VIDEO = {"h264", "hevc"};
constexpr std::array<const char *, 1> FAST_PATH_AUDIO = {"aac"};

template <size_t N>
bool contains(const std::array<const char *, N> &list,
              const std::string &codec) {
  return std::any_of(list.begin(), list.end(),
                     [&codec](const char *c) { return codec == c; });
}

} // anonymous namespace

bool is_fast_path_video_codec(const std::string &codec) {
  return contains(FAST_PATH_VIDEO, codec);
}

bool is_fast_path_audio_codec(const std::string &codec) {
  return contains(FAST_PATH_AUDIO, codec);
}

CompatibilityDecision evaluate_fast_path(const ProbeResult &probe) {
  CompatibilityDecision decision;

  if (!is_fast_path_video_codec(probe.video.codec_name)) {
    decision.reason = fmt::format("video codec '{}' is not stream-copy safe",
                                  probe.video.codec_name);
    return decision;
  }

  if (probe.audio && !is_fast_path_audio_codec(probe.audio->codec_name)) {
    decision.reason = fmt::format("audio codec '{}' is not stream-copy safe",
                                  probe.audio->codec_name);
    return decision;
  }

  decision.fast_path = true;
  decision.reason =
      probe.audio
          ? fmt::format("{} video with {} audio", probe.video.codec_name,
                        probe.audio->codec_name)
          : fmt::format("{} video without audio", probe.video.codec_name);
  return decision;
}

} // namespace stillcap
