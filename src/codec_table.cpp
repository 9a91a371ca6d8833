/**
 * @file codec_table.cpp
 * @brief Source-codec to encoder mapping implementation
 */

#include "stillcap/codec_table.hpp"

#include <cmath>
#include <unordered_map>

#include <fmt/core.h>

#include "stillcap/errors.hpp"

namespace stillcap {

// **---- Profile / Level Mapping ----**

std::string x264_profile(const std::string &probe_profile) {
  static const std::unordered_map<std::string, std::string> table = {
      {"Baseline", "baseline"},
      {"Constrained Baseline", "baseline"},
      {"Main", "main"},
      {"High", "high"},
      {"High 10", "high10"},
      {"High 10 Intra", "high10"},
      {"High 4:2:2", "high422"},
      {"High 4:2:2 Intra", "high422"},
      {"High 4:4:4 Predictive", "high444"},
      {"High 4:4:4 Intra", "high444"},
  };
  auto it = table.find(probe_profile);
  return (it != table.end()) ? it->second : std::string();
}

std::string x264_level(int probe_level) {
  if (probe_level <= 0)
    return {};
  /// Level 1b is signalled as 9
  if (probe_level == 9)
    return "1b";
  return fmt::format("{}.{}", probe_level / 10, probe_level % 10);
}

std::string x265_profile(const std::string &probe_profile) {
  static const std::unordered_map<std::string, std::string> table = {
      {"Main", "main"},
      {"Main 10", "main10"},
      {"Main Still Picture", "mainstillpicture"},
  };
  auto it = table.find(probe_profile);
  return (it != table.end()) ? it->second : std::string();
}

std::string x265_level(int probe_level) {
  if (probe_level <= 0)
    return {};
  /// general_level_idc is 30x the level number
  int tenths = static_cast<int>(std::lround(probe_level / 3.0));
  if (tenths % 10 == 0)
    return std::to_string(tenths / 10);
  return fmt::format("{}.{}", tenths / 10, tenths % 10);
}

std::string prores_profile(const std::string &probe_profile) {
  static const std::unordered_map<std::string, std::string> table = {
      {"Proxy", "proxy"}, {"LT", "lt"},     {"Standard", "standard"},
      {"HQ", "hq"},       {"4444", "4444"}, {"XQ", "4444xq"},
  };
  auto it = table.find(probe_profile);
  return (it != table.end()) ? it->second : std::string();
}

std::string dnxhr_profile(const std::string &probe_profile) {
  static const std::unordered_map<std::string, std::string> table = {
      {"DNXHR LB", "dnxhr_lb"},   {"DNXHR SQ", "dnxhr_sq"},
      {"DNXHR HQ", "dnxhr_hq"},   {"DNXHR HQX", "dnxhr_hqx"},
      {"DNXHR 444", "dnxhr_444"},
  };
  auto it = table.find(probe_profile);
  return (it != table.end()) ? it->second : std::string();
}

// **---- Encoder Selection ----**

VideoEncoderConfig select_video_encoder(const VideoInfo &info) {
  VideoEncoderConfig cfg;
  cfg.codec = info.codec_name;

  if (info.codec_name == "h264") {
    cfg.encoder = "libx264";
    cfg.uses_crf = true;
    cfg.gop = GopControl::X264;
    cfg.profile = x264_profile(info.profile);
    cfg.level = x264_level(info.level);
    return cfg;
  }

  if (info.codec_name == "hevc") {
    cfg.encoder = "libx265";
    cfg.uses_crf = true;
    cfg.gop = GopControl::X265;
    cfg.profile = x265_profile(info.profile);
    cfg.level = x265_level(info.level);
    return cfg;
  }

  if (info.codec_name == "vp9") {
    cfg.encoder = "libvpx-vp9";
    cfg.uses_crf = true;
    cfg.gop = GopControl::Generic;
    /// Constant quality mode needs an unconstrained bitrate
    cfg.extra_args = {"-b:v", "0"};
    return cfg;
  }

  if (info.codec_name == "prores") {
    cfg.encoder = "prores_ks";
    cfg.gop = GopControl::None;
    cfg.profile = prores_profile(info.profile);
    return cfg;
  }

  if (info.codec_name == "dnxhd") {
    cfg.encoder = "dnxhd";
    cfg.gop = GopControl::None;
    cfg.profile = dnxhr_profile(info.profile);
    if (cfg.profile.empty()) {
      throw UnsupportedCodecError(
          info.codec_name,
          fmt::format("DNxHD profile '{}' needs a fixed bitrate table; only "
                      "DNxHR sources can be reproduced",
                      info.profile));
    }
    return cfg;
  }

  throw UnsupportedCodecError(
      info.codec_name,
      fmt::format("No encoder can reproduce source video codec '{}'",
                  info.codec_name));
}

AudioEncoderConfig select_audio_encoder(const AudioInfo &info) {
  static const std::unordered_map<std::string, std::string> table = {
      {"aac", "aac"},
      {"mp3", "libmp3lame"},
      {"opus", "libopus"},
      {"ac3", "ac3"},
  };
  auto it = table.find(info.codec_name);
  if (it == table.end()) {
    throw UnsupportedCodecError(
        info.codec_name,
        fmt::format("No encoder can reproduce source audio codec '{}'",
                    info.codec_name));
  }
  AudioEncoderConfig cfg;
  cfg.codec = info.codec_name;
  cfg.encoder = it->second;
  return cfg;
}

} // namespace stillcap
