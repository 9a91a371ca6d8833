/**
 * @file still_clip.cpp
 * @brief Still clip synthesis implementation
 */

#include "stillcap/still_clip.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "stillcap/codec_table.hpp"
#include "stillcap/container.hpp"
#include "stillcap/errors.hpp"
#include "stillcap/logging.hpp"
#include "stillcap/probe.hpp"

namespace stillcap {

// **---- Parameter Derivation ----**

int compute_frame_count(double fps, double duration) {
  double frames = std::round(fps * duration);
  if (!(frames >= 1.0))
    return 1;
  if (frames >= static_cast<double>(std::numeric_limits<int>::max()))
    return std::numeric_limits<int>::max();
  return static_cast<int>(frames);
}

std::string normalize_sar(const std::string &probe_sar) {
  auto colon = probe_sar.find(':');
  if (colon == std::string::npos)
    return "1";
  Rational r = parse_rational(probe_sar.substr(0, colon) + "/" +
                              probe_sar.substr(colon + 1));
  if (!r.valid() || r.num <= 0 || r.den <= 0 || r.num == r.den)
    return "1";
  return fmt::format("{}/{}", r.num, r.den);
}

std::string resolve_channel_layout(const AudioInfo &audio) {
  if (!audio.channel_layout.empty())
    return audio.channel_layout;
  switch (audio.channels) {
  case 1:
    return "mono";
  case 6:
    return "5.1";
  case 8:
    return "7.1";
  default:
    return "stereo";
  }
}

StillClipSpec make_still_clip_spec(const ProbeResult &probe,
                                   const AppendOptions &options,
                                   const std::string &container_path,
                                   int threads) {
  const VideoInfo &v = probe.video;
  if (v.width <= 0 || v.height <= 0) {
    throw ValidationError(
        fmt::format("Invalid source geometry {}x{}", v.width, v.height));
  }

  StillClipSpec spec;
  spec.width = v.width;
  spec.height = v.height;
  spec.fps = v.fps;
  spec.fps_expr = v.fps_expr;
  spec.frame_count = compute_frame_count(v.fps, options.still_duration);
  spec.duration = spec.frame_count / v.fps;
  spec.pix_fmt = v.pix_fmt.empty() ? "yuv420p" : v.pix_fmt;
  spec.sample_aspect_ratio = normalize_sar(v.sample_aspect_ratio);
  spec.video = select_video_encoder(v);
  spec.crf = options.crf;
  spec.preset = options.preset;
  spec.color_primaries = v.color_primaries;
  spec.color_transfer = v.color_transfer;
  spec.color_space = v.color_space;
  spec.color_range = v.color_range;
  spec.threads = threads;

  const bool isobmff = is_isobmff_container(container_path);
  if (isobmff && v.time_base.num == 1 && v.time_base.den > 0)
    spec.timescale = v.time_base.den;
  if (isobmff && v.codec_name == "hevc" && v.codec_tag == "hvc1")
    spec.codec_tag = "hvc1";

  if (probe.audio) {
    AudioTarget target;
    target.encoder = select_audio_encoder(*probe.audio);
    target.sample_rate =
        (probe.audio->sample_rate > 0) ? probe.audio->sample_rate : 48000;
    target.channel_layout = resolve_channel_layout(*probe.audio);
    target.bitrate = options.audio_bitrate;
    spec.audio = std::move(target);
  }

  return spec;
}

// **---- Command Construction ----**

std::vector<std::string> build_still_clip_command(const std::string &ffmpeg,
                                                  const std::string &image,
                                                  const StillClipSpec &spec,
                                                  const std::string &out_path) {
  const std::string frames = std::to_string(spec.frame_count);

  std::vector<std::string> cmd = {ffmpeg,     "-hide_banner", "-nostdin",
                                  "-loglevel", "error",       "-y",
                                  "-loop",     "1",           "-framerate",
                                  spec.fps_expr, "-i",        image};

  if (spec.audio) {
    cmd.insert(cmd.end(),
               {"-f", "lavfi", "-t", fmt::format("{:.6f}", spec.duration),
                "-i",
                fmt::format("anullsrc=r={}:cl={}", spec.audio->sample_rate,
                            spec.audio->channel_layout)});
  }

  cmd.insert(cmd.end(), {"-map", "0:v:0"});
  if (spec.audio)
    cmd.insert(cmd.end(), {"-map", "1:a:0"});

  std::string filters =
      fmt::format("scale={}:{}:flags=lanczos,setsar={}", spec.width,
                  spec.height, spec.sample_aspect_ratio);
  if (!spec.pix_fmt.empty())
    filters += fmt::format(",format={}", spec.pix_fmt);
  cmd.insert(cmd.end(), {"-vf", filters, "-frames:v", frames});

  // **---- Video encoder ----**

  const VideoEncoderConfig &enc = spec.video;
  cmd.insert(cmd.end(), {"-c:v", enc.encoder});
  if (enc.uses_crf)
    cmd.insert(cmd.end(), {"-crf", std::to_string(spec.crf)});
  if ((enc.gop == GopControl::X264 || enc.gop == GopControl::X265) &&
      !spec.preset.empty())
    cmd.insert(cmd.end(), {"-preset", spec.preset});
  if (!enc.profile.empty())
    cmd.insert(cmd.end(), {"-profile:v", enc.profile});

  switch (enc.gop) {
  case GopControl::X264:
    if (!enc.level.empty())
      cmd.insert(cmd.end(), {"-level", enc.level});
    cmd.insert(cmd.end(), {"-g", frames, "-keyint_min", frames,
                           "-sc_threshold", "0"});
    break;
  case GopControl::X265: {
    // The concat demuxer keeps the source's hvcC, so the still's VPS/SPS/PPS
    // must travel in-band with its keyframe.
    std::string params = fmt::format(
        "keyint={0}:min-keyint={0}:scenecut=0:repeat-headers=1:log-level=error",
        frames);
    if (!enc.level.empty())
      params += fmt::format(":level-idc={}", enc.level);
    cmd.insert(cmd.end(), {"-x265-params", params});
    break;
  }
  case GopControl::Generic:
    cmd.insert(cmd.end(), {"-g", frames, "-keyint_min", frames});
    break;
  case GopControl::None:
    break;
  }

  cmd.insert(cmd.end(), enc.extra_args.begin(), enc.extra_args.end());

  if (!spec.pix_fmt.empty())
    cmd.insert(cmd.end(), {"-pix_fmt", spec.pix_fmt});

  // **---- Colorimetry and muxing ----**

  if (!spec.color_primaries.empty())
    cmd.insert(cmd.end(), {"-color_primaries", spec.color_primaries});
  if (!spec.color_transfer.empty())
    cmd.insert(cmd.end(), {"-color_trc", spec.color_transfer});
  if (!spec.color_space.empty())
    cmd.insert(cmd.end(), {"-colorspace", spec.color_space});
  if (!spec.color_range.empty())
    cmd.insert(cmd.end(), {"-color_range", spec.color_range});
  if (spec.timescale > 0)
    cmd.insert(cmd.end(),
               {"-video_track_timescale", std::to_string(spec.timescale)});
  if (!spec.codec_tag.empty())
    cmd.insert(cmd.end(), {"-tag:v", spec.codec_tag});

  // **---- Audio encoder ----**

  if (spec.audio) {
    cmd.insert(cmd.end(), {"-c:a", spec.audio->encoder.encoder});
    if (!spec.audio->bitrate.empty())
      cmd.insert(cmd.end(), {"-b:a", spec.audio->bitrate});
    cmd.insert(cmd.end(), {"-ar", std::to_string(spec.audio->sample_rate)});
  }

  if (spec.threads > 0)
    cmd.insert(cmd.end(), {"-threads", std::to_string(spec.threads)});

  cmd.push_back(out_path);
  return cmd;
}

// **---- StillClipSynthesizer ----**

StillClipSynthesizer::StillClipSynthesizer(CommandRunner &runner,
                                           ToolPaths tools)
    : runner_(runner), tools_(std::move(tools)) {}

void StillClipSynthesizer::synthesize(const std::string &image,
                                      const StillClipSpec &spec,
                                      const std::string &out_path) {
  if (!std::filesystem::exists(image))
    throw ValidationError(fmt::format("Thumbnail image not found: {}", image));

  LOG_INFO("Still: {}x{} @ {} fps, {} frames ({:.3f}s) via {}", spec.width,
           spec.height, spec.fps_expr, spec.frame_count, spec.duration,
           spec.video.encoder);

  run_checked(runner_,
              build_still_clip_command(tools_.ffmpeg, image, spec, out_path));

  std::error_code ec;
  auto size = std::filesystem::file_size(out_path, ec);
  if (ec || size == 0) {
    throw ValidationError(
        fmt::format("Still clip was not produced: {}", out_path));
  }
}

} // namespace stillcap
