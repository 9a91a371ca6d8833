/**
 * @file probe.cpp
 * @brief ffprobe-based metadata prober implementation
 *
 * @details Duration resolution order:
 *
 *          1. Stream duration
 *
 *          2. Container duration (separate query)
 *
 *          3. nb_frames / fps
 *
 *          4. 0.0
 */

#include "stillcap/probe.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "stillcap/errors.hpp"
#include "stillcap/logging.hpp"

namespace stillcap {

// **---- Internal Helpers ----**

namespace {

/// Stream fields requested for v:0
constexpr const char *VIDEO_ENTRIES =
    "stream=codec_name,codec_tag_string,profile,level,width,height,pix_fmt,"
    "sample_aspect_ratio,avg_frame_rate,r_frame_rate,time_base,duration,"
    "nb_frames,color_range,color_space,color_transfer,color_primaries";

/// Stream fields requested for a:0
constexpr const char *AUDIO_ENTRIES =
    "stream=codec_name,sample_rate,channels,channel_layout";

/// Strict integer parse: whole string must be consumed
bool parse_int64(const std::string &text, int64_t &out) {
  if (text.empty())
    return false;
  errno = 0;
  char *end = nullptr;
  long long v = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0')
    return false;
  out = static_cast<int64_t>(v);
  return true;
}

/// Strict floating point parse: whole string must be consumed
bool parse_double(const std::string &text, double &out) {
  if (text.empty())
    return false;
  errno = 0;
  char *end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (errno != 0 || end == text.c_str() || *end != '\0')
    return false;
  out = v;
  return true;
}

std::string field_or_empty(const ProbeFields &fields, const char *key) {
  auto it = fields.find(key);
  return (it != fields.end()) ? it->second : std::string();
}

/// Positive dimension or ProbeError
int require_dimension(const ProbeFields &fields, const char *key,
                      const std::string &path) {
  int64_t value = 0;
  std::string raw = field_or_empty(fields, key);
  if (!parse_int64(raw, value) || value <= 0 || value > 65535) {
    throw ProbeError(fmt::format("Malformed {} '{}' reported for {}", key, raw,
                                 path));
  }
  return static_cast<int>(value);
}

std::vector<std::string> ffprobe_base(const std::string &binary) {
  return {binary, "-v", "error"};
}

} // anonymous namespace

// **---- Parsing ----**

ProbeFields parse_probe_fields(const std::string &text) {
  ProbeFields fields;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0)
      continue;
    std::string key = line.substr(0, eq);
    std::string value = line.substr(eq + 1);
    if (value.empty() || value == "N/A" || value == "unknown")
      continue;
    /// First occurrence wins (only one stream is selected per query)
    fields.emplace(std::move(key), std::move(value));
  }
  return fields;
}

Rational parse_rational(const std::string &text) {
  Rational r;
  auto slash = text.find('/');
  if (slash == std::string::npos) {
    int64_t whole = 0;
    if (parse_int64(text, whole)) {
      r.num = whole;
      r.den = 1;
    }
    return r;
  }
  int64_t num = 0;
  int64_t den = 0;
  if (!parse_int64(text.substr(0, slash), num) ||
      !parse_int64(text.substr(slash + 1), den)) {
    return r;
  }
  r.num = num;
  r.den = den; /// den == 0 stays unparsable
  return r;
}

double resolve_frame_rate(const ProbeFields &fields, std::string &expr_out) {
  for (const char *key : {"avg_frame_rate", "r_frame_rate"}) {
    std::string text = field_or_empty(fields, key);
    Rational r = parse_rational(text);
    if (!r.valid())
      continue;
    double fps = r.to_double();
    if (fps >= MIN_FPS && fps <= MAX_FPS) {
      expr_out = (r.den == 1) ? std::to_string(r.num)
                              : fmt::format("{}/{}", r.num, r.den);
      return fps;
    }
  }
  expr_out = "30";
  return DEFAULT_FPS;
}

// **---- MetadataProber ----**

MetadataProber::MetadataProber(CommandRunner &runner, ToolPaths tools)
    : runner_(runner), tools_(std::move(tools)) {}

ProbeResult MetadataProber::probe(const std::string &path) {
  ProbeResult result;
  result.video = probe_video(path);
  result.audio = probe_audio(path);
  result.video.has_audio = result.audio.has_value();
  return result;
}

VideoInfo MetadataProber::probe_video(const std::string &path) {
  if (!std::filesystem::exists(path))
    throw ProbeError(fmt::format("Input video not found: {}", path));

  auto cmd = ffprobe_base(tools_.ffprobe);
  cmd.insert(cmd.end(), {"-select_streams", "v:0", "-show_entries",
                         VIDEO_ENTRIES, "-of", "default=noprint_wrappers=1",
                         path});
  CommandResult res = runner_.run(cmd);
  if (res.exit_code != 0) {
    throw ProbeError(fmt::format("ffprobe could not read {} (exit {}): {}",
                                 path, res.exit_code, res.err));
  }

  ProbeFields fields = parse_probe_fields(res.out);
  if (fields.empty())
    throw ProbeError(fmt::format("No video stream found in {}", path));

  VideoInfo info;
  info.width = require_dimension(fields, "width", path);
  info.height = require_dimension(fields, "height", path);
  info.fps = resolve_frame_rate(fields, info.fps_expr);

  info.codec_name = field_or_empty(fields, "codec_name");
  if (info.codec_name.empty())
    throw ProbeError(fmt::format("No codec reported for video of {}", path));

  info.codec_tag = field_or_empty(fields, "codec_tag_string");
  info.profile = field_or_empty(fields, "profile");
  int64_t level = 0;
  if (parse_int64(field_or_empty(fields, "level"), level) && level > 0)
    info.level = static_cast<int>(level);
  info.pix_fmt = field_or_empty(fields, "pix_fmt");
  info.sample_aspect_ratio = field_or_empty(fields, "sample_aspect_ratio");
  info.color_range = field_or_empty(fields, "color_range");
  info.color_space = field_or_empty(fields, "color_space");
  info.color_transfer = field_or_empty(fields, "color_transfer");
  info.color_primaries = field_or_empty(fields, "color_primaries");
  info.time_base = parse_rational(field_or_empty(fields, "time_base"));

  int64_t frames = 0;
  if (parse_int64(field_or_empty(fields, "nb_frames"), frames) && frames > 0)
    info.frame_count = frames;

  double duration = 0.0;
  if (!parse_double(field_or_empty(fields, "duration"), duration) ||
      duration <= 0.0) {
    duration = probe_container_duration(path);
  }
  if (duration <= 0.0 && info.frame_count > 0)
    duration = static_cast<double>(info.frame_count) / info.fps;
  info.duration = (duration > 0.0) ? duration : 0.0;

  return info;
}

double MetadataProber::probe_container_duration(const std::string &path) {
  auto cmd = ffprobe_base(tools_.ffprobe);
  cmd.insert(cmd.end(), {"-show_entries", "format=duration", "-of",
                         "default=noprint_wrappers=1:nokey=1", path});
  CommandResult res;
  try {
    res = runner_.run(cmd);
  } catch (const ToolExecutionError &e) {
    LOG_WARN("Container duration unavailable for {}: {}", path, e.what());
    return 0.0;
  }
  if (res.exit_code != 0) {
    LOG_WARN("Container duration unavailable for {}", path);
    return 0.0;
  }

  std::string text = res.out;
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r' ||
                           text.back() == ' '))
    text.pop_back();

  double duration = 0.0;
  if (!parse_double(text, duration) || duration <= 0.0)
    return 0.0;
  return duration;
}

std::optional<AudioInfo> MetadataProber::probe_audio(const std::string &path) {
  auto cmd = ffprobe_base(tools_.ffprobe);
  cmd.insert(cmd.end(), {"-select_streams", "a:0", "-show_entries",
                         AUDIO_ENTRIES, "-of", "default=noprint_wrappers=1",
                         path});

  CommandResult res;
  try {
    res = runner_.run(cmd);
  } catch (const ToolExecutionError &e) {
    LOG_WARN("Audio probe failed, treating {} as silent: {}", path, e.what());
    return std::nullopt;
  }
  if (res.exit_code != 0) {
    LOG_WARN("Audio probe exited with {}, treating {} as silent",
             res.exit_code, path);
    return std::nullopt;
  }

  ProbeFields fields = parse_probe_fields(res.out);
  std::string codec = field_or_empty(fields, "codec_name");
  if (codec.empty())
    return std::nullopt;

  AudioInfo audio;
  audio.codec_name = codec;
  int64_t value = 0;
  if (parse_int64(field_or_empty(fields, "sample_rate"), value) && value > 0)
    audio.sample_rate = static_cast<int>(value);
  if (parse_int64(field_or_empty(fields, "channels"), value) && value > 0)
    audio.channels = static_cast<int>(value);
  audio.channel_layout = field_or_empty(fields, "channel_layout");
  return audio;
}

} // namespace stillcap
