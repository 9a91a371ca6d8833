/**
 * @file concat.cpp
 * @brief Stream-copy concatenation and re-encode fallback implementation
 *
 * @details Intermediates of the fast path live in the caller's scoped work
 *          directory and reuse the source's container extension, so every
 *          copy step stays inside one muxer family.
 */

#include "stillcap/concat.hpp"

#include <filesystem>
#include <fstream>
#include <utility>

#include <fmt/core.h>

#include "stillcap/container.hpp"
#include "stillcap/errors.hpp"
#include "stillcap/logging.hpp"
#include "stillcap/still_clip.hpp"

namespace stillcap {

namespace fs = std::filesystem;

// **---- Concat List ----**

std::string escape_concat_path(const std::string &path) {
  std::string out;
  out.reserve(path.size() + 2);
  out += '\'';
  for (char c : path) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += '\'';
  return out;
}

std::string build_concat_list(const std::vector<std::string> &paths) {
  std::string list;
  list.reserve(256 * paths.size());
  for (const auto &p : paths) {
    std::string abs_path = fs::absolute(p).string();
    list += fmt::format("file {}\n", escape_concat_path(abs_path));
  }
  return list;
}

void write_concat_list(const std::string &list_path,
                       const std::vector<std::string> &paths) {
  std::ofstream out(list_path, std::ios::binary | std::ios::trunc);
  if (!out)
    throw Error(fmt::format("Failed to create concat list: {}", list_path));
  out << build_concat_list(paths);
  out.close();
  if (!out)
    throw Error(fmt::format("Failed to write concat list: {}", list_path));
}

// **---- Fallback Filter Graph ----**

std::string build_reencode_filter_graph(const ProbeResult &probe,
                                        double still_duration) {
  const VideoInfo &v = probe.video;
  const std::string dur = fmt::format("{:.6f}", still_duration);

  const std::string sar = normalize_sar(v.sample_aspect_ratio);

  // Both concat inputs carry the output pixel format and sample aspect ratio.
  std::string graph = fmt::format(
      "[0:v]format=yuv420p,setsar={},setpts=PTS-STARTPTS[v0];", sar);
  graph += fmt::format("[1:v]scale={}:{},fps={},format=yuv420p,setsar={},"
                       "trim=duration={},setpts=PTS-STARTPTS[v1];",
                       v.width, v.height, v.fps_expr, sar, dur);

  if (!probe.audio) {
    graph += "[v0][v1]concat=n=2:v=1:a=0[v]";
    return graph;
  }

  int rate = (probe.audio->sample_rate > 0) ? probe.audio->sample_rate : 48000;
  std::string layout = resolve_channel_layout(*probe.audio);
  graph += fmt::format("[0:a]aresample={},aformat=channel_layouts={},"
                       "asetpts=PTS-STARTPTS[a0];",
                       rate, layout);
  graph += fmt::format(
      "anullsrc=r={}:cl={},atrim=duration={},asetpts=PTS-STARTPTS[a1];", rate,
      layout, dur);
  graph += "[v0][a0][v1][a1]concat=n=2:v=1:a=1[v][a]";
  return graph;
}

std::vector<std::string> build_reencode_command(const std::string &ffmpeg,
                                                const ProbeResult &probe,
                                                const ReencodeRequest &req) {
  std::vector<std::string> cmd = {
      ffmpeg,
      "-hide_banner",
      "-nostdin",
      "-loglevel",
      "error",
      "-y",
      "-i",
      req.source,
      "-loop",
      "1",
      "-framerate",
      probe.video.fps_expr,
      "-t",
      fmt::format("{:.6f}", req.still_duration),
      "-i",
      req.image,
      "-filter_complex",
      build_reencode_filter_graph(probe, req.still_duration),
      "-map",
      "[v]",
  };
  if (probe.audio)
    cmd.insert(cmd.end(), {"-map", "[a]"});

  cmd.insert(cmd.end(), {"-c:v", "libx264", "-pix_fmt", "yuv420p",
                         "-profile:v", "high", "-crf", std::to_string(req.crf),
                         "-preset", req.preset});
  if (probe.audio)
    cmd.insert(cmd.end(), {"-c:a", "aac", "-b:a", req.audio_bitrate});
  if (req.threads > 0)
    cmd.insert(cmd.end(), {"-threads", std::to_string(req.threads)});
  if (is_isobmff_container(req.output))
    cmd.insert(cmd.end(), {"-movflags", "+faststart"});
  cmd.push_back(req.output);
  return cmd;
}

// **---- ConcatEngine ----**

ConcatEngine::ConcatEngine(CommandRunner &runner, ToolPaths tools)
    : runner_(runner), tools_(std::move(tools)) {}

std::vector<std::string> ConcatEngine::ffmpeg_base() const {
  return {tools_.ffmpeg, "-hide_banner", "-nostdin", "-loglevel", "error",
          "-y"};
}

void ConcatEngine::isolate_stream(const std::string &input, const char *stream,
                                  const std::string &out_path) {
  auto cmd = ffmpeg_base();
  const std::string map = fmt::format("0:{}:0", stream);
  const char *drop = (std::string(stream) == "v") ? "-an" : "-vn";
  cmd.insert(cmd.end(), {"-i", input, "-map", map, "-c", "copy", drop, "-sn",
                         "-dn", out_path});
  run_checked(runner_, cmd);
}

void ConcatEngine::concat_copy(const std::vector<std::string> &parts,
                               const std::string &list_path,
                               const std::string &out_path) {
  write_concat_list(list_path, parts);

  auto cmd = ffmpeg_base();
  cmd.insert(cmd.end(), {"-fflags", "+genpts", "-f", "concat", "-safe", "0",
                         "-i", list_path, "-map", "0", "-c", "copy",
                         "-avoid_negative_ts", "make_zero"});
  if (is_isobmff_container(out_path))
    cmd.insert(cmd.end(), {"-movflags", "+faststart"});
  cmd.push_back(out_path);
  run_checked(runner_, cmd);
}

void ConcatEngine::mux_copy(const std::string &video, const std::string &audio,
                            const std::string &out_path) {
  auto cmd = ffmpeg_base();
  cmd.insert(cmd.end(), {"-i", video, "-i", audio, "-map", "0:v:0", "-map",
                         "1:a:0", "-c", "copy"});
  if (is_isobmff_container(out_path))
    cmd.insert(cmd.end(), {"-movflags", "+faststart"});
  cmd.push_back(out_path);
  run_checked(runner_, cmd);
}

void ConcatEngine::run_fast_path(const FastPathRequest &req) {
  const fs::path work(req.work_dir);
  const std::string ext = container_extension(req.source);
  auto part = [&work, &ext](const char *name) {
    return (work / (std::string(name) + ext)).string();
  };

  LOG_PHASE("Isolating streams...");
  const std::string source_video = part("source_video");
  const std::string still_video = part("still_video");
  isolate_stream(req.source, "v", source_video);
  isolate_stream(req.still_clip, "v", still_video);

  LOG_PHASE("Concatenating (stream copy)...");
  if (!req.has_audio) {
    concat_copy({source_video, still_video},
                (work / "video_list.txt").string(), req.output);
    return;
  }

  const std::string source_audio = part("source_audio");
  const std::string still_audio = part("still_audio");
  isolate_stream(req.source, "a", source_audio);
  isolate_stream(req.still_clip, "a", still_audio);

  const std::string joined_video = part("joined_video");
  const std::string joined_audio = part("joined_audio");
  concat_copy({source_video, still_video}, (work / "video_list.txt").string(),
              joined_video);
  concat_copy({source_audio, still_audio}, (work / "audio_list.txt").string(),
              joined_audio);

  LOG_PHASE("Muxing audio...");
  mux_copy(joined_video, joined_audio, req.output);
}

void ConcatEngine::run_reencode(const ProbeResult &probe,
                                const ReencodeRequest &req) {
  if (!fs::exists(req.image))
    throw ValidationError(
        fmt::format("Thumbnail image not found: {}", req.image));

  LOG_PHASE("Re-encoding source and still...");
  run_checked(runner_, build_reencode_command(tools_.ffmpeg, probe, req));
}

} // namespace stillcap
