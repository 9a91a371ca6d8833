/**
 * @file appender.cpp
 * @brief Append orchestration implementation
 */

#include "stillcap/appender.hpp"

#include <cmath>
#include <filesystem>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "stillcap/atomic_output.hpp"
#include "stillcap/compat_gate.hpp"
#include "stillcap/concat.hpp"
#include "stillcap/container.hpp"
#include "stillcap/errors.hpp"
#include "stillcap/logging.hpp"
#include "stillcap/probe.hpp"
#include "stillcap/still_clip.hpp"
#include "stillcap/system.hpp"
#include "stillcap/verify.hpp"

namespace stillcap {

namespace fs = std::filesystem;

const char *append_path_name(AppendPath path) {
  return path == AppendPath::FastCopy ? "stream copy" : "re-encode";
}

// **---- Constructor ----**

ThumbnailAppender::ThumbnailAppender(AppendOptions options,
                                     CommandRunner &runner)
    : options_(std::move(options)), runner_(runner) {}

// **---- Validation ----**

void ThumbnailAppender::validate(const AppendRequest &req,
                                 const std::string &dest) const {
  if (!std::isfinite(options_.still_duration) || options_.still_duration <= 0)
    throw ValidationError(fmt::format("Duration must be positive, got {}",
                                      options_.still_duration));
  if (options_.still_duration > MAX_STILL_DURATION)
    throw ValidationError(fmt::format("Duration must not exceed {}s, got {}",
                                      MAX_STILL_DURATION,
                                      options_.still_duration));
  if (options_.crf < 0 || options_.crf > 51)
    throw ValidationError(
        fmt::format("CRF must be within 0..51, got {}", options_.crf));
  if (dest.empty())
    throw ValidationError("No output path given");

  if (!is_supported_container(req.video))
    throw ValidationError(fmt::format("Unsupported container '{}': {}",
                                      container_extension(req.video),
                                      req.video));
  if (!is_supported_container(dest))
    throw ValidationError(fmt::format("Unsupported container '{}': {}",
                                      container_extension(dest), dest));
  if (!same_container_family(req.video, dest))
    throw ValidationError(
        fmt::format("Output container {} cannot hold a stream copy of {}",
                    container_extension(dest), container_extension(req.video)));

  if (!fs::exists(req.image))
    throw ValidationError(
        fmt::format("Thumbnail image not found: {}", req.image));

  fs::path dir = fs::path(dest).parent_path();
  if (!dir.empty() && !fs::is_directory(dir))
    throw ValidationError(
        fmt::format("Output directory does not exist: {}", dir.string()));
}

// **---- Path Selection ----**

AppendPath
ThumbnailAppender::choose_path(const ProbeResult &probe,
                               const CompatibilityDecision &decision) const {
  switch (options_.policy) {
  case PathPolicy::ReencodeOnly:
    return AppendPath::Reencode;
  case PathPolicy::CopyOnly:
    if (!decision.fast_path) {
      const std::string codec =
          is_fast_path_video_codec(probe.video.codec_name)
              ? (probe.audio ? probe.audio->codec_name : std::string())
              : probe.video.codec_name;
      throw UnsupportedCodecError(
          codec, fmt::format("Stream copy not possible: {}", decision.reason));
    }
    return AppendPath::FastCopy;
  case PathPolicy::Auto:
    break;
  }
  return decision.fast_path ? AppendPath::FastCopy : AppendPath::Reencode;
}

// **---- Main Processing ----**

AppendReport ThumbnailAppender::run(const AppendRequest &req) {
  TimingCollector timings;
  TIMER_START(total);

  const std::string dest = req.in_place ? req.video : req.output;
  validate(req, dest);

  // **----- PROBE -----**

  LOG_PHASE("Probing {}...", req.video);
  TIMER_START(probe);
  MetadataProber prober(runner_, options_.tools);
  ProbeResult probe = prober.probe(req.video);
  TIMER_END(timings, probe);

  const VideoInfo &v = probe.video;
  LOG_INFO("Video: {} {}x{} @ {} fps ({:.3f}), {}, {}", v.codec_name, v.width,
           v.height, v.fps_expr, v.fps, v.pix_fmt.empty() ? "?" : v.pix_fmt,
           format_time(v.duration));
  if (probe.audio) {
    LOG_INFO("Audio: {} {} Hz, {}", probe.audio->codec_name,
             probe.audio->sample_rate, resolve_channel_layout(*probe.audio));
  } else {
    LOG_INFO("Audio: none");
  }

  // **----- GATE -----**

  const CompatibilityDecision decision = evaluate_fast_path(probe);
  const AppendPath path = choose_path(probe, decision);

  AppendReport report;
  report.path = path;
  report.output = dest;
  report.source_duration = v.duration;
  report.reason = (path == AppendPath::Reencode && decision.fast_path)
                      ? std::string("re-encode requested")
                      : decision.reason;
  report.still_duration =
      compute_frame_count(v.fps, options_.still_duration) / v.fps;
  report.expected_duration = v.duration + report.still_duration;

  LOG_INFO("Path: {} ({})", append_path_name(path), report.reason);

  const int threads = resolve_thread_count(options_.threads);

  // **----- STAGE AND BUILD -----**

  ScopedTempDir work(options_.temp_root);
  StagedOutput staged(dest);

  ConcatEngine engine(runner_, options_.tools);
  TIMER_START(build);
  if (path == AppendPath::FastCopy) {
    StillClipSpec spec = make_still_clip_spec(probe, options_, dest, threads);

    LOG_PHASE("Synthesizing still clip...");
    const std::string still_clip =
        work.file("still" + container_extension(req.video));
    StillClipSynthesizer synth(runner_, options_.tools);
    synth.synthesize(req.image, spec, still_clip);

    FastPathRequest fast;
    fast.source = req.video;
    fast.still_clip = still_clip;
    fast.has_audio = probe.audio.has_value();
    fast.work_dir = work.path();
    fast.output = staged.path();
    engine.run_fast_path(fast);
  } else {
    ReencodeRequest slow;
    slow.source = req.video;
    slow.image = req.image;
    slow.still_duration = report.still_duration;
    slow.crf = options_.crf;
    slow.preset = options_.preset;
    slow.audio_bitrate = options_.audio_bitrate;
    slow.threads = threads;
    slow.output = staged.path();
    engine.run_reencode(probe, slow);
  }
  TIMER_END(timings, build);

  // **----- VERIFY AND COMMIT -----**

  if (options_.verify) {
    LOG_PHASE("Verifying output...");
    TIMER_START(verify);
    verify_output(staged.path(), req.video, v, report.still_duration,
                  options_.verify_slack);
    TIMER_END(timings, verify);
  }

  staged.commit();

  TIMER_END(timings, total);
  if (options_.verbose)
    timings.print_summary(append_path_name(path));

  return report;
}

// **---- Append Summary ----**

void print_append_summary(const AppendReport &report) {
  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== APPEND SUMMARY ==================\n");
  fmt::print("{:<20} {:>15}\n", "Path:", append_path_name(report.path));
  fmt::print("{:<20} {:>15}\n", "Source:",
             report.source_duration > 0 ? format_time(report.source_duration)
                                        : std::string("unknown"));
  fmt::print("{:<20} {:>15}\n", "Still:", format_time(report.still_duration));
  fmt::print("{:<20} {:>15}\n", "Output:",
             format_time(report.expected_duration));
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

} // namespace stillcap
