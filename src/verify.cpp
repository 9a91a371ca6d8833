/**
 * @file verify.cpp
 * @brief Output verification implementation
 */

#include "stillcap/verify.hpp"

#include <cmath>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include <fmt/core.h>

#include "stillcap/errors.hpp"
#include "stillcap/logging.hpp"

namespace stillcap {

namespace {

/// Owns an opened AVFormatContext
class FormatInput {
public:
  explicit FormatInput(const std::string &path) {
    if (avformat_open_input(&ctx_, path.c_str(), nullptr, nullptr) < 0)
      ctx_ = nullptr;
  }
  ~FormatInput() {
    if (ctx_)
      avformat_close_input(&ctx_);
  }
  FormatInput(const FormatInput &) = delete;
  FormatInput &operator=(const FormatInput &) = delete;

  AVFormatContext *get() const { return ctx_; }

private:
  AVFormatContext *ctx_ = nullptr;
};

std::string version_string(unsigned v) {
  return fmt::format("{}.{}.{}", AV_VERSION_MAJOR(v), AV_VERSION_MINOR(v),
                     AV_VERSION_MICRO(v));
}

} // anonymous namespace

std::optional<MediaSummary> read_media_summary(const std::string &path) {
  FormatInput input(path);
  AVFormatContext *fmt_ctx = input.get();
  if (!fmt_ctx)
    return std::nullopt;

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0)
    return std::nullopt;

  int video_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0)
    return std::nullopt;

  const AVCodecParameters *par = fmt_ctx->streams[video_idx]->codecpar;

  MediaSummary summary;
  summary.width = par->width;
  summary.height = par->height;
  summary.duration = (fmt_ctx->duration > 0)
                         ? fmt_ctx->duration / static_cast<double>(AV_TIME_BASE)
                         : 0.0;
  return summary;
}

std::string check_output_summary(const MediaSummary &summary,
                                 const VideoInfo &source,
                                 double source_duration,
                                 double still_duration, double slack) {
  if (summary.width != source.width || summary.height != source.height) {
    return fmt::format("geometry {}x{} does not match source {}x{}",
                       summary.width, summary.height, source.width,
                       source.height);
  }

  if (source_duration <= 0.0)
    return {};

  const double expected = source_duration + still_duration;
  const double frame = 1.0 / (source.fps > 0.0 ? source.fps : DEFAULT_FPS);
  const double tolerance = frame + slack;
  if (std::fabs(summary.duration - expected) > tolerance) {
    return fmt::format("duration {:.3f}s, expected {:.3f}s (+/- {:.3f}s)",
                       summary.duration, expected, tolerance);
  }
  return {};
}

void verify_output(const std::string &path, const std::string &source_path,
                   const VideoInfo &source, double still_duration,
                   double slack) {
  auto summary = read_media_summary(path);
  if (!summary)
    throw ValidationError(
        fmt::format("Output is not a readable video file: {}", path));

  double source_duration = source.duration;
  auto source_summary = read_media_summary(source_path);
  if (source_summary && source_summary->duration > 0.0)
    source_duration = source_summary->duration;

  std::string mismatch = check_output_summary(*summary, source, source_duration,
                                              still_duration, slack);
  if (!mismatch.empty())
    throw ValidationError(fmt::format("Output check failed: {}", mismatch));

  LOG_INFO("Verified: {}x{}, {:.3f}s", summary->width, summary->height,
           summary->duration);
}

std::string libav_versions() {
  return fmt::format("libavformat {}, libavcodec {}, libavutil {}",
                     version_string(avformat_version()),
                     version_string(avcodec_version()),
                     version_string(avutil_version()));
}

} // namespace stillcap
