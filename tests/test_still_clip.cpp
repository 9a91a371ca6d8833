// Still clip parameter derivation and ffmpeg command construction.

#include <gtest/gtest.h>

#include <limits>

#include "stillcap/atomic_output.hpp"
#include "stillcap/errors.hpp"
#include "stillcap/still_clip.hpp"
#include "support/fake_runner.hpp"

namespace stillcap {
namespace {

using test_support::flag_value;
using test_support::has_arg;

ProbeResult h264_with_aac() {
  ProbeResult p;
  VideoInfo &v = p.video;
  v.width = 1920;
  v.height = 1080;
  v.fps = 30.0;
  v.fps_expr = "30";
  v.duration = 10.0;
  v.codec_name = "h264";
  v.codec_tag = "avc1";
  v.profile = "High";
  v.level = 40;
  v.pix_fmt = "yuv420p";
  v.sample_aspect_ratio = "1:1";
  v.color_primaries = "bt709";
  v.color_transfer = "bt709";
  v.color_space = "bt709";
  v.color_range = "tv";
  v.time_base = {1, 15360};
  v.has_audio = true;

  AudioInfo a;
  a.codec_name = "aac";
  a.sample_rate = 44100;
  a.channels = 2;
  a.channel_layout = "stereo";
  p.audio = a;
  return p;
}

TEST(StillClipTest, FrameCountRoundsAndNeverDropsToZero) {
  EXPECT_EQ(compute_frame_count(30.0, 0.3), 9);
  EXPECT_EQ(compute_frame_count(29.97, 0.3), 9);
  EXPECT_EQ(compute_frame_count(25.0, 0.01), 1);
  EXPECT_EQ(compute_frame_count(60.0, 1.0), 60);
}

TEST(StillClipTest, FrameCountSaturatesInsteadOfWrapping) {
  EXPECT_EQ(compute_frame_count(30.0, 1e9), std::numeric_limits<int>::max());
  EXPECT_EQ(compute_frame_count(MAX_FPS, MAX_STILL_DURATION), 1296000);
}

TEST(StillClipTest, SampleAspectRatioNormalization) {
  EXPECT_EQ(normalize_sar("1:1"), "1");
  EXPECT_EQ(normalize_sar(""), "1");
  EXPECT_EQ(normalize_sar("0:1"), "1");
  EXPECT_EQ(normalize_sar("4:3"), "4/3");
}

TEST(StillClipTest, ChannelLayoutFromCount) {
  AudioInfo a;
  a.channels = 1;
  EXPECT_EQ(resolve_channel_layout(a), "mono");
  a.channels = 6;
  EXPECT_EQ(resolve_channel_layout(a), "5.1");
  a.channels = 0;
  EXPECT_EQ(resolve_channel_layout(a), "stereo");
  a.channel_layout = "5.1(side)";
  EXPECT_EQ(resolve_channel_layout(a), "5.1(side)");
}

TEST(StillClipTest, SpecMirrorsSource) {
  AppendOptions opts;
  opts.still_duration = 0.3;
  opts.crf = 20;
  StillClipSpec spec = make_still_clip_spec(h264_with_aac(), opts, "out.mp4", 4);

  EXPECT_EQ(spec.width, 1920);
  EXPECT_EQ(spec.height, 1080);
  EXPECT_EQ(spec.frame_count, 9);
  EXPECT_DOUBLE_EQ(spec.duration, 0.3);
  EXPECT_EQ(spec.video.encoder, "libx264");
  EXPECT_EQ(spec.crf, 20);
  EXPECT_EQ(spec.timescale, 15360);
  EXPECT_EQ(spec.threads, 4);
  ASSERT_TRUE(spec.audio.has_value());
  EXPECT_EQ(spec.audio->sample_rate, 44100);
  EXPECT_EQ(spec.audio->channel_layout, "stereo");
  EXPECT_EQ(spec.audio->encoder.encoder, "aac");
}

TEST(StillClipTest, TimescaleOnlyForCanonicalTimeBaseInIsoContainers) {
  ProbeResult p = h264_with_aac();
  AppendOptions opts;
  EXPECT_EQ(make_still_clip_spec(p, opts, "out.mkv", 0).timescale, 0);

  p.video.time_base = {1001, 30000};
  EXPECT_EQ(make_still_clip_spec(p, opts, "out.mp4", 0).timescale, 0);
}

TEST(StillClipTest, HevcKeepsHvc1Tag) {
  ProbeResult p = h264_with_aac();
  p.video.codec_name = "hevc";
  p.video.codec_tag = "hvc1";
  p.video.profile = "Main";
  p.video.level = 120;
  AppendOptions opts;
  StillClipSpec spec = make_still_clip_spec(p, opts, "out.mov", 0);
  EXPECT_EQ(spec.codec_tag, "hvc1");
  EXPECT_EQ(spec.video.encoder, "libx265");
}

TEST(StillClipTest, UnsupportedCodecIsRejected) {
  ProbeResult p = h264_with_aac();
  p.video.codec_name = "theora";
  AppendOptions opts;
  EXPECT_THROW(make_still_clip_spec(p, opts, "out.mp4", 0),
               UnsupportedCodecError);
}

TEST(StillClipTest, CommandForcesClosedGopAndColorTags) {
  AppendOptions opts;
  StillClipSpec spec = make_still_clip_spec(h264_with_aac(), opts, "out.mp4", 2);
  auto cmd = build_still_clip_command("ffmpeg", "thumb.png", spec, "still.mp4");

  EXPECT_EQ(cmd.front(), "ffmpeg");
  EXPECT_EQ(cmd.back(), "still.mp4");
  EXPECT_EQ(flag_value(cmd, "-framerate"), "30");
  EXPECT_EQ(flag_value(cmd, "-frames:v"), "9");
  EXPECT_EQ(flag_value(cmd, "-c:v"), "libx264");
  EXPECT_EQ(flag_value(cmd, "-crf"), "18");
  EXPECT_EQ(flag_value(cmd, "-profile:v"), "high");
  EXPECT_EQ(flag_value(cmd, "-level"), "4.0");
  EXPECT_EQ(flag_value(cmd, "-g"), "9");
  EXPECT_EQ(flag_value(cmd, "-keyint_min"), "9");
  EXPECT_EQ(flag_value(cmd, "-sc_threshold"), "0");
  EXPECT_EQ(flag_value(cmd, "-pix_fmt"), "yuv420p");
  EXPECT_EQ(flag_value(cmd, "-color_primaries"), "bt709");
  EXPECT_EQ(flag_value(cmd, "-color_range"), "tv");
  EXPECT_EQ(flag_value(cmd, "-video_track_timescale"), "15360");
  EXPECT_EQ(flag_value(cmd, "-c:a"), "aac");
  EXPECT_EQ(flag_value(cmd, "-ar"), "44100");
  EXPECT_EQ(flag_value(cmd, "-threads"), "2");
  EXPECT_EQ(flag_value(cmd, "-vf"),
            "scale=1920:1080:flags=lanczos,setsar=1,format=yuv420p");
  EXPECT_EQ(flag_value(cmd, "-t"), "0.300000");
  EXPECT_TRUE(has_arg(cmd, "anullsrc=r=44100:cl=stereo"));
  EXPECT_TRUE(has_arg(cmd, "1:a:0"));
}

TEST(StillClipTest, AudioBitrateFollowsOptions) {
  ProbeResult p = h264_with_aac();
  AppendOptions opts;
  opts.audio_bitrate = "128k";
  StillClipSpec spec = make_still_clip_spec(p, opts, "out.mp4", 0);
  auto cmd = build_still_clip_command("ffmpeg", "thumb.png", spec, "still.mp4");
  EXPECT_EQ(flag_value(cmd, "-c:a"), "aac");
  EXPECT_EQ(flag_value(cmd, "-b:a"), "128k");

  opts.audio_bitrate.clear();
  spec = make_still_clip_spec(p, opts, "out.mp4", 0);
  cmd = build_still_clip_command("ffmpeg", "thumb.png", spec, "still.mp4");
  EXPECT_FALSE(has_arg(cmd, "-b:a"));
}

TEST(StillClipTest, SilentSourceGetsVideoOnlyClip) {
  ProbeResult p = h264_with_aac();
  p.audio.reset();
  p.video.has_audio = false;
  AppendOptions opts;
  StillClipSpec spec = make_still_clip_spec(p, opts, "out.mp4", 0);
  auto cmd = build_still_clip_command("ffmpeg", "thumb.png", spec, "still.mp4");
  EXPECT_FALSE(has_arg(cmd, "-c:a"));
  EXPECT_FALSE(has_arg(cmd, "lavfi"));
  EXPECT_FALSE(has_arg(cmd, "-threads"));
}

TEST(StillClipTest, X265GopGoesThroughParams) {
  ProbeResult p = h264_with_aac();
  p.video.codec_name = "hevc";
  p.video.profile = "Main";
  p.video.level = 120;
  AppendOptions opts;
  StillClipSpec spec = make_still_clip_spec(p, opts, "out.mp4", 0);
  auto cmd = build_still_clip_command("ffmpeg", "thumb.png", spec, "still.mp4");
  EXPECT_EQ(flag_value(cmd, "-x265-params"),
            "keyint=9:min-keyint=9:scenecut=0:repeat-headers=1:"
            "log-level=error:level-idc=4");
  EXPECT_FALSE(has_arg(cmd, "-g"));
}

TEST(StillClipTest, X265StillCarriesParameterSetsInBand) {
  ProbeResult p = h264_with_aac();
  p.video.codec_name = "hevc";
  p.video.profile = "Main";
  AppendOptions opts;
  for (const char *container : {"out.mp4", "out.mov", "out.mkv"}) {
    StillClipSpec spec = make_still_clip_spec(p, opts, container, 0);
    auto cmd =
        build_still_clip_command("ffmpeg", "thumb.png", spec, "still.mp4");
    EXPECT_NE(flag_value(cmd, "-x265-params").find("repeat-headers=1"),
              std::string::npos)
        << container;
  }
}

TEST(StillClipTest, SynthesizerRunsFfmpegAndChecksOutput) {
  ScopedTempDir dir;
  const std::string image = dir.file("thumb.png");
  test_support::write_file(image, "png");

  test_support::FakeCommandRunner runner;
  StillClipSynthesizer synth(runner, ToolPaths{});
  AppendOptions opts;
  StillClipSpec spec = make_still_clip_spec(h264_with_aac(), opts, "o.mp4", 0);
  synth.synthesize(image, spec, dir.file("still.mp4"));
  EXPECT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(test_support::read_file(dir.file("still.mp4")), "fake");
}

TEST(StillClipTest, SynthesizerRejectsMissingImageAndEmptyOutput) {
  ScopedTempDir dir;
  test_support::FakeCommandRunner runner;
  StillClipSynthesizer synth(runner, ToolPaths{});
  AppendOptions opts;
  StillClipSpec spec = make_still_clip_spec(h264_with_aac(), opts, "o.mp4", 0);

  EXPECT_THROW(synth.synthesize(dir.file("none.png"), spec, dir.file("s.mp4")),
               ValidationError);

  const std::string image = dir.file("thumb.png");
  test_support::write_file(image, "png");
  runner.reply("ffmpeg", "-loop", "");
  EXPECT_THROW(synth.synthesize(image, spec, dir.file("s.mp4")),
               ValidationError);
}

TEST(StillClipTest, SynthesizerSurfacesToolFailure) {
  ScopedTempDir dir;
  const std::string image = dir.file("thumb.png");
  test_support::write_file(image, "png");
  test_support::FakeCommandRunner runner;
  runner.fail("ffmpeg", "-loop", 1, "Unknown encoder 'libx264'");
  StillClipSynthesizer synth(runner, ToolPaths{});
  AppendOptions opts;
  StillClipSpec spec = make_still_clip_spec(h264_with_aac(), opts, "o.mp4", 0);
  try {
    synth.synthesize(image, spec, dir.file("s.mp4"));
    FAIL() << "expected ToolExecutionError";
  } catch (const ToolExecutionError &e) {
    EXPECT_EQ(e.exit_code(), 1);
    EXPECT_EQ(e.diagnostics(), "Unknown encoder 'libx264'");
    EXPECT_NE(e.command().find("libx264"), std::string::npos);
  }
}

} // namespace
} // namespace stillcap
