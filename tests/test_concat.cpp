// Concat list rendering, fast-path stages and the re-encode filter graph.

#include <gtest/gtest.h>

#include "stillcap/atomic_output.hpp"
#include "stillcap/concat.hpp"
#include "stillcap/errors.hpp"
#include "support/fake_runner.hpp"

namespace stillcap {
namespace {

using test_support::FakeCommandRunner;
using test_support::flag_value;
using test_support::has_arg;

ProbeResult source(bool with_audio) {
  ProbeResult p;
  p.video.width = 1280;
  p.video.height = 720;
  p.video.fps = 30000.0 / 1001.0;
  p.video.fps_expr = "30000/1001";
  p.video.duration = 10.0;
  p.video.codec_name = "mpeg4";
  p.video.sample_aspect_ratio = "1:1";
  if (with_audio) {
    AudioInfo a;
    a.codec_name = "mp3";
    a.sample_rate = 44100;
    a.channels = 1;
    p.audio = a;
    p.video.has_audio = true;
  }
  return p;
}

TEST(ConcatListTest, QuotesAndEscapesPaths) {
  EXPECT_EQ(escape_concat_path("/tmp/a.mp4"), "'/tmp/a.mp4'");
  EXPECT_EQ(escape_concat_path("/tmp/it's.mp4"), "'/tmp/it'\\''s.mp4'");
  EXPECT_EQ(build_concat_list({"/x/a.mp4", "/x/b.mp4"}),
            "file '/x/a.mp4'\nfile '/x/b.mp4'\n");
}

TEST(ConcatListTest, RelativePathsBecomeAbsolute) {
  std::string list = build_concat_list({"a.mp4"});
  EXPECT_EQ(list.rfind("file '/", 0), 0u);
}

TEST(ConcatListTest, WriteFailsForMissingDirectory) {
  EXPECT_THROW(write_concat_list("/nonexistent/dir/list.txt", {"/a.mp4"}),
               Error);
}

// -----------------------------------------------------------------------------
// Fast path
// -----------------------------------------------------------------------------

TEST(ConcatEngineTest, FastPathWithAudioIsolatesJoinsAndMuxes) {
  ScopedTempDir work;
  FakeCommandRunner runner;
  ConcatEngine engine(runner, ToolPaths{});

  FastPathRequest req;
  req.source = "/videos/in.mp4";
  req.still_clip = work.file("still.mp4");
  req.has_audio = true;
  req.work_dir = work.path();
  req.output = work.file("staged.mp4");
  engine.run_fast_path(req);

  // 4 isolations, 2 concats, 1 mux
  ASSERT_EQ(runner.calls.size(), 7u);
  EXPECT_EQ(runner.count("-f concat -safe 0"), 2u);
  EXPECT_EQ(runner.count("-c copy"), 7u);
  EXPECT_EQ(runner.count("-map 0:v:0 -c copy -an -sn -dn"), 2u);
  EXPECT_EQ(runner.count("-map 0:a:0 -c copy -vn -sn -dn"), 2u);

  const auto &mux = runner.calls.back();
  EXPECT_EQ(mux.back(), req.output);
  EXPECT_EQ(flag_value(mux, "-movflags"), "+faststart");
  EXPECT_TRUE(has_arg(mux, "1:a:0"));

  std::string video_list = test_support::read_file(work.file("video_list.txt"));
  EXPECT_NE(video_list.find("source_video.mp4"), std::string::npos);
  EXPECT_LT(video_list.find("source_video.mp4"),
            video_list.find("still_video.mp4"));
  std::string audio_list = test_support::read_file(work.file("audio_list.txt"));
  EXPECT_LT(audio_list.find("source_audio.mp4"),
            audio_list.find("still_audio.mp4"));
}

TEST(ConcatEngineTest, FastPathWithoutAudioConcatsStraightToOutput) {
  ScopedTempDir work;
  FakeCommandRunner runner;
  ConcatEngine engine(runner, ToolPaths{});

  FastPathRequest req;
  req.source = "/videos/in.mkv";
  req.still_clip = work.file("still.mkv");
  req.has_audio = false;
  req.work_dir = work.path();
  req.output = work.file("staged.mkv");
  engine.run_fast_path(req);

  ASSERT_EQ(runner.calls.size(), 3u);
  EXPECT_EQ(runner.count("0:a:0"), 0u);
  const auto &concat = runner.calls.back();
  EXPECT_EQ(concat.back(), req.output);
  EXPECT_FALSE(has_arg(concat, "-movflags"));
  EXPECT_EQ(flag_value(concat, "-avoid_negative_ts"), "make_zero");
}

TEST(ConcatEngineTest, FastPathFailureDoesNotFallBack) {
  ScopedTempDir work;
  FakeCommandRunner runner;
  runner.fail("ffmpeg", "-f concat", 1, "Non-monotonous DTS");
  ConcatEngine engine(runner, ToolPaths{});

  FastPathRequest req;
  req.source = "/videos/in.mp4";
  req.still_clip = work.file("still.mp4");
  req.has_audio = false;
  req.work_dir = work.path();
  req.output = work.file("staged.mp4");
  EXPECT_THROW(engine.run_fast_path(req), ToolExecutionError);
  EXPECT_EQ(runner.count("-filter_complex"), 0u);
}

// -----------------------------------------------------------------------------
// Fallback
// -----------------------------------------------------------------------------

TEST(ReencodeTest, FilterGraphWithAudio) {
  std::string graph = build_reencode_filter_graph(source(true), 0.3003);
  EXPECT_EQ(graph,
            "[0:v]format=yuv420p,setsar=1,setpts=PTS-STARTPTS[v0];"
            "[1:v]scale=1280:720,fps=30000/1001,format=yuv420p,setsar=1,"
            "trim=duration=0.300300,setpts=PTS-STARTPTS[v1];"
            "[0:a]aresample=44100,aformat=channel_layouts=mono,"
            "asetpts=PTS-STARTPTS[a0];"
            "anullsrc=r=44100:cl=mono,atrim=duration=0.300300,"
            "asetpts=PTS-STARTPTS[a1];"
            "[v0][a0][v1][a1]concat=n=2:v=1:a=1[v][a]");
}

TEST(ReencodeTest, FilterGraphWithoutAudioKeepsLayout) {
  std::string graph = build_reencode_filter_graph(source(false), 0.3);
  EXPECT_EQ(graph.find("anullsrc"), std::string::npos);
  EXPECT_NE(graph.find("[v0][v1]concat=n=2:v=1:a=0[v]"), std::string::npos);
}

TEST(ReencodeTest, CommandEncodesEverything) {
  ReencodeRequest req;
  req.source = "in.mov";
  req.image = "thumb.png";
  req.still_duration = 0.3;
  req.crf = 23;
  req.preset = "fast";
  req.audio_bitrate = "128k";
  req.threads = 3;
  req.output = "out_tmp.mov";
  auto cmd = build_reencode_command("ffmpeg", source(true), req);

  EXPECT_EQ(cmd.back(), "out_tmp.mov");
  EXPECT_EQ(flag_value(cmd, "-c:v"), "libx264");
  EXPECT_EQ(flag_value(cmd, "-crf"), "23");
  EXPECT_EQ(flag_value(cmd, "-preset"), "fast");
  EXPECT_EQ(flag_value(cmd, "-c:a"), "aac");
  EXPECT_EQ(flag_value(cmd, "-b:a"), "128k");
  EXPECT_EQ(flag_value(cmd, "-threads"), "3");
  EXPECT_EQ(flag_value(cmd, "-movflags"), "+faststart");
  EXPECT_EQ(flag_value(cmd, "-framerate"), "30000/1001");
  EXPECT_EQ(flag_value(cmd, "-t"), "0.300000");
  EXPECT_TRUE(has_arg(cmd, "[a]"));
}

TEST(ReencodeTest, SilentSourceMapsVideoOnly) {
  ReencodeRequest req;
  req.source = "in.mkv";
  req.image = "thumb.png";
  req.still_duration = 0.3;
  req.output = "out.mkv";
  auto cmd = build_reencode_command("ffmpeg", source(false), req);
  EXPECT_FALSE(has_arg(cmd, "[a]"));
  EXPECT_FALSE(has_arg(cmd, "-c:a"));
  EXPECT_FALSE(has_arg(cmd, "-movflags"));
}

TEST(ReencodeTest, EngineRejectsMissingImage) {
  FakeCommandRunner runner;
  ConcatEngine engine(runner, ToolPaths{});
  ReencodeRequest req;
  req.source = "in.mp4";
  req.image = "/nonexistent/thumb.png";
  req.still_duration = 0.3;
  req.output = "out.mp4";
  EXPECT_THROW(engine.run_reencode(source(true), req), ValidationError);
  EXPECT_TRUE(runner.calls.empty());
}

} // namespace
} // namespace stillcap
