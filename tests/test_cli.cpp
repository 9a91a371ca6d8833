// Command-line parsing and option overrides.

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "stillcap/cli.hpp"

namespace stillcap {
namespace {

CliCommand parse(const std::vector<std::string> &args, AppendOptions &opts) {
  return parse_command_line(args, opts);
}

TEST(CliTest, NoArgumentsShowsUsage) {
  AppendOptions opts;
  EXPECT_EQ(parse({}, opts).mode, CliMode::Help);
  EXPECT_EQ(parse({"--crf", "20"}, opts).mode, CliMode::Help);
}

TEST(CliTest, PairModeInfersImageAndOutput) {
  AppendOptions opts;
  CliCommand cmd = parse({"--pair", "/media/show/ep01.mp4"}, opts);
  ASSERT_EQ(cmd.mode, CliMode::Append);
  EXPECT_EQ(cmd.request.video, "/media/show/ep01.mp4");
  EXPECT_EQ(cmd.request.image, "/media/show/ep01.png");
  EXPECT_EQ(cmd.request.output, "/media/show/ep01_thumb.mp4");
  EXPECT_FALSE(cmd.request.in_place);
}

TEST(CliTest, ExplicitPairWithOverrides) {
  AppendOptions opts;
  CliCommand cmd =
      parse({"-v", "a.mov", "-t", "cover.jpg", "-o", "b.mov", "-d", "0.5",
             "--crf", "23", "--preset", "slow", "--audio-bitrate", "128k",
             "--timeout", "90", "--no-verify", "--verbose"},
            opts);
  ASSERT_EQ(cmd.mode, CliMode::Append);
  EXPECT_EQ(cmd.request.video, "a.mov");
  EXPECT_EQ(cmd.request.image, "cover.jpg");
  EXPECT_EQ(cmd.request.output, "b.mov");
  EXPECT_DOUBLE_EQ(opts.still_duration, 0.5);
  EXPECT_EQ(opts.crf, 23);
  EXPECT_EQ(opts.preset, "slow");
  EXPECT_EQ(opts.audio_bitrate, "128k");
  EXPECT_DOUBLE_EQ(opts.tool_timeout, 90.0);
  EXPECT_FALSE(opts.verify);
  EXPECT_TRUE(opts.verbose);
  EXPECT_EQ(opts.policy, PathPolicy::Auto);
}

TEST(CliTest, InPlaceHasNoSeparateOutput) {
  AppendOptions opts;
  CliCommand cmd = parse({"--pair", "clip.mkv", "--inplace"}, opts);
  EXPECT_TRUE(cmd.request.in_place);
  EXPECT_TRUE(cmd.request.output.empty());
}

TEST(CliTest, PathPolicyFlags) {
  AppendOptions opts;
  parse({"--pair", "x.mp4", "--copy-only"}, opts);
  EXPECT_EQ(opts.policy, PathPolicy::CopyOnly);

  AppendOptions opts2;
  parse({"--pair", "x.mp4", "--no-copy-concat"}, opts2);
  EXPECT_EQ(opts2.policy, PathPolicy::ReencodeOnly);
}

TEST(CliTest, InfoAndHelp) {
  AppendOptions opts;
  EXPECT_EQ(parse({"--info"}, opts).mode, CliMode::Info);
  EXPECT_EQ(parse({"-h"}, opts).mode, CliMode::Help);
  EXPECT_EQ(parse({"--pair", "x.mp4", "--help"}, opts).mode, CliMode::Help);
}

TEST(CliTest, UsageErrors) {
  AppendOptions opts;
  EXPECT_THROW(parse({"--pair", "a.mp4", "-v", "b.mp4", "-t", "c.png"}, opts),
               UsageError);
  EXPECT_THROW(parse({"--pair", "a.mp4", "--info"}, opts), UsageError);
  EXPECT_THROW(parse({"-v", "a.mp4"}, opts), UsageError);
  EXPECT_THROW(parse({"-t", "a.png"}, opts), UsageError);
  EXPECT_THROW(parse({"--pair", "a.mp4", "-t", "a.png"}, opts), UsageError);
  EXPECT_THROW(parse({"--pair", "a.mp4", "-o", "b.mp4", "--inplace"}, opts),
               UsageError);
  EXPECT_THROW(
      parse({"--pair", "a.mp4", "--copy-only", "--no-copy-concat"}, opts),
      UsageError);
  EXPECT_THROW(parse({"--pair", "a.mp4", "--crf", "high"}, opts), UsageError);
  EXPECT_THROW(parse({"--pair", "a.mp4", "-d", "0.3s"}, opts), UsageError);
  EXPECT_THROW(parse({"--pair", "a.mp4", "--timeout", "-1"}, opts),
               UsageError);
  EXPECT_THROW(parse({"--pair"}, opts), UsageError);
  EXPECT_THROW(parse({"--bogus"}, opts), UsageError);
}

TEST(CliTest, PathHelpers) {
  EXPECT_EQ(infer_pair_image("dir/clip.final.mp4"), "dir/clip.final.png");
  EXPECT_EQ(default_output_path("clip.mov"), "clip_thumb.mov");
  EXPECT_EQ(default_output_path("/a/b/clip.mkv"), "/a/b/clip_thumb.mkv");
}

} // namespace
} // namespace stillcap
