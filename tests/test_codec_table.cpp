// Encoder selection for the still clip.

#include <gtest/gtest.h>

#include "stillcap/codec_table.hpp"
#include "stillcap/errors.hpp"

namespace stillcap {
namespace {

VideoInfo video(const std::string &codec, const std::string &profile = "",
                int level = 0) {
  VideoInfo v;
  v.width = 1920;
  v.height = 1080;
  v.codec_name = codec;
  v.profile = profile;
  v.level = level;
  return v;
}

TEST(CodecTableTest, H264MapsToX264WithProfileAndLevel) {
  VideoEncoderConfig cfg = select_video_encoder(video("h264", "High", 41));
  EXPECT_EQ(cfg.encoder, "libx264");
  EXPECT_TRUE(cfg.uses_crf);
  EXPECT_EQ(cfg.gop, GopControl::X264);
  EXPECT_EQ(cfg.profile, "high");
  EXPECT_EQ(cfg.level, "4.1");
}

TEST(CodecTableTest, HevcMapsToX265) {
  VideoEncoderConfig cfg = select_video_encoder(video("hevc", "Main 10", 123));
  EXPECT_EQ(cfg.encoder, "libx265");
  EXPECT_EQ(cfg.gop, GopControl::X265);
  EXPECT_EQ(cfg.profile, "main10");
  EXPECT_EQ(cfg.level, "4.1");
}

TEST(CodecTableTest, IntermediateCodecs) {
  VideoEncoderConfig prores = select_video_encoder(video("prores", "HQ"));
  EXPECT_EQ(prores.encoder, "prores_ks");
  EXPECT_EQ(prores.profile, "hq");
  EXPECT_EQ(prores.gop, GopControl::None);
  EXPECT_FALSE(prores.uses_crf);

  VideoEncoderConfig dnxhr = select_video_encoder(video("dnxhd", "DNXHR HQ"));
  EXPECT_EQ(dnxhr.encoder, "dnxhd");
  EXPECT_EQ(dnxhr.profile, "dnxhr_hq");

  VideoEncoderConfig vp9 = select_video_encoder(video("vp9"));
  EXPECT_EQ(vp9.encoder, "libvpx-vp9");
  EXPECT_EQ(vp9.gop, GopControl::Generic);
  ASSERT_EQ(vp9.extra_args.size(), 2u);
  EXPECT_EQ(vp9.extra_args[0], "-b:v");
}

TEST(CodecTableTest, UnknownVideoCodecIsHardError) {
  try {
    select_video_encoder(video("mpeg4"));
    FAIL() << "expected UnsupportedCodecError";
  } catch (const UnsupportedCodecError &e) {
    EXPECT_EQ(e.codec(), "mpeg4");
  }
  EXPECT_THROW(select_video_encoder(video("dnxhd", "DNXHD")),
               UnsupportedCodecError);
}

TEST(CodecTableTest, AudioEncoders) {
  AudioInfo a;
  a.codec_name = "aac";
  EXPECT_EQ(select_audio_encoder(a).encoder, "aac");
  a.codec_name = "mp3";
  EXPECT_EQ(select_audio_encoder(a).encoder, "libmp3lame");
  a.codec_name = "opus";
  EXPECT_EQ(select_audio_encoder(a).encoder, "libopus");
  a.codec_name = "pcm_s16le";
  EXPECT_THROW(select_audio_encoder(a), UnsupportedCodecError);
}

TEST(CodecTableTest, LevelAndProfileTranslation) {
  EXPECT_EQ(x264_level(9), "1b");
  EXPECT_EQ(x264_level(31), "3.1");
  EXPECT_EQ(x264_level(0), "");
  EXPECT_EQ(x265_level(120), "4");
  EXPECT_EQ(x265_level(153), "5.1");
  EXPECT_EQ(x265_level(-1), "");
  EXPECT_EQ(x264_profile("Constrained Baseline"), "baseline");
  EXPECT_EQ(x264_profile("Nonexistent"), "");
  EXPECT_EQ(prores_profile("XQ"), "4444xq");
  EXPECT_EQ(dnxhr_profile("DNXHR 444"), "dnxhr_444");
}

} // namespace
} // namespace stillcap
