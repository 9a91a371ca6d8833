/**
 * @file codec_table.hpp
 * @brief Fixed source-codec to encoder mapping
 *
 * @details Video:
 *
 *          - h264   -> libx264 (CRF, profile/level from source)
 *
 *          - hevc   -> libx265 (CRF, profile/level-idc from source)
 *
 *          - vp9    -> libvpx-vp9 (CRF with -b:v 0)
 *
 *          - prores -> prores_ks (profile from source)
 *
 *          - dnxhd  -> dnxhd, DNxHR profiles only
 *
 *          Audio: aac, mp3, opus, ac3.
 *
 * @attention Anything else throws UnsupportedCodecError. A still encoded
 *            with a "close enough" codec would break stream-copy
 *            concatenation silently.
 */

#ifndef STILLCAP_CODEC_TABLE_HPP
#define STILLCAP_CODEC_TABLE_HPP

#include <string>

#include "types.hpp"

namespace stillcap {

/**
 * @brief Encoder that reproduces the source video codec.
 * @throws UnsupportedCodecError for codecs outside the table
 */
VideoEncoderConfig select_video_encoder(const VideoInfo &info);

/**
 * @brief Encoder that reproduces the source audio codec.
 * @throws UnsupportedCodecError for codecs outside the table
 */
AudioEncoderConfig select_audio_encoder(const AudioInfo &info);

/// ffprobe H.264 profile name -> libx264 profile, empty if unknown
std::string x264_profile(const std::string &probe_profile);

/// ffprobe H.264 level (41) -> libx264 level ("4.1"), empty if unknown
std::string x264_level(int probe_level);

/// ffprobe HEVC profile name -> libx265 profile, empty if unknown
std::string x265_profile(const std::string &probe_profile);

/// ffprobe HEVC level (123 = 30 * 4.1) -> level-idc ("4.1"), empty if unknown
std::string x265_level(int probe_level);

/// ffprobe ProRes profile name -> prores_ks profile, empty if unknown
std::string prores_profile(const std::string &probe_profile);

/// ffprobe DNxHD profile name -> dnxhd encoder profile, empty if not DNxHR
std::string dnxhr_profile(const std::string &probe_profile);

} // namespace stillcap

#endif // STILLCAP_CODEC_TABLE_HPP
