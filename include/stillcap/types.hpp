/**
 * @file types.hpp
 * @brief Core data types for stillcap
 *
 * @details Contains the typed snapshots that flow through one append run:
 *          - Rational for "N/D" fields reported by the probing tool
 *
 *          - VideoInfo / AudioInfo / ProbeResult from the prober
 *
 *          - CompatibilityDecision from the fast-path gate
 *
 *          - Encoder configurations and StillClipSpec for the synthesizer
 */

#ifndef STILLCAP_TYPES_HPP
#define STILLCAP_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stillcap {

// **----- CONSTANTS -----**

/// Frame rate used when the source reports nothing usable
constexpr double DEFAULT_FPS = 30.0;

/// Plausible frame-rate range; anything outside falls back to DEFAULT_FPS
constexpr double MIN_FPS = 1.0;
constexpr double MAX_FPS = 360.0;

/// Longest still accepted, keeps MAX_FPS * duration well inside int
constexpr double MAX_STILL_DURATION = 3600.0;

// **----- DATA STRUCTURES -----**

/**
 * @struct Rational
 * @brief A "num/den" pair as reported by ffprobe.
 * @note A zero denominator marks the value as unparsable.
 */
struct Rational {
  int64_t num = 0;
  int64_t den = 0;

  bool valid() const { return den != 0; }
  double to_double() const {
    return valid() ? static_cast<double>(num) / static_cast<double>(den) : 0.0;
  }
};

/**
 * @struct VideoInfo
 * @brief Read-only snapshot of the first video stream of a file.
 * @note width/height are always > 0. fps is within [MIN_FPS, MAX_FPS].
 *       duration is 0.0 when it cannot be determined. String fields are empty
 *       when the prober reported them as missing.
 */
struct VideoInfo {
  int width = 0;
  int height = 0;
  double fps = DEFAULT_FPS;
  std::string fps_expr = "30"; //< Rational text the fps was parsed from
  double duration = 0.0;
  bool has_audio = false;
  std::string codec_name;
  std::string codec_tag;
  std::string profile;
  int level = 0; //< Raw level as reported (h264: 41, hevc: 123), 0 = unknown
  std::string pix_fmt;
  std::string sample_aspect_ratio;
  std::string color_range;
  std::string color_space;
  std::string color_transfer;
  std::string color_primaries;
  Rational time_base;
  int64_t frame_count = 0; //< nb_frames when the container reports it
};

/**
 * @struct AudioInfo
 * @brief First audio stream of a file, present only when one exists.
 */
struct AudioInfo {
  std::string codec_name;
  int sample_rate = 0;
  int channels = 0;
  std::string channel_layout;
};

/**
 * @struct ProbeResult
 * @brief Everything the prober learned about one source.
 * @note An empty audio optional is a legitimate "no audio" state.
 */
struct ProbeResult {
  VideoInfo video;
  std::optional<AudioInfo> audio;
};

/**
 * @struct CompatibilityDecision
 * @brief Outcome of the fast-path gate, computed once per run.
 */
struct CompatibilityDecision {
  bool fast_path = false;
  std::string reason;
};

/// How an encoder is told to produce a closed, self-contained GOP
enum class GopControl {
  None,    //< Intra-only codec, every frame is a keyframe
  X264,    //< -g / -keyint_min / -sc_threshold 0
  X265,    //< -x265-params keyint/min-keyint/scenecut=0
  Generic, //< -g / -keyint_min
};

/**
 * @struct VideoEncoderConfig
 * @brief Encoder chosen to reproduce a source video codec.
 */
struct VideoEncoderConfig {
  std::string codec;   //< Source codec family this encoder reproduces
  std::string encoder; //< ffmpeg encoder name
  bool uses_crf = false;
  GopControl gop = GopControl::None;
  std::string profile;                 //< Encoder profile, empty = default
  std::string level;                   //< Encoder level, empty = default
  std::vector<std::string> extra_args; //< Encoder-specific arguments
};

/**
 * @struct AudioEncoderConfig
 * @brief Encoder chosen to reproduce a source audio codec.
 */
struct AudioEncoderConfig {
  std::string codec;
  std::string encoder;
};

/**
 * @struct AudioTarget
 * @brief Silent audio track to synthesize next to the still.
 */
struct AudioTarget {
  AudioEncoderConfig encoder;
  int sample_rate = 48000;
  std::string channel_layout = "stereo";
  std::string bitrate;
};

/**
 * @struct StillClipSpec
 * @brief Parameters of the still clip, derived entirely from the probe.
 */
struct StillClipSpec {
  int width = 0;
  int height = 0;
  double fps = DEFAULT_FPS;
  std::string fps_expr = "30";
  int frame_count = 0;   //< round(fps * requested duration), at least 1
  double duration = 0.0; //< frame_count / fps
  std::string pix_fmt;
  std::string sample_aspect_ratio; //< setsar argument, e.g. "1" or "4/3"
  VideoEncoderConfig video;
  int crf = 18;
  std::string preset;
  std::string color_primaries;
  std::string color_transfer;
  std::string color_space;
  std::string color_range;
  int64_t timescale = 0; //< Forced track timescale, 0 = muxer default
  std::string codec_tag; //< Forced codec tag, empty = muxer default
  std::optional<AudioTarget> audio;
  int threads = 0;
};

/// Route actually taken by a run
enum class AppendPath { FastCopy, Reencode };

} // namespace stillcap

#endif // STILLCAP_TYPES_HPP
