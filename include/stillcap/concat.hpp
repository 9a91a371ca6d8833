/**
 * @file concat.hpp
 * @brief Stream-copy concatenation and full re-encode fallback
 *
 * @details Fast path (nothing from the source is re-encoded):
 *
 *          1. Isolate source video (and audio) with -c copy
 *
 *          2. Isolate still video (and audio) the same way
 *
 *          3. Join the video tracks with the concat demuxer
 *
 *          4. Join the audio tracks and mux both joined tracks, or remux the
 *             joined video alone when the source is silent
 *
 *          Fallback: one filter graph decodes source and still, normalizes
 *          the still to the source geometry/rate, concatenates raw frames and
 *          re-encodes everything with libx264/aac.
 */

#ifndef STILLCAP_CONCAT_HPP
#define STILLCAP_CONCAT_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "process_runner.hpp"
#include "types.hpp"

namespace stillcap {

// **---- Concat List ----**

/**
 * @brief Quote a path for the concat demuxer list.
 * @note Embedded single quotes become '\''
 */
std::string escape_concat_path(const std::string &path);

/**
 * @brief Render a concat list, one "file '<path>'" line per entry.
 */
std::string build_concat_list(const std::vector<std::string> &paths);

/**
 * @brief Write a concat list file.
 * @throws Error if the file cannot be written
 */
void write_concat_list(const std::string &list_path,
                       const std::vector<std::string> &paths);

// **---- Requests ----**

/**
 * @struct FastPathRequest
 * @brief Inputs of the stream-copy route.
 */
struct FastPathRequest {
  std::string source;     //< Original video
  std::string still_clip; //< Synthesized still clip
  bool has_audio = false; //< Source (and therefore still) carries audio
  std::string work_dir;   //< Scoped temp directory for intermediates
  std::string output;     //< Staged output path
};

/**
 * @struct ReencodeRequest
 * @brief Inputs of the full re-encode route.
 */
struct ReencodeRequest {
  std::string source;
  std::string image;
  double still_duration = 0.0; //< Frame-aligned still length
  int crf = 18;
  std::string preset = "medium";
  std::string audio_bitrate = "192k";
  int threads = 0;
  std::string output;
};

/**
 * @brief Filter graph for the fallback route.
 * @note Audio chains are emitted only when the source has audio.
 */
std::string build_reencode_filter_graph(const ProbeResult &probe,
                                        double still_duration);

/**
 * @brief ffmpeg argv for the fallback route.
 */
std::vector<std::string> build_reencode_command(const std::string &ffmpeg,
                                                const ProbeResult &probe,
                                                const ReencodeRequest &req);

/**
 * @class ConcatEngine
 * @brief Runs either route against a staged output path.
 */
class ConcatEngine {
public:
  ConcatEngine(CommandRunner &runner, ToolPaths tools);

  /**
   * @brief Stream-copy concatenation.
   * @throws ToolExecutionError on any stage failure; there is no implicit
   *         fallback to re-encoding
   */
  void run_fast_path(const FastPathRequest &req);

  /**
   * @brief Full filter-graph re-encode.
   * @throws ToolExecutionError if ffmpeg fails
   */
  void run_reencode(const ProbeResult &probe, const ReencodeRequest &req);

private:
  /// Copy one stream ("v" or "a") of input into its own file
  void isolate_stream(const std::string &input, const char *stream,
                      const std::string &out_path);

  /// Join files with the concat demuxer, copying every stream
  void concat_copy(const std::vector<std::string> &parts,
                   const std::string &list_path, const std::string &out_path);

  /// Mux one video file and one audio file without re-encoding
  void mux_copy(const std::string &video, const std::string &audio,
                const std::string &out_path);

  std::vector<std::string> ffmpeg_base() const;

  CommandRunner &runner_;
  ToolPaths tools_;
};

} // namespace stillcap

#endif // STILLCAP_CONCAT_HPP
