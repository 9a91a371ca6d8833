/**
 * @file config.hpp
 * @brief Configuration via environment variables and the AppendOptions struct
 *
 * @details Environment variables only seed the defaults of AppendOptions.
 *          main() builds one AppendOptions, applies command-line overrides and
 *          passes it down explicitly; nothing below main() reads the
 *          environment.
 *
 *          - STILLCAP_FFMPEG / STILLCAP_FFPROBE: tool binaries
 *
 *          - STILLCAP_TOOL_TIMEOUT_SEC: per-tool timeout (0 = unbounded)
 *
 *          - STILLCAP_THREADS: encoder threads (0 = cgroup-aware auto)
 *
 *          - STILLCAP_PRESET: x264/x265 preset
 *
 *          - STILLCAP_TMPDIR: root of the scoped work area
 *
 *          - STILLCAP_VERIFY_SLACK_SEC: duration tolerance beyond one frame
 */

#ifndef STILLCAP_CONFIG_HPP
#define STILLCAP_CONFIG_HPP

#include <cstdlib>
#include <string>

#include "errors.hpp"

namespace stillcap {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 * @throws ValidationError if the variable is set but not a number
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  char *end = nullptr;
  double parsed = std::strtod(val, &end);
  if (end == val || *end != '\0')
    throw ValidationError(std::string(name) + " is not a number: " + val);
  return parsed;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 * @throws ValidationError if the variable is set but not an integer
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  char *end = nullptr;
  long parsed = std::strtol(val, &end, 10);
  if (end == val || *end != '\0')
    throw ValidationError(std::string(name) + " is not an integer: " + val);
  return static_cast<int>(parsed);
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

} // namespace Config

// **---- APPEND OPTIONS ----**

/**
 * @brief Which concatenation route the run may take.
 * @note Auto lets the compatibility gate decide. CopyOnly turns a gate
 *       rejection into UnsupportedCodecError. ReencodeOnly skips stream copy.
 */
enum class PathPolicy { Auto, CopyOnly, ReencodeOnly };

/// Locations of the external tools
struct ToolPaths {
  std::string ffmpeg = "ffmpeg";
  std::string ffprobe = "ffprobe";
};

/**
 * @struct AppendOptions
 * @brief Everything one append invocation is parameterized by.
 */
struct AppendOptions {
  double still_duration = 0.3;        //< Requested still length in seconds
  int crf = 18;                       //< Quality factor for CRF encoders
  std::string preset = "medium";      //< x264/x265 preset
  std::string audio_bitrate = "192k"; //< Bitrate for synthesized audio
  PathPolicy policy = PathPolicy::Auto;
  bool verify = true;          //< Re-open the staged output before commit
  double verify_slack = 0.1;   //< Seconds tolerated beyond one frame
  double tool_timeout = 0.0;   //< Seconds per tool invocation, 0 = unbounded
  int threads = 0;             //< Encoder threads, 0 = auto
  bool verbose = false;        //< Echo commands and print timings
  std::string temp_root;       //< Empty = system temp directory
  ToolPaths tools;
};

/**
 * @brief Build AppendOptions from the STILLCAP_* environment variables.
 * @throws ValidationError on malformed numeric values
 */
inline AppendOptions options_from_environment() {
  AppendOptions opts;
  opts.tools.ffmpeg = Config::get_env_string("STILLCAP_FFMPEG", "ffmpeg");
  opts.tools.ffprobe = Config::get_env_string("STILLCAP_FFPROBE", "ffprobe");
  opts.tool_timeout = Config::get_env_double("STILLCAP_TOOL_TIMEOUT_SEC", 0.0);
  opts.threads = Config::get_env_int("STILLCAP_THREADS", 0);
  opts.preset = Config::get_env_string("STILLCAP_PRESET", "medium");
  opts.temp_root = Config::get_env_string("STILLCAP_TMPDIR", "");
  opts.verify_slack = Config::get_env_double("STILLCAP_VERIFY_SLACK_SEC", 0.1);
  return opts;
}

} // namespace stillcap

#endif // STILLCAP_CONFIG_HPP
