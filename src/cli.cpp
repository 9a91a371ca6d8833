/**
 * @file cli.cpp
 * @brief Command-line parsing implementation
 */

#include "stillcap/cli.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>

#include <fmt/core.h>

namespace stillcap {

namespace fs = std::filesystem;

namespace {

double parse_double_arg(const std::string &flag, const std::string &value) {
  char *end = nullptr;
  errno = 0;
  double parsed = std::strtod(value.c_str(), &end);
  if (value.empty() || *end != '\0' || errno == ERANGE)
    throw UsageError(fmt::format("{} expects a number, got '{}'", flag, value));
  return parsed;
}

int parse_int_arg(const std::string &flag, const std::string &value) {
  char *end = nullptr;
  errno = 0;
  long parsed = std::strtol(value.c_str(), &end, 10);
  if (value.empty() || *end != '\0' || errno == ERANGE || parsed < -100000 ||
      parsed > 100000)
    throw UsageError(
        fmt::format("{} expects an integer, got '{}'", flag, value));
  return static_cast<int>(parsed);
}

} // anonymous namespace

std::string infer_pair_image(const std::string &video) {
  return fs::path(video).replace_extension(".png").string();
}

std::string default_output_path(const std::string &video) {
  fs::path p(video);
  return (p.parent_path() /
          (p.stem().string() + "_thumb" + p.extension().string()))
      .string();
}

CliCommand parse_command_line(const std::vector<std::string> &args,
                              AppendOptions &options) {
  CliCommand cmd;
  std::string pair, video, thumb, out;
  bool info = false;
  bool in_place = false;
  bool copy_only = false;
  bool no_copy = false;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    auto value = [&]() -> const std::string & {
      if (i + 1 >= args.size())
        throw UsageError(fmt::format("{} requires a value", arg));
      return args[++i];
    };

    if (arg == "-h" || arg == "--help") {
      cmd.mode = CliMode::Help;
      return cmd;
    } else if (arg == "--pair") {
      pair = value();
    } else if (arg == "-v" || arg == "--video") {
      video = value();
    } else if (arg == "-t" || arg == "--thumb") {
      thumb = value();
    } else if (arg == "-o" || arg == "--out") {
      out = value();
    } else if (arg == "-d" || arg == "--duration") {
      options.still_duration = parse_double_arg(arg, value());
    } else if (arg == "--crf") {
      options.crf = parse_int_arg(arg, value());
    } else if (arg == "--preset") {
      options.preset = value();
    } else if (arg == "--audio-bitrate") {
      options.audio_bitrate = value();
    } else if (arg == "--timeout") {
      options.tool_timeout = parse_double_arg(arg, value());
    } else if (arg == "--inplace") {
      in_place = true;
    } else if (arg == "--copy-only") {
      copy_only = true;
    } else if (arg == "--no-copy-concat") {
      no_copy = true;
    } else if (arg == "--no-verify") {
      options.verify = false;
    } else if (arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "--info") {
      info = true;
    } else {
      throw UsageError(fmt::format("Unknown argument: {}", arg));
    }
  }

  int modes = (pair.empty() ? 0 : 1) + (video.empty() ? 0 : 1) + (info ? 1 : 0);
  if (modes > 1)
    throw UsageError("--pair, -v/--video and --info are mutually exclusive");
  if (info) {
    cmd.mode = CliMode::Info;
    return cmd;
  }
  if (modes == 0) {
    if (!thumb.empty())
      throw UsageError("-t/--thumb requires -v/--video");
    cmd.mode = CliMode::Help;
    return cmd;
  }

  if (!video.empty() && thumb.empty())
    throw UsageError("When using -v/--video you must also pass -t/--thumb");
  if (!pair.empty() && !thumb.empty())
    throw UsageError("-t/--thumb cannot be combined with --pair");
  if (in_place && !out.empty())
    throw UsageError("--out and --inplace are mutually exclusive");
  if (copy_only && no_copy)
    throw UsageError("--copy-only and --no-copy-concat are mutually exclusive");
  if (options.tool_timeout < 0)
    throw UsageError("--timeout must not be negative");

  if (copy_only)
    options.policy = PathPolicy::CopyOnly;
  else if (no_copy)
    options.policy = PathPolicy::ReencodeOnly;

  cmd.mode = CliMode::Append;
  AppendRequest &req = cmd.request;
  if (!pair.empty()) {
    req.video = pair;
    req.image = infer_pair_image(pair);
  } else {
    req.video = video;
    req.image = thumb;
  }
  req.in_place = in_place;
  if (!in_place)
    req.output = out.empty() ? default_output_path(req.video) : out;
  return cmd;
}

void print_usage(std::FILE *out) {
  fmt::print(out,
             "Usage: stillcap --pair <video> [options]\n"
             "       stillcap -v <video> -t <image> [options]\n"
             "       stillcap --info\n"
             "\n"
             "Append a still image to the end of a video (default 0.3s) to "
             "aid thumbnail selection.\n"
             "\n"
             "Options:\n"
             "  --pair <video>          Image is inferred as <stem>.png\n"
             "  -v, --video <video>     Explicit video (use with -t)\n"
             "  -t, --thumb <image>     Explicit still image\n"
             "  -o, --out <path>        Output path (default: "
             "<stem>_thumb<ext>)\n"
             "  -d, --duration <sec>    Still duration (default: 0.3)\n"
             "  --crf <0..51>           Quality for re-encoded video "
             "(default: 18)\n"
             "  --preset <name>         x264/x265 preset (default: medium)\n"
             "  --audio-bitrate <rate>  Bitrate of encoded audio (default: "
             "192k)\n"
             "  --inplace               Atomically replace the source video\n"
             "  --copy-only             Fail unless stream copy is possible\n"
             "  --no-copy-concat        Always re-encode\n"
             "  --no-verify             Skip the output check\n"
             "  --timeout <sec>         Per-tool time limit (0 = none)\n"
             "  --verbose               Echo tool commands and timings\n"
             "  --info                  Show version and tool locations\n"
             "  -h, --help              Show this help\n"
             "\n"
             "Environment: STILLCAP_FFMPEG, STILLCAP_FFPROBE, "
             "STILLCAP_TOOL_TIMEOUT_SEC,\n"
             "             STILLCAP_THREADS, STILLCAP_PRESET, STILLCAP_TMPDIR, "
             "STILLCAP_VERIFY_SLACK_SEC\n");
}

} // namespace stillcap
