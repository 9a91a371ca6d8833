/**
 * @file main.cpp
 * @brief Entry point for stillcap
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - --info: version, tool locations and libav versions
 *
 *          - Append mode: one ThumbnailAppender run
 *
 * @note Exit codes: 0 success, 1 failure, 2 usage error, 130 interrupted.
 *       Environment variables seed the options, flags override them.
 */

#include <cstdio>
#include <exception>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "stillcap/appender.hpp"
#include "stillcap/cli.hpp"
#include "stillcap/config.hpp"
#include "stillcap/errors.hpp"
#include "stillcap/logging.hpp"
#include "stillcap/process_runner.hpp"
#include "stillcap/system.hpp"
#include "stillcap/verify.hpp"

#ifndef STILLCAP_VERSION
#define STILLCAP_VERSION "0.0.0"
#endif

using namespace stillcap;

namespace {

void show_info(const AppendOptions &options) {
  auto ffmpeg = find_executable(options.tools.ffmpeg);
  auto ffprobe = find_executable(options.tools.ffprobe);

  LOG_INFO("Version: {}",
           Config::get_env_string("STILLCAP_CLI_VERSION", STILLCAP_VERSION));
  LOG_INFO("ffmpeg: {}", ffmpeg ? *ffmpeg : std::string("not on PATH"));
  LOG_INFO("ffprobe: {}", ffprobe ? *ffprobe : std::string("not on PATH"));
  LOG_INFO("Linked: {}", libav_versions());
  LOG_INFO("CPU limit: {}", detect_cpu_limit());
}

/// Fail early with one line when a tool is missing
void require_tool(const std::string &tool) {
  if (!find_executable(tool))
    throw Error(fmt::format("{} not found on PATH", tool));
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  install_cancellation_handlers();

  try {
    AppendOptions options = options_from_environment();
    std::vector<std::string> args(argv + 1, argv + argc);
    CliCommand cmd = parse_command_line(args, options);

    switch (cmd.mode) {
    case CliMode::Help:
      print_usage(stdout);
      return 0;
    case CliMode::Info:
      show_info(options);
      return 0;
    case CliMode::Append:
      break;
    }

    require_tool(options.tools.ffprobe);
    require_tool(options.tools.ffmpeg);

    ProcessRunner runner(options.tool_timeout, options.verbose);
    ThumbnailAppender appender(options, runner);
    AppendReport report = appender.run(cmd.request);

    if (cmd.request.in_place) {
      LOG_SUCCESS("Updated in place: {}", report.output);
    } else {
      LOG_SUCCESS("Done: {}", report.output);
    }
    print_append_summary(report);
    return 0;

  } catch (const CancelledError &e) {
    LOG_ERROR("{}", e.what());
    return 130;
  } catch (const UsageError &e) {
    LOG_ERROR("{}", e.what());
    print_usage(stderr);
    return 2;
  } catch (const std::exception &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }
}
