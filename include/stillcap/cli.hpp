/**
 * @file cli.hpp
 * @brief Command-line parsing
 *
 * @details Three modes, mutually exclusive:
 *
 *          - --pair <video>: image inferred as <stem>.png beside the video
 *
 *          - -v <video> -t <image>: explicit pair
 *
 *          - --info: version and tool locations
 *
 *          Flags override the AppendOptions seeded from the environment.
 */

#ifndef STILLCAP_CLI_HPP
#define STILLCAP_CLI_HPP

#include <cstdio>
#include <string>
#include <vector>

#include "appender.hpp"
#include "config.hpp"
#include "errors.hpp"

namespace stillcap {

/// Malformed or contradictory command line (exit code 2)
class UsageError : public Error {
public:
  using Error::Error;
};

enum class CliMode { Help, Info, Append };

/**
 * @struct CliCommand
 * @brief Parsed command line.
 */
struct CliCommand {
  CliMode mode = CliMode::Help;
  AppendRequest request;
};

/**
 * @brief Parse arguments (without the program name).
 * @param args Arguments after argv[0]
 * @param options Seeded options, updated in place by flags
 * @throws UsageError on unknown flags, missing values or conflicts
 */
CliCommand parse_command_line(const std::vector<std::string> &args,
                              AppendOptions &options);

/// <stem>.png next to the video
std::string infer_pair_image(const std::string &video);

/// <dir>/<stem>_thumb<ext>
std::string default_output_path(const std::string &video);

/// Print the usage text
void print_usage(std::FILE *out);

} // namespace stillcap

#endif // STILLCAP_CLI_HPP
