/**
 * @file errors.cpp
 * @brief Message formatting for ToolExecutionError
 */

#include "stillcap/errors.hpp"

#include <fmt/core.h>

namespace stillcap {

namespace {

std::string describe_failure(const std::string &command, int exit_code,
                             const std::string &diagnostics) {
  std::string msg =
      (exit_code >= 0)
          ? fmt::format("Command failed ({}): {}", exit_code, command)
          : fmt::format("Command failed: {}", command);
  if (!diagnostics.empty())
    msg += fmt::format("\nSTDERR:\n{}", diagnostics);
  return msg;
}

} // anonymous namespace

ToolExecutionError::ToolExecutionError(std::string command, int exit_code,
                                       std::string diagnostics)
    : Error(describe_failure(command, exit_code, diagnostics)),
      command_(std::move(command)), exit_code_(exit_code),
      diagnostics_(std::move(diagnostics)) {}

} // namespace stillcap
