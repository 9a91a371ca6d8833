/**
 * @file errors.hpp
 * @brief Exception hierarchy for append failures
 *
 * @details Every failure of an append run surfaces as one of these types and
 *          reaches main() unmodified:
 *
 *          - ProbeError: missing file, missing stream, malformed probe output
 *
 *          - UnsupportedCodecError: codec cannot be reproduced for stream copy
 *
 *          - ToolExecutionError: external tool failed, could not start or
 *            timed out
 *
 *          - ValidationError: bad parameters or a staged output that does not
 *            match the source
 *
 *          - CancelledError: the run was interrupted by a signal
 */

#ifndef STILLCAP_ERRORS_HPP
#define STILLCAP_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace stillcap {

/// Common base so callers can catch every append failure at once
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ProbeError : public Error {
public:
  using Error::Error;
};

class ValidationError : public Error {
public:
  using Error::Error;
};

class CancelledError : public Error {
public:
  CancelledError() : Error("Interrupted by signal") {}
};

/**
 * @class UnsupportedCodecError
 * @brief Source codec outside the reproducible set.
 * @note Fatal for the fast path: a still encoded with a different codec would
 *       corrupt the stream-copy concatenation without detection.
 */
class UnsupportedCodecError : public Error {
public:
  UnsupportedCodecError(std::string codec, const std::string &message)
      : Error(message), codec_(std::move(codec)) {}

  const std::string &codec() const { return codec_; }

private:
  std::string codec_;
};

/**
 * @class ToolExecutionError
 * @brief An external tool exited non-zero, failed to launch or timed out.
 * @note Carries the quoted command line, exit code (-1 when the process never
 *       produced one) and the captured diagnostic stream.
 */
class ToolExecutionError : public Error {
public:
  ToolExecutionError(std::string command, int exit_code,
                     std::string diagnostics);

  const std::string &command() const { return command_; }
  int exit_code() const { return exit_code_; }
  const std::string &diagnostics() const { return diagnostics_; }

private:
  std::string command_;
  int exit_code_;
  std::string diagnostics_;
};

} // namespace stillcap

#endif // STILLCAP_ERRORS_HPP
