/**
 * @file atomic_output.cpp
 * @brief Scoped work area and staged output implementation
 */

#include "stillcap/atomic_output.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

#include "stillcap/errors.hpp"
#include "stillcap/logging.hpp"

namespace stillcap {

namespace fs = std::filesystem;

// **---- ScopedTempDir ----**

ScopedTempDir::ScopedTempDir(const std::string &root,
                             const std::string &prefix) {
  fs::path base = root.empty() ? fs::temp_directory_path() : fs::path(root);
  std::string templ = (base / (prefix + "XXXXXX")).string();

  std::vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');
  if (!mkdtemp(buf.data())) {
    throw Error(fmt::format("Failed to create work directory in {}: {}",
                            base.string(), std::strerror(errno)));
  }
  path_ = buf.data();
}

ScopedTempDir::~ScopedTempDir() {
  if (path_.empty())
    return;
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec)
    LOG_WARN("Could not remove work directory {}: {}", path_, ec.message());
}

std::string ScopedTempDir::file(const std::string &name) const {
  return (fs::path(path_) / name).string();
}

// **---- StagedOutput ----**

StagedOutput::StagedOutput(std::string destination)
    : destination_(std::move(destination)) {
  fs::path dest(destination_);
  fs::path dir = dest.parent_path();
  if (dir.empty())
    dir = ".";

  const std::string ext = dest.extension().string();
  std::string templ =
      (dir / (dest.stem().string() + "_tmp_XXXXXX" + ext)).string();

  std::vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');
  int fd = mkstemps(buf.data(), static_cast<int>(ext.size()));
  if (fd < 0) {
    throw Error(fmt::format("Failed to stage output in {}: {}", dir.string(),
                            std::strerror(errno)));
  }
  ::close(fd);
  staged_ = buf.data();
}

StagedOutput::~StagedOutput() {
  if (committed_ || staged_.empty())
    return;
  if (::unlink(staged_.c_str()) != 0 && errno != ENOENT)
    LOG_WARN("Could not remove staged file {}: {}", staged_,
             std::strerror(errno));
}

void StagedOutput::commit() {
  struct stat st;
  if (::stat(staged_.c_str(), &st) != 0 || st.st_size == 0)
    throw Error(fmt::format("Staged output missing or empty: {}", staged_));

  /// mkstemps creates 0600; match the destination or the umask default
  mode_t mode;
  struct stat dest_st;
  if (::stat(destination_.c_str(), &dest_st) == 0) {
    mode = dest_st.st_mode & 07777;
  } else {
    mode_t mask = ::umask(0);
    ::umask(mask);
    mode = 0666 & ~mask;
  }
  if (::chmod(staged_.c_str(), mode) != 0)
    LOG_WARN("Could not set permissions on {}: {}", staged_,
             std::strerror(errno));

  if (std::rename(staged_.c_str(), destination_.c_str()) != 0) {
    throw Error(fmt::format("Failed to replace {}: {}", destination_,
                            std::strerror(errno)));
  }
  committed_ = true;
}

} // namespace stillcap
