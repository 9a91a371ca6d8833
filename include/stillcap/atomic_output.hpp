/**
 * @file atomic_output.hpp
 * @brief Scoped work area and same-directory staged output
 *
 * @details The destination is only ever touched by one rename(2):
 *
 *          - ScopedTempDir holds every intermediate and removes itself on
 *            every exit path, exceptions included
 *
 *          - StagedOutput reserves `<stem>_tmp_XXXXXX<ext>` next to the
 *            destination so that the final rename never crosses a filesystem
 *
 * @note Concurrent runs against the same destination are not coordinated.
 */

#ifndef STILLCAP_ATOMIC_OUTPUT_HPP
#define STILLCAP_ATOMIC_OUTPUT_HPP

#include <string>

namespace stillcap {

/**
 * @class ScopedTempDir
 * @brief mkdtemp(3) directory removed recursively on destruction.
 */
class ScopedTempDir {
public:
  /**
   * @param root Parent directory, empty = system temp directory
   * @param prefix Directory name prefix
   * @throws Error if the directory cannot be created
   */
  explicit ScopedTempDir(const std::string &root = "",
                         const std::string &prefix = "stillcap_");
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir &operator=(const ScopedTempDir &) = delete;

  const std::string &path() const { return path_; }

  /// Path of a file inside the directory
  std::string file(const std::string &name) const;

private:
  std::string path_;
};

/**
 * @class StagedOutput
 * @brief Temporary sibling of a destination, renamed over it on commit.
 */
class StagedOutput {
public:
  /**
   * @param destination Final path; its directory must exist
   * @throws Error if the temporary file cannot be reserved
   */
  explicit StagedOutput(std::string destination);

  /// Unlinks the staged file unless commit() succeeded
  ~StagedOutput();

  StagedOutput(const StagedOutput &) = delete;
  StagedOutput &operator=(const StagedOutput &) = delete;

  const std::string &path() const { return staged_; }
  const std::string &destination() const { return destination_; }
  bool committed() const { return committed_; }

  /**
   * @brief Atomically replace the destination with the staged file.
   * @note An existing destination's permission bits are carried over.
   * @throws Error if the staged file is missing or the rename fails
   */
  void commit();

private:
  std::string destination_;
  std::string staged_;
  bool committed_ = false;
};

} // namespace stillcap

#endif // STILLCAP_ATOMIC_OUTPUT_HPP
