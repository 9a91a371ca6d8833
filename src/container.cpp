/**
 * @file container.cpp
 * @brief Container-extension rules implementation
 */

#include "stillcap/container.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace stillcap {

std::string container_extension(const std::string &path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

bool is_isobmff_container(const std::string &path) {
  std::string ext = container_extension(path);
  return ext == ".mp4" || ext == ".m4v" || ext == ".mov";
}

bool is_supported_container(const std::string &path) {
  return is_isobmff_container(path) || container_extension(path) == ".mkv";
}

bool same_container_family(const std::string &a, const std::string &b) {
  if (!is_supported_container(a) || !is_supported_container(b))
    return false;
  return is_isobmff_container(a) == is_isobmff_container(b);
}

} // namespace stillcap
