/**
 * @file container.hpp
 * @brief Container-extension rules
 *
 * @details Supported containers are the ISO base media family (.mp4, .m4v,
 *          .mov) and Matroska (.mkv). Source and output must belong to the
 *          same family so that stream copy never changes the muxer.
 */

#ifndef STILLCAP_CONTAINER_HPP
#define STILLCAP_CONTAINER_HPP

#include <string>

namespace stillcap {

/// Lower-cased extension including the dot (".mp4"), empty if none
std::string container_extension(const std::string &path);

/// .mp4 / .m4v / .mov / .mkv
bool is_supported_container(const std::string &path);

/// .mp4 / .m4v / .mov: faststart and track timescale apply
bool is_isobmff_container(const std::string &path);

/// Both paths are ISO BMFF, or both are Matroska
bool same_container_family(const std::string &a, const std::string &b);

} // namespace stillcap

#endif // STILLCAP_CONTAINER_HPP
