/**
 * @file utils.hpp
 * @brief Formatting helpers for the treetool command line
 *
 * Key utilities:
 * - formatSavedSize: coarse human-readable byte count for the size command
 *
 * @see formatSavedSize()
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <string>

/**
 * @brief Formats a byte count with a whole-number unit
 *
 * Picks the largest binary unit the value exceeds and truncates towards
 * zero, so the result never overstates the amount.
 *
 * Formatting rules:
 * - > 1 GiB: Returns "X GB"
 * - > 1 MiB: Returns "X MB"
 * - > 1 KiB: Returns "X KB"
 * - otherwise: Returns "X Bytes"
 *
 * @param bytes The number of bytes to format
 *
 * Example outputs:
 * - formatSavedSize(0) → "0 Bytes"
 * - formatSavedSize(1024) → "1024 Bytes"
 * - formatSavedSize(1536) → "1 KB"
 * - formatSavedSize(5 * 1048576 + 1) → "5 MB"
 */
inline std::string formatSavedSize(std::uint64_t bytes) {
  if (bytes > (1024ULL * 1024 * 1024))
    return std::to_string(bytes >> 30) + " GB";
  if (bytes > (1024ULL * 1024))
    return std::to_string(bytes >> 20) + " MB";
  if (bytes > 1024ULL)
    return std::to_string(bytes >> 10) + " KB";
  return std::to_string(bytes) + " Bytes";
}

#endif // UTILS_HPP
