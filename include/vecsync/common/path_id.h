#ifndef VECSYNC_COMMON_PATH_ID_H_
#define VECSYNC_COMMON_PATH_ID_H_

#include <filesystem>
#include <string>

#include "vecsync/core/types.h"

namespace vecsync {
namespace common {

/**
 * @brief Absolute, lexically normal path with symlinks in the existing
 * prefix resolved. Works for paths that no longer exist, so a deleted file
 * maps to the same string it had while present.
 */
std::string canonical_path(const std::filesystem::path& path);

/**
 * @brief Identifier of a file: SHA-256 of its canonical path, first eight
 * digest bytes big-endian, masked to 63 bits.
 *
 * Pure and stable across restarts. Distinct paths with equal ids are
 * treated as the same file.
 */
core::RecordID path_id(const std::string& canonical);

// canonical_path() followed by path_id().
core::RecordID path_id_for(const std::filesystem::path& path);

// Lower case extension including the dot, "" if none.
std::string lower_extension(const std::filesystem::path& path);

} // namespace common
} // namespace vecsync

#endif // VECSYNC_COMMON_PATH_ID_H_
