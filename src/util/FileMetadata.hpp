#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>

#include "util/Expected.hpp"

namespace idemzip {

/**
 * @brief Filesystem metadata that can leak into a rebuilt archive
 *
 * Read with lstat semantics: a symlink describes itself, not its target.
 */
struct FileMetadata {
    uint64_t sizeBytes{0};   // File size in bytes (link text length for symlinks)
    int64_t mtimeSec{0};     // Last modification time, seconds since the Unix epoch
    int64_t atimeSec{0};     // Last access time, seconds since the Unix epoch
    uint32_t mode{0};        // Full st_mode: type bits | permission bits (e.g. 0100644)
    bool isSymlink{false};
    bool isDirectory{false};
};

/**
 * @brief Read metadata for a path without following symlinks
 * @return Metadata, or IoError if the path cannot be stat'ed
 */
Expected<FileMetadata> getFileMetadata(const std::filesystem::path& filePath);

/**
 * @brief Set access and modification time of a path to one instant
 *
 * Applies to the symlink itself when the path is a symlink.
 * @return IoError with the OS message on failure
 */
Expected<void> setFileTimes(const std::filesystem::path& filePath, std::time_t seconds);

}
