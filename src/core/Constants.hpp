#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>

/**
 * @brief Build-time constants for the repackaging engine
 *
 * Nothing here is runtime-configurable: changing any value changes the
 * bytes of every rebuilt archive.
 */
namespace idemzip {

namespace Constants {
    // 1990-02-01T00:00:00Z; every extracted file gets this atime and mtime
    constexpr std::time_t NORMALIZED_EPOCH_SECONDS = 633830400;

    // Layout of a packaged service
    constexpr const char* PACKAGE_DIR_NAME = ".serverless";  // Build output holding the archives
    constexpr const char* SCRATCH_DIR_NAME = ".repack";      // Per-run working root
    constexpr const char* ARCHIVE_EXTENSION = ".zip";
    constexpr const char* STAGING_SUFFIX = ".new";           // <name>.zip.new
    constexpr const char* SWAP_TEMP_SUFFIX = ".idemzip-swap";
    constexpr const char* DEFAULT_DISCOVERY_PATTERN = "**/*.zip";

    // Rebuild parameters
    constexpr int DEFAULT_DEFLATE_LEVEL = 6;   // zip's own default level
    constexpr size_t IO_BUFFER_SIZE = 64 * 1024;

    // File modes (octal)
    constexpr uint32_t MODE_TYPE_MASK = 0170000;
    constexpr uint32_t MODE_FILE = 0100644;       // Regular file (-rw-r--r--)
    constexpr uint32_t MODE_EXECUTABLE = 0100755; // Executable file (-rwxr-xr-x)
    constexpr uint32_t MODE_DIR = 0040000;        // Directory
    constexpr uint32_t MODE_SYMLINK = 0120000;    // Symbolic link
    constexpr uint32_t MODE_PERMISSION_MASK = 07777;
}
}
