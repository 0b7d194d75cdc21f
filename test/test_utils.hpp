#pragma once

#include <ctime>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "core/ZipArchive.hpp"

namespace idemzip::test {

/**
 * @brief Test utilities for idemzip tests
 *
 * Provides helpers for temporary directories, test files and hand-built
 * zip archives with arbitrary order, timestamps and attributes.
 */
namespace utils {

/**
 * @brief Create a temporary directory for testing
 * @return Path to temporary directory
 */
std::filesystem::path createTempDir();

/**
 * @brief Remove a directory and all its contents
 * @param dir Directory to remove
 */
void removeDir(const std::filesystem::path& dir);

/**
 * @brief Create a file with content in the given directory
 * @param baseDir Base directory
 * @param filename File name (may contain subdirectories)
 * @param content File content, written in binary mode
 * @return Full path to created file
 */
std::filesystem::path createFile(
    const std::filesystem::path& baseDir,
    const std::string& filename,
    const std::string& content = ""
);

/**
 * @brief Create multiple files in a directory
 * @param baseDir Base directory
 * @param files Vector of filename-content pairs
 */
void createFiles(
    const std::filesystem::path& baseDir,
    const std::vector<std::pair<std::string, std::string>>& files
);

/**
 * @brief Read file content (binary)
 * @param filePath Path to file
 * @return File content as string
 */
std::string readFile(const std::filesystem::path& filePath);

/// Set atime and mtime of a path (not following symlinks)
void setMtime(const std::filesystem::path& path, std::time_t seconds);

/// Modification time of a path in seconds (not following symlinks)
std::time_t getMtime(const std::filesystem::path& path);

/// Permission and type bits of a path (lstat st_mode)
unsigned getMode(const std::filesystem::path& path);

/**
 * @brief Regular file entry for makeZip
 * @param mtime Converted to the entry's DOS date/time
 * @param mode 0 writes an entry without Unix attributes
 */
ZipEntry fileEntry(const std::string& name, const std::string& content,
                   std::time_t mtime = 1700000000, uint32_t mode = 0100644);

/// Directory entry ("name/") for makeZip
ZipEntry dirEntry(const std::string& name, std::time_t mtime = 1700000000);

/**
 * @brief Write an archive with entries exactly in the given order
 * @param level 0 stores every entry
 * @return archivePath
 */
std::filesystem::path makeZip(
    const std::filesystem::path& archivePath,
    const std::vector<ZipEntry>& entries,
    int level = 6
);

/**
 * @brief Get current working directory
 * @return Current working directory path
 */
std::filesystem::path getCwd();

/**
 * @brief Set working directory
 * @param dir Directory to change to
 */
void setCwd(const std::filesystem::path& dir);

} // namespace utils

} // namespace idemzip::test
