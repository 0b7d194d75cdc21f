#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace idemzip {

/**
 * @brief Unpacks one zip archive into a fresh directory through libarchive
 *
 * Relative paths and bytes are preserved. Timestamps are not: the tree is
 * normalized afterwards anyway. Permission bits are the archive's, masked
 * to 0777 and always readable and writable by the owner, independent of
 * umask.
 *
 * Every entry name is validated before anything is written. Extraction
 * then streams entry by entry with libarchive's secure-path checks on.
 *
 * Errors:
 *   ExtractionError  - unreadable or malformed archive, unsafe entry name
 *                      (absolute or escaping with ".."), names colliding
 *                      after normalization, a file entry that is also the
 *                      parent of another entry, device or fifo entries,
 *                      destination already present or not creatable
 *   FilesystemError - writing an extracted entry's data failed
 */
class Extractor {
public:
    /// @return Number of entries written (directories included)
    static size_t extract(const std::filesystem::path& archivePath, const std::filesystem::path& destination);

    /**
     * @brief Validate an entry name and map it below the destination
     * @throws ExtractionError if the name is absolute, empty or escapes with ".."
     */
    static std::filesystem::path safeRelativePath(const std::string& entryName);
};

}
