#pragma once

#include <filesystem>
#include <memory>
#include <string>

struct archive;

namespace idemzip {

/**
 * @brief RAII ownership of libarchive handles
 *
 * Readers are zip-only and use the seekable zip reader, which works from
 * the central directory. Archives without one are rejected instead of
 * being read front to back.
 */
struct ArchiveReadDeleter {
    void operator()(struct archive* a) const;
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const;
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

/// Open a zip archive on disk. Throws ExtractionError.
ArchiveReadHandle openZipFile(const std::filesystem::path& archivePath);

/// Open a zip archive held in memory; bytes must outlive the handle. Throws ExtractionError.
ArchiveReadHandle openZipMemory(const std::string& bytes, const std::string& label);

/// Last error message recorded on a handle
std::string archiveErrorString(struct archive* a);

}
