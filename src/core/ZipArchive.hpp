#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>

#include "core/ArchiveHandle.hpp"

namespace idemzip {

/**
 * @brief One record of a zip archive
 *
 * Names use '/' separators; directory entries end with '/'.
 * For symlinks the content is the link target.
 *
 * Zip record layout written by ZipWriter (all little-endian):
 *   local header     : "PK\3\4" ... name, data
 *   central directory: "PK\1\2" ... name
 *   end record       : "PK\5\6" entry count, directory size and offset
 */
struct ZipEntry {
    std::string name;
    std::string content;
    uint32_t mode{0};            // st_mode style (0100644); 0 means "no Unix attributes" to the writer
    bool isDirectory{false};
    uint16_t dosTime{0};
    uint16_t dosDate{0};
    uint16_t method{0};          // 0 = stored, 8 = deflated, kMethodUnknown otherwise
    uint32_t crc32{0};

    static constexpr uint16_t kMethodUnknown = 0xFFFF;

    bool isSymlink() const;
};

/**
 * @brief Streams the entries of a zip archive through libarchive
 *
 * One entry is held in memory at a time. Every structural problem is
 * reported as ExtractionError: unrecognized or truncated archives, bad
 * CRCs, encrypted entries, unsupported methods and duplicate names.
 * Modes for entries without Unix attributes are the ones libarchive
 * derives from the DOS attributes.
 */
class ZipReader {
public:
    explicit ZipReader(const std::filesystem::path& archivePath);

    /// Read an archive held in memory; bytes must outlive the reader
    ZipReader(const std::string& bytes, const std::string& label);

    /**
     * @brief Advance to the next entry
     * @param withContent false skips the data (content stays empty, crc32 is 0)
     * @return false once the archive is exhausted
     */
    bool next(ZipEntry& entry, bool withContent = true);

    /// Read and decompress every entry, in archive order
    static std::vector<ZipEntry> readAll(const std::filesystem::path& archivePath);

    /// Same as readAll for an archive held in memory
    static std::vector<ZipEntry> parse(const std::string& bytes, const std::string& label);

private:
    ArchiveReadHandle handle;
    std::string label;
    std::set<std::string> seen;
};

/**
 * @brief Streams a zip archive to disk
 *
 * Output depends only on the entries added, their order and the level:
 * no extra fields, no comments, no data descriptors. Entries whose
 * deflated form is not smaller than the content are stored, as are symlink
 * targets. A level of 0 stores everything.
 *
 * Throws CompressionError on zlib failures and zip32 limits, and
 * FilesystemError when the output file cannot be opened or written.
 */
class ZipWriter {
public:
    ZipWriter(const std::filesystem::path& outPath, int level);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /// Append one entry (name, content, mode, isDirectory, dosTime, dosDate are used)
    void addEntry(const ZipEntry& entry);

    /// Write central directory and end record, then flush and close
    void finish();

    size_t entryCount() const { return records.size(); }

private:
    struct Record {
        std::string name;
        uint16_t versionMadeBy{0};
        uint16_t flags{0};
        uint16_t method{0};
        uint16_t dosTime{0};
        uint16_t dosDate{0};
        uint32_t crc{0};
        uint32_t compressedSize{0};
        uint32_t uncompressedSize{0};
        uint32_t externalAttributes{0};
        uint32_t localHeaderOffset{0};
    };

    std::filesystem::path path;
    std::ofstream out;
    int level;
    bool finished{false};
    uint64_t offset{0};
    std::vector<Record> records;

    void writeBytes(const std::string& bytes);
};

/// Raw deflate (no zlib header) with fixed window and memory parameters
std::string deflateRaw(const std::string& data, int level);

/// zlib CRC-32 of a buffer, continuing from seed
uint32_t crc32Of(const std::string& data, uint32_t seed = 0);

/// Convert a Unix time to MS-DOS date/time in UTC (clamped to 1980-01-01)
void toDosDateTime(std::time_t seconds, uint16_t& dosDate, uint16_t& dosTime);

/// Format a DOS date/time as "YYYY-MM-DD HH:MM:SS"
std::string formatDosDateTime(uint16_t dosDate, uint16_t dosTime);

}
