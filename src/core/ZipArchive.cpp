#include "core/ZipArchive.hpp"

#include <algorithm>
#include <climits>
#include <iomanip>
#include <sstream>

#include "core/Constants.hpp"
#include "core/Errors.hpp"
#include "util/Logger.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <zlib.h>

namespace fs = std::filesystem;

namespace idemzip {

namespace {

constexpr uint32_t kLocalFileHeaderSignature = 0x04034b50U;
constexpr uint32_t kCentralDirectoryHeaderSignature = 0x02014b50U;
constexpr uint32_t kEndOfCentralDirectorySignature = 0x06054b50U;

constexpr size_t kLocalFileHeaderSize = 30;
constexpr size_t kCentralDirectoryHeaderSize = 46;

constexpr uint16_t kVersionStored = 10;     // 1.0
constexpr uint16_t kVersionDeflated = 20;   // 2.0
constexpr uint16_t kHostUnix = 3;
constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflated = 8;
constexpr uint16_t kFlagUtf8 = 0x0800;
constexpr uint32_t kDosDirectoryAttribute = 0x10;

constexpr uint64_t kZip32Limit = 0xFFFFFFFFULL;

void appendU16(std::string& out, uint16_t value) {
    out.push_back(static_cast<char>(value & 0xFFU));
    out.push_back(static_cast<char>((value >> 8) & 0xFFU));
}

void appendU32(std::string& out, uint32_t value) {
    out.push_back(static_cast<char>(value & 0xFFU));
    out.push_back(static_cast<char>((value >> 8) & 0xFFU));
    out.push_back(static_cast<char>((value >> 16) & 0xFFU));
    out.push_back(static_cast<char>((value >> 24) & 0xFFU));
}

/// Inverse of libarchive's DOS time decoding, which goes through mktime
void dosFromLocalTime(std::time_t seconds, uint16_t& dosDate, uint16_t& dosTime) {
    std::tm local{};
    if (localtime_r(&seconds, &local) == nullptr || local.tm_year < 80) {
        dosDate = static_cast<uint16_t>((1 << 5) | 1);
        dosTime = 0;
        return;
    }
    int years = std::min(local.tm_year - 80, 127);
    dosDate = static_cast<uint16_t>((years << 9) | ((local.tm_mon + 1) << 5) | local.tm_mday);
    dosTime = static_cast<uint16_t>((local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2));
}

uint16_t methodFromFormatName(const char* formatName) {
    const std::string name = formatName ? formatName : "";
    if (name.find("(uncompressed)") != std::string::npos) return kMethodStored;
    if (name.find("(deflation)") != std::string::npos) return kMethodDeflated;
    return ZipEntry::kMethodUnknown;
}

bool hasNonAscii(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char c) { return static_cast<unsigned char>(c) >= 0x80; });
}

}

bool ZipEntry::isSymlink() const {
    return (mode & Constants::MODE_TYPE_MASK) == Constants::MODE_SYMLINK;
}

uint32_t crc32Of(const std::string& data, uint32_t seed) {
    uLong crc = seed;
    const auto* p = reinterpret_cast<const Bytef*>(data.data());
    size_t remaining = data.size();
    while (remaining > 0) {
        uInt chunk = static_cast<uInt>(std::min<size_t>(remaining, UINT_MAX));
        crc = ::crc32(crc, p, chunk);
        p += chunk;
        remaining -= chunk;
    }
    return static_cast<uint32_t>(crc);
}

std::string deflateRaw(const std::string& data, int level) {
    if (data.size() > kZip32Limit) {
        throw CompressionError("input too large for zip32 deflate");
    }

    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    // Negative window bits: raw deflate, as zip stores it
    if (deflateInit2(&stream, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw CompressionError("zlib deflateInit2 failed");
    }

    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));

    std::string compressed;
    std::vector<uint8_t> buffer(Constants::IO_BUFFER_SIZE);

    int ret;
    do {
        stream.avail_out = static_cast<uInt>(buffer.size());
        stream.next_out = buffer.data();

        ret = deflate(&stream, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&stream);
            throw CompressionError("zlib deflate failed");
        }

        size_t have = buffer.size() - stream.avail_out;
        compressed.append(reinterpret_cast<char*>(buffer.data()), have);
    } while (ret != Z_STREAM_END);

    deflateEnd(&stream);
    return compressed;
}

void toDosDateTime(std::time_t seconds, uint16_t& dosDate, uint16_t& dosTime) {
    std::tm utc{};
    if (gmtime_r(&seconds, &utc) == nullptr || utc.tm_year < 80) {
        dosDate = static_cast<uint16_t>((1 << 5) | 1);  // 1980-01-01
        dosTime = 0;
        return;
    }
    int years = std::min(utc.tm_year - 80, 127);
    dosDate = static_cast<uint16_t>((years << 9) | ((utc.tm_mon + 1) << 5) | utc.tm_mday);
    dosTime = static_cast<uint16_t>((utc.tm_hour << 11) | (utc.tm_min << 5) | (utc.tm_sec / 2));
}

std::string formatDosDateTime(uint16_t dosDate, uint16_t dosTime) {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (((dosDate >> 9) & 0x7F) + 1980) << '-'
        << std::setw(2) << ((dosDate >> 5) & 0x0F) << '-'
        << std::setw(2) << (dosDate & 0x1F) << ' '
        << std::setw(2) << ((dosTime >> 11) & 0x1F) << ':'
        << std::setw(2) << ((dosTime >> 5) & 0x3F) << ':'
        << std::setw(2) << ((dosTime & 0x1F) * 2);
    return oss.str();
}

ZipReader::ZipReader(const fs::path& archivePath)
    : handle(openZipFile(archivePath)), label(archivePath.string()) {}

ZipReader::ZipReader(const std::string& bytes, const std::string& label)
    : handle(openZipMemory(bytes, label)), label(label) {}

bool ZipReader::next(ZipEntry& entry, bool withContent) {
    struct archive* a = handle.get();
    struct archive_entry* ae = nullptr;

    int r = archive_read_next_header(a, &ae);
    if (r == ARCHIVE_EOF) {
        return false;
    }
    if (r == ARCHIVE_WARN) {
        Logger::instance().warn(label + ": " + archiveErrorString(a));
    } else if (r != ARCHIVE_OK) {
        throw ExtractionError(label + ": " + archiveErrorString(a));
    }

    entry = ZipEntry();
    const char* name = archive_entry_pathname(ae);
    entry.name = name ? name : "";
    if (entry.name.empty()) {
        throw ExtractionError(label + ": entry with empty name");
    }
    if (!seen.insert(entry.name).second) {
        throw ExtractionError(label + ": duplicate entry " + entry.name);
    }
    if (archive_entry_is_encrypted(ae)) {
        throw ExtractionError(label + ": encrypted entry " + entry.name);
    }

    entry.mode = static_cast<uint32_t>(archive_entry_mode(ae));
    entry.isDirectory = archive_entry_filetype(ae) == AE_IFDIR;
    entry.method = methodFromFormatName(archive_format_name(a));
    dosFromLocalTime(archive_entry_mtime(ae), entry.dosDate, entry.dosTime);

    if (!withContent) {
        if (archive_read_data_skip(a) != ARCHIVE_OK) {
            throw ExtractionError(label + ": " + entry.name + ": " + archiveErrorString(a));
        }
        return true;
    }

    if (entry.isSymlink()) {
        const char* target = archive_entry_symlink(ae);
        entry.content = target ? target : "";
    } else if (!entry.isDirectory) {
        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        // Anything but ARCHIVE_OK is fatal here: a bad CRC comes back as ARCHIVE_WARN
        while ((r = archive_read_data_block(a, &buff, &size, &offset)) == ARCHIVE_OK) {
            if (static_cast<uint64_t>(offset) > entry.content.size()) {
                entry.content.resize(static_cast<size_t>(offset));
            }
            entry.content.append(static_cast<const char*>(buff), size);
        }
        if (r != ARCHIVE_EOF) {
            throw ExtractionError(label + ": " + entry.name + ": " + archiveErrorString(a));
        }
    }
    entry.crc32 = crc32Of(entry.content);
    return true;
}

std::vector<ZipEntry> ZipReader::readAll(const fs::path& archivePath) {
    ZipReader reader(archivePath);
    std::vector<ZipEntry> entries;
    ZipEntry entry;
    while (reader.next(entry)) {
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<ZipEntry> ZipReader::parse(const std::string& bytes, const std::string& label) {
    ZipReader reader(bytes, label);
    std::vector<ZipEntry> entries;
    ZipEntry entry;
    while (reader.next(entry)) {
        entries.push_back(std::move(entry));
    }
    return entries;
}

ZipWriter::ZipWriter(const fs::path& outPath, int level) : path(outPath), level(level) {
    out.open(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw FilesystemError("failed to open archive for writing: " + path.string());
    }
}

ZipWriter::~ZipWriter() {
    if (!finished && out.is_open()) {
        out.close();
    }
}

void ZipWriter::writeBytes(const std::string& bytes) {
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw FilesystemError("failed while writing " + path.string());
    }
    offset += bytes.size();
}

void ZipWriter::addEntry(const ZipEntry& entry) {
    if (finished) {
        throw CompressionError("archive already finished: " + path.string());
    }

    Record rec;
    rec.name = entry.name;
    if (entry.isDirectory && (rec.name.empty() || rec.name.back() != '/')) {
        rec.name += '/';
    }
    if (rec.name.empty() || rec.name.size() > 0xFFFF) {
        throw CompressionError("invalid entry name length: " + rec.name);
    }
    if (entry.content.size() >= kZip32Limit) {
        throw CompressionError("entry too large for zip32: " + rec.name);
    }
    if (offset > kZip32Limit) {
        throw CompressionError("archive too large for zip32: " + path.string());
    }

    std::string payload = entry.isDirectory ? std::string() : entry.content;
    rec.crc = crc32Of(payload);
    rec.uncompressedSize = static_cast<uint32_t>(payload.size());
    rec.method = kMethodStored;
    // Link targets are always stored; readers expect them uncompressed
    if (level != 0 && !payload.empty() && !entry.isSymlink()) {
        std::string deflated = deflateRaw(payload, level);
        if (deflated.size() < payload.size()) {
            rec.method = kMethodDeflated;
            payload = std::move(deflated);
        }
    }
    rec.compressedSize = static_cast<uint32_t>(payload.size());
    rec.versionMadeBy = entry.mode != 0 ? static_cast<uint16_t>((kHostUnix << 8) | kVersionDeflated)
                                        : kVersionDeflated;
    rec.flags = hasNonAscii(rec.name) ? kFlagUtf8 : 0;
    rec.dosTime = entry.dosTime;
    rec.dosDate = entry.dosDate;
    rec.externalAttributes = (entry.mode << 16) | (entry.isDirectory ? kDosDirectoryAttribute : 0);
    rec.localHeaderOffset = static_cast<uint32_t>(offset);

    std::string header;
    header.reserve(kLocalFileHeaderSize + rec.name.size());
    appendU32(header, kLocalFileHeaderSignature);
    appendU16(header, rec.method == kMethodDeflated ? kVersionDeflated : kVersionStored);
    appendU16(header, rec.flags);
    appendU16(header, rec.method);
    appendU16(header, rec.dosTime);
    appendU16(header, rec.dosDate);
    appendU32(header, rec.crc);
    appendU32(header, rec.compressedSize);
    appendU32(header, rec.uncompressedSize);
    appendU16(header, static_cast<uint16_t>(rec.name.size()));
    appendU16(header, 0);  // extra field length
    header += rec.name;

    writeBytes(header);
    writeBytes(payload);
    records.push_back(std::move(rec));
}

void ZipWriter::finish() {
    if (finished) return;
    if (records.size() > 0xFFFE) {
        throw CompressionError("too many entries for zip32: " + path.string());
    }
    if (offset > kZip32Limit) {
        throw CompressionError("archive too large for zip32: " + path.string());
    }

    const uint64_t centralDirOffset = offset;
    for (const auto& rec : records) {
        std::string header;
        header.reserve(kCentralDirectoryHeaderSize + rec.name.size());
        appendU32(header, kCentralDirectoryHeaderSignature);
        appendU16(header, rec.versionMadeBy);
        appendU16(header, rec.method == kMethodDeflated ? kVersionDeflated : kVersionStored);
        appendU16(header, rec.flags);
        appendU16(header, rec.method);
        appendU16(header, rec.dosTime);
        appendU16(header, rec.dosDate);
        appendU32(header, rec.crc);
        appendU32(header, rec.compressedSize);
        appendU32(header, rec.uncompressedSize);
        appendU16(header, static_cast<uint16_t>(rec.name.size()));
        appendU16(header, 0);  // extra field length
        appendU16(header, 0);  // file comment length
        appendU16(header, 0);  // disk number start
        appendU16(header, 0);  // internal file attributes
        appendU32(header, rec.externalAttributes);
        appendU32(header, rec.localHeaderOffset);
        header += rec.name;
        writeBytes(header);
    }

    const uint64_t centralDirSize = offset - centralDirOffset;
    if (offset > kZip32Limit) {
        throw CompressionError("central directory too large for zip32: " + path.string());
    }

    std::string end;
    appendU32(end, kEndOfCentralDirectorySignature);
    appendU16(end, 0);  // number of this disk
    appendU16(end, 0);  // disk with the central directory
    appendU16(end, static_cast<uint16_t>(records.size()));
    appendU16(end, static_cast<uint16_t>(records.size()));
    appendU32(end, static_cast<uint32_t>(centralDirSize));
    appendU32(end, static_cast<uint32_t>(centralDirOffset));
    appendU16(end, 0);  // comment length
    writeBytes(end);

    out.flush();
    out.close();
    if (out.fail()) {
        throw FilesystemError("failed to finalize archive: " + path.string());
    }
    finished = true;
}

}
