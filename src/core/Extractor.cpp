#include "core/Extractor.hpp"

#include <map>
#include <set>
#include <string>
#include <system_error>

#include "core/ArchiveHandle.hpp"
#include "core/Constants.hpp"
#include "core/Errors.hpp"
#include "core/ZipArchive.hpp"
#include "util/Logger.hpp"

#include <archive.h>
#include <archive_entry.h>

namespace fs = std::filesystem;

namespace idemzip {

namespace {

// Names are already checked, and rewritten to absolute paths below a
// canonical destination, so NOABSOLUTEPATHS cannot be applied here.
constexpr int kDiskOptions = ARCHIVE_EXTRACT_PERM |
                             ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                             ARCHIVE_EXTRACT_SECURE_SYMLINKS;

bool isSupportedType(uint32_t mode) {
    const uint32_t type = mode & Constants::MODE_TYPE_MASK;
    return type == 0 || type == Constants::MODE_DIR || type == Constants::MODE_SYMLINK ||
           type == (Constants::MODE_FILE & Constants::MODE_TYPE_MASK);
}

/**
 * First pass: read headers only and reject the archive before the
 * destination exists. Returns the number of entries.
 */
size_t validateEntries(const fs::path& archivePath) {
    ZipReader reader(archivePath);
    std::map<fs::path, std::string> targets;
    std::set<fs::path> nonDirectories;

    ZipEntry entry;
    while (reader.next(entry, false)) {
        fs::path rel = Extractor::safeRelativePath(entry.name);
        if (!isSupportedType(entry.mode)) {
            throw ExtractionError("unsupported entry type in " + archivePath.string() + ": " + entry.name);
        }
        if (!targets.emplace(rel, entry.name).second) {
            throw ExtractionError("entries collide after normalization: " + entry.name);
        }
        if (!entry.isDirectory) {
            nonDirectories.insert(rel);
        }
    }

    for (const auto& [rel, name] : targets) {
        for (fs::path parent = rel.parent_path(); !parent.empty(); parent = parent.parent_path()) {
            if (nonDirectories.count(parent)) {
                throw ExtractionError("entry " + name + " lies below non-directory entry " + targets.at(parent));
            }
        }
    }
    return targets.size();
}

void copyData(struct archive* in, struct archive* out, const fs::path& target) {
    const void* buff = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;
    int r;
    while ((r = archive_read_data_block(in, &buff, &size, &offset)) == ARCHIVE_OK) {
        if (archive_write_data_block(out, buff, size, offset) < ARCHIVE_OK) {
            throw FilesystemError("Failed to write " + target.string() + ": " + archiveErrorString(out));
        }
    }
    // A bad CRC is reported as ARCHIVE_WARN
    if (r != ARCHIVE_EOF) {
        throw ExtractionError(target.string() + ": " + archiveErrorString(in));
    }
}

}

fs::path Extractor::safeRelativePath(const std::string& entryName) {
    fs::path rel = fs::path(entryName).lexically_normal();
    if (rel.is_absolute() || rel.has_root_name() || rel.has_root_directory()) {
        throw ExtractionError("absolute entry path: " + entryName);
    }
    if (rel.empty() || rel == ".") {
        throw ExtractionError("empty entry path: " + entryName);
    }
    for (const auto& part : rel) {
        if (part == "..") {
            throw ExtractionError("entry path escapes destination: " + entryName);
        }
    }
    // "dir/" normalizes to "dir/" with an empty filename; drop it
    if (rel.filename().empty()) {
        rel = rel.parent_path();
    }
    return rel;
}

size_t Extractor::extract(const fs::path& archivePath, const fs::path& destination) {
    std::error_code ec;
    if (fs::exists(fs::symlink_status(destination, ec))) {
        throw ExtractionError("extraction destination already exists: " + destination.string());
    }

    const size_t expected = validateEntries(archivePath);

    fs::create_directories(destination, ec);
    if (ec) {
        throw ExtractionError("Failed to create extraction directory " + destination.string() + ": " + ec.message());
    }
    // The symlink check walks every component of the absolute target path
    const fs::path base = fs::canonical(destination, ec);
    if (ec) {
        throw ExtractionError("Failed to resolve extraction directory " + destination.string() + ": " + ec.message());
    }

    ArchiveReadHandle in = openZipFile(archivePath);
    ArchiveWriteHandle out(archive_write_disk_new());
    if (!out) {
        throw FilesystemError("libarchive: failed to allocate disk writer");
    }
    archive_write_disk_set_options(out.get(), kDiskOptions);

    size_t written = 0;
    struct archive_entry* ae = nullptr;
    int r;
    while ((r = archive_read_next_header(in.get(), &ae)) != ARCHIVE_EOF) {
        if (r < ARCHIVE_WARN) {
            throw ExtractionError(archivePath.string() + ": " + archiveErrorString(in.get()));
        }

        const char* name = archive_entry_pathname(ae);
        const fs::path target = base / safeRelativePath(name ? name : "");
        archive_entry_set_pathname(ae, target.c_str());

        const auto type = archive_entry_filetype(ae);
        const auto perm = archive_entry_perm(ae) & 0777;
        if (type == AE_IFDIR) {
            archive_entry_set_perm(ae, perm | 0700);
        } else if (type != AE_IFLNK) {
            archive_entry_set_perm(ae, perm | 0600);
        }

        if (archive_write_header(out.get(), ae) < ARCHIVE_OK) {
            throw ExtractionError("Failed to create " + target.string() + ": " + archiveErrorString(out.get()));
        }
        if (type != AE_IFDIR && type != AE_IFLNK) {
            copyData(in.get(), out.get(), target);
        }
        if (archive_write_finish_entry(out.get()) < ARCHIVE_OK) {
            throw FilesystemError("Failed to finish " + target.string() + ": " + archiveErrorString(out.get()));
        }
        ++written;
    }

    // Directory permissions are applied on close
    if (archive_write_close(out.get()) != ARCHIVE_OK) {
        throw FilesystemError("Failed to finish extraction into " + base.string() + ": " + archiveErrorString(out.get()));
    }
    if (written != expected) {
        throw ExtractionError(archivePath.string() + ": entry count changed during extraction");
    }

    Logger::instance().debug("Extracted " + std::to_string(written) + " entries from " +
                             archivePath.string() + " into " + base.string());
    return written;
}

}
