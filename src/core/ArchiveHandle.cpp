#include "core/ArchiveHandle.hpp"

#include <archive.h>

#include "core/Constants.hpp"
#include "core/Errors.hpp"

namespace fs = std::filesystem;

namespace idemzip {

namespace {

ArchiveReadHandle newZipReader() {
    ArchiveReadHandle a(archive_read_new());
    if (!a) {
        throw ExtractionError("libarchive: failed to allocate reader");
    }
    if (archive_read_support_format_zip_seekable(a.get()) != ARCHIVE_OK) {
        throw ExtractionError("libarchive: zip support unavailable: " + archiveErrorString(a.get()));
    }
    return a;
}

}

void ArchiveReadDeleter::operator()(struct archive* a) const {
    if (a) {
        archive_read_close(a);
        archive_read_free(a);
    }
}

void ArchiveWriteDeleter::operator()(struct archive* a) const {
    if (a) {
        archive_write_close(a);
        archive_write_free(a);
    }
}

std::string archiveErrorString(struct archive* a) {
    const char* msg = a ? archive_error_string(a) : nullptr;
    return msg ? msg : "unknown libarchive error";
}

ArchiveReadHandle openZipFile(const fs::path& archivePath) {
    ArchiveReadHandle a = newZipReader();
    if (archive_read_open_filename(a.get(), archivePath.c_str(), Constants::IO_BUFFER_SIZE) != ARCHIVE_OK) {
        throw ExtractionError(archivePath.string() + ": " + archiveErrorString(a.get()));
    }
    return a;
}

ArchiveReadHandle openZipMemory(const std::string& bytes, const std::string& label) {
    ArchiveReadHandle a = newZipReader();
    if (archive_read_open_memory(a.get(), bytes.data(), bytes.size()) != ARCHIVE_OK) {
        throw ExtractionError(label + ": " + archiveErrorString(a.get()));
    }
    return a;
}

}
