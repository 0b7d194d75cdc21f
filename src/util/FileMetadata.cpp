#include "util/FileMetadata.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>

namespace idemzip {

Expected<FileMetadata> getFileMetadata(const std::filesystem::path& filePath) {
    struct stat st {};
    if (::lstat(filePath.c_str(), &st) != 0) {
        return Error{ErrorCode::IoError, "stat failed for " + filePath.string() + ": " + std::strerror(errno)};
    }

    FileMetadata metadata;
    metadata.sizeBytes = static_cast<uint64_t>(st.st_size);
    metadata.mtimeSec = static_cast<int64_t>(st.st_mtime);
    metadata.atimeSec = static_cast<int64_t>(st.st_atime);
    metadata.mode = static_cast<uint32_t>(st.st_mode);
    metadata.isSymlink = S_ISLNK(st.st_mode);
    metadata.isDirectory = S_ISDIR(st.st_mode);
    return metadata;
}

Expected<void> setFileTimes(const std::filesystem::path& filePath, std::time_t seconds) {
    struct timespec times[2];
    times[0].tv_sec = seconds;   // atime
    times[0].tv_nsec = 0;
    times[1].tv_sec = seconds;   // mtime
    times[1].tv_nsec = 0;
    if (::utimensat(AT_FDCWD, filePath.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        return Error{ErrorCode::IoError, "utimensat failed for " + filePath.string() + ": " + std::strerror(errno)};
    }
    return {};
}

}
