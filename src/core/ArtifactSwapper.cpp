#include "core/ArtifactSwapper.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "core/Constants.hpp"
#include "core/Errors.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace idemzip {

namespace {

/// Closes a file descriptor on scope exit
class FdGuard {
public:
    explicit FdGuard(int fd) : fd(fd) {}
    ~FdGuard() { if (fd >= 0) ::close(fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd; }

    int release() {
        int closed = ::close(fd);
        fd = -1;
        return closed;
    }

private:
    int fd;
};

std::string errnoMessage() { return std::strerror(errno); }

void copyAndSync(const fs::path& from, const fs::path& to, mode_t mode) {
    FdGuard in(::open(from.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.get() < 0) {
        throw SwapError("Failed to open staging archive " + from.string() + ": " + errnoMessage());
    }
    FdGuard out(::open(to.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode));
    if (out.get() < 0) {
        throw SwapError("Failed to create " + to.string() + ": " + errnoMessage());
    }

    std::vector<char> buffer(Constants::IO_BUFFER_SIZE);
    while (true) {
        ssize_t n = ::read(in.get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw SwapError("Failed to read " + from.string() + ": " + errnoMessage());
        }
        if (n == 0) break;
        ssize_t written = 0;
        while (written < n) {
            ssize_t w = ::write(out.get(), buffer.data() + written, static_cast<size_t>(n - written));
            if (w < 0) {
                if (errno == EINTR) continue;
                throw SwapError("Failed to write " + to.string() + ": " + errnoMessage());
            }
            written += w;
        }
    }

    // umask may have narrowed the mode passed to open()
    if (::fchmod(out.get(), mode) != 0) {
        throw SwapError("Failed to set mode on " + to.string() + ": " + errnoMessage());
    }
    if (::fsync(out.get()) != 0) {
        throw SwapError("Failed to flush " + to.string() + ": " + errnoMessage());
    }
    if (out.release() != 0) {
        throw SwapError("Failed to close " + to.string() + ": " + errnoMessage());
    }
}

void syncDirectory(const fs::path& dir) {
    FdGuard fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (fd.get() < 0 || ::fsync(fd.get()) != 0) {
        Logger::instance().debug("Could not fsync directory " + dir.string() + ": " + errnoMessage());
    }
}

mode_t targetMode(const fs::path& target) {
    struct stat st {};
    if (::stat(target.c_str(), &st) != 0) {
        return static_cast<mode_t>(Constants::MODE_FILE & 0777);
    }
    return st.st_mode & 07777;
}

fs::path resolveTarget(const fs::path& target) {
    std::error_code ec;
    if (fs::is_symlink(target, ec)) {
        fs::path real = fs::canonical(target, ec);
        if (ec) {
            throw SwapError("Failed to resolve symlinked target " + target.string() + ": " + ec.message());
        }
        return real;
    }
    return target;
}

}

void ArtifactSwapper::commit(const fs::path& stagingPath, const fs::path& targetPath) {
    const fs::path target = resolveTarget(targetPath);
    const mode_t mode = targetMode(target);

    if (::chmod(stagingPath.c_str(), mode) != 0) {
        throw SwapError("Failed to set mode on staging archive " + stagingPath.string() + ": " + errnoMessage());
    }

    std::error_code ec;
    fs::rename(stagingPath, target, ec);
    if (!ec) {
        Logger::instance().debug("Renamed " + stagingPath.string() + " over " + target.string());
        return;
    }
    if (ec != std::errc::cross_device_link) {
        throw SwapError("Failed to replace " + target.string() + ": " + ec.message());
    }

    Logger::instance().debug("Staging area on another filesystem, copying into place: " + target.string());
    copyReplace(stagingPath, target);
}

void ArtifactSwapper::copyReplace(const fs::path& stagingPath, const fs::path& targetPath) {
    const fs::path target = resolveTarget(targetPath);
    const mode_t mode = targetMode(target);
    const fs::path temp = target.parent_path() /
        ("." + target.filename().string() + Constants::SWAP_TEMP_SUFFIX);

    std::error_code ec;
    fs::remove(temp, ec);  // leftover of an interrupted swap

    try {
        copyAndSync(stagingPath, temp, mode);
    } catch (const SwapError&) {
        fs::remove(temp, ec);
        throw;
    }

    // Same directory as the target, so this rename cannot cross devices
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw SwapError("Failed to move " + temp.string() + " over " + target.string() + ": " + ec.message());
    }
    syncDirectory(target.parent_path());

    fs::remove(stagingPath, ec);
    if (ec) {
        Logger::instance().warn("Failed to remove staging archive " + stagingPath.string() + ": " + ec.message());
    }
}

}
