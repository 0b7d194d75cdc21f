#include "core/ScratchSpace.hpp"

#include <string>
#include <system_error>

#include "core/Constants.hpp"
#include "core/Errors.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace idemzip {

namespace {

fs::path resolved(const fs::path& p, std::error_code& ec) {
    fs::path out = fs::weakly_canonical(fs::absolute(p, ec), ec);
    if (!out.empty() && out.filename().empty()) {
        out = out.parent_path();
    }
    return out;
}

/// True if path equals ancestor or lies below it
bool isWithin(const fs::path& path, const fs::path& ancestor) {
    auto p = path.begin();
    for (auto a = ancestor.begin(); a != ancestor.end(); ++a, ++p) {
        if (p == path.end() || *p != *a) {
            return false;
        }
    }
    return true;
}

}

void ScratchSpaceManager::checkRoot(const fs::path& root, const std::vector<fs::path>& keep) {
    std::error_code ec;
    const fs::path scratch = resolved(root, ec);
    if (ec || scratch.empty()) {
        throw FilesystemError("Failed to resolve scratch root " + root.string() + ": " + ec.message());
    }

    std::vector<fs::path> guarded{fs::current_path(ec)};
    if (ec) {
        throw FilesystemError("Failed to determine current directory: " + ec.message());
    }
    guarded.insert(guarded.end(), keep.begin(), keep.end());

    for (const auto& p : guarded) {
        fs::path target = resolved(p, ec);
        if (ec) {
            throw FilesystemError("Failed to resolve " + p.string() + ": " + ec.message());
        }
        if (isWithin(target, scratch)) {
            throw FilesystemError("refusing scratch root " + root.string() + ": wiping it would remove " + p.string());
        }
    }
}

ScratchSpaceManager::ScratchSpaceManager(const fs::path& root) {
    std::error_code ec;
    rootPath = fs::absolute(root, ec).lexically_normal();
    if (ec || rootPath.empty() || rootPath == rootPath.root_path()) {
        throw FilesystemError("refusing to use scratch root: " + root.string());
    }

    // A stale root from an interrupted run is expected; a missing one is fine too
    fs::remove_all(rootPath, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw FilesystemError("Failed to remove stale scratch root " + rootPath.string() + ": " + ec.message());
    }
    ec.clear();

    fs::create_directories(rootPath, ec);
    if (ec) {
        throw FilesystemError("Failed to create scratch root " + rootPath.string() + ": " + ec.message());
    }
    Logger::instance().debug("Scratch root ready: " + rootPath.string());
}

ScratchSpaceManager::~ScratchSpaceManager() {
    std::error_code ec;
    fs::remove_all(rootPath, ec);
    if (ec) {
        Logger::instance().warn("Failed to remove scratch root " + rootPath.string() + ": " + ec.message());
    } else {
        Logger::instance().debug("Scratch root removed: " + rootPath.string());
    }
}

RepackJob ScratchSpaceManager::allocateJob(size_t ordinal, const fs::path& archivePath) const {
    std::string stem = archivePath.filename().string();
    const std::string ext = Constants::ARCHIVE_EXTENSION;
    if (stem.size() > ext.size() && stem.compare(stem.size() - ext.size(), ext.size(), ext) == 0) {
        stem.erase(stem.size() - ext.size());
    }
    if (stem.empty()) stem = "archive";
    const std::string base = std::to_string(ordinal) + "_" + stem;

    RepackJob job;
    job.ordinal = ordinal;
    job.sourceArchivePath = archivePath;
    job.scratchExtractDir = rootPath / base;
    job.stagingArchivePath = rootPath / (base + ext + Constants::STAGING_SUFFIX);

    std::error_code ec;
    if (fs::exists(fs::symlink_status(job.scratchExtractDir, ec)) ||
        fs::exists(fs::symlink_status(job.stagingArchivePath, ec))) {
        throw FilesystemError("scratch path collision for job " + base);
    }
    return job;
}

void ScratchSpaceManager::releaseJob(const RepackJob& job) const {
    std::error_code ec;
    fs::remove_all(job.scratchExtractDir, ec);
    if (ec) {
        Logger::instance().warn("Failed to remove " + job.scratchExtractDir.string() + ": " + ec.message());
    }
    fs::remove(job.stagingArchivePath, ec);
    if (ec) {
        Logger::instance().warn("Failed to remove " + job.stagingArchivePath.string() + ": " + ec.message());
    }
}

}
