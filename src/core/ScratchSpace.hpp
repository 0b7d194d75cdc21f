#pragma once

#include <filesystem>
#include <vector>

#include "core/RepackJob.hpp"

namespace idemzip {

/**
 * @brief Owns the run's scratch root for its whole lifetime
 *
 * Construction wipes whatever a previous (possibly crashed) run left at
 * the path and creates a fresh empty directory; failure throws
 * FilesystemError and no job can run. Destruction removes the root again.
 * Removal problems on teardown are logged, never thrown.
 *
 * Layout:
 *   <root>/
 *     0_api/            extracted tree of api.zip
 *     0_api.zip.new     staging archive for api.zip
 *     1_worker/
 *     ...
 */
class ScratchSpaceManager {
public:
    explicit ScratchSpaceManager(const std::filesystem::path& root);
    ~ScratchSpaceManager();

    ScratchSpaceManager(const ScratchSpaceManager&) = delete;
    ScratchSpaceManager& operator=(const ScratchSpaceManager&) = delete;

    const std::filesystem::path& root() const { return rootPath; }

    /**
     * @brief Refuse a root whose wipe would destroy something we must keep
     *
     * Paths are compared after resolving symlinks. The root may not be, or
     * contain, the current directory or any of the given paths.
     * @throws FilesystemError naming the first path that would be lost
     */
    static void checkRoot(const std::filesystem::path& root, const std::vector<std::filesystem::path>& keep);

    /**
     * @brief Reserve scratch paths for one archive
     *
     * Names are "<ordinal>_<stem>" so two archives with the same base name
     * never share a directory. Throws FilesystemError if either path
     * already exists, which means two jobs were given the same ordinal.
     */
    RepackJob allocateJob(size_t ordinal, const std::filesystem::path& archivePath) const;

    /// Best-effort removal of a finished job's scratch paths
    void releaseJob(const RepackJob& job) const;

private:
    std::filesystem::path rootPath;
};

}
