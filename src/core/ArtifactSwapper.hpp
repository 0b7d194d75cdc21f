#pragma once

#include <filesystem>

namespace idemzip {

/**
 * @brief Commits a staging archive over the original
 *
 * Readers of the target path see either the old archive or the complete
 * new one, never a truncated file:
 *   - same filesystem: a single rename(2)
 *   - across filesystems (EXDEV): copy into a hidden sibling of the target,
 *     fsync it, then rename the sibling over the target
 *
 * The target keeps its permission bits. A target that is a symlink is
 * resolved and the file it points to is replaced.
 *
 * Throws SwapError on failure; the original is then untouched and no
 * temporary file is left beside it.
 */
class ArtifactSwapper {
public:
    static void commit(const std::filesystem::path& stagingPath, const std::filesystem::path& targetPath);

    /// Cross-device path of commit(), usable on its own
    static void copyReplace(const std::filesystem::path& stagingPath, const std::filesystem::path& targetPath);
};

}
