#pragma once

#include <cstddef>
#include <filesystem>

namespace idemzip {

/**
 * @brief Pins the timestamps of an extracted tree
 *
 * Every non-directory below the root (symlinks themselves included) gets
 * atime = mtime = Constants::NORMALIZED_EPOCH_SECONDS. Afterwards the
 * timestamps carry no information about when the archive was built.
 *
 * Throws FilesystemError if any path cannot be updated; a file left with
 * its original time would silently break determinism.
 */
class MetadataNormalizer {
public:
    /// @return Number of files normalized
    static size_t normalize(const std::filesystem::path& root);
};

}
