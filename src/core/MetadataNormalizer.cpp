#include "core/MetadataNormalizer.hpp"

#include <string>
#include <system_error>

#include "core/Constants.hpp"
#include "core/Errors.hpp"
#include "util/FileMetadata.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace idemzip {

size_t MetadataNormalizer::normalize(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(root, ec))) {
        throw FilesystemError("not a directory: " + root.string());
    }

    size_t count = 0;
    for (auto it = fs::recursive_directory_iterator(root, ec);
         it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (ec) break;
        if (fs::is_directory(it->symlink_status(ec))) continue;

        auto res = setFileTimes(it->path(), Constants::NORMALIZED_EPOCH_SECONDS);
        if (!res) {
            throw FilesystemError(res.error().message);
        }
        ++count;
    }
    if (ec) {
        throw FilesystemError("Failed to walk " + root.string() + ": " + ec.message());
    }

    Logger::instance().debug("Normalized timestamps of " + std::to_string(count) + " file(s) under " + root.string());
    return count;
}

}
