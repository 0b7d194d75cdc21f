#pragma once

#include <cstddef>
#include <filesystem>

namespace idemzip {

/**
 * @brief Working record for one archive passing through the pipeline
 *
 * Owned by exactly one pass of extract -> normalize -> compress -> swap.
 * Both scratch paths live under the run's scratch root and are disjoint
 * from every other job's.
 */
struct RepackJob {
    size_t ordinal{0};                           // Position in the locator's list
    std::filesystem::path sourceArchivePath;     // Archive to rewrite in place
    std::filesystem::path scratchExtractDir;     // <scratch>/<ordinal>_<name>/
    std::filesystem::path stagingArchivePath;    // <scratch>/<ordinal>_<name>.zip.new
};

}
