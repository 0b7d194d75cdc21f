#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "core/Constants.hpp"

namespace idemzip {

/**
 * @brief Knobs of the archive rebuild
 *
 * Passed explicitly to the compressor; nothing is read from the
 * environment. Both fields are part of the output's identity.
 */
struct CompressorConfig {
    bool omitDirectoryEntries{true};                 // Never emit "dir/" placeholder entries
    int level{Constants::DEFAULT_DEFLATE_LEVEL};     // zlib level, 0 stores every entry
};

/**
 * @brief Strategy interface for rebuilding an archive from a tree
 *
 * Implementations write to a staging path only and leave no staging file
 * behind on failure. CompressionError means the encoder itself failed (zlib
 * error, zip32 limit); FilesystemError means reading the tree or writing the
 * staging file failed.
 */
class ICompressor {
public:
    virtual ~ICompressor() = default;

    /**
     * @param tree Normalized directory tree
     * @param stagingPath Output archive, distinct from the final target
     * @return Number of entries written
     */
    virtual size_t compress(const std::filesystem::path& tree, const std::filesystem::path& stagingPath) const = 0;

    virtual const char* name() const = 0;
};

/**
 * @brief Deterministic zip rebuild with raw deflate
 *
 * Algorithm:
 *   1. Enumerate regular files and symlinks below the tree (directories
 *      only when the config asks for them)
 *   2. Sort by relative path, byte-wise
 *   3. Write each entry with the same level, no extra fields, the file's
 *      mode and its (normalized) mtime as DOS time in UTC
 *
 * Given the same paths, bytes, modes and mtimes the output is identical
 * on every run; only a different zlib build could change it.
 */
class DeflateCompressor : public ICompressor {
public:
    explicit DeflateCompressor(CompressorConfig config = {});

    size_t compress(const std::filesystem::path& tree, const std::filesystem::path& stagingPath) const override;
    const char* name() const override { return "deflate"; }

    const CompressorConfig& config() const { return cfg; }

    /**
     * @brief Entry names in canonical order
     *
     * Relative, '/'-separated; directories end with '/' and only appear
     * when includeDirectories is set. Throws FilesystemError if the tree
     * cannot be walked or holds something that cannot be archived (fifo,
     * socket, device).
     */
    static std::vector<std::string> canonicalEntries(const std::filesystem::path& tree, bool includeDirectories);

private:
    CompressorConfig cfg;
};

/**
 * @brief Factory for compressor instances
 */
class CompressorFactory {
public:
    /// Deflate compressor with the default configuration
    static std::unique_ptr<ICompressor> createDefault();

    static std::unique_ptr<ICompressor> create(const CompressorConfig& config);
};

}
