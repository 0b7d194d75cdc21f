#include "core/Compressor.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

#include "core/Errors.hpp"
#include "core/ZipArchive.hpp"
#include "util/FileMetadata.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace idemzip {

namespace {

std::string readWholeFile(const fs::path& filePath) {
    std::ifstream in(filePath, std::ios::binary);
    if (!in) {
        throw FilesystemError("Failed to open file for reading: " + filePath.string());
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw FilesystemError("Error reading file: " + filePath.string());
    }
    return bytes;
}

ZipEntry entryFor(const fs::path& tree, const std::string& name) {
    const bool isDirectory = !name.empty() && name.back() == '/';
    const fs::path full = tree / fs::path(isDirectory ? name.substr(0, name.size() - 1) : name);

    auto meta = getFileMetadata(full);
    if (!meta) {
        throw FilesystemError(meta.error().message);
    }

    ZipEntry entry;
    entry.name = name;
    entry.isDirectory = isDirectory;
    entry.mode = meta.value().mode & (Constants::MODE_TYPE_MASK | 0777);
    toDosDateTime(static_cast<std::time_t>(meta.value().mtimeSec), entry.dosDate, entry.dosTime);

    if (meta.value().isSymlink) {
        std::error_code ec;
        entry.content = fs::read_symlink(full, ec).string();
        if (ec) {
            throw FilesystemError("Failed to read symlink " + full.string() + ": " + ec.message());
        }
    } else if (!isDirectory) {
        entry.content = readWholeFile(full);
    }
    return entry;
}

}

DeflateCompressor::DeflateCompressor(CompressorConfig config) : cfg(config) {}

std::vector<std::string> DeflateCompressor::canonicalEntries(const fs::path& tree, bool includeDirectories) {
    std::vector<std::string> names;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(tree, ec);
         it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (ec) break;
        fs::file_status st = it->symlink_status(ec);
        if (ec) break;

        std::string rel = it->path().lexically_relative(tree).generic_string();
        if (fs::is_directory(st)) {
            if (includeDirectories) names.push_back(rel + "/");
        } else if (fs::is_regular_file(st) || fs::is_symlink(st)) {
            names.push_back(rel);
        } else {
            throw FilesystemError("unsupported file type in tree: " + it->path().string());
        }
    }
    if (ec) {
        throw FilesystemError("Failed to enumerate " + tree.string() + ": " + ec.message());
    }

    // std::string ordering compares bytes as unsigned char
    std::sort(names.begin(), names.end());
    return names;
}

size_t DeflateCompressor::compress(const fs::path& tree, const fs::path& stagingPath) const {
    try {
        std::vector<std::string> names = canonicalEntries(tree, !cfg.omitDirectoryEntries);

        ZipWriter writer(stagingPath, cfg.level);
        for (const auto& name : names) {
            writer.addEntry(entryFor(tree, name));
        }
        writer.finish();

        Logger::instance().debug("Wrote " + std::to_string(writer.entryCount()) + " entries to " + stagingPath.string());
        return writer.entryCount();
    } catch (const CompressionError&) {
        std::error_code ec;
        fs::remove(stagingPath, ec);
        throw;
    } catch (const FilesystemError&) {
        std::error_code ec;
        fs::remove(stagingPath, ec);
        throw;
    }
}

std::unique_ptr<ICompressor> CompressorFactory::createDefault() {
    return std::make_unique<DeflateCompressor>();
}

std::unique_ptr<ICompressor> CompressorFactory::create(const CompressorConfig& config) {
    return std::make_unique<DeflateCompressor>(config);
}

}
