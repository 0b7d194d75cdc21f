#pragma once

#include <stdexcept>
#include <string>

namespace idemzip {

/**
 * @brief Failure taxonomy of the repackaging pipeline
 *
 * Components throw these; RepackEngine decides their scope:
 *   ExtractionError  - archive unreadable or corrupt (job-local)
 *   FilesystemError - scratch dirs, timestamps, tree reads, staging I/O (job-local,
 *                      run-fatal during scratch-root setup)
 *   CompressionError - encoder failed: zlib error or zip32 limit (run-fatal)
 *   SwapError        - replacing the original failed, original intact (job-local)
 */
class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& msg) : std::runtime_error(msg) {}
};

class FilesystemError : public std::runtime_error {
public:
    explicit FilesystemError(const std::string& msg) : std::runtime_error(msg) {}
};

class CompressionError : public std::runtime_error {
public:
    explicit CompressionError(const std::string& msg) : std::runtime_error(msg) {}
};

class SwapError : public std::runtime_error {
public:
    explicit SwapError(const std::string& msg) : std::runtime_error(msg) {}
};

}
