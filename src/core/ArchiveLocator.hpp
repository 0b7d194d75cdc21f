#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace idemzip {

/**
 * @brief What the packaging step built for a service
 *
 * Mirrors how deployment archives are named under <serviceDir>/.serverless:
 *   individually packaged -> one <function>.zip per function
 *   otherwise            -> a single <serviceName>.zip
 */
struct PackagingPlan {
    std::filesystem::path serviceDir;
    std::string serviceName;
    std::vector<std::string> functions;
    bool individually{false};
    std::string onlyFunction;   // Restrict to one function (individual packaging only)
};

/**
 * @brief Resolves the ordered list of archives a run must process
 */
class ArchiveLocator {
public:
    /// <serviceDir>/.serverless
    static std::filesystem::path packageDir(const std::filesystem::path& serviceDir);

    /**
     * @brief Archive paths the packaging step is known to produce
     * @return Paths in function order, or InvalidArgs if the plan names nothing
     */
    static Expected<std::vector<std::filesystem::path>> expectedArchives(const PackagingPlan& plan);

    /**
     * @brief Merge an explicit list with archives discovered on disk
     *
     * Explicit paths come first, in caller order, without duplicates.
     * Glob matches under searchRoot follow in traversal order, skipping any
     * path that resolves to an explicit one. Some archives are produced by
     * auxiliary build steps and only exist on disk; they still need to be
     * normalized, but exactly once.
     *
     * @param explicitPaths Known archives (need not exist yet)
     * @param searchRoot Directory to scan; an empty path disables discovery
     * @param pattern Glob relative to searchRoot (see Constants::DEFAULT_DISCOVERY_PATTERN)
     * @param excludeDir Subtree never scanned (the scratch root)
     */
    static std::vector<std::filesystem::path> locate(
        const std::vector<std::filesystem::path>& explicitPaths,
        const std::filesystem::path& searchRoot,
        const std::string& pattern,
        const std::filesystem::path& excludeDir = {}
    );

private:
    /// Comparison key: canonical path when resolvable, else absolute normal form
    static std::string identityOf(const std::filesystem::path& p);
};

}
