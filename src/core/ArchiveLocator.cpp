#include "core/ArchiveLocator.hpp"

#include <unordered_set>

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace fs = std::filesystem;

namespace idemzip {

fs::path ArchiveLocator::packageDir(const fs::path& serviceDir) {
    return serviceDir / Constants::PACKAGE_DIR_NAME;
}

Expected<std::vector<fs::path>> ArchiveLocator::expectedArchives(const PackagingPlan& plan) {
    const fs::path dir = packageDir(plan.serviceDir);
    std::vector<fs::path> archives;

    if (plan.individually) {
        std::vector<std::string> names = plan.functions;
        if (!plan.onlyFunction.empty()) {
            names = {plan.onlyFunction};
        }
        if (names.empty()) {
            return Error{ErrorCode::InvalidArgs, "individual packaging requires at least one function"};
        }
        for (const auto& name : names) {
            archives.push_back(dir / (name + Constants::ARCHIVE_EXTENSION));
        }
        return archives;
    }

    if (plan.serviceName.empty()) {
        return Error{ErrorCode::InvalidArgs, "service packaging requires a service name"};
    }
    archives.push_back(dir / (plan.serviceName + Constants::ARCHIVE_EXTENSION));
    return archives;
}

std::string ArchiveLocator::identityOf(const fs::path& p) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(p, ec);
    if (ec) {
        ec.clear();
        resolved = fs::absolute(p, ec).lexically_normal();
        if (ec) resolved = p.lexically_normal();
    }
    return resolved.generic_string();
}

std::vector<fs::path> ArchiveLocator::locate(
    const std::vector<fs::path>& explicitPaths,
    const fs::path& searchRoot,
    const std::string& pattern,
    const fs::path& excludeDir
) {
    std::vector<fs::path> result;
    std::unordered_set<std::string> known;

    for (const auto& p : explicitPaths) {
        if (known.insert(identityOf(p)).second) {
            result.push_back(p);
        }
    }

    if (searchRoot.empty()) {
        return result;
    }

    size_t discovered = 0;
    for (const auto& match : PatternMatcher::matchFiles(pattern, searchRoot, excludeDir)) {
        if (known.insert(identityOf(match)).second) {
            Logger::instance().debug("Discovered archive: " + match.string());
            result.push_back(match);
            ++discovered;
        }
    }
    Logger::instance().debug("Located " + std::to_string(result.size()) + " archive(s), " +
                             std::to_string(discovered) + " discovered under " + searchRoot.string());
    return result;
}

}
