#include "cli/commands/RepackCommand.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include "cli/RunSupport.hpp"
#include "core/ArchiveLocator.hpp"
#include "core/Constants.hpp"
#include "core/RepackEngine.hpp"

namespace idemzip {

namespace fs = std::filesystem;

/**
 * @brief Execute 'idemzip repack' command
 *
 * Operands are archive paths or globs (matched under the current
 * directory). With --discover, archives found under that directory are
 * appended unless they resolve to an operand.
 */
Expected<void> RepackCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    RepackOptions options;
    options.scratchRoot = fs::path(Constants::SCRATCH_DIR_NAME);
    fs::path discoverRoot;
    std::string pattern = Constants::DEFAULT_DISCOVERY_PATTERN;
    std::vector<std::string> operands;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        bool hasValue = i + 1 < args.size();
        if (a == "--scratch" && hasValue) {
            options.scratchRoot = args[++i];
        } else if (a == "--jobs" && hasValue) {
            auto jobs = RunSupport::parseJobs(args[++i]);
            if (!jobs) return Error{jobs.error().code, "repack: " + jobs.error().message};
            options.workers = jobs.value();
        } else if (a == "--discover" && hasValue) {
            discoverRoot = args[++i];
        } else if (a == "--pattern" && hasValue) {
            pattern = args[++i];
        } else if (a == "--level" && hasValue) {
            const std::string& v = args[++i];
            if (v.size() != 1 || v[0] < '0' || v[0] > '9') {
                return Error{ErrorCode::InvalidArgs, "repack: invalid --level value: '" + v + "'"};
            }
            options.compressor.level = v[0] - '0';
        } else if (a == "--keep-dirs") {
            options.compressor.omitDirectoryEntries = false;
        } else if (!a.empty() && a[0] == '-') {
            return Error{ErrorCode::InvalidArgs, "repack: unknown or incomplete option: " + a};
        } else {
            operands.push_back(a);
        }
    }

    if (operands.empty() && discoverRoot.empty()) {
        return Error{ErrorCode::InvalidArgs, "repack: no archives given (pass paths or --discover <dir>)"};
    }
    if (!discoverRoot.empty() && !fs::is_directory(discoverRoot)) {
        return Error{ErrorCode::InvalidArgs, "repack: not a directory: " + discoverRoot.string()};
    }

    auto explicitPaths = RunSupport::expandOperands(operands, fs::current_path());
    if (!explicitPaths) return Error{explicitPaths.error().code, "repack: " + explicitPaths.error().message};

    auto archives = ArchiveLocator::locate(explicitPaths.value(), discoverRoot, pattern,
                                           fs::absolute(options.scratchRoot));

    RepackEngine engine(options);
    auto report = engine.repack(archives);
    return RunSupport::printReport(*ctx.out, report);
}

}
