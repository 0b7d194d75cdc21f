#include "cli/commands/RepackServiceCommand.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include "cli/RunSupport.hpp"
#include "core/ArchiveLocator.hpp"
#include "core/Constants.hpp"
#include "core/RepackEngine.hpp"

namespace idemzip {

namespace fs = std::filesystem;

Expected<void> RepackServiceCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    PackagingPlan plan;
    RepackOptions options;
    std::string pattern = Constants::DEFAULT_DISCOVERY_PATTERN;
    bool discover = true;
    std::vector<std::string> operands;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        bool hasValue = i + 1 < args.size();
        if (a == "--name" && hasValue) {
            plan.serviceName = args[++i];
        } else if (a == "--function" && hasValue) {
            plan.functions.push_back(args[++i]);
        } else if (a == "--individually") {
            plan.individually = true;
        } else if (a == "--only" && hasValue) {
            plan.onlyFunction = args[++i];
            plan.individually = true;
        } else if (a == "--pattern" && hasValue) {
            pattern = args[++i];
        } else if (a == "--no-discover") {
            discover = false;
        } else if (a == "--jobs" && hasValue) {
            auto jobs = RunSupport::parseJobs(args[++i]);
            if (!jobs) return Error{jobs.error().code, "repack-service: " + jobs.error().message};
            options.workers = jobs.value();
        } else if (!a.empty() && a[0] == '-') {
            return Error{ErrorCode::InvalidArgs, "repack-service: unknown or incomplete option: " + a};
        } else {
            operands.push_back(a);
        }
    }

    if (operands.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "repack-service: expected exactly one <service-dir>"};
    }
    std::error_code ec;
    plan.serviceDir = fs::absolute(operands.front(), ec).lexically_normal();
    if (ec || !fs::is_directory(plan.serviceDir)) {
        return Error{ErrorCode::InvalidArgs, "repack-service: not a directory: " + operands.front()};
    }
    if (plan.serviceName.empty()) {
        // A trailing separator leaves an empty filename
        plan.serviceName = plan.serviceDir.has_filename() ? plan.serviceDir.filename().string()
                                                          : plan.serviceDir.parent_path().filename().string();
    }

    auto expected = ArchiveLocator::expectedArchives(plan);
    if (!expected) return Error{expected.error().code, "repack-service: " + expected.error().message};

    options.scratchRoot = plan.serviceDir / Constants::SCRATCH_DIR_NAME;
    fs::path searchRoot = discover ? ArchiveLocator::packageDir(plan.serviceDir) : fs::path();
    if (!searchRoot.empty() && !fs::is_directory(searchRoot)) {
        searchRoot.clear();
    }

    auto archives = ArchiveLocator::locate(expected.value(), searchRoot, pattern, options.scratchRoot);

    RepackEngine engine(options);
    auto report = engine.repack(archives);
    return RunSupport::printReport(*ctx.out, report);
}

}
