#include "cli/RunSupport.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <stdexcept>

#include "util/PatternMatcher.hpp"

namespace fs = std::filesystem;

namespace idemzip {

namespace RunSupport {

namespace {

ErrorCode codeFor(JobStatus status) {
    switch (status) {
        case JobStatus::ExtractionFailed: return ErrorCode::ExtractionFailed;
        case JobStatus::FilesystemFailed: return ErrorCode::FilesystemFailed;
        case JobStatus::CompressionFailed: return ErrorCode::CompressionFailed;
        case JobStatus::SwapFailed: return ErrorCode::SwapFailed;
        case JobStatus::NotAttempted: return ErrorCode::RunAborted;
        case JobStatus::Ok: break;
    }
    return ErrorCode::None;
}

}

Expected<size_t> parseJobs(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return Error{ErrorCode::InvalidArgs, "invalid --jobs value: '" + text + "'"};
    }
    size_t n = 0;
    try {
        n = static_cast<size_t>(std::stoul(text));
    } catch (const std::out_of_range&) {
        return Error{ErrorCode::InvalidArgs, "--jobs value out of range: " + text};
    }
    if (n == 0) {
        return Error{ErrorCode::InvalidArgs, "--jobs must be at least 1"};
    }
    return n;
}

Expected<std::vector<fs::path>> expandOperands(const std::vector<std::string>& operands, const fs::path& cwd) {
    std::vector<fs::path> out;
    for (const auto& op : operands) {
        if (!PatternMatcher::isPattern(op)) {
            out.emplace_back(op);
            continue;
        }
        auto matches = PatternMatcher::matchFiles(op, cwd);
        if (matches.empty()) {
            return Error{ErrorCode::InvalidArgs, "pattern matched no files: " + op};
        }
        std::sort(matches.begin(), matches.end());
        out.insert(out.end(), matches.begin(), matches.end());
    }
    return out;
}

Expected<void> printReport(std::ostream& out, const RunReport& report) {
    size_t rebuilt = 0;
    for (const auto& o : report.outcomes) {
        out << std::left << std::setw(19) << toString(o.status) << o.archive.string();
        if (o.ok()) {
            ++rebuilt;
            out << " (" << o.entries << " entries)";
        } else if (!o.message.empty()) {
            out << ": " << o.message;
        }
        out << "\n";
    }
    out << rebuilt << " of " << report.outcomes.size() << " archive(s) repacked, run "
        << toString(report.status) << "\n";

    if (report.ok()) return {};

    const auto failures = report.failures();
    auto has = [&](JobStatus st) {
        return std::any_of(failures.begin(), failures.end(), [st](const JobOutcome& o) { return o.status == st; });
    };
    ErrorCode code;
    if (report.status == RunStatus::Aborted) {
        code = has(JobStatus::CompressionFailed) ? ErrorCode::CompressionFailed : ErrorCode::RunAborted;
    } else if (has(JobStatus::SwapFailed)) {
        code = ErrorCode::SwapFailed;
    } else {
        code = failures.empty() ? ErrorCode::InternalError : codeFor(failures.front().status);
    }

    std::string failed;
    for (const auto& o : failures) {
        if (o.status == JobStatus::NotAttempted) continue;
        if (!failed.empty()) failed += ", ";
        failed += o.archive.string();
    }
    std::string msg = report.status == RunStatus::Aborted ? "run aborted: " + report.abortReason
                                                          : "failed to repack " + failed;
    return Error{code, msg};
}

}

}
