#include "core/RepackEngine.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <optional>
#include <thread>

#include "core/ArtifactSwapper.hpp"
#include "core/Errors.hpp"
#include "core/Extractor.hpp"
#include "core/MetadataNormalizer.hpp"
#include "core/ScratchSpace.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace idemzip {

const char* toString(JobStatus status) {
    switch (status) {
        case JobStatus::Ok: return "ok";
        case JobStatus::ExtractionFailed: return "extraction-failed";
        case JobStatus::FilesystemFailed: return "filesystem-failed";
        case JobStatus::CompressionFailed: return "compression-failed";
        case JobStatus::SwapFailed: return "swap-failed";
        case JobStatus::NotAttempted: return "not-attempted";
    }
    return "unknown";
}

const char* toString(RunStatus status) {
    return status == RunStatus::Completed ? "completed" : "aborted";
}

bool RunReport::ok() const {
    return status == RunStatus::Completed &&
           std::all_of(outcomes.begin(), outcomes.end(), [](const JobOutcome& o) { return o.ok(); });
}

std::vector<JobOutcome> RunReport::failures() const {
    std::vector<JobOutcome> out;
    std::copy_if(outcomes.begin(), outcomes.end(), std::back_inserter(out),
                 [](const JobOutcome& o) { return !o.ok(); });
    return out;
}

RepackEngine::RepackEngine(RepackOptions options, std::unique_ptr<ICompressor> compressor)
    : opts(std::move(options)),
      compressor(compressor ? std::move(compressor) : CompressorFactory::create(opts.compressor)) {}

RepackEngine::~RepackEngine() = default;

JobOutcome RepackEngine::runJob(const ScratchSpaceManager& scratch, size_t ordinal,
                                const fs::path& archive, RunState& state) const {
    auto& log = Logger::instance();
    JobOutcome outcome;
    outcome.archive = archive;

    std::error_code ec;
    fs::path source = fs::absolute(archive, ec);
    if (ec) source = archive;

    std::optional<RepackJob> job;
    try {
        job = scratch.allocateJob(ordinal, source);
        log.info("Repacking " + source.string());

        Extractor::extract(job->sourceArchivePath, job->scratchExtractDir);
        MetadataNormalizer::normalize(job->scratchExtractDir);
        outcome.entries = compressor->compress(job->scratchExtractDir, job->stagingArchivePath);
        ArtifactSwapper::commit(job->stagingArchivePath, job->sourceArchivePath);

        outcome.status = JobStatus::Ok;
        log.info("Repacked " + source.string() + " (" + std::to_string(outcome.entries) + " entries)");
    } catch (const ExtractionError& e) {
        outcome.status = JobStatus::ExtractionFailed;
        outcome.message = e.what();
    } catch (const FilesystemError& e) {
        outcome.status = JobStatus::FilesystemFailed;
        outcome.message = e.what();
    } catch (const CompressionError& e) {
        outcome.status = JobStatus::CompressionFailed;
        outcome.message = e.what();
        std::scoped_lock lock(state.mtx);
        if (!state.aborted.exchange(true)) {
            state.abortReason = "rebuild of " + source.string() + " failed: " + e.what();
        }
    } catch (const SwapError& e) {
        outcome.status = JobStatus::SwapFailed;
        outcome.message = e.what();
    } catch (const std::exception& e) {
        // std::filesystem_error, bad_alloc: the job cannot have swapped
        outcome.status = JobStatus::FilesystemFailed;
        outcome.message = e.what();
    }

    if (!outcome.ok()) {
        log.error("Failed to repack " + source.string() + " [" + toString(outcome.status) + "]: " + outcome.message);
    }
    if (job) {
        scratch.releaseJob(*job);
    }
    return outcome;
}

RunReport RepackEngine::repack(const std::vector<fs::path>& paths) {
    auto& log = Logger::instance();
    RunReport report;
    report.outcomes.resize(paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        report.outcomes[i].archive = paths[i];
    }

    if (paths.empty()) {
        log.info("No archives to repack");
        return report;
    }

    log.info("Repacking " + std::to_string(paths.size()) + " archive(s) with " + compressor->name() + " rebuild");

    std::unique_ptr<ScratchSpaceManager> scratch;
    try {
        ScratchSpaceManager::checkRoot(opts.scratchRoot, paths);
        scratch = std::make_unique<ScratchSpaceManager>(opts.scratchRoot);
    } catch (const FilesystemError& e) {
        report.status = RunStatus::Aborted;
        report.abortReason = e.what();
        for (auto& o : report.outcomes) {
            o.message = "scratch space unavailable";
        }
        log.error(std::string("Cannot prepare scratch space: ") + e.what());
        return report;
    }

    RunState state;
    const size_t workers = std::max<size_t>(1, std::min(opts.workers, paths.size()));

    if (workers == 1) {
        for (size_t i = 0; i < paths.size(); ++i) {
            if (state.aborted) break;
            report.outcomes[i] = runJob(*scratch, i, paths[i], state);
        }
    } else {
        // Each slot of report.outcomes is written by exactly one worker
        std::atomic<size_t> next{0};
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            pool.emplace_back([&] {
                while (!state.aborted) {
                    size_t i = next.fetch_add(1);
                    if (i >= paths.size()) break;
                    report.outcomes[i] = runJob(*scratch, i, paths[i], state);
                }
            });
        }
        for (auto& t : pool) {
            t.join();
        }
    }

    // Teardown only after every job has finished
    scratch.reset();

    if (state.aborted) {
        report.status = RunStatus::Aborted;
        report.abortReason = state.abortReason;
        for (auto& o : report.outcomes) {
            if (o.status == JobStatus::NotAttempted && o.message.empty()) {
                o.message = "run aborted before this archive was processed";
            }
        }
    }

    size_t rebuilt = static_cast<size_t>(std::count_if(report.outcomes.begin(), report.outcomes.end(),
                                                       [](const JobOutcome& o) { return o.ok(); }));
    std::string summary = "Repacked " + std::to_string(rebuilt) + " of " + std::to_string(paths.size()) +
                          " archive(s), run " + toString(report.status);
    if (report.ok()) {
        log.info(summary);
    } else {
        log.error(summary);
    }
    return report;
}

}
