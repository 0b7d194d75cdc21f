#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/Compressor.hpp"

namespace idemzip {

class ScratchSpaceManager;

enum class JobStatus {
    Ok,
    ExtractionFailed,    // Archive unreadable or corrupt; original untouched
    FilesystemFailed,    // Scratch or timestamp problem; original untouched
    CompressionFailed,   // Rebuild failed; the whole run was aborted
    SwapFailed,          // Replacement failed; original untouched
    NotAttempted         // Skipped because the run aborted first
};

enum class RunStatus { Completed, Aborted };

const char* toString(JobStatus status);
const char* toString(RunStatus status);

/// Result for one archive of the batch
struct JobOutcome {
    std::filesystem::path archive;
    JobStatus status{JobStatus::NotAttempted};
    std::string message;
    size_t entries{0};   // Entries in the rebuilt archive

    bool ok() const { return status == JobStatus::Ok; }
};

/// Result of one repack() call, outcomes in input order
struct RunReport {
    RunStatus status{RunStatus::Completed};
    std::string abortReason;
    std::vector<JobOutcome> outcomes;

    /// True only if the run completed and every archive was rebuilt
    bool ok() const;

    /// Outcomes that are not Ok (NotAttempted included)
    std::vector<JobOutcome> failures() const;
};

/// Run configuration
struct RepackOptions {
    std::filesystem::path scratchRoot;   // Wiped and recreated for the run, removed after;
                                         // may not hold an input or the current directory
    size_t workers{1};                   // >1 runs jobs on a bounded pool
    CompressorConfig compressor;
};

/**
 * @brief Idempotent repackaging of a batch of zip archives
 *
 * For each archive, in order:
 *   extract -> normalize timestamps -> rebuild into staging -> swap
 *
 * Failure policy:
 *   - extraction, filesystem and swap failures stay with their job;
 *     the batch continues and the original archive is left as it was
 *   - a compression failure aborts the run: no further job starts,
 *     jobs already running finish, the failed job is never swapped
 *   - a scratch root that cannot be prepared, or whose wipe would take
 *     an input archive or the current directory with it, aborts before
 *     any job and before anything is deleted
 *
 * The engine never terminates the process; everything is reported
 * through the returned RunReport.
 */
class RepackEngine {
public:
    /**
     * @param options Scratch location, worker count and compressor config
     * @param compressor Rebuild strategy (defaults to DeflateCompressor with options.compressor)
     */
    explicit RepackEngine(RepackOptions options, std::unique_ptr<ICompressor> compressor = nullptr);
    ~RepackEngine();

    RepackEngine(const RepackEngine&) = delete;
    RepackEngine& operator=(const RepackEngine&) = delete;

    /// Rewrite every archive in place
    RunReport repack(const std::vector<std::filesystem::path>& paths);

    const RepackOptions& options() const { return opts; }

private:
    RepackOptions opts;
    std::unique_ptr<ICompressor> compressor;

    /// Shared state of one repack() call
    struct RunState {
        std::atomic<bool> aborted{false};
        std::mutex mtx;
        std::string abortReason;
    };

    JobOutcome runJob(const ScratchSpaceManager& scratch, size_t ordinal,
                      const std::filesystem::path& archive, RunState& state) const;
};

}
