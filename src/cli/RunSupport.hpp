#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "core/RepackEngine.hpp"
#include "util/Expected.hpp"

namespace idemzip {

// Helpers shared by the commands that run the repack engine.
namespace RunSupport {

/// Parse a --jobs value (positive integer)
Expected<size_t> parseJobs(const std::string& text);

/**
 * @brief Turn command-line operands into archive paths
 *
 * Plain operands are kept as given, even if missing, so the run reports
 * them. Glob operands are matched under the current directory and their
 * matches appended in sorted order; a glob matching nothing is an error.
 */
Expected<std::vector<std::filesystem::path>> expandOperands(const std::vector<std::string>& operands,
                                                            const std::filesystem::path& cwd);

/**
 * @brief Print one line per archive plus a summary
 * @return Success only if the report is ok(); otherwise an Error whose code
 *         reflects the most severe outcome and whose message lists the failures
 */
Expected<void> printReport(std::ostream& out, const RunReport& report);

}

}
