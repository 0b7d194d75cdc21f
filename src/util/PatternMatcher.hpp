#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace idemzip {

// Glob pattern matching for archive discovery.
//
// Patterns are matched against paths relative to a search root, using
// forward slashes on every platform.
//
// Supported syntax:
//   *      -> any run of characters except '/'
//   ?      -> one character except '/'
//   **     -> any run of characters including '/'
//   **/    -> zero or more leading directories ("**/*.zip" matches "a.zip")
//   [abc]  -> character class, "[!abc]" negates
//
// Examples:
//   **/*.zip        -> every zip below the root, at any depth
//   *.zip           -> zips directly in the root
//   build/fn?.zip   -> fn1.zip, fn2.zip in build/
namespace PatternMatcher {

/// Convert glob pattern to an anchored std::regex.
/// Example: "**/*.zip" -> "^(?:.*/)?[^/]*\.zip$"
std::regex globToRegex(const std::string& pattern);

/// True if the string contains *, ? or [
bool isPattern(const std::string& path);

/**
 * @brief Walk a directory tree and collect files matching a glob
 *
 * Hidden files and directories are included, directory symlinks are
 * followed and unreadable subtrees are skipped. Results come back in
 * traversal order; callers that need a stable order must sort.
 *
 * @param pattern Glob relative to root
 * @param root Directory to search
 * @param excludeDir Directory never descended into (empty for none)
 * @return Absolute, lexically normal paths of matching regular files
 */
std::vector<std::filesystem::path> matchFiles(
    const std::string& pattern,
    const std::filesystem::path& root,
    const std::filesystem::path& excludeDir = {}
);

}  // namespace PatternMatcher

}  // namespace idemzip
