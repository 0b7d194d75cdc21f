#include "util/PatternMatcher.hpp"

#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

namespace idemzip {
namespace PatternMatcher {

std::regex globToRegex(const std::string& pattern) {
    std::string regexStr = "^";
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                ++i;
                if (i + 1 < pattern.size() && pattern[i + 1] == '/') {
                    // "**/" also matches no directory at all
                    ++i;
                    regexStr += "(?:.*/)?";
                } else {
                    regexStr += ".*";
                }
            } else {
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '[') {
            size_t close = pattern.find(']', i + 1);
            if (close == std::string::npos) {
                regexStr += "\\[";
                continue;
            }
            std::string cls = pattern.substr(i + 1, close - i - 1);
            if (!cls.empty() && cls[0] == '!') cls[0] = '^';
            regexStr += '[';
            for (char k : cls) {
                if (k == '\\' || k == '[') regexStr += '\\';
                regexStr += k;
            }
            regexStr += ']';
            i = close;
        } else if (c == '.' || c == '+' || c == ']' || c == '(' || c == ')' ||
                   c == '{' || c == '}' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }
    regexStr += "$";
    return std::regex(regexStr);
}

bool isPattern(const std::string& path) {
    return path.find('*') != std::string::npos ||
           path.find('?') != std::string::npos ||
           path.find('[') != std::string::npos;
}

std::vector<fs::path> matchFiles(
    const std::string& pattern,
    const fs::path& root,
    const fs::path& excludeDir
) {
    std::vector<fs::path> matches;
    if (pattern.empty()) {
        return matches;
    }

    std::error_code ec;
    fs::path searchRoot = fs::absolute(root, ec).lexically_normal();
    if (ec || !fs::is_directory(searchRoot, ec)) {
        return matches;
    }

    std::string excludeStr;
    if (!excludeDir.empty()) {
        excludeStr = fs::absolute(excludeDir, ec).lexically_normal().generic_string();
        if (excludeStr.size() > 1 && excludeStr.back() == '/') excludeStr.pop_back();
    }

    std::regex re = globToRegex(pattern);
    const auto opts = fs::directory_options::follow_directory_symlink |
                      fs::directory_options::skip_permission_denied;

    for (auto it = fs::recursive_directory_iterator(searchRoot, opts, ec);
         it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (ec) break;
        const fs::path entry = it->path().lexically_normal();

        if (!excludeStr.empty()) {
            std::string entryStr = entry.generic_string();
            if (entryStr == excludeStr || entryStr.rfind(excludeStr + "/", 0) == 0) {
                it.disable_recursion_pending();
                continue;
            }
        }

        if (!fs::is_regular_file(entry, ec)) continue;

        std::string relStr = entry.lexically_relative(searchRoot).generic_string();
        if (std::regex_match(relStr, re)) {
            matches.push_back(entry);
        }
    }

    return matches;
}

}  // namespace PatternMatcher
}  // namespace idemzip
