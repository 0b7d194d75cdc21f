#pragma once

#include "cli/ICommand.hpp"

namespace idemzip {

class RepackCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "repack"; }
    const char* description() const override { return "Rewrite zip archives in place, byte-for-byte reproducible"; }
    const char* helpNameLine() const override { return "repack -  Normalize zip archives so identical content gives identical bytes"; }
    const char* helpSynopsis() const override {
        return "idemzip repack [--scratch <dir>] [--jobs <n>] [--discover <dir> [--pattern <glob>]] [--level <0-9>] "
               "[--keep-dirs] <archive|glob>...";
    }
    const char* helpDescription() const override {
        return "Extract each archive into a scratch directory, reset every file timestamp to a fixed epoch, "
               "rebuild the archive with entries in sorted order and atomically replace the original. "
               "An archive that cannot be read is reported and left untouched; a failed rebuild aborts the run.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--scratch <dir>", "Scratch root, wiped before and removed after the run (default ./.repack)."},
            {"--jobs <n>", "Repack up to <n> archives concurrently (default 1)."},
            {"--discover <dir>", "Also repack archives found under <dir>, excluding the scratch root."},
            {"--pattern <glob>", "Discovery pattern relative to --discover (default **/*.zip)."},
            {"--level <0-9>", "Deflate level of the rebuilt archives (default 6)."},
            {"--keep-dirs", "Write explicit directory entries into the rebuilt archives."}
        };
    }
};

}
