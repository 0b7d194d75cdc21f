#pragma once

#include "cli/ICommand.hpp"

namespace idemzip {

class InspectCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "inspect"; }
    const char* description() const override { return "List the entries of a zip archive"; }
    const char* helpNameLine() const override { return "inspect -  Show stored entries and the archive checksum"; }
    const char* helpSynopsis() const override { return "idemzip inspect <archive>"; }
    const char* helpDescription() const override {
        return "Print every entry in stored order with its mode, size, CRC-32, method and DOS timestamp, "
               "followed by the CRC-32 of the whole archive. Two archives with the same checksum are identical.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
