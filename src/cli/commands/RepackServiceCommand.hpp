#pragma once

#include "cli/ICommand.hpp"

namespace idemzip {

class RepackServiceCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "repack-service"; }
    const char* description() const override { return "Repack every deployment archive of a packaged service"; }
    const char* helpNameLine() const override { return "repack-service -  Normalize the archives under <service-dir>/.serverless"; }
    const char* helpSynopsis() const override {
        return "idemzip repack-service <service-dir> [--name <service>] [--function <name>]... [--individually] "
               "[--only <function>] [--pattern <glob>] [--no-discover] [--jobs <n>]";
    }
    const char* helpDescription() const override {
        return "Repack the archives the packaging step produced for a service: <service>.zip, or one "
               "<function>.zip per function when packaged individually. Other archives found under "
               ".serverless are repacked too, each exactly once. Scratch space is <service-dir>/.repack.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--name <service>", "Service name (default: the directory name)."},
            {"--function <name>", "Function packaged individually; repeat for each function."},
            {"--individually", "Expect one archive per function instead of one per service."},
            {"--only <function>", "Repack only this function's archive (implies --individually)."},
            {"--pattern <glob>", "Discovery pattern relative to .serverless (default **/*.zip)."},
            {"--no-discover", "Only repack the archives named by the packaging plan."},
            {"--jobs <n>", "Repack up to <n> archives concurrently (default 1)."}
        };
    }
};

}
