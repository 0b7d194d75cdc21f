#include "cli/CommandInvoker.hpp"

#include <chrono>

#include "util/Logger.hpp"

namespace idemzip {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    auto& log = Logger::instance();
    log.debug(std::string("Executing command: ") + cmd.name());

    const auto started = std::chrono::steady_clock::now();
    auto res = cmd.execute(ctx, args);
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (!res) {
        log.error(std::string(cmd.name()) + ": " + res.error().message);
        return res;
    }
    log.debug(std::string(cmd.name()) + " finished in " + std::to_string(elapsedMs) + " ms");
    return {};
}

}
