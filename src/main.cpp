// Command-line entry for the zip repackaging engine.

#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "util/Logger.hpp"

using namespace idemzip;

int main(int argc, char** argv) {
    CommandFactory::registerBuiltins();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    // Global flags come before the command name
    auto& log = Logger::instance();
    while (!args.empty() && !args.front().empty() && args.front()[0] == '-') {
        const std::string flag = args.front();
        if (flag == "-v" || flag == "--verbose") {
            log.setLevel(LogLevel::Debug);
        } else if (flag == "-q" || flag == "--quiet") {
            log.setLevel(LogLevel::Error);
        } else if (flag == "-h" || flag == "--help") {
            args.front() = "help";
            break;
        } else {
            std::cerr << "Unknown option: " << flag << "\n";
            return 2;
        }
        args.erase(args.begin());
    }

    AppContext ctx{};
    CommandInvoker invoker;
    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        auto res = invoker.invoke(*cmd, ctx, {});
        return res ? 0 : 1;
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return 1;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : 1;
}
