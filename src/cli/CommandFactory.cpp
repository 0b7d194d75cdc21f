#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/InspectCommand.hpp"
#include "cli/commands/RepackCommand.hpp"
#include "cli/commands/RepackServiceCommand.hpp"

namespace idemzip {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerBuiltins() {
    auto& f = instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("repack", [] { return std::make_unique<RepackCommand>(); });
    f.registerCreator("repack-service", [] { return std::make_unique<RepackServiceCommand>(); });
    f.registerCreator("inspect", [] { return std::make_unique<InspectCommand>(); });
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

}
