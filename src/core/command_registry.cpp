#include "assetrelay/core/command_registry.hpp"
#include <iomanip>

namespace assetrelay::core {

CommandRegistry::CommandRegistry(CommandContext& context) {
    register_command("upload", std::make_unique<UploadCommandHandler>(context));
    register_command("fetch", std::make_unique<FetchCommandHandler>(context));
    register_command("assets", std::make_unique<AssetsCommandHandler>(context));
    register_command("delete", std::make_unique<DeleteCommandHandler>(context));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::usage("Unknown command: " + command);
    }

    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help(std::ostream& out) const {
    out << "\nCommands:\n";
    for (const auto& [name, handler] : handlers_) {
        out << "  " << std::left << std::setw(10) << name << handler->get_description() << "\n"
            << "  " << std::setw(10) << "" << handler->get_usage() << "\n";
    }
}

}
