#include "CommandManager.hpp"
#include <iostream>

void CommandManager::registerCommand(const std::string& name, std::unique_ptr<Command> command) {
    commands[name] = std::move(command);
}

bool CommandManager::executeCommand(const std::string& name, const CommandOptions& options) {
    auto it = commands.find(name);
    if (it != commands.end()) {
        try {
            it->second->execute(options);
            return true;
        } catch (const std::exception& e) {
            std::cerr << "Error executing command: " << e.what() << std::endl;
        }
    } else {
        std::cerr << "Unknown command: " << name << std::endl;
    }
    return false;
}

void CommandManager::printUsage(std::ostream& out, const std::string& program) const {
    out << "Usage: " << program << " <command> [options] <args>" << std::endl;
    for (const auto& [name, command] : commands) {
        out << "  " << command->usage() << std::endl;
    }
}

CommandOptions CommandManager::parseCommandOptions(const std::vector<std::string>& arguments) {
    CommandOptions options;

    for (size_t i = 0; i < arguments.size(); i++) {
        const std::string& arg = arguments[i];
        // A lone "-" means standard input, not an option
        if (arg.size() > 1 && arg[0] == '-') {
            if (i + 1 < arguments.size()) {  // Make sure we have a value after the option
                options.options[arg] = arguments[i + 1];
                i++;  // Skip the next argument since it's the option value
            }
        } else {
            options.args.push_back(arg);
        }
    }

    return options;
}
