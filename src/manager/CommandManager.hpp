#pragma once

#include "../commands/Command.hpp"
#include "../commands/CommandOptions.hpp"
#include <map>
#include <memory>
#include <ostream>

class CommandManager {
public:
    void registerCommand(const std::string& name, std::unique_ptr<Command> command);
    // Returns false when the command is unknown or fails; the reason goes to std::cerr.
    bool executeCommand(const std::string& name, const CommandOptions& options);
    void printUsage(std::ostream& out, const std::string& program) const;

    // Splits the arguments after the command name into "-x value" options and plain args.
    static CommandOptions parseCommandOptions(const std::vector<std::string>& arguments);

private:
    std::map<std::string, std::unique_ptr<Command>> commands;
};
