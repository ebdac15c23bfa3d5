#include "commands/DecodeCommand.hpp"
#include "commands/DecodeFileCommand.hpp"
#include "commands/EncodeCommand.hpp"
#include "manager/CommandManager.hpp"
#include <iostream>
#include <memory>
#include <vector>

int main(int argc, char* argv[]) {
    CommandManager manager;
    manager.registerCommand("decode", std::make_unique<DecodeCommand>());
    manager.registerCommand("decode_file", std::make_unique<DecodeFileCommand>());
    manager.registerCommand("encode", std::make_unique<EncodeCommand>());

    if (argc < 2) {
        manager.printUsage(std::cerr, argv[0]);
        return 1;
    }

    std::string command = argv[1];
    CommandOptions options = CommandManager::parseCommandOptions(std::vector<std::string>(argv + 2, argv + argc));

    return manager.executeCommand(command, options) ? 0 : 1;
}
