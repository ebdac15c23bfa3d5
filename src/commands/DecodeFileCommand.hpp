#pragma once

#include "Command.hpp"

// Decodes every top-level value in a file, one JSON document per line.
class DecodeFileCommand : public Command {
public:
    void execute(const CommandOptions& options) override;
    std::string usage() const override;
};
