#pragma once

#include "Command.hpp"

class DecodeCommand : public Command {
public:
    void execute(const CommandOptions& options) override;
    std::string usage() const override;
};
