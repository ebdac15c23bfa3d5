#pragma once

#include "Command.hpp"

class EncodeCommand : public Command {
public:
    void execute(const CommandOptions& options) override;
    std::string usage() const override;
};
