#pragma once
#include <string>
#include <map>
#include <vector>
#include "../bencode/DecoderOptions.hpp"

struct CommandOptions {
    std::map<std::string, std::string> options;  // Stores options like -c and their values
    std::vector<std::string> args;               // Stores regular arguments

    // -c <charset>, -s <true|false>, -d <max depth>
    DecoderOptions toDecoderOptions() const;
};
