#include "EncodeCommand.hpp"
#include "../bencode/Bencode.hpp"
#include "../utils/JsonUtils.hpp"
#include <iostream>

void EncodeCommand::execute(const CommandOptions& options) {
    if (options.args.empty()) {
        throw std::runtime_error("No input provided for encode");
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(options.args[0]);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON input: " + std::string(e.what()));
    }
    std::cout << Bencode::encode(JsonUtils::fromJson(document)) << std::endl;
}

std::string EncodeCommand::usage() const {
    return "encode <json>";
}
