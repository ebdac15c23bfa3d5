#include "DecodeFileCommand.hpp"
#include "../bencode/BencodeReader.hpp"
#include "../utils/JsonUtils.hpp"
#include <fstream>
#include <iostream>

void DecodeFileCommand::execute(const CommandOptions& options) {
    if (options.args.empty()) {
        throw std::runtime_error("No file provided for decode_file");
    }

    std::ifstream file(options.args[0], std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + options.args[0]);
    }

    StreamByteSource source(file);
    BencodeReader reader(source, options.toDecoderOptions());
    while (!reader.atEnd()) {
        std::cout << JsonUtils::dump(reader.readObject()) << std::endl;
    }
}

std::string DecodeFileCommand::usage() const {
    return "decode_file [-c charset] [-s true|false] [-d depth] <path>";
}
