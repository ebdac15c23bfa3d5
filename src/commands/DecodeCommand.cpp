#include "DecodeCommand.hpp"
#include "../bencode/Bencode.hpp"
#include "../utils/JsonUtils.hpp"
#include <iostream>
#include <unistd.h>

void DecodeCommand::execute(const CommandOptions& options) {
    try {
        if (options.args.empty()) {
            throw std::runtime_error("No input provided for decode");
        }
        DecoderOptions decoder_options = options.toDecoderOptions();

        BencodeValue decoded_value;
        if (options.args[0] == "-") {
            FileDescriptorByteSource source(STDIN_FILENO);
            BencodeReader reader(source, decoder_options);
            decoded_value = reader.readObject();
        } else {
            decoded_value = Bencode::decode(options.args[0], decoder_options);
        }
        std::cout << JsonUtils::dump(decoded_value) << std::endl;
    } catch (const std::exception& e) {
        throw std::runtime_error("Decode failed: " + std::string(e.what()));
    }
}

std::string DecodeCommand::usage() const {
    return "decode [-c charset] [-s true|false] [-d depth] <encoded|->";
}
