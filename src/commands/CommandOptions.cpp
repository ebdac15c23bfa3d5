#include "CommandOptions.hpp"
#include <stdexcept>

DecoderOptions CommandOptions::toDecoderOptions() const {
    DecoderOptions decoder_options;

    auto charset = options.find("-c");
    if (charset != options.end()) {
        decoder_options.charset = charset->second;
    }

    auto as_string = options.find("-s");
    if (as_string != options.end()) {
        if (as_string->second == "true" || as_string->second == "1") {
            decoder_options.decodeAsString = true;
        } else if (as_string->second == "false" || as_string->second == "0") {
            decoder_options.decodeAsString = false;
        } else {
            throw std::invalid_argument("Invalid value for -s: " + as_string->second);
        }
    }

    auto depth = options.find("-d");
    if (depth != options.end()) {
        try {
            decoder_options.maxDepth = std::stoul(depth->second);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Invalid value for -d: " + depth->second);
        }
    }

    return decoder_options;
}
