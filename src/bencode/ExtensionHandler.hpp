#pragma once
#include "BencodeValue.hpp"
#include <cstdint>

class BencodeReader;

// Grammar for lead bytes the core dispatcher does not recognize. The lead
// byte has not been consumed when read() is called.
class ExtensionHandler {
public:
    virtual ~ExtensionHandler() = default;
    virtual BencodeValue read(uint8_t lead_byte, BencodeReader& reader) = 0;
};
