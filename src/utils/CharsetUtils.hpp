#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Reusable conversion from one charset to UTF-8. Undecodable input is
// replaced with U+FFFD; an unknown charset throws std::invalid_argument.
class CharsetConverter {
public:
    explicit CharsetConverter(const std::string& charset);
    ~CharsetConverter();
    CharsetConverter(const CharsetConverter&) = delete;
    CharsetConverter& operator=(const CharsetConverter&) = delete;

    const std::string& charset() const { return name; }

    std::string toUtf8(const uint8_t* data, size_t len);
    std::string toUtf8(const std::vector<uint8_t>& data) { return toUtf8(data.data(), data.size()); }

private:
    std::string name;
    void* handle;
};

class CharsetUtils {
public:
    // One-off conversions; keep a CharsetConverter for repeated use.
    static std::string toUtf8(const uint8_t* data, size_t len, const std::string& charset);
    static std::string toUtf8(const std::vector<uint8_t>& data, const std::string& charset);

    static bool isSupported(const std::string& charset);
};
