#include "CharsetUtils.hpp"
#include <cerrno>
#include <cstring>
#include <iconv.h>
#include <stdexcept>

namespace {

const char* const REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

const iconv_t INVALID_HANDLE = reinterpret_cast<iconv_t>(-1);

}

CharsetConverter::CharsetConverter(const std::string& charset)
    : name(charset), handle(iconv_open("UTF-8", charset.c_str())) {
    if (handle == INVALID_HANDLE) {
        throw std::invalid_argument("Unsupported charset: " + charset);
    }
}

CharsetConverter::~CharsetConverter() {
    iconv_close(static_cast<iconv_t>(handle));
}

std::string CharsetConverter::toUtf8(const uint8_t* data, size_t len) {
    iconv_t converter = static_cast<iconv_t>(handle);
    // Start every conversion from the initial shift state
    iconv(converter, nullptr, nullptr, nullptr, nullptr);

    std::string result;
    result.reserve(len);

    char buffer[4096];
    char* in = const_cast<char*>(reinterpret_cast<const char*>(data));
    size_t in_left = len;

    while (in_left > 0) {
        char* out = buffer;
        size_t out_left = sizeof(buffer);
        size_t converted = iconv(converter, &in, &in_left, &out, &out_left);
        result.append(buffer, out - buffer);

        if (converted != static_cast<size_t>(-1)) {
            continue;
        }
        if (errno == E2BIG) {
            continue;
        }
        if (errno == EILSEQ || errno == EINVAL) {
            // Skip one offending byte and restart from the initial shift state
            result += REPLACEMENT_CHARACTER;
            in++;
            in_left--;
            iconv(converter, nullptr, nullptr, nullptr, nullptr);
            continue;
        }
        throw std::runtime_error("Charset conversion from " + name + " failed: " + std::strerror(errno));
    }

    char* out = buffer;
    size_t out_left = sizeof(buffer);
    iconv(converter, nullptr, nullptr, &out, &out_left);
    result.append(buffer, out - buffer);
    return result;
}

std::string CharsetUtils::toUtf8(const uint8_t* data, size_t len, const std::string& charset) {
    return CharsetConverter(charset).toUtf8(data, len);
}

std::string CharsetUtils::toUtf8(const std::vector<uint8_t>& data, const std::string& charset) {
    return toUtf8(data.data(), data.size(), charset);
}

bool CharsetUtils::isSupported(const std::string& charset) {
    iconv_t handle = iconv_open("UTF-8", charset.c_str());
    if (handle == INVALID_HANDLE) {
        return false;
    }
    iconv_close(handle);
    return true;
}
