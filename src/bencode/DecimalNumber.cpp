#include "DecimalNumber.hpp"
#include "BencodeError.hpp"
#include <cctype>
#include <cstdlib>

namespace {

BigInteger powerOfTen(uint32_t exponent) {
    BigInteger result = 1;
    for (uint32_t i = 0; i < exponent; i++) {
        result *= 10;
    }
    return result;
}

bool allDigits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

BigInteger digitsToInteger(const std::string& digits) {
    // cpp_int reads a leading zero as an octal prefix
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return BigInteger(0);
    }
    return BigInteger(digits.substr(first));
}

}

BigInteger parseBigInteger(const std::string& text) {
    bool negative = false;
    std::string digits = text;
    if (!digits.empty() && (digits[0] == '-' || digits[0] == '+')) {
        negative = digits[0] == '-';
        digits = digits.substr(1);
    }
    if (!allDigits(digits)) {
        throw NumberFormatError("Invalid integer: " + text);
    }

    BigInteger value = digitsToInteger(digits);
    return negative ? BigInteger(-value) : value;
}

DecimalNumber::DecimalNumber(BigInteger unscaled, uint32_t scale)
    : unscaled_value(std::move(unscaled)), scale_digits(scale) {}

DecimalNumber DecimalNumber::parse(const std::string& text) {
    bool negative = false;
    std::string body = text;
    if (!body.empty() && (body[0] == '-' || body[0] == '+')) {
        negative = body[0] == '-';
        body = body.substr(1);
    }

    size_t dot_index = body.find('.');
    if (dot_index == std::string::npos || body.find('.', dot_index + 1) != std::string::npos) {
        throw NumberFormatError("Invalid decimal: " + text);
    }

    std::string integer_digits = body.substr(0, dot_index);
    std::string fraction_digits = body.substr(dot_index + 1);
    if (!allDigits(integer_digits) || !allDigits(fraction_digits)) {
        throw NumberFormatError("Invalid decimal: " + text);
    }

    BigInteger unscaled = digitsToInteger(integer_digits + fraction_digits);
    if (negative) {
        unscaled = -unscaled;
    }
    return DecimalNumber(std::move(unscaled), static_cast<uint32_t>(fraction_digits.size()));
}

BigInteger DecimalNumber::integerPart() const {
    // cpp_int division truncates toward zero
    return unscaled_value / powerOfTen(scale_digits);
}

double DecimalNumber::toDouble() const {
    // Out-of-range values overflow to +-HUGE_VAL like integer conversion does
    std::string text = toString();
    return std::strtod(text.c_str(), nullptr);
}

std::string DecimalNumber::toString() const {
    std::string digits = (unscaled_value < 0 ? BigInteger(-unscaled_value) : unscaled_value).str();
    if (digits.size() <= scale_digits) {
        digits.insert(0, scale_digits - digits.size() + 1, '0');
    }

    std::string result = unscaled_value < 0 ? "-" : "";
    if (scale_digits == 0) {
        return result + digits;
    }
    size_t point = digits.size() - scale_digits;
    return result + digits.substr(0, point) + "." + digits.substr(point);
}

bool DecimalNumber::operator==(const DecimalNumber& other) const {
    return scale_digits == other.scale_digits && unscaled_value == other.unscaled_value;
}
