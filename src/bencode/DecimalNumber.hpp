#pragma once
#include <string>
#include <cstdint>
#include <boost/multiprecision/cpp_int.hpp>

using BigInteger = boost::multiprecision::cpp_int;

// Parses [+-]<digits> in base 10 (leading zeros allowed); throws NumberFormatError.
BigInteger parseBigInteger(const std::string& text);

// Arbitrary-precision decimal stored as unscaled * 10^-scale.
class DecimalNumber {
public:
    DecimalNumber() = default;
    DecimalNumber(BigInteger unscaled, uint32_t scale);

    // Accepts [+-]<digits>.<digits>; throws NumberFormatError otherwise.
    static DecimalNumber parse(const std::string& text);

    const BigInteger& unscaled() const { return unscaled_value; }
    uint32_t scale() const { return scale_digits; }

    BigInteger integerPart() const;
    double toDouble() const;
    std::string toString() const;

    bool operator==(const DecimalNumber& other) const;
    bool operator!=(const DecimalNumber& other) const { return !(*this == other); }

private:
    BigInteger unscaled_value;
    uint32_t scale_digits = 0;
};
