#pragma once
#include <stdexcept>
#include <string>

// Every decode failure is fatal to the current decode; the stream position
// is unreliable afterwards.
class BencodeError : public std::runtime_error {
public:
    explicit BencodeError(const std::string& message) : std::runtime_error(message) {}
};

class EndOfInputError : public BencodeError {
public:
    explicit EndOfInputError(const std::string& message) : BencodeError(message) {}
};

class MalformedLengthError : public BencodeError {
public:
    explicit MalformedLengthError(const std::string& message) : BencodeError(message) {}
};

class NumberFormatError : public BencodeError {
public:
    explicit NumberFormatError(const std::string& message) : BencodeError(message) {}
};

class TypeMismatchError : public BencodeError {
public:
    explicit TypeMismatchError(const std::string& message) : BencodeError(message) {}
};

class UnknownEnumValueError : public BencodeError {
public:
    explicit UnknownEnumValueError(const std::string& message) : BencodeError(message) {}
};

class DecodeError : public BencodeError {
public:
    explicit DecodeError(const std::string& message) : BencodeError(message) {}
};
