#pragma once
#include "BencodeValue.hpp"
#include "ByteSource.hpp"
#include "DecoderOptions.hpp"
#include "ExtensionHandler.hpp"
#include "PushbackReader.hpp"
#include "../utils/CharsetUtils.hpp"
#include <functional>
#include <memory>
#include <string>

// Streaming bencode decoder over a caller-owned ByteSource.
class BencodeReader {
public:
    // Invoked for every list element or dictionary value as soon as it is decoded.
    using ElementCheck = std::function<void(const BencodeValue&)>;

    static constexpr uint8_t DICTIONARY = 'd';
    static constexpr uint8_t LIST = 'l';
    static constexpr uint8_t NUMBER = 'i';
    static constexpr uint8_t TERMINATOR = 'e';
    static constexpr uint8_t LENGTH_DELIMITER = ':';

    explicit BencodeReader(ByteSource& source,
                           DecoderOptions options = DecoderOptions(),
                           std::shared_ptr<ExtensionHandler> extension = nullptr);

    const DecoderOptions& getOptions() const { return options; }
    const std::string& getCharset() const { return options.charset; }
    bool isDecodeAsString() const { return options.decodeAsString; }

    BencodeValue readObject();

    // Raw payload of a byte-string token.
    BencodeBytes readBytes();
    std::string readString();
    std::string readString(const std::string& charset);

    // Integer or Decimal value.
    BencodeValue readNumber();

    BencodeList readList(const ElementCheck& check = ElementCheck());
    // Appends to dst.
    void readList(BencodeList& dst, const ElementCheck& check = ElementCheck());
    BencodeDictionary readMap(const ElementCheck& check = ElementCheck());
    // Merges into dst; later keys overwrite existing entries.
    void readMap(BencodeDictionary& dst, const ElementCheck& check = ElementCheck());

    // True when the source is exhausted; does not consume anything.
    bool atEnd();

    PushbackReader& input() { return in; }

private:
    BencodeValue readCustom();
    BencodeBytes read_raw(uint64_t length);
    void expect(uint8_t token, const char* what);
    void enter_aggregate();
    std::string offset() const;

    PushbackReader in;
    DecoderOptions options;
    std::shared_ptr<ExtensionHandler> extension;
    CharsetConverter converter;
    size_t depth = 0;
};
