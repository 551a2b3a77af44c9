#include "base64_utils.hpp"

#include <array>
#include <cctype>
#include <stdexcept>

namespace Base64Utils {

    static const char base64Chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789+/";

    static std::array<int, 256> buildDecodeTable() {
        std::array<int, 256> table;
        table.fill(-1);
        for (int i = 0; i < 64; ++i) {
            table[static_cast<unsigned char>(base64Chars[i])] = i;
        }
        return table;
    }

    std::string encode(const unsigned char* data, size_t len) {
        std::string ret;
        ret.reserve(((len + 2) / 3) * 4);

        size_t i = 0;
        for (; i + 2 < len; i += 3) {
            unsigned int triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
            ret += base64Chars[(triple >> 18) & 0x3f];
            ret += base64Chars[(triple >> 12) & 0x3f];
            ret += base64Chars[(triple >> 6) & 0x3f];
            ret += base64Chars[triple & 0x3f];
        }

        size_t rest = len - i;
        if (rest > 0) {
            unsigned int triple = data[i] << 16;
            if (rest == 2) triple |= data[i + 1] << 8;
            ret += base64Chars[(triple >> 18) & 0x3f];
            ret += base64Chars[(triple >> 12) & 0x3f];
            ret += rest == 2 ? base64Chars[(triple >> 6) & 0x3f] : '=';
            ret += '=';
        }

        return ret;
    }

    std::vector<unsigned char> decode(const std::string& encodedString) {
        static const std::array<int, 256> decodeTable = buildDecodeTable();

        std::vector<unsigned char> ret;
        ret.reserve(encodedString.size() * 3 / 4);

        unsigned int buffer = 0;
        int bits = 0;
        int groupLength = 0;
        bool padding = false;

        for (unsigned char c : encodedString) {
            if (std::isspace(c)) continue;
            if (c == '=') {
                padding = true;
                continue;
            }
            if (padding) {
                throw std::invalid_argument("base64: data after padding");
            }

            int value = decodeTable[c];
            if (value < 0) {
                throw std::invalid_argument(std::string("base64: invalid character '") +
                                            static_cast<char>(c) + "'");
            }

            buffer = (buffer << 6) | static_cast<unsigned int>(value);
            bits += 6;
            groupLength = (groupLength + 1) % 4;
            if (bits >= 8) {
                bits -= 8;
                ret.push_back(static_cast<unsigned char>((buffer >> bits) & 0xff));
            }
        }

        if (groupLength == 1) {
            throw std::invalid_argument("base64: truncated input");
        }

        return ret;
    }

    std::string stripDataUrlPrefix(const std::string& dataUrl) {
        if (dataUrl.compare(0, 5, "data:") != 0) {
            return dataUrl;
        }

        size_t comma = dataUrl.find(',');
        if (comma == std::string::npos) {
            throw std::invalid_argument("data URL without payload");
        }

        std::string header = dataUrl.substr(0, comma);
        if (header.size() < 7 || header.compare(header.size() - 7, 7, ";base64") != 0) {
            throw std::invalid_argument("data URL is not base64 encoded");
        }

        return dataUrl.substr(comma + 1);
    }
}
