#ifndef BASE64_UTILS_HPP
#define BASE64_UTILS_HPP

#include <string>
#include <vector>

namespace Base64Utils {
    /**
     * Encode binary data to base64 string
     */
    std::string encode(const unsigned char* data, size_t len);

    /**
     * Decode base64 string to binary data. Whitespace is skipped, padding is optional.
     * Throws std::invalid_argument on characters outside the base64 alphabet or on a
     * truncated final group.
     */
    std::vector<unsigned char> decode(const std::string& encoded);

    /**
     * Return the payload of a "data:<mime>;base64,<payload>" URL. Strings without the
     * "data:" scheme are returned unchanged. Throws std::invalid_argument for data URLs
     * that are not base64 encoded.
     */
    std::string stripDataUrlPrefix(const std::string& dataUrl);
}

#endif // BASE64_UTILS_HPP
