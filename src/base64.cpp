#include "base64.hpp"

#include <openssl/evp.h>
#include <stdexcept>

namespace zeldwallet {

std::string Base64::encode(std::span<const uint8_t> data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    if (written < 0) {
        throw std::runtime_error("Base64 encoding failed");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

std::vector<uint8_t> Base64::decode(std::string_view encoded) {
    if (encoded.empty()) {
        return {};
    }
    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("Invalid base64 length");
    }

    // EVP_DecodeBlock skips surrounding whitespace silently; reject it here
    size_t padding = 0;
    for (size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        bool alpha = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                     (c >= '0' && c <= '9') || c == '+' || c == '/';
        if (c == '=') {
            if (i < encoded.size() - 2) {
                throw std::invalid_argument("Invalid base64 padding");
            }
            ++padding;
        } else if (!alpha || padding > 0) {
            throw std::invalid_argument("Invalid base64 character");
        }
    }

    std::vector<uint8_t> out(3 * (encoded.size() / 4));
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        throw std::invalid_argument("Invalid base64 input");
    }
    // EVP_DecodeBlock counts the zero bytes produced by '=' padding
    out.resize(static_cast<size_t>(written) - padding);

    // Unused bits before '=' must be zero, so each byte string has one encoding
    if (encode(out) != encoded) {
        throw std::invalid_argument("Non-canonical base64");
    }
    return out;
}

} // namespace zeldwallet
