#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace zeldwallet {

// Standard (RFC 4648, padded) Base64 on top of OpenSSL's EVP block codec.
// PSBTs, message signatures and backup envelopes cross the API boundary in
// this form.
class Base64 {
public:
    static std::string encode(std::span<const uint8_t> data);

    // Throws std::invalid_argument on characters outside the alphabet,
    // bad padding or a length that is not a multiple of four
    static std::vector<uint8_t> decode(std::string_view encoded);

private:
    Base64() = delete;
};

} // namespace zeldwallet
