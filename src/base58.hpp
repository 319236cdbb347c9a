#pragma once

#include <string>
#include <vector>
#include <span>
#include <cstdint>

namespace zeldwallet {

// Base58 is a utility class for Base58 and Base58Check encoding.
//
// Base58 is a binary-to-text encoding scheme used for legacy Bitcoin
// addresses. It uses a 58-character alphabet consisting of easily
// distinguishable characters (excluding 0, O, I, l). Base58Check appends the
// first four bytes of double-SHA256 of the payload as a checksum.
class Base58 {
public:
    // Encodes bytes as Base58 without a checksum
    static std::string encode(std::span<const uint8_t> data);

    // Decodes a Base58 string into bytes without checksum handling
    static std::vector<uint8_t> decode(const std::string& encoded);

    // Appends a 4-byte checksum and encodes
    static std::string encode_check(std::span<const uint8_t> payload);

    // Decodes and verifies the 4-byte checksum, returning the payload
    static std::vector<uint8_t> decode_check(const std::string& encoded);

private:
    // Private constructor to prevent instantiation
    Base58() = delete;
};

} // namespace zeldwallet
