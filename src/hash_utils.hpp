#pragma once

#include <array>
#include <vector>
#include <span>
#include <string_view>
#include <cstdint>
#include <openssl/sha.h>
#include <openssl/ripemd.h>

namespace zeldwallet {

using Hash256 = std::array<uint8_t, SHA256_DIGEST_LENGTH>;
using Hash160 = std::array<uint8_t, RIPEMD160_DIGEST_LENGTH>;
using Hash512 = std::array<uint8_t, SHA512_DIGEST_LENGTH>;

// HashUtils is a utility class for the hash functions, MACs and key
// stretching used by Bitcoin key derivation and by the encrypted store
class HashUtils {
public:
    // Computes the SHA256 hash of input data
    static Hash256 sha256(std::span<const uint8_t> data);

    // Computes double SHA256 hash (SHA256(SHA256(data)))
    static Hash256 double_sha256(std::span<const uint8_t> data);

    // Computes RIPEMD160 hash of input data
    static Hash160 ripemd160(std::span<const uint8_t> data);

    // Computes HASH160 (RIPEMD160(SHA256(data)))
    static Hash160 hash160(std::span<const uint8_t> data);

    // Computes the SHA512 hash of input data
    static Hash512 sha512(std::span<const uint8_t> data);

    // HMAC-SHA512 as used by BIP32
    static Hash512 hmac_sha512(std::span<const uint8_t> key, std::span<const uint8_t> data);

    // HMAC-SHA256
    static Hash256 hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data);

    // BIP340 tagged hash: SHA256(SHA256(tag) || SHA256(tag) || data)
    static Hash256 tagged_hash(std::string_view tag, std::span<const uint8_t> data);

    // PBKDF2-HMAC-SHA512, used for BIP39 seeds
    static std::vector<uint8_t> pbkdf2_sha512(std::span<const uint8_t> password,
                                              std::span<const uint8_t> salt,
                                              uint32_t iterations, size_t length);

    // PBKDF2-HMAC-SHA256, used for storage and backup keys
    static std::vector<uint8_t> pbkdf2_sha256(std::span<const uint8_t> password,
                                              std::span<const uint8_t> salt,
                                              uint32_t iterations, size_t length);

private:
    // Private constructor to prevent instantiation
    HashUtils() = delete;
};

} // namespace zeldwallet
