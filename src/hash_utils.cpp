#include "hash_utils.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

namespace zeldwallet {

// Computes the SHA256 hash of input data
// SHA256 produces a fixed-size 32-byte output regardless of the input size.
// Bitcoin uses it for transaction IDs, sighashes and address checksums.
Hash256 HashUtils::sha256(std::span<const uint8_t> data) {
    Hash256 hash;
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash.data(), &sha256);
    return hash;
}

// Computes double SHA256 hash (SHA256(SHA256(data)))
// Used for txids, legacy/BIP143 sighashes, Base58Check checksums and the
// Bitcoin signed-message digest.
Hash256 HashUtils::double_sha256(std::span<const uint8_t> data) {
    auto first_hash = sha256(data);
    return sha256(std::span<const uint8_t>(first_hash.data(), first_hash.size()));
}

// Computes RIPEMD160 hash of input data
Hash160 HashUtils::ripemd160(std::span<const uint8_t> data) {
    Hash160 hash;
    RIPEMD160_CTX ripemd160;
    RIPEMD160_Init(&ripemd160);
    RIPEMD160_Update(&ripemd160, data.data(), data.size());
    RIPEMD160_Final(hash.data(), &ripemd160);
    return hash;
}

// Computes HASH160 (RIPEMD160(SHA256(data)))
// HASH160 commits to a public key (P2PKH, P2WPKH) or a redeem script (P2SH)
// in 20 bytes.
Hash160 HashUtils::hash160(std::span<const uint8_t> data) {
    auto sha256_result = sha256(data);
    return ripemd160(std::span<const uint8_t>(sha256_result.data(), sha256_result.size()));
}

Hash512 HashUtils::sha512(std::span<const uint8_t> data) {
    Hash512 hash;
    SHA512_CTX sha512;
    SHA512_Init(&sha512);
    SHA512_Update(&sha512, data.data(), data.size());
    SHA512_Final(hash.data(), &sha512);
    return hash;
}

Hash512 HashUtils::hmac_sha512(std::span<const uint8_t> key, std::span<const uint8_t> data) {
    Hash512 result;
    unsigned int result_len = 0;
    if (!HMAC(EVP_sha512(), key.data(), static_cast<int>(key.size()),
              data.data(), data.size(), result.data(), &result_len) ||
        result_len != result.size()) {
        throw std::runtime_error("HMAC-SHA512 failed");
    }
    return result;
}

Hash256 HashUtils::hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data) {
    Hash256 result;
    unsigned int result_len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              data.data(), data.size(), result.data(), &result_len) ||
        result_len != result.size()) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return result;
}

// Tagged hashes (BIP340) domain-separate the different uses of SHA256:
//   tagged_hash(tag, x) = SHA256(SHA256(tag) || SHA256(tag) || x)
// Tags in use: "TapTweak", "TapSighash", "BIP0340/aux", "BIP0340/nonce",
// "BIP0340/challenge" and "BIP0322-signed-message".
Hash256 HashUtils::tagged_hash(std::string_view tag, std::span<const uint8_t> data) {
    auto tag_hash = sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(tag.data()), tag.size()));

    Hash256 hash;
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, tag_hash.data(), tag_hash.size());
    SHA256_Update(&sha256, tag_hash.data(), tag_hash.size());
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash.data(), &sha256);
    return hash;
}

std::vector<uint8_t> HashUtils::pbkdf2_sha512(std::span<const uint8_t> password,
                                              std::span<const uint8_t> salt,
                                              uint32_t iterations, size_t length) {
    std::vector<uint8_t> out(length);
    if (PKCS5_PBKDF2_HMAC(reinterpret_cast<const char*>(password.data()),
                          static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha512(),
                          static_cast<int>(out.size()), out.data()) != 1) {
        throw std::runtime_error("PBKDF2-HMAC-SHA512 failed");
    }
    return out;
}

std::vector<uint8_t> HashUtils::pbkdf2_sha256(std::span<const uint8_t> password,
                                              std::span<const uint8_t> salt,
                                              uint32_t iterations, size_t length) {
    std::vector<uint8_t> out(length);
    if (PKCS5_PBKDF2_HMAC(reinterpret_cast<const char*>(password.data()),
                          static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha256(),
                          static_cast<int>(out.size()), out.data()) != 1) {
        throw std::runtime_error("PBKDF2-HMAC-SHA256 failed");
    }
    return out;
}

} // namespace zeldwallet
