#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>
#include "secure_memory.hpp"

namespace zeldwallet {

// Upper bound on PBKDF2 rounds read from stored or imported documents
constexpr uint32_t MAX_PBKDF2_ITERATIONS = 10000000;

// Authenticated encryption with associated data. Ciphertexts carry the
// authentication tag appended to the encrypted bytes.
class AeadCipher {
public:
    virtual ~AeadCipher() = default;

    virtual std::string name() const = 0;
    virtual size_t key_size() const = 0;
    virtual size_t iv_size() const = 0;

    virtual std::vector<uint8_t> encrypt(std::span<const uint8_t> key, std::span<const uint8_t> iv,
                                         std::span<const uint8_t> plaintext,
                                         std::span<const uint8_t> aad) = 0;

    // Returns false when the tag does not authenticate; plaintext is left
    // empty in that case
    virtual bool decrypt(std::span<const uint8_t> key, std::span<const uint8_t> iv,
                         std::span<const uint8_t> ciphertext, std::span<const uint8_t> aad,
                         SecureMemory& plaintext) = 0;
};

// Password based key derivation
class KeyDerivationFunction {
public:
    virtual ~KeyDerivationFunction() = default;

    virtual std::string name() const = 0;   // e.g. "PBKDF2"
    virtual std::string hash() const = 0;   // e.g. "SHA-256"

    virtual SecureMemory derive(std::span<const uint8_t> password, std::span<const uint8_t> salt,
                                uint32_t iterations, size_t length) = 0;
};

// Keyed message authentication
class Mac {
public:
    virtual ~Mac() = default;

    virtual std::string name() const = 0;

    virtual std::vector<uint8_t> compute(std::span<const uint8_t> key, std::span<const uint8_t> data) = 0;

    // Constant-time comparison against an expected tag
    virtual bool verify(std::span<const uint8_t> key, std::span<const uint8_t> data,
                        std::span<const uint8_t> tag) = 0;
};

class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual void fill(std::span<uint8_t> out) = 0;

    std::vector<uint8_t> bytes(size_t count) {
        std::vector<uint8_t> out(count);
        fill(out);
        return out;
    }
};

// The primitives the encrypted store and the backup envelope are built on.
// Tests swap individual members for deterministic fakes.
struct CryptoProvider {
    std::shared_ptr<AeadCipher> aead;
    std::shared_ptr<KeyDerivationFunction> kdf;
    std::shared_ptr<Mac> mac;
    std::shared_ptr<RandomSource> random;

    // AES-256-GCM, PBKDF2-HMAC-SHA256, HMAC-SHA256 and RAND_bytes
    static CryptoProvider openssl();
};

} // namespace zeldwallet
