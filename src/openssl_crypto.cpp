#include "crypto_provider.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <memory>

namespace zeldwallet {

namespace {

constexpr size_t GCM_KEY_SIZE = 32;
constexpr size_t GCM_IV_SIZE = 12;
constexpr size_t GCM_TAG_SIZE = 16;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

[[noreturn]] void cipher_failure(const char* step) {
    throw StorageError(StorageError::ErrorType::StorageFailure,
                       std::string("AES-GCM failure: ") + step);
}

// AES-256-GCM with a 96-bit IV and a 128-bit tag appended to the ciphertext
class OpenSslAesGcm : public AeadCipher {
public:
    std::string name() const override { return "AES-GCM"; }
    size_t key_size() const override { return GCM_KEY_SIZE; }
    size_t iv_size() const override { return GCM_IV_SIZE; }

    std::vector<uint8_t> encrypt(std::span<const uint8_t> key, std::span<const uint8_t> iv,
                                 std::span<const uint8_t> plaintext,
                                 std::span<const uint8_t> aad) override {
        if (key.size() != GCM_KEY_SIZE || iv.size() != GCM_IV_SIZE) {
            cipher_failure("bad key or IV size");
        }

        CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) cipher_failure("context allocation");

        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
            cipher_failure("init");
        }

        int len = 0;
        if (!aad.empty() &&
            EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
            cipher_failure("aad");
        }

        std::vector<uint8_t> out(plaintext.size() + GCM_TAG_SIZE);
        int written = 0;
        if (!plaintext.empty()) {
            if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext.data(),
                                  static_cast<int>(plaintext.size())) != 1) {
                cipher_failure("update");
            }
            written = len;
        }
        if (EVP_EncryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) {
            cipher_failure("final");
        }
        written += len;

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_SIZE),
                                out.data() + written) != 1) {
            cipher_failure("tag");
        }
        out.resize(static_cast<size_t>(written) + GCM_TAG_SIZE);
        return out;
    }

    bool decrypt(std::span<const uint8_t> key, std::span<const uint8_t> iv,
                 std::span<const uint8_t> ciphertext, std::span<const uint8_t> aad,
                 SecureMemory& plaintext) override {
        plaintext = SecureMemory();
        if (key.size() != GCM_KEY_SIZE || iv.size() != GCM_IV_SIZE || ciphertext.size() < GCM_TAG_SIZE) {
            return false;
        }

        size_t body_size = ciphertext.size() - GCM_TAG_SIZE;
        CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) cipher_failure("context allocation");

        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
            cipher_failure("init");
        }

        int len = 0;
        if (!aad.empty() &&
            EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
            return false;
        }

        // One spare byte keeps the buffer non-empty for empty plaintexts
        SecureMemory out(body_size + 1);
        int written = 0;
        if (body_size > 0) {
            if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext.data(),
                                  static_cast<int>(body_size)) != 1) {
                return false;
            }
            written = len;
        }

        std::vector<uint8_t> tag(ciphertext.end() - GCM_TAG_SIZE, ciphertext.end());
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(GCM_TAG_SIZE), tag.data()) != 1) {
            cipher_failure("tag");
        }
        if (EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) {
            return false;  // authentication failed, nothing is released
        }
        written += len;

        plaintext = SecureMemory(out.data(), static_cast<size_t>(written));
        return true;
    }
};

class OpenSslPbkdf2Sha256 : public KeyDerivationFunction {
public:
    std::string name() const override { return "PBKDF2"; }
    std::string hash() const override { return "SHA-256"; }

    SecureMemory derive(std::span<const uint8_t> password, std::span<const uint8_t> salt,
                        uint32_t iterations, size_t length) override {
        auto derived = HashUtils::pbkdf2_sha256(password, salt, iterations, length);
        SecureMemory out(derived);
        secure_wipe(derived);
        return out;
    }
};

class OpenSslHmacSha256 : public Mac {
public:
    std::string name() const override { return "HMAC-SHA256"; }

    std::vector<uint8_t> compute(std::span<const uint8_t> key, std::span<const uint8_t> data) override {
        auto tag = HashUtils::hmac_sha256(key, data);
        return std::vector<uint8_t>(tag.begin(), tag.end());
    }

    bool verify(std::span<const uint8_t> key, std::span<const uint8_t> data,
                std::span<const uint8_t> tag) override {
        auto expected = HashUtils::hmac_sha256(key, data);
        if (tag.size() != expected.size()) {
            return false;
        }
        return CRYPTO_memcmp(expected.data(), tag.data(), expected.size()) == 0;
    }
};

class OpenSslRandom : public RandomSource {
public:
    void fill(std::span<uint8_t> out) override {
        if (!out.empty() && RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
            throw StorageError(StorageError::ErrorType::StorageFailure, "Random generator failure");
        }
    }
};

} // namespace

CryptoProvider CryptoProvider::openssl() {
    CryptoProvider provider;
    provider.aead = std::make_shared<OpenSslAesGcm>();
    provider.kdf = std::make_shared<OpenSslPbkdf2Sha256>();
    provider.mac = std::make_shared<OpenSslHmacSha256>();
    provider.random = std::make_shared<OpenSslRandom>();
    return provider;
}

} // namespace zeldwallet
