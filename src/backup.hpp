#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "crypto_provider.hpp"
#include "key_manager.hpp"
#include "network.hpp"

namespace zeldwallet {

constexpr int BACKUP_VERSION = 1;
constexpr uint32_t BACKUP_MAX_ITERATIONS = MAX_PBKDF2_ITERATIONS;

struct BackupKdf {
    std::string name;        // "PBKDF2"
    std::string hash;        // "SHA-256"
    uint32_t iterations = 0;
    std::string salt;        // base64
};

// Portable, password-encrypted wallet export. Every field except mac and
// mac_algo is covered by the MAC.
struct BackupEnvelope {
    int version = BACKUP_VERSION;
    std::string cipher;      // "AES-GCM"
    BackupKdf kdf;
    std::string iv;          // base64
    std::string ciphertext;  // base64, tag appended
    int64_t created_at = 0;  // ms since epoch
    std::string network;
    std::string mac;         // base64
    std::string mac_algo;    // "HMAC-SHA256"
};

void to_json(nlohmann::json& j, const BackupEnvelope& envelope);
void from_json(const nlohmann::json& j, BackupEnvelope& envelope);

// Decrypted backup contents. Secrets are wiped on destruction.
struct BackupPayload {
    std::string mnemonic;
    std::optional<std::string> passphrase;
    Network network = Network::Mainnet;
    int64_t created_at = 0;
    std::optional<CustomPaths> custom_paths;

    BackupPayload() = default;
    BackupPayload(const BackupPayload&) = delete;
    BackupPayload& operator=(const BackupPayload&) = delete;
    BackupPayload(BackupPayload&&) = default;
    BackupPayload& operator=(BackupPayload&&) = default;
    ~BackupPayload();
};

// Seals and opens backup envelopes.
//
// Key material: PBKDF2(backup password, salt, iterations) stretched to 64
// bytes; the first half is the AEAD key, the second half the MAC key. The
// MAC covers the envelope fields in a fixed order:
//   version, cipher, kdf{name, hash, iterations, salt}, iv, ciphertext,
//   createdAt, network
// and is checked in constant time before any decryption is attempted.
class BackupCodec {
public:
    explicit BackupCodec(CryptoProvider crypto) : crypto_(std::move(crypto)) {}

    BackupEnvelope seal(const BackupPayload& payload, const std::string& backup_password,
                        uint32_t iterations);

    // base64(JSON) form handed to users
    static std::string encode(const BackupEnvelope& envelope);

    // Accepts base64-wrapped JSON or plain JSON. BackupFormatInvalid for
    // anything else.
    static BackupEnvelope parse(const std::string& text);

    // BackupIntegrityFailure on MAC mismatch, DecryptionFailed when the
    // ciphertext does not open, BackupFormatInvalid for a bad payload
    BackupPayload open(const BackupEnvelope& envelope, const std::string& backup_password);

    // Canonical serialization the MAC is computed over
    static std::string mac_payload(const BackupEnvelope& envelope);

private:
    CryptoProvider crypto_;
};

} // namespace zeldwallet
