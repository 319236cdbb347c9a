#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <nlohmann/json.hpp>
#include "crypto_provider.hpp"
#include "secure_memory.hpp"
#include "storage_backend.hpp"

namespace zeldwallet {

constexpr uint32_t DEFAULT_PBKDF2_ITERATIONS = 600000;

struct StorageInitOptions {
    // Only open an existing store; never create one
    bool read_only = false;
};

// SecureStorage is a password-optional encrypted key-value store. Every
// slot is sealed with the AEAD under one wallet key, with the slot name as
// associated data so blobs cannot be swapped between slots.
//
// The wallet key is either derived from a password (PBKDF2, per-wallet
// salt) or, for passwordless wallets, a random device key kept by the
// backend. A verifier blob under the same key tells a wrong password apart
// from a corrupted slot.
//
// Document layout:
//   {
//     "version": 1,
//     "meta": {
//       "mode": "password" | "device",
//       "kdf": {"name", "hash", "iterations", "salt"},   (password mode)
//       "verifier": {"iv", "data"},
//       "createdAt": <ms>, "backupCompletedAt": <ms> | null
//     },
//     "slots": {"<name>": {"iv", "data"}}
//   }
class SecureStorage {
public:
    static constexpr const char* SLOT_MNEMONIC = "mnemonic";
    static constexpr const char* SLOT_PASSPHRASE = "passphrase";
    static constexpr const char* SLOT_CONFIG = "config";

    explicit SecureStorage(std::shared_ptr<StorageBackend> backend,
                           CryptoProvider crypto = CryptoProvider::openssl(),
                           uint32_t iterations = DEFAULT_PBKDF2_ITERATIONS);
    ~SecureStorage();

    SecureStorage(const SecureStorage&) = delete;
    SecureStorage& operator=(const SecureStorage&) = delete;

    // Opens the store, creating it unless read_only is set. Errors:
    //   NoWallet          read_only and nothing stored
    //   PasswordRequired  password-protected store opened without one
    //   WrongPassword     the verifier does not authenticate
    void init(const std::optional<std::string>& password, StorageInitOptions options = {});

    bool is_open() const { return !key_.isEmpty(); }

    // True when a wallet (a mnemonic slot) is stored
    bool exists();

    // Decrypted slot contents; nullopt when the slot is empty.
    // DecryptionFailed when the blob does not authenticate.
    std::optional<SecureMemory> get(const std::string& slot);
    void set(const std::string& slot, std::span<const uint8_t> value);
    void remove(const std::string& slot);

    // Erases the document and the device key, then closes
    void clear();

    // Forgets the wallet key
    void close();

    bool request_persistence();

    bool has_password();

    // Password-protects a passwordless store
    void set_password(const std::string& password);

    void change_password(const std::string& old_password, const std::string& new_password,
                         std::optional<uint32_t> iterations = std::nullopt);

    // Reverts to a device key
    void remove_password(const std::string& current_password);

    bool has_backup();
    void mark_backup_completed(int64_t timestamp_ms);

    // Iteration count of the open store's KDF, or the configured default
    uint32_t pbkdf2_iterations();

    const CryptoProvider& crypto() const { return crypto_; }

private:
    void require_open() const;
    nlohmann::json load_document();
    SecureMemory derive_password_key(const std::string& password, std::span<const uint8_t> salt,
                                     uint32_t iterations);
    nlohmann::json seal(std::span<const uint8_t> key, std::span<const uint8_t> plaintext,
                        const std::string& aad);
    bool open_blob(std::span<const uint8_t> key, const nlohmann::json& blob, const std::string& aad,
                   SecureMemory& plaintext);
    bool check_verifier(std::span<const uint8_t> key, const nlohmann::json& document);
    SecureMemory key_for_password(const nlohmann::json& document, const std::string& password);

    // Copy of the current document with every slot and the verifier sealed
    // under new_key and the given key metadata
    nlohmann::json rewrap(std::span<const uint8_t> new_key, const nlohmann::json& meta);

    std::shared_ptr<StorageBackend> backend_;
    CryptoProvider crypto_;
    uint32_t iterations_;
    SecureMemory key_;
    nlohmann::json document_;
};

} // namespace zeldwallet
