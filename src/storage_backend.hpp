#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <nlohmann/json.hpp>
#include "secure_memory.hpp"

namespace zeldwallet {

// Persistence underneath the encrypted store. A backend only ever sees
// ciphertext documents and, for passwordless wallets, the device key.
// Failures raise StorageError(StorageFailure).
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Current document, nullopt when nothing has been stored
    virtual std::optional<nlohmann::json> load() = 0;

    // Replaces the whole document atomically: after a failure the previous
    // document is still the current one
    virtual void commit(const nlohmann::json& document) = 0;

    virtual void erase() = 0;

    // Key of a passwordless wallet, kept apart from the document
    virtual std::optional<SecureMemory> load_device_key() = 0;
    virtual void store_device_key(std::span<const uint8_t> key) = 0;
    virtual void erase_device_key() = 0;

    // Asks the platform to keep the data across storage pressure; returns
    // whether the data is durable
    virtual bool request_persistence() = 0;
};

// JSON document on disk, replaced through write-to-temp and rename. The
// device key lives in "<path>.key" with owner-only permissions.
class FileStorageBackend : public StorageBackend {
public:
    explicit FileStorageBackend(std::filesystem::path path);

    std::optional<nlohmann::json> load() override;
    void commit(const nlohmann::json& document) override;
    void erase() override;

    std::optional<SecureMemory> load_device_key() override;
    void store_device_key(std::span<const uint8_t> key) override;
    void erase_device_key() override;

    bool request_persistence() override { return true; }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path key_path() const;

    std::filesystem::path path_;
};

// Process-local backend for tests and ephemeral sessions
class MemoryStorageBackend : public StorageBackend {
public:
    std::optional<nlohmann::json> load() override { return document_; }
    void commit(const nlohmann::json& document) override;
    void erase() override { document_.reset(); }

    std::optional<SecureMemory> load_device_key() override;
    void store_device_key(std::span<const uint8_t> key) override;
    void erase_device_key() override { device_key_ = SecureMemory(); }

    bool request_persistence() override { return false; }

    // Makes the next `count` commits fail, for exercising rollback paths
    void fail_next_commits(int count) { failing_commits_ = count; }

private:
    std::optional<nlohmann::json> document_;
    SecureMemory device_key_;
    int failing_commits_ = 0;
};

} // namespace zeldwallet
