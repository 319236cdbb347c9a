#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>
#include "key_manager.hpp"
#include "network.hpp"
#include "secure_storage.hpp"
#include "storage_backend.hpp"

namespace zeldwallet {

// Construction-time settings of a Wallet
struct WalletOptions {
    // Backend to persist to; when null, a FileStorageBackend at wallet_file
    // is used, and an in-memory backend when wallet_file is empty as well
    std::shared_ptr<StorageBackend> backend;
    std::filesystem::path wallet_file;

    // PBKDF2 rounds for new password-derived keys. Values below the default
    // are accepted with a warning.
    uint32_t pbkdf2_iterations = DEFAULT_PBKDF2_ITERATIONS;

    // Check new wallet and backup passwords against PasswordPolicy. When
    // off, passwords only need to be non-empty.
    bool enforce_password_policy = true;

    // Network used until a stored config says otherwise
    Network network = Network::Mainnet;
};

// Non-secret settings kept in the "config" slot:
//   {"network": "mainnet" | "testnet", "customPaths": {"payment", "ordinals"}}
struct WalletConfig {
    Network network = Network::Mainnet;
    std::optional<CustomPaths> custom_paths;

    std::string serialize() const;

    // nullopt for malformed or unknown contents
    static std::optional<WalletConfig> parse(const std::string& text);
};

void to_json(nlohmann::json& j, const CustomPaths& paths);
void from_json(const nlohmann::json& j, CustomPaths& paths);

} // namespace zeldwallet
