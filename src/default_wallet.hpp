#pragma once

#include <memory>
#include <mutex>
#include "wallet.hpp"

namespace zeldwallet {

// Process-wide Wallet for callers that prefer static calls. The core never
// uses it; code that needs more than one wallet owns Wallet objects
// directly.
class DefaultWallet {
public:
    // Replaces the options used when the instance is first created. Has no
    // effect once instance() has been called, unless reset() runs first.
    static void configure(WalletOptions options);

    static Wallet& instance();

    // Drops the instance; the next instance() builds a fresh one
    static void reset();

    static std::string create(const std::optional<std::string>& password = std::nullopt,
                              const std::optional<std::string>& mnemonic_passphrase = std::nullopt) {
        return instance().create(password, mnemonic_passphrase);
    }
    static void restore(const std::string& mnemonic, const std::optional<std::string>& password = std::nullopt,
                        const std::optional<std::string>& mnemonic_passphrase = std::nullopt,
                        const std::optional<CustomPaths>& custom_paths = std::nullopt) {
        instance().restore(mnemonic, password, mnemonic_passphrase, custom_paths);
    }
    static void unlock(const std::optional<std::string>& password = std::nullopt,
                       const std::optional<std::string>& mnemonic_passphrase = std::nullopt) {
        instance().unlock(password, mnemonic_passphrase);
    }
    static void lock() { instance().lock(); }
    static bool is_unlocked() { return instance().is_unlocked(); }
    static bool exists() { return instance().exists(); }
    static void destroy() { instance().destroy(); }

    static std::vector<AddressInfo> get_addresses(const std::vector<AddressPurpose>& purposes) {
        return instance().get_addresses(purposes);
    }
    static std::string sign_message(const std::string& message, const std::string& address,
                                    std::optional<MessageProtocol> protocol = std::nullopt) {
        return instance().sign_message(message, address, protocol);
    }
    static std::string sign_psbt(const std::string& psbt_base64, const std::vector<SignInputRequest>& requests) {
        return instance().sign_psbt(psbt_base64, requests);
    }
    static Network network() { return instance().network(); }
    static void set_network(Network network) { instance().set_network(network); }

    static std::string export_backup(const std::string& backup_password) {
        return instance().export_backup(backup_password);
    }
    static void import_backup(const std::string& backup, const std::string& backup_password,
                              const std::string& wallet_password, ImportBackupOptions options = {}) {
        instance().import_backup(backup, backup_password, wallet_password, options);
    }

private:
    static std::mutex& mutex();
    static WalletOptions& options();
    static std::unique_ptr<Wallet>& slot();

    DefaultWallet() = delete;
};

} // namespace zeldwallet
