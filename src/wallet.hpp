#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "backup.hpp"
#include "key_manager.hpp"
#include "message_signer.hpp"
#include "secure_storage.hpp"
#include "signing_engine.hpp"
#include "wallet_config.hpp"

namespace zeldwallet {

enum class WalletEvent {
    Unlock,
    Lock,
    NetworkChanged,
    AccountsChanged
};

const char* to_string(WalletEvent event);

struct WalletEventData {
    WalletEvent event;
    std::optional<Network> network;    // NetworkChanged
    std::vector<AddressInfo> accounts; // AccountsChanged
};

using WalletEventHandler = std::function<void(const WalletEventData&)>;

struct ImportBackupOptions {
    // Replace an existing wallet once the backup has been fully verified
    bool overwrite = false;
};

// Wallet ties the encrypted store, the derivation engine and the signing
// engine into one session:
//
//   create / restore / import  ->  unlocked
//   unlock                     ->  unlocked
//   lock                       ->  locked (keys wiped, store closed)
//   destroy                    ->  no wallet
//
// Secrets only leave the store transiently, to load the derivation engine
// or to seal a backup. Unlock, lock, destroy and import_backup fail with
// WalletBusy while a signing call is running on another thread.
class Wallet {
public:
    explicit Wallet(WalletOptions options = {});
    ~Wallet();

    Wallet(const Wallet&) = delete;
    Wallet& operator=(const Wallet&) = delete;

    // Generates a fresh mnemonic, stores it and unlocks. Returns the
    // mnemonic, which the caller must show to the user for backup.
    std::string create(const std::optional<std::string>& password = std::nullopt,
                       const std::optional<std::string>& mnemonic_passphrase = std::nullopt,
                       Mnemonic::Strength strength = Mnemonic::Strength::Words12);

    void restore(const std::string& mnemonic,
                 const std::optional<std::string>& password = std::nullopt,
                 const std::optional<std::string>& mnemonic_passphrase = std::nullopt,
                 const std::optional<CustomPaths>& custom_paths = std::nullopt);

    // A mnemonic passphrase given here must match the stored one; a wallet
    // stored without one rejects a non-empty passphrase
    void unlock(const std::optional<std::string>& password = std::nullopt,
                const std::optional<std::string>& mnemonic_passphrase = std::nullopt);

    void lock();
    bool is_unlocked() const;

    bool exists();

    // Wipes the keys and erases the stored wallet
    void destroy();

    void set_password(const std::string& password);
    void change_password(const std::string& old_password, const std::string& new_password,
                         std::optional<uint32_t> iterations = std::nullopt);
    void remove_password(const std::string& current_password);
    bool has_password();

    bool has_backup();

    // Records that the user has backed the wallet up; defaults to now
    void mark_backup_completed(std::optional<int64_t> timestamp_ms = std::nullopt);

    std::vector<AddressInfo> get_addresses(const std::vector<AddressPurpose>& purposes);

    std::string sign_message(const std::string& message, const std::string& address,
                             std::optional<MessageProtocol> protocol = std::nullopt);

    bool verify_message(const std::string& message, const std::string& address,
                        const std::string& signature) const;

    std::string sign_psbt(const std::string& psbt_base64, const std::vector<SignInputRequest>& requests);

    void set_address_lookup_config(const AddressLookupUpdate& update);
    AddressLookupConfig address_lookup_config() const;

    Network network() const;

    // Persists the new network; on a failed write the previous network is
    // restored and NetworkPersistFailure raised
    void set_network(Network network);

    std::string export_mnemonic() const;

    // base64(JSON) backup envelope sealed with backup_password. Requires a
    // password-protected wallet.
    std::string export_backup(const std::string& backup_password);

    // Verifies and decrypts the backup before touching any existing wallet,
    // then stores the recovered mnemonic under wallet_password and unlocks
    void import_backup(const std::string& backup, const std::string& backup_password,
                       const std::string& wallet_password, ImportBackupOptions options = {});

    // Handlers run synchronously on the calling thread; a handler that
    // throws is logged and does not affect the wallet or other handlers
    uint64_t on(WalletEvent event, WalletEventHandler handler);
    void off(WalletEvent event, uint64_t handler_id);

private:
    class SigningScope;

    void ensure_unlocked() const;
    void ensure_not_busy() const;
    void assert_password_strength(const std::string& password, const char* label) const;

    // Stores a validated mnemonic in a fresh store and loads the keys
    void setup_wallet(const std::string& mnemonic, const std::optional<std::string>& password,
                      const std::optional<std::string>& mnemonic_passphrase,
                      const std::optional<CustomPaths>& custom_paths);
    void apply_stored_config();
    void persist_config();

    void emit(const WalletEventData& data);
    void emit_accounts_snapshot();

    WalletOptions options_;
    SecureStorage storage_;
    KeyManager keys_;
    SigningEngine signer_;
    WalletConfig config_;

    mutable std::recursive_mutex mutex_;
    std::atomic<bool> unlocked_{false};
    std::atomic<int> signing_in_flight_{0};

    std::mutex handlers_mutex_;
    uint64_t next_handler_id_ = 1;
    std::map<WalletEvent, std::map<uint64_t, WalletEventHandler>> handlers_;
};

} // namespace zeldwallet
