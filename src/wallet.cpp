#include "wallet.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "password_policy.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>

namespace zeldwallet {

namespace {

std::shared_ptr<StorageBackend> make_backend(const WalletOptions& options) {
    if (options.backend) {
        return options.backend;
    }
    if (!options.wallet_file.empty()) {
        return std::make_shared<FileStorageBackend>(options.wallet_file);
    }
    return std::make_shared<MemoryStorageBackend>();
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool is_blank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
}

// An empty password or passphrase means "none"
std::optional<std::string> non_empty(const std::optional<std::string>& value) {
    if (value && !value->empty()) {
        return value;
    }
    return std::nullopt;
}

std::span<const uint8_t> as_bytes(const std::string& value) {
    return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
}

const std::vector<AddressPurpose> ACCOUNT_PURPOSES = {AddressPurpose::Payment, AddressPurpose::Ordinals};

} // namespace

const char* to_string(WalletEvent event) {
    switch (event) {
        case WalletEvent::Unlock: return "unlock";
        case WalletEvent::Lock: return "lock";
        case WalletEvent::NetworkChanged: return "networkChanged";
        case WalletEvent::AccountsChanged: return "accountsChanged";
    }
    return "unknown";
}

// Marks a signing call as running for its whole duration. Entry is
// serialized with the lifecycle operations, so lock() either completes
// before the call starts or sees it in flight.
class Wallet::SigningScope {
public:
    explicit SigningScope(Wallet& wallet) : wallet_(wallet) {
        std::lock_guard<std::recursive_mutex> guard(wallet_.mutex_);
        wallet_.ensure_unlocked();
        ++wallet_.signing_in_flight_;
    }
    ~SigningScope() { --wallet_.signing_in_flight_; }

    SigningScope(const SigningScope&) = delete;
    SigningScope& operator=(const SigningScope&) = delete;

private:
    Wallet& wallet_;
};

Wallet::Wallet(WalletOptions options)
    : options_(std::move(options))
    , storage_(make_backend(options_), CryptoProvider::openssl(), options_.pbkdf2_iterations)
    , signer_(keys_)
{
    keys_.set_network(options_.network);
    config_.network = options_.network;
}

Wallet::~Wallet() {
    keys_.lock();
    storage_.close();
}

void Wallet::ensure_unlocked() const {
    if (!unlocked_) {
        throw WalletError(WalletError::ErrorType::WalletLocked, "Wallet is locked. Call unlock() first");
    }
}

void Wallet::ensure_not_busy() const {
    if (signing_in_flight_ > 0) {
        throw WalletError(WalletError::ErrorType::WalletBusy, "A signing operation is in progress");
    }
}

void Wallet::assert_password_strength(const std::string& password, const char* label) const {
    if (password.empty() || is_blank(password)) {
        throw WalletError(WalletError::ErrorType::WeakPassword, std::string(label) + " is required");
    }
    if (!options_.enforce_password_policy) {
        return;
    }
    PasswordCheck check = PasswordPolicy::check(password);
    if (!check.is_valid) {
        throw WalletError(WalletError::ErrorType::WeakPassword,
                          std::string("Invalid ") + label + ": " + check.error_message);
    }
}

// Creation is all-or-nothing: if any step after the store is initialised
// fails, the partial store is erased again
void Wallet::setup_wallet(const std::string& mnemonic, const std::optional<std::string>& password,
                          const std::optional<std::string>& mnemonic_passphrase,
                          const std::optional<CustomPaths>& custom_paths) {
    if (custom_paths) {
        if (custom_paths->payment) {
            DerivationPaths::type_of_path(*custom_paths->payment);
        }
        if (custom_paths->ordinals) {
            DerivationPaths::type_of_path(*custom_paths->ordinals);
        }
    }

    auto passphrase = non_empty(mnemonic_passphrase);
    keys_.from_mnemonic(mnemonic, passphrase.value_or(""));

    // Anything still stored has no mnemonic slot and is left over from an
    // interrupted setup
    storage_.clear();

    try {
        storage_.init(non_empty(password));

        std::string normalized = keys_.export_mnemonic();
        WipeGuard<std::string> normalized_guard(normalized);
        storage_.set(SecureStorage::SLOT_MNEMONIC, as_bytes(normalized));
        if (passphrase) {
            storage_.set(SecureStorage::SLOT_PASSPHRASE, as_bytes(*passphrase));
        }

        config_.network = keys_.network();
        config_.custom_paths.reset();
        if (custom_paths && !custom_paths->empty()) {
            config_.custom_paths = custom_paths;
        }
        keys_.set_custom_paths(config_.custom_paths.value_or(CustomPaths{}));
        persist_config();

        if (!storage_.request_persistence()) {
            LogPrintWallet(DEBUG, "Storage backend does not persist across restarts");
        }
    } catch (const std::exception& e) {
        LogPrintWallet(ERROR, "Wallet setup failed: %s", e.what());
        keys_.lock();
        try {
            storage_.clear();
        } catch (const StorageError& cleanup) {
            LogPrintWallet(ERROR, "Cannot erase partial wallet: %s", cleanup.what());
        }
        throw;
    }

    unlocked_ = true;
}

std::string Wallet::create(const std::optional<std::string>& password,
                           const std::optional<std::string>& mnemonic_passphrase,
                           Mnemonic::Strength strength) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    ensure_not_busy();
    if (non_empty(password)) {
        assert_password_strength(*password, "wallet password");
    }
    if (storage_.exists()) {
        throw StorageError(StorageError::ErrorType::WalletExists,
                           "Wallet already exists. Call unlock() to use it or destroy() before creating a new one");
    }

    std::string mnemonic = KeyManager::generate_mnemonic(strength);
    setup_wallet(mnemonic, password, mnemonic_passphrase, std::nullopt);
    LogPrintWallet(INFO, "Created new wallet (%s)", non_empty(password) ? "password" : "device key");

    emit({WalletEvent::Unlock, std::nullopt, {}});
    emit_accounts_snapshot();
    return mnemonic;
}

void Wallet::restore(const std::string& mnemonic, const std::optional<std::string>& password,
                     const std::optional<std::string>& mnemonic_passphrase,
                     const std::optional<CustomPaths>& custom_paths) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    ensure_not_busy();
    if (non_empty(password)) {
        assert_password_strength(*password, "wallet password");
    }
    if (storage_.exists()) {
        throw StorageError(StorageError::ErrorType::WalletExists,
                           "Wallet already exists. Call destroy() before restoring a new one");
    }

    setup_wallet(mnemonic, password, mnemonic_passphrase, custom_paths);
    LogPrintWallet(INFO, "Restored wallet from mnemonic");

    emit({WalletEvent::Unlock, std::nullopt, {}});
    emit_accounts_snapshot();
}

void Wallet::unlock(const std::optional<std::string>& password,
                    const std::optional<std::string>& mnemonic_passphrase) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    ensure_not_busy();

    // Never create a store just because someone tried to unlock
    if (!storage_.exists()) {
        throw StorageError(StorageError::ErrorType::NoWallet, "No wallet found. Create or restore a wallet first");
    }

    storage_.init(non_empty(password), StorageInitOptions{true});
    try {
        auto mnemonic_bytes = storage_.get(SecureStorage::SLOT_MNEMONIC);
        if (!mnemonic_bytes) {
            throw StorageError(StorageError::ErrorType::NoWallet, "No wallet found. Create or restore a wallet first");
        }
        std::string mnemonic = mnemonic_bytes->to_string();
        WipeGuard<std::string> mnemonic_guard(mnemonic);

        std::string stored_passphrase;
        WipeGuard<std::string> stored_guard(stored_passphrase);
        auto passphrase_bytes = storage_.get(SecureStorage::SLOT_PASSPHRASE);
        if (passphrase_bytes) {
            stored_passphrase = passphrase_bytes->to_string();
        }

        if (mnemonic_passphrase) {
            if (!passphrase_bytes && !is_blank(*mnemonic_passphrase)) {
                throw WalletError(WalletError::ErrorType::PassphraseMismatch,
                                  "Wallet was created without a passphrase. Do not provide one when unlocking");
            }
            if (passphrase_bytes) {
                // Compared the way the seed sees them
                std::string provided = Mnemonic::nfkd(*mnemonic_passphrase);
                WipeGuard<std::string> provided_guard(provided);
                std::string stored = Mnemonic::nfkd(stored_passphrase);
                WipeGuard<std::string> stored_nfkd_guard(stored);
                if (provided != stored) {
                    throw WalletError(WalletError::ErrorType::PassphraseMismatch,
                                      "Provided passphrase does not match the stored wallet passphrase");
                }
            }
        }

        keys_.from_mnemonic(mnemonic, stored_passphrase);
        apply_stored_config();
    } catch (const std::exception&) {
        keys_.lock();
        storage_.close();
        throw;
    }

    unlocked_ = true;
    LogPrintWallet(INFO, "Wallet unlocked");
    emit({WalletEvent::Unlock, std::nullopt, {}});
    emit_accounts_snapshot();
}

void Wallet::lock() {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    ensure_not_busy();
    keys_.lock();
    storage_.close();
    unlocked_ = false;
    LogPrintWallet(INFO, "Wallet locked");
    emit({WalletEvent::Lock, std::nullopt, {}});
}

bool Wallet::is_unlocked() const {
    return unlocked_;
}

bool Wallet::exists() {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    return storage_.exists();
}

void Wallet::destroy() {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    ensure_not_busy();
    keys_.lock();
    unlocked_ = false;
    config_ = WalletConfig{};
    config_.network = keys_.network();
    storage_.clear();
    LogPrintWallet(INFO, "Wallet destroyed");
}

void Wallet::set_password(const std::string& password) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    ensure_unlocked();
    assert_password_strength(password, "wallet password");
    storage_.set_password(password);
}

void Wallet::change_password(const std::string& old_password, const std::string& new_password,
                             std::optional<uint32_t> iterations) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    ensure_unlocked();
    assert_password_strength(new_password, "new wallet password");
    storage_.change_password(old_password, new_password, iterations);
}

void Wallet::remove_password(const std::string& current_password) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    ensure_unlocked();
    if (current_password.empty() || is_blank(current_password)) {
        throw WalletError(WalletError::ErrorType::InvalidArgument,
                          "Current password is required to remove password protection");
    }
    storage_.remove_password(current_password);
}

bool Wallet::has_password() {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    return storage_.has_password();
}

bool Wallet::has_backup() {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    return storage_.has_backup();
}

void Wallet::mark_backup_completed(std::optional<int64_t> timestamp_ms) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    storage_.mark_backup_completed(timestamp_ms.value_or(now_ms()));
}

std::vector<AddressInfo> Wallet::get_addresses(const std::vector<AddressPurpose>& purposes) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    ensure_unlocked();
    return keys_.get_addresses(purposes, config_.custom_paths);
}

std::string Wallet::sign_message(const std::string& message, const std::string& address,
                                 std::optional<MessageProtocol> protocol) {
    SigningScope scope(*this);
    return signer_.sign_message(message, address, protocol);
}

bool Wallet::verify_message(const std::string& message, const std::string& address,
                            const std::string& signature) const {
    return signer_.verify_message(message, address, signature);
}

std::string Wallet::sign_psbt(const std::string& psbt_base64, const std::vector<SignInputRequest>& requests) {
    SigningScope scope(*this);
    return signer_.sign_psbt(psbt_base64, requests);
}

void Wallet::set_address_lookup_config(const AddressLookupUpdate& update) {
    keys_.set_address_lookup_config(update);
}

AddressLookupConfig Wallet::address_lookup_config() const {
    return keys_.address_lookup_config();
}

Network Wallet::network() const {
    return keys_.network();
}

void Wallet::set_network(Network network) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    ensure_unlocked();
    Network previous = keys_.network();
    if (previous == network) {
        return;
    }

    keys_.set_network(network);
    config_.network = network;
    try {
        persist_config();
    } catch (const std::exception& e) {
        keys_.set_network(previous);
        config_.network = previous;
        LogPrintWallet(ERROR, "Persisting network change failed: %s", e.what());
        throw WalletError(WalletError::ErrorType::NetworkPersistFailure,
                          "Failed to persist network change. Network remains set to " + to_string(previous));
    }

    emit({WalletEvent::NetworkChanged, network, {}});
    emit_accounts_snapshot();
}

std::string Wallet::export_mnemonic() const {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    ensure_unlocked();
    return keys_.export_mnemonic();
}

std::string Wallet::export_backup(const std::string& backup_password) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    ensure_unlocked();
    assert_password_strength(backup_password, "backup password");
    if (!storage_.has_password()) {
        throw StorageError(StorageError::ErrorType::BackupRequiresPassword,
                           "Set a wallet password before exporting a backup");
    }

    auto mnemonic_bytes = storage_.get(SecureStorage::SLOT_MNEMONIC);
    if (!mnemonic_bytes) {
        throw StorageError(StorageError::ErrorType::NoWallet, "No mnemonic stored");
    }

    BackupPayload payload;
    payload.mnemonic = mnemonic_bytes->to_string();
    if (auto passphrase_bytes = storage_.get(SecureStorage::SLOT_PASSPHRASE)) {
        payload.passphrase = passphrase_bytes->to_string();
    }
    payload.network = keys_.network();
    payload.created_at = now_ms();
    payload.custom_paths = config_.custom_paths;

    BackupCodec codec(storage_.crypto());
    BackupEnvelope envelope = codec.seal(payload, backup_password, storage_.pbkdf2_iterations());
    storage_.mark_backup_completed(payload.created_at);
    LogPrintWallet(INFO, "Exported wallet backup");
    return BackupCodec::encode(envelope);
}

void Wallet::import_backup(const std::string& backup, const std::string& backup_password,
                           const std::string& wallet_password, ImportBackupOptions options) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    ensure_not_busy();
    assert_password_strength(wallet_password, "wallet password");

    bool existing = storage_.exists();
    if (existing && !options.overwrite) {
        throw StorageError(StorageError::ErrorType::WalletExists,
                           "Wallet already exists. Pass overwrite to replace it with the backup");
    }

    // Everything up to here leaves an existing wallet untouched
    BackupEnvelope envelope = BackupCodec::parse(backup);
    BackupCodec codec(storage_.crypto());
    BackupPayload payload = codec.open(envelope, backup_password);

    std::string normalized = Mnemonic::normalize(payload.mnemonic);
    WipeGuard<std::string> normalized_guard(normalized);
    if (!Mnemonic::validate(normalized)) {
        throw StorageError(StorageError::ErrorType::BackupFormatInvalid, "Backup holds an invalid mnemonic");
    }

    if (existing) {
        LogPrintWallet(WARN, "Overwriting existing wallet with imported backup");
        keys_.lock();
        unlocked_ = false;
        storage_.clear();
    }

    Network previous = keys_.network();
    keys_.set_network(payload.network);
    try {
        setup_wallet(normalized, wallet_password, payload.passphrase, payload.custom_paths);
    } catch (const std::exception&) {
        keys_.set_network(previous);
        throw;
    }
    storage_.mark_backup_completed(payload.created_at);
    LogPrintWallet(INFO, "Imported wallet backup");

    emit({WalletEvent::Unlock, std::nullopt, {}});
    if (payload.network != previous) {
        emit({WalletEvent::NetworkChanged, payload.network, {}});
    }
    emit_accounts_snapshot();
}

uint64_t Wallet::on(WalletEvent event, WalletEventHandler handler) {
    std::lock_guard<std::mutex> guard(handlers_mutex_);
    uint64_t id = next_handler_id_++;
    handlers_[event].emplace(id, std::move(handler));
    return id;
}

void Wallet::off(WalletEvent event, uint64_t handler_id) {
    std::lock_guard<std::mutex> guard(handlers_mutex_);
    auto it = handlers_.find(event);
    if (it != handlers_.end()) {
        it->second.erase(handler_id);
    }
}

void Wallet::emit(const WalletEventData& data) {
    std::vector<WalletEventHandler> targets;
    {
        std::lock_guard<std::mutex> guard(handlers_mutex_);
        auto it = handlers_.find(data.event);
        if (it == handlers_.end()) {
            return;
        }
        for (const auto& [id, handler] : it->second) {
            targets.push_back(handler);
        }
    }

    for (const auto& handler : targets) {
        try {
            handler(data);
        } catch (const std::exception& e) {
            LogPrintWallet(ERROR, "Error in %s event handler: %s", to_string(data.event), e.what());
        }
    }
}

void Wallet::emit_accounts_snapshot() {
    if (!unlocked_) {
        return;
    }
    emit({WalletEvent::AccountsChanged, std::nullopt, keys_.get_addresses(ACCOUNT_PURPOSES, config_.custom_paths)});
}

// Malformed config never blocks an unlock; the defaults stay in place
void Wallet::apply_stored_config() {
    auto config_bytes = storage_.get(SecureStorage::SLOT_CONFIG);
    if (!config_bytes) {
        return;
    }
    auto config = WalletConfig::parse(config_bytes->to_string());
    if (!config) {
        return;
    }
    config_ = *config;
    keys_.set_network(config_.network);
    keys_.set_custom_paths(config_.custom_paths.value_or(CustomPaths{}));
}

void Wallet::persist_config() {
    storage_.set(SecureStorage::SLOT_CONFIG, as_bytes(config_.serialize()));
}

} // namespace zeldwallet
