#include "key_manager.hpp"
#include "address.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "logging.hpp"
#include <algorithm>

namespace zeldwallet {

namespace {

uint32_t clamp_lookup_value(const std::optional<int64_t>& value, uint32_t current,
                            uint32_t limit, const char* name) {
    if (!value) {
        return current;
    }
    if (*value < 0) {
        throw KeyError(KeyError::ErrorType::InvalidLookupConfig,
                       std::string(name) + " must be a non-negative integer");
    }
    return static_cast<uint32_t>(std::min<int64_t>(*value, limit));
}

} // namespace

KeyManager::~KeyManager() {
    lock();
}

std::string KeyManager::generate_mnemonic(Mnemonic::Strength strength) {
    return Mnemonic::generate(strength);
}

void KeyManager::from_mnemonic(const std::string& mnemonic, const std::string& passphrase) {
    std::string normalized = Mnemonic::normalize(mnemonic);
    WipeGuard<std::string> normalized_guard(normalized);

    if (!Mnemonic::validate(normalized)) {
        throw KeyError(KeyError::ErrorType::InvalidSeedPhrase, "Invalid mnemonic");
    }

    SecureMemory seed = Mnemonic::to_seed(normalized, passphrase);
    auto master = std::make_unique<CachedNode>();
    master->node = Bip32Util::master_from_seed(seed.span());
    master->public_key = CurveUtils::derive_public_key(master->node.key);

    std::lock_guard<std::mutex> guard(mutex_);
    master_ = std::move(master);
    mnemonic_ = SecureMemory::from_string(normalized);
    cache_.clear();
    LogPrintKeys(INFO, "Master key loaded");
}

bool KeyManager::is_unlocked() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return master_ != nullptr && !mnemonic_.isEmpty();
}

void KeyManager::lock() {
    std::lock_guard<std::mutex> guard(mutex_);
    master_.reset();
    mnemonic_ = SecureMemory();
    cache_.clear();
    custom_paths_ = CustomPaths{};
}

Network KeyManager::network() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return network_;
}

void KeyManager::set_network(Network network) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (network_ != network) {
        network_ = network;
        cache_.clear();
        LogPrintKeys(INFO, "Network switched to %s", to_string(network).c_str());
    }
}

void KeyManager::set_custom_paths(const CustomPaths& paths) {
    std::lock_guard<std::mutex> guard(mutex_);
    custom_paths_ = paths;
}

CustomPaths KeyManager::custom_paths() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return custom_paths_;
}

void KeyManager::set_address_lookup_config(const AddressLookupUpdate& update) {
    std::lock_guard<std::mutex> guard(mutex_);
    AddressLookupConfig next = lookup_;
    next.max_account = clamp_lookup_value(update.max_account, lookup_.max_account,
                                          ADDRESS_LOOKUP_LIMITS.max_account, "maxAccount");
    next.receive_window = clamp_lookup_value(update.receive_window, lookup_.receive_window,
                                             ADDRESS_LOOKUP_LIMITS.receive_window, "receiveWindow");
    next.change_window = clamp_lookup_value(update.change_window, lookup_.change_window,
                                            ADDRESS_LOOKUP_LIMITS.change_window, "changeWindow");
    lookup_ = next;
}

AddressLookupConfig KeyManager::address_lookup_config() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return lookup_;
}

void KeyManager::assert_unlocked() const {
    if (master_ == nullptr || mnemonic_.isEmpty()) {
        throw KeyError(KeyError::ErrorType::WalletLocked, "Wallet is locked");
    }
}

// Walks the path from the master node, reusing every cached prefix. Each
// prefix node is cached with its public key, so a fresh address below a
// known account costs one child derivation and one point multiplication.
const KeyManager::CachedNode& KeyManager::derive_node(const std::vector<uint32_t>& components) {
    const CachedNode* current = master_.get();
    for (size_t depth = 1; depth <= components.size(); ++depth) {
        std::string prefix = Bip32Util::format_path(std::span<const uint32_t>(components.data(), depth));
        auto it = cache_.find(prefix);
        if (it == cache_.end()) {
            CachedNode child;
            child.node = Bip32Util::derive_priv_child(current->node, components[depth - 1], &current->public_key);
            child.public_key = CurveUtils::derive_public_key(child.node.key);
            it = cache_.emplace(prefix, std::move(child)).first;
        }
        current = &it->second;
    }
    return *current;
}

DerivedAddress KeyManager::make_address(const std::string& path, DerivationPathType type) {
    const CachedNode& node = derive_node(Bip32Util::parse_path(path));
    if (!CurveUtils::is_valid_public_key(node.public_key)) {
        throw KeyError(KeyError::ErrorType::DerivedInvalidPublicKey,
                       "Derived invalid public key at " + path);
    }

    DerivedAddress derived;
    derived.type = DerivationPaths::address_type(type);
    derived.address = Address::from_public_key(node.public_key, derived.type, network_);
    derived.public_key = node.public_key;
    derived.path = path;
    return derived;
}

DerivedAddress KeyManager::derive_address(DerivationPathType type, uint32_t account,
                                          uint32_t change, uint32_t index) {
    if (account >= HARDENED_OFFSET || index >= HARDENED_OFFSET || change > 1) {
        throw KeyError(KeyError::ErrorType::InvalidDerivationPath,
                       "Account, change or index out of range");
    }

    std::lock_guard<std::mutex> guard(mutex_);
    assert_unlocked();
    return make_address(DerivationPaths::build(type, network_, account, change, index), type);
}

DerivedAddress KeyManager::derive_address_from_path(const std::string& path) {
    // Rejects bad syntax and unknown purposes before touching key material
    DerivationPathType type = DerivationPaths::type_of_path(path);

    std::lock_guard<std::mutex> guard(mutex_);
    assert_unlocked();
    return make_address(path, type);
}

std::vector<AddressInfo> KeyManager::get_addresses(const std::vector<AddressPurpose>& purposes,
                                                   const std::optional<CustomPaths>& custom_paths) {
    CustomPaths overrides = custom_paths ? *custom_paths : this->custom_paths();

    std::vector<AddressInfo> addresses;
    for (AddressPurpose purpose : purposes) {
        const auto& custom = purpose == AddressPurpose::Payment ? overrides.payment : overrides.ordinals;

        DerivedAddress derived = custom ? derive_address_from_path(*custom)
                                        : derive_address(DerivationPaths::type_for(purpose), 0, 0, 0);

        AddressInfo info;
        info.address = derived.address;
        info.public_key = HexUtils::encode(derived.public_key);
        info.purpose = purpose;
        info.address_type = derived.type;
        info.derivation_path = derived.path;
        addresses.push_back(std::move(info));
    }
    return addresses;
}

// Reverse lookup order:
// 1. Custom payment path, then custom ordinals path
// 2. For each script type (legacy, nested segwit, native segwit, taproot)
//    and each account 0..max_account: receive indices, then change indices
std::optional<ResolvedPath> KeyManager::find_address_path(const std::string& address) {
    CustomPaths custom = custom_paths();
    for (const auto& path : {custom.payment, custom.ordinals}) {
        if (!path) {
            continue;
        }
        try {
            DerivedAddress derived = derive_address_from_path(*path);
            if (derived.address == address) {
                return ResolvedPath{derived.path, derived.type};
            }
        } catch (const KeyError& e) {
            if (e.type() == KeyError::ErrorType::WalletLocked) {
                throw;
            }
            LogPrintKeys(DEBUG, "Skipping unusable custom path %s: %s", path->c_str(), e.what());
        }
    }

    std::lock_guard<std::mutex> guard(mutex_);
    assert_unlocked();
    return scan_standard_paths(address);
}

std::optional<ResolvedPath> KeyManager::scan_standard_paths(const std::string& address) {
    for (DerivationPathType type : DerivationPaths::ALL_TYPES) {
        for (uint32_t account = 0; account <= lookup_.max_account; ++account) {
            for (uint32_t index = 0; index < lookup_.receive_window; ++index) {
                auto derived = make_address(DerivationPaths::build(type, network_, account, 0, index), type);
                if (derived.address == address) {
                    return ResolvedPath{derived.path, derived.type};
                }
            }
            for (uint32_t index = 0; index < lookup_.change_window; ++index) {
                auto derived = make_address(DerivationPaths::build(type, network_, account, 1, index), type);
                if (derived.address == address) {
                    return ResolvedPath{derived.path, derived.type};
                }
            }
        }
    }

    LogPrintKeys(DEBUG, "Address %s not found in lookup window", address.c_str());
    return std::nullopt;
}

KeyPair KeyManager::derive_key(const std::string& path) {
    auto components = Bip32Util::parse_path(path);

    std::lock_guard<std::mutex> guard(mutex_);
    assert_unlocked();
    const CachedNode& node = derive_node(components);

    KeyPair pair;
    pair.private_key = node.node.key;
    pair.public_key = node.public_key;
    return pair;
}

std::string KeyManager::export_mnemonic() const {
    std::lock_guard<std::mutex> guard(mutex_);
    if (mnemonic_.isEmpty()) {
        throw KeyError(KeyError::ErrorType::WalletLocked, "No mnemonic available");
    }
    return mnemonic_.to_string();
}

} // namespace zeldwallet
