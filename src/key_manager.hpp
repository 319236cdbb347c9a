#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "bip32_util.hpp"
#include "curve_utils.hpp"
#include "derivation_path.hpp"
#include "mnemonic.hpp"
#include "network.hpp"
#include "secure_memory.hpp"

namespace zeldwallet {

// An address together with the key and path that produced it
struct DerivedAddress {
    std::string address;
    PublicKey public_key;
    std::string path;
    AddressType type;
};

// Address record handed to callers of get_addresses
struct AddressInfo {
    std::string address;
    std::string public_key;  // hex, compressed
    AddressPurpose purpose;
    AddressType address_type;
    std::string derivation_path;
};

// Explicit derivation paths overriding the defaults, for wallets restored
// from software that uses non-standard accounts
struct CustomPaths {
    std::optional<std::string> payment;
    std::optional<std::string> ordinals;

    bool empty() const { return !payment && !ordinals; }
};

// Bounds of the reverse address lookup scan
struct AddressLookupConfig {
    uint32_t max_account = 4;      // accounts 0..max_account
    uint32_t receive_window = 20;  // receive indices 0..receive_window-1
    uint32_t change_window = 20;   // change indices 0..change_window-1
};

constexpr AddressLookupConfig ADDRESS_LOOKUP_LIMITS{100, 200, 200};

// Partial update of the lookup config. Values are signed so that callers
// passing negative numbers get an error instead of a wrap-around.
struct AddressLookupUpdate {
    std::optional<int64_t> max_account;
    std::optional<int64_t> receive_window;
    std::optional<int64_t> change_window;
};

// Result of a reverse lookup
struct ResolvedPath {
    std::string path;
    AddressType type;
};

// Private/public key pair of one derived node. The private key is wiped on
// destruction.
struct KeyPair {
    PrivateKey private_key{};
    PublicKey public_key{};

    KeyPair() = default;
    KeyPair(const KeyPair&) = default;
    KeyPair& operator=(const KeyPair&) = default;
    ~KeyPair() { secure_wipe(private_key); }
};

// KeyManager is the derivation engine: it holds the master node while the
// wallet is unlocked, derives and caches BIP32 nodes, turns public keys into
// addresses and resolves addresses back to their paths.
//
// All public methods are serialized by an internal mutex, so one instance
// can be shared between threads.
class KeyManager {
public:
    KeyManager() = default;
    ~KeyManager();

    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;

    static std::string generate_mnemonic(Mnemonic::Strength strength = Mnemonic::Strength::Words12);

    // Validates the mnemonic checksum (KeyError InvalidSeedPhrase), builds
    // the master node from the BIP39 seed and drops every cached node
    void from_mnemonic(const std::string& mnemonic, const std::string& passphrase = "");

    bool is_unlocked() const;

    // Wipes the master node, the mnemonic, the cache and the custom paths
    void lock();

    Network network() const;

    // Switching networks drops the cache, since coin types differ
    void set_network(Network network);

    void set_custom_paths(const CustomPaths& paths);
    CustomPaths custom_paths() const;

    // Validates every provided field, clamps it to ADDRESS_LOOKUP_LIMITS
    // and replaces the active config. Throws InvalidLookupConfig.
    void set_address_lookup_config(const AddressLookupUpdate& update);
    AddressLookupConfig address_lookup_config() const;

    // Address at m/purpose'/coin'/account'/change/index
    DerivedAddress derive_address(DerivationPathType type, uint32_t account = 0,
                                  uint32_t change = 0, uint32_t index = 0);

    // Address at an explicit path; the script type follows the purpose field
    DerivedAddress derive_address_from_path(const std::string& path);

    // One record per purpose. Custom paths passed in win over the stored
    // ones, which win over the default account 0 receive 0 paths.
    std::vector<AddressInfo> get_addresses(const std::vector<AddressPurpose>& purposes,
                                           const std::optional<CustomPaths>& custom_paths = std::nullopt);

    // Custom paths first, then the bounded scan over standard paths.
    // nullopt means the address is not ours (within the scanned window).
    std::optional<ResolvedPath> find_address_path(const std::string& address);

    // Key pair at a path, for the signing engine
    KeyPair derive_key(const std::string& path);

    // Throws KeyError(WalletLocked) when no mnemonic is loaded
    std::string export_mnemonic() const;

private:
    struct CachedNode {
        ExKey node;
        PublicKey public_key;
    };

    void assert_unlocked() const;
    const CachedNode& derive_node(const std::vector<uint32_t>& components);
    DerivedAddress make_address(const std::string& path, DerivationPathType type);
    std::optional<ResolvedPath> scan_standard_paths(const std::string& address);

    mutable std::mutex mutex_;
    std::unique_ptr<CachedNode> master_;
    SecureMemory mnemonic_;
    Network network_ = Network::Mainnet;
    std::map<std::string, CachedNode> cache_;
    AddressLookupConfig lookup_;
    CustomPaths custom_paths_;
};

} // namespace zeldwallet
