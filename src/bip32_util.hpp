#pragma once

#include <vector>
#include <span>
#include <cstdint>
#include <array>
#include <string>
#include "curve_utils.hpp"
#include "error.hpp"

namespace zeldwallet {

// Extended key structure used in BIP32 hierarchical deterministic wallets.
// The private key and chain code are wiped when the node is destroyed, so
// every temporary copy made during derivation is scrubbed on all paths.
struct ExKey {
    std::array<uint8_t, 1> depth{};        // Depth in the derivation path (0 for master keys)
    std::array<uint8_t, 4> finger_print{}; // First 4 bytes of the parent key's identifier
    std::array<uint8_t, 4> child_number{}; // Index of the key in relation to its parent
    std::array<uint8_t, 32> chaincode{};   // Extra entropy used in child key derivation
    std::array<uint8_t, 32> key{};         // The private key

    ExKey() = default;
    ExKey(const ExKey&) = default;
    ExKey& operator=(const ExKey&) = default;
    ~ExKey();
};

// Utility class for BIP32 hierarchical deterministic wallet operations
class Bip32Util {
public:
    // Builds the master node from a BIP39 seed (16 to 64 bytes)
    static ExKey master_from_seed(std::span<const uint8_t> seed);

    // Derives a child private key from a parent private key using BIP32
    // derivation. parent_pubkey may carry the parent's cached public key to
    // save a point multiplication on normal (non-hardened) steps.
    static ExKey derive_priv_child(const ExKey& parent, uint32_t child_num,
                                   const PublicKey* parent_pubkey = nullptr);

    // Parses "m/44'/0'/0'/0/0" style paths; ' and h both mark hardened steps
    static std::vector<uint32_t> parse_path(const std::string& derivation_path);

    // Formats child numbers back into the canonical "m/84'/0'/0'/0/0" form
    static std::string format_path(std::span<const uint32_t> components);

    // Derives a key at a specific BIP32 derivation path from a parent key
    static ExKey get_child_key_at_path(const ExKey& key, const std::string& derivation_path);

    // First four bytes of HASH160 of the compressed public key
    static std::array<uint8_t, 4> fingerprint(const PublicKey& pubkey);

private:
    Bip32Util() = delete;
};

} // namespace zeldwallet
