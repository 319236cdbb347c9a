#include "bip32_util.hpp"
#include "consts.hpp"
#include "hash_utils.hpp"
#include "secure_memory.hpp"
#include <algorithm>
#include <charconv>
#include <sstream>

namespace zeldwallet {

ExKey::~ExKey() {
    secure_wipe(key);
    secure_wipe(chaincode);
}

// Generates the master node as defined in BIP32:
//   I = HMAC-SHA512(key = "Bitcoin seed", data = seed)
//   master key = I[0:32], master chain code = I[32:64]
// A left half of zero or >= n is an invalid master key.
ExKey Bip32Util::master_from_seed(std::span<const uint8_t> seed) {
    if (seed.size() < 16 || seed.size() > 64) {
        throw KeyError(KeyError::ErrorType::DerivationFailure, "Seed must be 16 to 64 bytes");
    }

    static const std::string BITCOIN_SEED = "Bitcoin seed";
    auto i = HashUtils::hmac_sha512(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(BITCOIN_SEED.data()), BITCOIN_SEED.size()),
        seed);
    WipeGuard<Hash512> i_guard(i);

    ExKey master;
    std::copy_n(i.begin(), 32, master.key.begin());
    std::copy_n(i.begin() + 32, 32, master.chaincode.begin());

    if (!CurveUtils::is_valid_private_key(master.key)) {
        throw KeyError(KeyError::ErrorType::DerivationFailure, "Seed produced an invalid master key");
    }
    return master;
}

// Derives a child private key from a parent private key according to BIP32
// https://github.com/bitcoin/bips/blob/master/bip-0032.mediawiki
//
// The derivation process:
// 1. Create a seed data from parent key and child index
// 2. Calculate HMAC-SHA512 of the seed data using the parent chain code as key
// 3. Split the HMAC result into two 32-byte parts: left and right
// 4. The left part is added to the parent private key (mod n) to get the child private key
// 5. The right part becomes the child chain code
//
// There are two types of derivation:
// - Normal derivation (child_num < 0x80000000): uses parent public key in the seed
// - Hardened derivation (child_num >= 0x80000000): uses parent private key in the seed
ExKey Bip32Util::derive_priv_child(const ExKey& parent, uint32_t child_num, const PublicKey* parent_pubkey) {
    std::vector<uint8_t> data;
    WipeGuard<std::vector<uint8_t>> data_guard(data);
    data.reserve(37);

    // The parent public key feeds the child's parent fingerprint either way
    PublicKey pubkey = parent_pubkey ? *parent_pubkey : CurveUtils::derive_public_key(parent.key);
    if (child_num >= HARDENED_OFFSET) {
        // Hardened derivation: data = 0x00 || parent private key
        data.push_back(0x00);
        data.insert(data.end(), parent.key.begin(), parent.key.end());
    } else {
        // Normal derivation: data = parent public key
        data.insert(data.end(), pubkey.begin(), pubkey.end());
    }

    // Add child number in big-endian format
    auto child_num_be = std::array<uint8_t, 4>{
        static_cast<uint8_t>((child_num >> 24) & 0xff),
        static_cast<uint8_t>((child_num >> 16) & 0xff),
        static_cast<uint8_t>((child_num >> 8) & 0xff),
        static_cast<uint8_t>(child_num & 0xff)
    };
    data.insert(data.end(), child_num_be.begin(), child_num_be.end());

    auto hmac_result = HashUtils::hmac_sha512(parent.chaincode, data);
    WipeGuard<Hash512> hmac_guard(hmac_result);

    // child_key = (parent_key + IL) mod n. BIP32 declares the index invalid
    // when IL >= n or the sum is zero (probability below 2^-127).
    auto child_key = CurveUtils::tweak_add(parent.key,
        std::span<const uint8_t>(hmac_result.data(), 32));
    if (!child_key) {
        throw KeyError(KeyError::ErrorType::DerivationFailure,
                       "Invalid child key at index " + std::to_string(child_num));
    }

    ExKey child;
    child.depth[0] = static_cast<uint8_t>(parent.depth[0] + 1);
    child.finger_print = fingerprint(pubkey);
    child.child_number = child_num_be;
    std::copy_n(hmac_result.begin() + 32, 32, child.chaincode.begin());
    child.key = *child_key;
    secure_wipe(*child_key);

    return child;
}

// Parses a derivation path string.
//
// The derivation path format:
// - "m" represents the master key
// - "/" separates path components
// - Numbers represent child indices (below 2^31)
// - Numbers with ' or h suffix represent hardened derivation (index + 0x80000000)
std::vector<uint32_t> Bip32Util::parse_path(const std::string& derivation_path) {
    auto invalid = [&derivation_path]() {
        return KeyError(KeyError::ErrorType::InvalidDerivationPath,
                        "Invalid derivation path: " + derivation_path);
    };

    if (derivation_path != "m" && !derivation_path.starts_with("m/")) {
        throw invalid();
    }

    std::vector<uint32_t> components;
    if (derivation_path == "m") {
        return components;
    }

    std::istringstream path_stream(derivation_path.substr(2));
    std::string index_str;
    while (std::getline(path_stream, index_str, '/')) {
        bool hardened = index_str.ends_with('\'') || index_str.ends_with('h') || index_str.ends_with('H');
        if (hardened) {
            index_str.pop_back();
        }
        if (index_str.empty() || index_str.size() > 10 ||
            !std::all_of(index_str.begin(), index_str.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            throw invalid();
        }

        uint64_t index = 0;
        auto [ptr, ec] = std::from_chars(index_str.data(), index_str.data() + index_str.size(), index);
        if (ec != std::errc() || ptr != index_str.data() + index_str.size() || index >= HARDENED_OFFSET) {
            throw invalid();
        }
        components.push_back(static_cast<uint32_t>(hardened ? index + HARDENED_OFFSET : index));
    }

    // getline drops a trailing empty component, so "m/0/" would pass silently
    if (derivation_path.ends_with('/') || components.empty()) {
        throw invalid();
    }
    return components;
}

std::string Bip32Util::format_path(std::span<const uint32_t> components) {
    std::string path = "m";
    for (uint32_t component : components) {
        path += '/';
        if (component >= HARDENED_OFFSET) {
            path += std::to_string(component - HARDENED_OFFSET);
            path += '\'';
        } else {
            path += std::to_string(component);
        }
    }
    return path;
}

// Derives a child key at a specific derivation path from a parent key by
// applying derive_priv_child for each component in the path.
ExKey Bip32Util::get_child_key_at_path(const ExKey& key, const std::string& derivation_path) {
    auto components = parse_path(derivation_path);

    ExKey current_key = key;
    for (uint32_t index : components) {
        current_key = derive_priv_child(current_key, index);
    }
    return current_key;
}

std::array<uint8_t, 4> Bip32Util::fingerprint(const PublicKey& pubkey) {
    auto id = HashUtils::hash160(pubkey);
    return {id[0], id[1], id[2], id[3]};
}

} // namespace zeldwallet
