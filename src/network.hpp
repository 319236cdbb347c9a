#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace zeldwallet {

enum class Network {
    Mainnet,
    Testnet
};

// Address encoding and BIP44 coin type for a network
struct NetworkParams {
    uint8_t p2pkh_version;   // Base58Check version byte for P2PKH
    uint8_t p2sh_version;    // Base58Check version byte for P2SH
    const char* bech32_hrp;  // Human readable part of segwit addresses
    uint32_t coin_type;      // BIP44 coin type (0 mainnet, 1 testnet)
};

const NetworkParams& network_params(Network network);

std::string to_string(Network network);

// Accepts "mainnet" and "testnet"
std::optional<Network> network_from_string(const std::string& name);

} // namespace zeldwallet
