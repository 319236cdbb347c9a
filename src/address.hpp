#pragma once

#include <optional>
#include <span>
#include <string>
#include "curve_utils.hpp"
#include "derivation_path.hpp"
#include "network.hpp"
#include "script.hpp"

namespace zeldwallet {

// Address encodes output scripts as human-readable addresses and back:
//   P2PKH / P2SH  -> Base58Check with the network's version byte
//   P2WPKH        -> Bech32, witness version 0
//   P2TR          -> Bech32m, witness version 1
class Address {
public:
    static std::string from_public_key(const PublicKey& pubkey, AddressType type, Network network);

    // nullopt for scripts that have no standard address form
    static std::optional<std::string> from_script(std::span<const uint8_t> script, Network network);

    // Throws KeyError(InvalidAddress) if the address does not parse for the network
    static Bytes to_script(const std::string& address, Network network);

private:
    Address() = delete;
};

} // namespace zeldwallet
