#include "address.hpp"
#include "base58.hpp"
#include "bech32.hpp"
#include "consts.hpp"
#include "error.hpp"
#include <algorithm>

namespace zeldwallet {

std::string Address::from_public_key(const PublicKey& pubkey, AddressType type, Network network) {
    auto address = from_script(Script::for_public_key(pubkey, type), network);
    if (!address) {
        throw KeyError(KeyError::ErrorType::DerivationFailure, "Cannot encode address");
    }
    return *address;
}

std::optional<std::string> Address::from_script(std::span<const uint8_t> script, Network network) {
    const auto& params = network_params(network);
    auto info = Script::classify(script);

    switch (info.type) {
        case ScriptType::P2pkh:
        case ScriptType::P2sh: {
            Bytes payload;
            payload.push_back(info.type == ScriptType::P2pkh ? params.p2pkh_version : params.p2sh_version);
            payload.insert(payload.end(), info.payload.begin(), info.payload.end());
            return Base58::encode_check(payload);
        }
        case ScriptType::P2wpkh:
            return Bech32::encode_segwit(params.bech32_hrp, WITNESS_VERSION_0, info.payload);
        case ScriptType::P2tr:
            return Bech32::encode_segwit(params.bech32_hrp, WITNESS_VERSION_1, info.payload);
        case ScriptType::Unknown:
            break;
    }
    return std::nullopt;
}

Bytes Address::to_script(const std::string& address, Network network) {
    const auto& params = network_params(network);

    if (auto witness = Bech32::decode_segwit(params.bech32_hrp, address)) {
        if (witness->version == 0 && witness->program.size() == 20) {
            Bytes script{WITNESS_VERSION_0, PUBKEY_HASH_SIZE};
            script.insert(script.end(), witness->program.begin(), witness->program.end());
            return script;
        }
        if (witness->version == 1 && witness->program.size() == 32) {
            XOnlyPublicKey key;
            std::copy(witness->program.begin(), witness->program.end(), key.begin());
            return Script::p2tr(key);
        }
        throw KeyError(KeyError::ErrorType::InvalidAddress, "Unsupported witness program: " + address);
    }

    Bytes payload;
    try {
        payload = Base58::decode_check(address);
    } catch (const KeyError&) {
        throw KeyError(KeyError::ErrorType::InvalidAddress, "Invalid address: " + address);
    }
    if (payload.size() != 21) {
        throw KeyError(KeyError::ErrorType::InvalidAddress, "Invalid address payload: " + address);
    }

    std::span<const uint8_t> hash(payload.data() + 1, 20);
    if (payload[0] == params.p2pkh_version) {
        return Script::p2pkh(hash);
    }
    if (payload[0] == params.p2sh_version) {
        return Script::p2sh(hash);
    }
    throw KeyError(KeyError::ErrorType::InvalidAddress, "Address belongs to another network: " + address);
}

} // namespace zeldwallet
