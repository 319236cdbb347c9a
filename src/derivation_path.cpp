#include "derivation_path.hpp"
#include "bip32_util.hpp"
#include "consts.hpp"
#include "error.hpp"

namespace zeldwallet {

uint32_t DerivationPaths::purpose(DerivationPathType type) {
    switch (type) {
        case DerivationPathType::Legacy: return 44;
        case DerivationPathType::NestedSegwit: return 49;
        case DerivationPathType::NativeSegwit: return 84;
        case DerivationPathType::Taproot: return 86;
    }
    throw KeyError(KeyError::ErrorType::UnsupportedDerivationPurpose);
}

AddressType DerivationPaths::address_type(DerivationPathType type) {
    switch (type) {
        case DerivationPathType::Legacy: return AddressType::P2pkh;
        case DerivationPathType::NestedSegwit: return AddressType::P2shP2wpkh;
        case DerivationPathType::NativeSegwit: return AddressType::P2wpkh;
        case DerivationPathType::Taproot: return AddressType::P2tr;
    }
    throw KeyError(KeyError::ErrorType::UnsupportedDerivationPurpose);
}

DerivationPathType DerivationPaths::type_for(AddressPurpose purpose) {
    return purpose == AddressPurpose::Ordinals ? DerivationPathType::Taproot
                                               : DerivationPathType::NativeSegwit;
}

std::optional<DerivationPathType> DerivationPaths::type_for_purpose(uint32_t purpose) {
    switch (purpose) {
        case 44: return DerivationPathType::Legacy;
        case 49: return DerivationPathType::NestedSegwit;
        case 84: return DerivationPathType::NativeSegwit;
        case 86: return DerivationPathType::Taproot;
        default: return std::nullopt;
    }
}

std::string DerivationPaths::build(DerivationPathType type, Network network,
                                   uint32_t account, uint32_t change, uint32_t index) {
    const uint32_t components[] = {
        purpose(type) + HARDENED_OFFSET,
        network_params(network).coin_type + HARDENED_OFFSET,
        account + HARDENED_OFFSET,
        change,
        index
    };
    return Bip32Util::format_path(components);
}

DerivationPathType DerivationPaths::type_of_path(const std::string& path) {
    auto components = Bip32Util::parse_path(path);
    if (components.empty() || components[0] < HARDENED_OFFSET) {
        throw KeyError(KeyError::ErrorType::UnsupportedDerivationPurpose,
                       "Derivation path has no hardened purpose: " + path);
    }

    uint32_t purpose_value = components[0] - HARDENED_OFFSET;
    auto type = type_for_purpose(purpose_value);
    if (!type) {
        throw KeyError(KeyError::ErrorType::UnsupportedDerivationPurpose,
                       "Unsupported derivation purpose: " + std::to_string(purpose_value));
    }
    return *type;
}

std::optional<StandardPath> DerivationPaths::parse_standard(const std::string& path) {
    std::vector<uint32_t> components;
    try {
        components = Bip32Util::parse_path(path);
    } catch (const KeyError&) {
        return std::nullopt;
    }

    if (components.size() != 5 ||
        components[0] < HARDENED_OFFSET || components[1] < HARDENED_OFFSET ||
        components[2] < HARDENED_OFFSET || components[3] >= HARDENED_OFFSET ||
        components[4] >= HARDENED_OFFSET) {
        return std::nullopt;
    }

    auto type = type_for_purpose(components[0] - HARDENED_OFFSET);
    if (!type) {
        return std::nullopt;
    }
    return StandardPath{*type, components[1] - HARDENED_OFFSET, components[2] - HARDENED_OFFSET,
                        components[3], components[4]};
}

const char* to_string(DerivationPathType type) {
    switch (type) {
        case DerivationPathType::Legacy: return "legacy";
        case DerivationPathType::NestedSegwit: return "nestedSegwit";
        case DerivationPathType::NativeSegwit: return "nativeSegwit";
        case DerivationPathType::Taproot: return "taproot";
    }
    return "unknown";
}

const char* to_string(AddressType type) {
    switch (type) {
        case AddressType::P2pkh: return "p2pkh";
        case AddressType::P2shP2wpkh: return "p2sh";
        case AddressType::P2wpkh: return "p2wpkh";
        case AddressType::P2tr: return "p2tr";
    }
    return "unknown";
}

const char* to_string(AddressPurpose purpose) {
    return purpose == AddressPurpose::Payment ? "payment" : "ordinals";
}

std::optional<AddressPurpose> purpose_from_string(const std::string& name) {
    if (name == "payment") return AddressPurpose::Payment;
    if (name == "ordinals") return AddressPurpose::Ordinals;
    return std::nullopt;
}

} // namespace zeldwallet
