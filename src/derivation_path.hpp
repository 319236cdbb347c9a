#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "network.hpp"

namespace zeldwallet {

// The four standard derivation schemes, each bound to a BIP purpose and
// to one output script type:
//   Legacy       -> 44' -> P2PKH
//   NestedSegwit -> 49' -> P2SH-P2WPKH
//   NativeSegwit -> 84' -> P2WPKH
//   Taproot      -> 86' -> P2TR (key path only)
enum class DerivationPathType {
    Legacy,
    NestedSegwit,
    NativeSegwit,
    Taproot
};

enum class AddressType {
    P2pkh,
    P2shP2wpkh,
    P2wpkh,
    P2tr
};

// Roles an address plays for callers
enum class AddressPurpose {
    Payment,
    Ordinals
};

// Components of a standard m/purpose'/coin'/account'/change/index path
struct StandardPath {
    DerivationPathType type;
    uint32_t coin_type;
    uint32_t account;
    uint32_t change;
    uint32_t index;
};

class DerivationPaths {
public:
    static constexpr DerivationPathType ALL_TYPES[] = {
        DerivationPathType::Legacy,
        DerivationPathType::NestedSegwit,
        DerivationPathType::NativeSegwit,
        DerivationPathType::Taproot
    };

    static uint32_t purpose(DerivationPathType type);

    static AddressType address_type(DerivationPathType type);

    // Default scheme for an address purpose
    static DerivationPathType type_for(AddressPurpose purpose);

    static std::optional<DerivationPathType> type_for_purpose(uint32_t purpose);

    // m/purpose'/coin'/account'/change/index for the network's coin type
    static std::string build(DerivationPathType type, Network network,
                             uint32_t account, uint32_t change, uint32_t index);

    // Script type implied by the purpose field of any path with at least one
    // hardened purpose component. Throws InvalidDerivationPath on syntax
    // errors and UnsupportedDerivationPurpose for other purposes.
    static DerivationPathType type_of_path(const std::string& path);

    // Splits a five-level standard path; nullopt for anything else
    static std::optional<StandardPath> parse_standard(const std::string& path);

private:
    DerivationPaths() = delete;
};

const char* to_string(DerivationPathType type);
const char* to_string(AddressType type);
const char* to_string(AddressPurpose purpose);

std::optional<AddressPurpose> purpose_from_string(const std::string& name);

} // namespace zeldwallet
