#include "network.hpp"

namespace zeldwallet {

namespace {

constexpr NetworkParams MAINNET_PARAMS{0x00, 0x05, "bc", 0};
constexpr NetworkParams TESTNET_PARAMS{0x6f, 0xc4, "tb", 1};

} // namespace

const NetworkParams& network_params(Network network) {
    return network == Network::Mainnet ? MAINNET_PARAMS : TESTNET_PARAMS;
}

std::string to_string(Network network) {
    return network == Network::Mainnet ? "mainnet" : "testnet";
}

std::optional<Network> network_from_string(const std::string& name) {
    if (name == "mainnet") return Network::Mainnet;
    if (name == "testnet") return Network::Testnet;
    return std::nullopt;
}

} // namespace zeldwallet
