#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace zeldwallet {

// Decoded segwit address: witness version plus program bytes
struct WitnessProgram {
    uint8_t version;
    std::vector<uint8_t> program;
};

// Bech32 (BIP173) and Bech32m (BIP350) segwit address codec.
//
// Witness version 0 outputs (P2WPKH) use the original Bech32 checksum
// constant 1; version 1 and above (P2TR) use the Bech32m constant
// 0x2bc830a3. Encoding picks the constant from the version and decoding
// rejects an address carrying the wrong one.
class Bech32 {
public:
    static std::string encode_segwit(std::string_view hrp, uint8_t witness_version,
                                     std::span<const uint8_t> program);

    // Returns nullopt for anything that is not a valid segwit address for hrp
    static std::optional<WitnessProgram> decode_segwit(std::string_view hrp, std::string_view address);

private:
    Bech32() = delete;
};

} // namespace zeldwallet
