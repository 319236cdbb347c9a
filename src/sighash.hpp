#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "hash_utils.hpp"
#include "transaction.hpp"

namespace zeldwallet {

// Signature hash algorithms for the three script generations the wallet
// signs for: pre-segwit, segwit v0 (BIP143) and taproot key path (BIP341).
class Sighash {
public:
    // Original algorithm: modified transaction copy, double SHA256
    static Hash256 legacy(const Transaction& tx, size_t input_index,
                          std::span<const uint8_t> script_code, uint32_t hash_type);

    // BIP143 commitment hash for P2WPKH and P2SH-P2WPKH inputs
    static Hash256 segwit_v0(const Transaction& tx, size_t input_index,
                             std::span<const uint8_t> script_code, uint64_t amount,
                             uint32_t hash_type);

    // BIP341 key-path signature message hash (ext_flag 0, no annex). Every
    // spent output must be known unless ANYONECANPAY is set.
    static Hash256 taproot_key_path(const Transaction& tx, size_t input_index,
                                    const std::vector<std::optional<TxOut>>& spent_outputs,
                                    uint8_t hash_type);

    // 0x00-0x03 and 0x81-0x83
    static bool is_valid_taproot_hash_type(uint8_t hash_type);

private:
    Sighash() = delete;
};

} // namespace zeldwallet
