#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "curve_utils.hpp"
#include "derivation_path.hpp"

namespace zeldwallet {

using Bytes = std::vector<uint8_t>;

// Output script templates the wallet can spend
enum class ScriptType {
    P2pkh,
    P2sh,
    P2wpkh,
    P2tr,
    Unknown
};

// A classified output script and the hash or key it commits to
struct ScriptInfo {
    ScriptType type;
    Bytes payload;  // 20-byte hash for P2PKH/P2SH/P2WPKH, 32-byte key for P2TR
};

// Script builds and classifies the standard output scripts and the
// scriptSig/scriptCode pieces needed to spend them.
class Script {
public:
    // OP_DUP OP_HASH160 <20 bytes> OP_EQUALVERIFY OP_CHECKSIG
    static Bytes p2pkh(std::span<const uint8_t> pubkey_hash);

    // OP_HASH160 <20 bytes> OP_EQUAL
    static Bytes p2sh(std::span<const uint8_t> script_hash);

    // OP_0 <20 bytes HASH160(pubkey)>
    static Bytes p2wpkh_program(std::span<const uint8_t> pubkey);

    // OP_1 <32 bytes x-only output key>
    static Bytes p2tr(const XOnlyPublicKey& output_key);

    // Output script paying to pubkey under the given address type
    static Bytes for_public_key(const PublicKey& pubkey, AddressType type);

    // Redeem script of a P2SH-wrapped P2WPKH output, i.e. its witness program
    static Bytes p2sh_p2wpkh_redeem_script(const PublicKey& pubkey);

    // BIP143 scriptCode of a P2WPKH spend (the equivalent P2PKH script)
    static Bytes p2wpkh_scriptcode(std::span<const uint8_t> pubkey_hash);

    static ScriptInfo classify(std::span<const uint8_t> script);

    // Minimal push of a data element inside a scriptSig
    static void push_data(Bytes& script, std::span<const uint8_t> data);

private:
    Script() = delete;
};

} // namespace zeldwallet
