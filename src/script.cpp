#include "script.hpp"
#include "consts.hpp"
#include "hash_utils.hpp"

namespace zeldwallet {

// Pay-to-Public-Key-Hash output script
//
// P2PKH structure (25 bytes total):
// - 0x76     : OP_DUP
// - 0xA9     : OP_HASH160
// - 0x14     : Push 20 bytes
// - [20 bytes]: HASH160 of public key
// - 0x88     : OP_EQUALVERIFY
// - 0xAC     : OP_CHECKSIG
Bytes Script::p2pkh(std::span<const uint8_t> pubkey_hash) {
    Bytes script;
    script.reserve(25);
    script.push_back(OP_DUP);
    script.push_back(OP_HASH160);
    script.push_back(PUBKEY_HASH_SIZE);
    script.insert(script.end(), pubkey_hash.begin(), pubkey_hash.end());
    script.push_back(OP_EQUALVERIFY);
    script.push_back(OP_CHECKSIG);
    return script;
}

// Pay-to-Script-Hash output script (BIP16)
//
// P2SH structure (23 bytes total):
// - 0xA9     : OP_HASH160
// - 0x14     : Push 20 bytes
// - [20 bytes]: HASH160 of the redeem script
// - 0x87     : OP_EQUAL
Bytes Script::p2sh(std::span<const uint8_t> script_hash) {
    Bytes script;
    script.reserve(23);
    script.push_back(OP_HASH160);
    script.push_back(PUBKEY_HASH_SIZE);
    script.insert(script.end(), script_hash.begin(), script_hash.end());
    script.push_back(OP_EQUAL);
    return script;
}

// Create a Pay-to-Witness-Public-Key-Hash (P2WPKH) program from a public key
// This implements the standard P2WPKH witness program as defined in BIP141
// https://github.com/bitcoin/bips/blob/master/bip-0141.mediawiki
//
// P2WPKH structure (22 bytes total):
// - 0x00     : Witness version 0
// - 0x14     : Push 20 bytes
// - [20 bytes]: HASH160 of public key
Bytes Script::p2wpkh_program(std::span<const uint8_t> pubkey) {
    auto hash160_result = HashUtils::hash160(pubkey);

    Bytes program;
    program.reserve(22);
    program.push_back(WITNESS_VERSION_0);
    program.push_back(PUBKEY_HASH_SIZE);
    program.insert(program.end(), hash160_result.begin(), hash160_result.end());
    return program;
}

// Pay-to-Taproot output script (BIP341)
//
// P2TR structure (34 bytes total):
// - 0x51     : OP_1 (witness version 1)
// - 0x20     : Push 32 bytes
// - [32 bytes]: x-only tweaked output key Q
Bytes Script::p2tr(const XOnlyPublicKey& output_key) {
    Bytes script;
    script.reserve(34);
    script.push_back(OP_1);
    script.push_back(XONLY_PUBKEY_SIZE);
    script.insert(script.end(), output_key.begin(), output_key.end());
    return script;
}

Bytes Script::for_public_key(const PublicKey& pubkey, AddressType type) {
    switch (type) {
        case AddressType::P2pkh:
            return p2pkh(HashUtils::hash160(pubkey));
        case AddressType::P2shP2wpkh:
            return p2sh(HashUtils::hash160(p2sh_p2wpkh_redeem_script(pubkey)));
        case AddressType::P2wpkh:
            return p2wpkh_program(pubkey);
        case AddressType::P2tr: {
            auto tweaked = CurveUtils::taproot_tweak_public_key(CurveUtils::x_only(pubkey));
            return p2tr(tweaked.x_only);
        }
    }
    return {};
}

// BIP49 wraps the P2WPKH program in P2SH: the witness program itself is the
// redeem script and its HASH160 goes into the P2SH output
Bytes Script::p2sh_p2wpkh_redeem_script(const PublicKey& pubkey) {
    return p2wpkh_program(pubkey);
}

// For P2WPKH the BIP143 scriptCode is the classic P2PKH script built from
// the 20-byte program:
//   OP_DUP OP_HASH160 <pubkey hash> OP_EQUALVERIFY OP_CHECKSIG
// The sighash serializer adds the length prefix.
Bytes Script::p2wpkh_scriptcode(std::span<const uint8_t> pubkey_hash) {
    return p2pkh(pubkey_hash);
}

ScriptInfo Script::classify(std::span<const uint8_t> script) {
    if (script.size() == 25 && script[0] == OP_DUP && script[1] == OP_HASH160 &&
        script[2] == PUBKEY_HASH_SIZE && script[23] == OP_EQUALVERIFY && script[24] == OP_CHECKSIG) {
        return {ScriptType::P2pkh, Bytes(script.begin() + 3, script.begin() + 23)};
    }
    if (script.size() == 23 && script[0] == OP_HASH160 && script[1] == PUBKEY_HASH_SIZE &&
        script[22] == OP_EQUAL) {
        return {ScriptType::P2sh, Bytes(script.begin() + 2, script.begin() + 22)};
    }
    if (script.size() == 22 && script[0] == WITNESS_VERSION_0 && script[1] == PUBKEY_HASH_SIZE) {
        return {ScriptType::P2wpkh, Bytes(script.begin() + 2, script.end())};
    }
    if (script.size() == 34 && script[0] == OP_1 && script[1] == XONLY_PUBKEY_SIZE) {
        return {ScriptType::P2tr, Bytes(script.begin() + 2, script.end())};
    }
    return {ScriptType::Unknown, {}};
}

void Script::push_data(Bytes& script, std::span<const uint8_t> data) {
    if (data.size() < OP_PUSHDATA1) {
        script.push_back(static_cast<uint8_t>(data.size()));
    } else if (data.size() <= 0xff) {
        script.push_back(OP_PUSHDATA1);
        script.push_back(static_cast<uint8_t>(data.size()));
    } else if (data.size() <= 0xffff) {
        script.push_back(OP_PUSHDATA2);
        script.push_back(static_cast<uint8_t>(data.size() & 0xff));
        script.push_back(static_cast<uint8_t>((data.size() >> 8) & 0xff));
    } else {
        script.push_back(OP_PUSHDATA4);
        for (int i = 0; i < 4; ++i) {
            script.push_back(static_cast<uint8_t>((data.size() >> (8 * i)) & 0xff));
        }
    }
    script.insert(script.end(), data.begin(), data.end());
}

} // namespace zeldwallet
