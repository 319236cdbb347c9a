#pragma once

#include <cstdint>

namespace zeldwallet {

    // Bitcoin Script Operation Codes
    constexpr uint8_t OP_0 = 0x00;
    constexpr uint8_t OP_PUSHDATA1 = 0x4c;
    constexpr uint8_t OP_PUSHDATA2 = 0x4d;
    constexpr uint8_t OP_PUSHDATA4 = 0x4e;
    constexpr uint8_t OP_1 = 0x51;
    constexpr uint8_t OP_RETURN = 0x6a;
    constexpr uint8_t OP_DUP = 0x76;
    constexpr uint8_t OP_EQUAL = 0x87;
    constexpr uint8_t OP_EQUALVERIFY = 0x88;
    constexpr uint8_t OP_HASH160 = 0xA9;
    constexpr uint8_t OP_CHECKSIG = 0xAC;

    // Common script-related constants
    constexpr uint8_t COMPRESSED_PUBKEY_SIZE = 0x21; // 33 bytes
    constexpr uint8_t XONLY_PUBKEY_SIZE = 0x20;      // 32 bytes
    constexpr uint8_t PUBKEY_HASH_SIZE = 0x14;       // 20 bytes
    constexpr uint8_t WITNESS_VERSION_0 = 0x00;
    constexpr uint8_t WITNESS_VERSION_1 = 0x01;

    // Transaction-related constants
    constexpr uint32_t SEQUENCE_FINAL = 0xFFFFFFFF;
    constexpr uint8_t TX_MARKER = 0x00;
    constexpr uint8_t TX_FLAG = 0x01;

    // Signature hash types
    constexpr uint8_t SIGHASH_DEFAULT = 0x00;
    constexpr uint8_t SIGHASH_ALL = 0x01;
    constexpr uint8_t SIGHASH_NONE = 0x02;
    constexpr uint8_t SIGHASH_SINGLE = 0x03;
    constexpr uint8_t SIGHASH_ANYONECANPAY = 0x80;
    constexpr uint8_t SIGHASH_OUTPUT_MASK = 0x03;

    // BIP32
    constexpr uint32_t HARDENED_OFFSET = 0x80000000;

} // namespace zeldwallet
