#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>
#include "script.hpp"

namespace zeldwallet {

class ByteWriter;

struct Outpoint {
    std::array<uint8_t, 32> txid{};  // Transaction ID in serialized (little-endian) byte order
    uint32_t index = 0;              // Output index in transaction
};

struct TxIn {
    Outpoint prevout;
    Bytes script_sig;
    uint32_t sequence = 0xFFFFFFFF;
    std::vector<Bytes> witness;
};

struct TxOut {
    uint64_t amount = 0;   // Amount in satoshis
    Bytes script_pubkey;   // Locking script
};

struct Transaction {
    int32_t version = 2;
    std::vector<TxIn> inputs;
    std::vector<TxOut> outputs;
    uint32_t locktime = 0;

    // Parses legacy or BIP144 segwit serialization. Throws std::out_of_range
    // on truncated data and std::invalid_argument on trailing bytes.
    static Transaction parse(std::span<const uint8_t> data, bool allow_witness = true);

    // Serializes with the segwit marker when with_witness is set and any
    // input carries witness data
    Bytes serialize(bool with_witness = true) const;

    // double-SHA256 of the witness-stripped serialization
    std::array<uint8_t, 32> txid() const;

    bool has_witness() const;
};

void serialize_outpoint(ByteWriter& writer, const Outpoint& outpoint);
void serialize_output(ByteWriter& writer, const TxOut& output);

} // namespace zeldwallet
