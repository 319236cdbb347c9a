#include "transaction.hpp"
#include "consts.hpp"
#include "hash_utils.hpp"
#include "serialize.hpp"
#include <algorithm>
#include <stdexcept>

namespace zeldwallet {

// Outpoint serialization:
// - [32 bytes]: Previous transaction ID (little-endian)
// - [4 bytes] : Previous output index (little-endian)
void serialize_outpoint(ByteWriter& writer, const Outpoint& outpoint) {
    writer.write_bytes(outpoint.txid);
    writer.write_u32(outpoint.index);
}

// Transaction output structure:
// - [8 bytes]: Value in satoshis (little-endian)
// - [1-9 bytes]: Script length (varint)
// - [variable]: Script (scriptPubKey)
void serialize_output(ByteWriter& writer, const TxOut& output) {
    writer.write_u64(output.amount);
    writer.write_var_bytes(output.script_pubkey);
}

bool Transaction::has_witness() const {
    return std::any_of(inputs.begin(), inputs.end(),
                       [](const TxIn& input) { return !input.witness.empty(); });
}

// Transaction layout (BIP144 when witness data is present):
// - [4 bytes]  : Version
// - [2 bytes]  : Marker 0x00 and flag 0x01 (segwit only)
// - [varint]   : Input count, then each input (outpoint, scriptSig, sequence)
// - [varint]   : Output count, then each output
// - [variable] : One witness stack per input (segwit only)
// - [4 bytes]  : Locktime
Bytes Transaction::serialize(bool with_witness) const {
    bool segwit = with_witness && has_witness();

    ByteWriter writer;
    writer.write_i32(version);
    if (segwit) {
        writer.write_u8(TX_MARKER);
        writer.write_u8(TX_FLAG);
    }

    writer.write_compact_size(inputs.size());
    for (const auto& input : inputs) {
        serialize_outpoint(writer, input.prevout);
        writer.write_var_bytes(input.script_sig);
        writer.write_u32(input.sequence);
    }

    writer.write_compact_size(outputs.size());
    for (const auto& output : outputs) {
        serialize_output(writer, output);
    }

    if (segwit) {
        for (const auto& input : inputs) {
            writer.write_compact_size(input.witness.size());
            for (const auto& item : input.witness) {
                writer.write_var_bytes(item);
            }
        }
    }

    writer.write_u32(locktime);
    return writer.release();
}

Transaction Transaction::parse(std::span<const uint8_t> data, bool allow_witness) {
    ByteReader reader(data);
    Transaction tx;
    tx.version = reader.read_i32();

    bool segwit = false;
    if (allow_witness && reader.remaining() >= 2 && data[reader.position()] == TX_MARKER &&
        data[reader.position() + 1] == TX_FLAG) {
        reader.read_u8();
        reader.read_u8();
        segwit = true;
    }

    uint64_t input_count = reader.read_compact_size();
    if (input_count > reader.remaining()) {
        throw std::out_of_range("Input count exceeds data");
    }
    tx.inputs.resize(static_cast<size_t>(input_count));
    for (auto& input : tx.inputs) {
        auto txid = reader.read_bytes(32);
        std::copy(txid.begin(), txid.end(), input.prevout.txid.begin());
        input.prevout.index = reader.read_u32();
        input.script_sig = reader.read_var_bytes();
        input.sequence = reader.read_u32();
    }

    uint64_t output_count = reader.read_compact_size();
    if (output_count > reader.remaining()) {
        throw std::out_of_range("Output count exceeds data");
    }
    tx.outputs.resize(static_cast<size_t>(output_count));
    for (auto& output : tx.outputs) {
        output.amount = reader.read_u64();
        output.script_pubkey = reader.read_var_bytes();
    }

    if (segwit) {
        for (auto& input : tx.inputs) {
            uint64_t items = reader.read_compact_size();
            if (items > reader.remaining()) {
                throw std::out_of_range("Witness item count exceeds data");
            }
            for (uint64_t i = 0; i < items; ++i) {
                input.witness.push_back(reader.read_var_bytes());
            }
        }
    }

    tx.locktime = reader.read_u32();
    if (!reader.empty()) {
        throw std::invalid_argument("Trailing bytes after transaction");
    }
    return tx;
}

// Calculates the transaction ID (txid): double SHA256 of the transaction
// serialized without witness data, kept in internal byte order
std::array<uint8_t, 32> Transaction::txid() const {
    return HashUtils::double_sha256(serialize(false));
}

} // namespace zeldwallet
