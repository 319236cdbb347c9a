#include "sighash.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "serialize.hpp"

namespace zeldwallet {

namespace {

uint32_t output_type(uint32_t hash_type) {
    return hash_type & SIGHASH_OUTPUT_MASK;
}

bool anyone_can_pay(uint32_t hash_type) {
    return (hash_type & SIGHASH_ANYONECANPAY) != 0;
}

} // namespace

// Legacy signature hash.
//
// The signed data is a modified copy of the transaction:
// 1. Every scriptSig is emptied, the signed input's is set to the scriptCode
// 2. SIGHASH_NONE drops all outputs; SIGHASH_SINGLE keeps outputs up to the
//    input's index, blanking the earlier ones (value -1, empty script)
// 3. For NONE and SINGLE the other inputs' sequences are zeroed
// 4. ANYONECANPAY keeps only the signed input
// 5. The 4-byte hash type is appended and the result double-SHA256'd
//
// SIGHASH_SINGLE without a matching output signs the constant 1, a
// consensus quirk kept for compatibility.
Hash256 Sighash::legacy(const Transaction& tx, size_t input_index,
                        std::span<const uint8_t> script_code, uint32_t hash_type) {
    if (input_index >= tx.inputs.size()) {
        throw SigningError(SigningError::ErrorType::InputNotFound, "Sighash input index out of range");
    }

    if (output_type(hash_type) == SIGHASH_SINGLE && input_index >= tx.outputs.size()) {
        Hash256 one{};
        one[0] = 0x01;
        return one;
    }

    Transaction copy = tx;
    for (auto& input : copy.inputs) {
        input.script_sig.clear();
        input.witness.clear();
    }
    copy.inputs[input_index].script_sig.assign(script_code.begin(), script_code.end());

    if (output_type(hash_type) == SIGHASH_NONE) {
        copy.outputs.clear();
    } else if (output_type(hash_type) == SIGHASH_SINGLE) {
        copy.outputs.resize(input_index + 1);
        for (size_t i = 0; i < input_index; ++i) {
            copy.outputs[i].amount = 0xFFFFFFFFFFFFFFFFULL;
            copy.outputs[i].script_pubkey.clear();
        }
    }

    if (output_type(hash_type) == SIGHASH_NONE || output_type(hash_type) == SIGHASH_SINGLE) {
        for (size_t i = 0; i < copy.inputs.size(); ++i) {
            if (i != input_index) {
                copy.inputs[i].sequence = 0;
            }
        }
    }

    if (anyone_can_pay(hash_type)) {
        TxIn signed_input = copy.inputs[input_index];
        copy.inputs.assign(1, signed_input);
    }

    ByteWriter writer;
    writer.write_bytes(copy.serialize(false));
    writer.write_u32(hash_type);
    return HashUtils::double_sha256(writer.data());
}

// Create the transaction digest (hash) for signing according to BIP143
// https://github.com/bitcoin/bips/blob/master/bip-0143.mediawiki
//
// The commitment structure includes:
// 1. Transaction version (4 bytes)
// 2. Hash of all input outpoints (32 bytes) - double SHA256
// 3. Hash of all input sequence numbers (32 bytes) - double SHA256
// 4. Outpoint being spent (36 bytes)
// 5. Script code of the input (variable)
// 6. Value of the output being spent (8 bytes)
// 7. Sequence number of the input (4 bytes)
// 8. Hash of all outputs (32 bytes) - double SHA256
// 9. Locktime (4 bytes)
// 10. Sighash type (4 bytes)
//
// ANYONECANPAY zeroes items 2 and 3, NONE and SINGLE zero item 3, and item 8
// covers only the matching output for SINGLE (zero if there is none) and
// nothing for NONE.
Hash256 Sighash::segwit_v0(const Transaction& tx, size_t input_index,
                           std::span<const uint8_t> script_code, uint64_t amount,
                           uint32_t hash_type) {
    if (input_index >= tx.inputs.size()) {
        throw SigningError(SigningError::ErrorType::InputNotFound, "Sighash input index out of range");
    }

    Hash256 hash_prevouts{};
    Hash256 hash_sequence{};
    Hash256 hash_outputs{};

    if (!anyone_can_pay(hash_type)) {
        ByteWriter prevouts;
        for (const auto& input : tx.inputs) {
            serialize_outpoint(prevouts, input.prevout);
        }
        hash_prevouts = HashUtils::double_sha256(prevouts.data());
    }

    if (!anyone_can_pay(hash_type) && output_type(hash_type) != SIGHASH_SINGLE &&
        output_type(hash_type) != SIGHASH_NONE) {
        ByteWriter sequences;
        for (const auto& input : tx.inputs) {
            sequences.write_u32(input.sequence);
        }
        hash_sequence = HashUtils::double_sha256(sequences.data());
    }

    if (output_type(hash_type) != SIGHASH_SINGLE && output_type(hash_type) != SIGHASH_NONE) {
        ByteWriter outputs;
        for (const auto& output : tx.outputs) {
            serialize_output(outputs, output);
        }
        hash_outputs = HashUtils::double_sha256(outputs.data());
    } else if (output_type(hash_type) == SIGHASH_SINGLE && input_index < tx.outputs.size()) {
        ByteWriter output;
        serialize_output(output, tx.outputs[input_index]);
        hash_outputs = HashUtils::double_sha256(output.data());
    }

    const auto& input = tx.inputs[input_index];
    ByteWriter commitment;
    commitment.write_i32(tx.version);
    commitment.write_bytes(hash_prevouts);
    commitment.write_bytes(hash_sequence);
    serialize_outpoint(commitment, input.prevout);
    commitment.write_var_bytes(script_code);
    commitment.write_u64(amount);
    commitment.write_u32(input.sequence);
    commitment.write_bytes(hash_outputs);
    commitment.write_u32(tx.locktime);
    commitment.write_u32(hash_type);

    return HashUtils::double_sha256(commitment.data());
}

bool Sighash::is_valid_taproot_hash_type(uint8_t hash_type) {
    return hash_type <= SIGHASH_SINGLE ||
           (hash_type >= (SIGHASH_ANYONECANPAY | SIGHASH_ALL) &&
            hash_type <= (SIGHASH_ANYONECANPAY | SIGHASH_SINGLE));
}

// BIP341 signature message for a key-path spend:
//   hash_TapSighash(0x00 || SigMsg(hash_type, 0))
//
// SigMsg:
// - hash_type (1), nVersion (4), nLockTime (4)
// - unless ANYONECANPAY: sha_prevouts, sha_amounts, sha_scriptpubkeys,
//   sha_sequences (single SHA256 each)
// - unless NONE or SINGLE: sha_outputs
// - spend_type (1) = 0 (key path, no annex)
// - ANYONECANPAY: outpoint, amount, scriptPubKey and nSequence of this
//   input; otherwise the 4-byte input index
// - SINGLE: sha_single_output of the output at the same index
//
// SIGHASH_DEFAULT (0x00) commits like ALL but is not appended to the
// signature.
Hash256 Sighash::taproot_key_path(const Transaction& tx, size_t input_index,
                                  const std::vector<std::optional<TxOut>>& spent_outputs,
                                  uint8_t hash_type) {
    if (input_index >= tx.inputs.size()) {
        throw SigningError(SigningError::ErrorType::InputNotFound, "Sighash input index out of range");
    }
    if (!is_valid_taproot_hash_type(hash_type)) {
        throw SigningError(SigningError::ErrorType::SighashNotAllowed, "Invalid taproot sighash type");
    }
    if (spent_outputs.size() != tx.inputs.size()) {
        throw SigningError(SigningError::ErrorType::CannotDetermineScript,
                           "Taproot signing needs the spent output of every input");
    }

    uint8_t out_type = hash_type & SIGHASH_OUTPUT_MASK;
    bool acp = anyone_can_pay(hash_type);

    ByteWriter msg;
    msg.write_u8(0x00);  // epoch
    msg.write_u8(hash_type);
    msg.write_i32(tx.version);
    msg.write_u32(tx.locktime);

    if (!acp) {
        ByteWriter prevouts;
        ByteWriter amounts;
        ByteWriter scripts;
        ByteWriter sequences;
        for (size_t i = 0; i < tx.inputs.size(); ++i) {
            if (!spent_outputs[i]) {
                throw SigningError(SigningError::ErrorType::CannotDetermineScript,
                                   "Missing spent output for input " + std::to_string(i));
            }
            serialize_outpoint(prevouts, tx.inputs[i].prevout);
            amounts.write_u64(spent_outputs[i]->amount);
            scripts.write_var_bytes(spent_outputs[i]->script_pubkey);
            sequences.write_u32(tx.inputs[i].sequence);
        }
        msg.write_bytes(HashUtils::sha256(prevouts.data()));
        msg.write_bytes(HashUtils::sha256(amounts.data()));
        msg.write_bytes(HashUtils::sha256(scripts.data()));
        msg.write_bytes(HashUtils::sha256(sequences.data()));
    }

    if (out_type != SIGHASH_NONE && out_type != SIGHASH_SINGLE) {
        ByteWriter outputs;
        for (const auto& output : tx.outputs) {
            serialize_output(outputs, output);
        }
        msg.write_bytes(HashUtils::sha256(outputs.data()));
    }

    msg.write_u8(0x00);  // spend_type: key path, no annex

    if (acp) {
        const auto& spent = spent_outputs[input_index];
        if (!spent) {
            throw SigningError(SigningError::ErrorType::CannotDetermineScript,
                               "Missing spent output for input " + std::to_string(input_index));
        }
        serialize_outpoint(msg, tx.inputs[input_index].prevout);
        msg.write_u64(spent->amount);
        msg.write_var_bytes(spent->script_pubkey);
        msg.write_u32(tx.inputs[input_index].sequence);
    } else {
        msg.write_u32(static_cast<uint32_t>(input_index));
    }

    if (out_type == SIGHASH_SINGLE) {
        if (input_index >= tx.outputs.size()) {
            throw SigningError(SigningError::ErrorType::SigningFailure,
                               "SIGHASH_SINGLE without a matching output");
        }
        ByteWriter output;
        serialize_output(output, tx.outputs[input_index]);
        msg.write_bytes(HashUtils::sha256(output.data()));
    }

    return HashUtils::tagged_hash("TapSighash", msg.data());
}

} // namespace zeldwallet
