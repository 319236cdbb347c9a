#include "psbt.hpp"
#include "base64.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "script.hpp"
#include "serialize.hpp"
#include <algorithm>
#include <stdexcept>

namespace zeldwallet {

namespace {

constexpr uint8_t PSBT_MAGIC[] = {'p', 's', 'b', 't', 0xff};

// Input records the finalizer strips; everything else (UTXOs, final fields,
// unknown and proprietary keys) is kept
constexpr uint8_t FINALIZER_CLEARED_TYPES[] = {
    PSBT_IN_PARTIAL_SIG,
    PSBT_IN_SIGHASH_TYPE,
    PSBT_IN_REDEEM_SCRIPT,
    PSBT_IN_WITNESS_SCRIPT,
    PSBT_IN_BIP32_DERIVATION,
    PSBT_IN_RIPEMD160,
    PSBT_IN_SHA256,
    PSBT_IN_HASH160,
    PSBT_IN_HASH256,
    PSBT_IN_TAP_KEY_SIG,
    PSBT_IN_TAP_SCRIPT_SIG,
    PSBT_IN_TAP_LEAF_SCRIPT,
    PSBT_IN_TAP_BIP32_DERIVATION,
    PSBT_IN_TAP_INTERNAL_KEY,
    PSBT_IN_TAP_MERKLE_ROOT
};

[[noreturn]] void invalid(const std::string& message) {
    throw SigningError(SigningError::ErrorType::InvalidPsbt, message);
}

PsbtMap read_map(ByteReader& reader) {
    PsbtMap map;
    while (true) {
        Bytes key = reader.read_var_bytes();
        if (key.empty()) {
            return map;  // separator
        }
        Bytes value = reader.read_var_bytes();
        map.add_unique(std::move(key), std::move(value));
    }
}

void write_map(ByteWriter& writer, const PsbtMap& map) {
    for (const auto& [key, value] : map.entries()) {
        writer.write_var_bytes(key);
        writer.write_var_bytes(value);
    }
    writer.write_u8(0x00);
}

Bytes encode_witness(const std::vector<Bytes>& stack) {
    ByteWriter writer;
    writer.write_compact_size(stack.size());
    for (const auto& item : stack) {
        writer.write_var_bytes(item);
    }
    return writer.release();
}

std::vector<Bytes> decode_witness(std::span<const uint8_t> data) {
    ByteReader reader(data);
    uint64_t count = reader.read_compact_size();
    std::vector<Bytes> stack;
    for (uint64_t i = 0; i < count; ++i) {
        stack.push_back(reader.read_var_bytes());
    }
    if (!reader.empty()) {
        throw std::invalid_argument("Trailing bytes after witness");
    }
    return stack;
}

// Partial signature whose public key hashes to `pubkey_hash`
std::optional<std::pair<Bytes, Bytes>> find_signature_for_hash(const PsbtMap& input,
                                                               std::span<const uint8_t> pubkey_hash) {
    for (const auto* entry : input.entries_of_type(PSBT_IN_PARTIAL_SIG)) {
        Bytes pubkey(entry->first.begin() + 1, entry->first.end());
        Hash160 hash = HashUtils::hash160(pubkey);
        if (std::equal(hash.begin(), hash.end(), pubkey_hash.begin(), pubkey_hash.end())) {
            return std::make_pair(entry->second, pubkey);
        }
    }
    return std::nullopt;
}

} // namespace

const Bytes* PsbtMap::find(std::span<const uint8_t> key) const {
    for (const auto& entry : entries_) {
        if (std::equal(entry.first.begin(), entry.first.end(), key.begin(), key.end())) {
            return &entry.second;
        }
    }
    return nullptr;
}

const Bytes* PsbtMap::find(uint8_t type) const {
    const uint8_t key[] = {type};
    return find(std::span<const uint8_t>(key));
}

void PsbtMap::set(Bytes key, Bytes value) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

void PsbtMap::add_unique(Bytes key, Bytes value) {
    if (find(key) != nullptr) {
        invalid("Duplicate PSBT key");
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

void PsbtMap::erase_type(uint8_t type) {
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [type](const Entry& entry) { return entry.first[0] == type; }),
                   entries_.end());
}

std::vector<const PsbtMap::Entry*> PsbtMap::entries_of_type(uint8_t type) const {
    std::vector<const Entry*> result;
    for (const auto& entry : entries_) {
        if (entry.first[0] == type) {
            result.push_back(&entry);
        }
    }
    return result;
}

// PSBT layout:
// - [5 bytes]  : Magic "psbt" 0xFF
// - global map : must hold the unsigned transaction (key 0x00)
// - one map per transaction input, then one map per output
// Each map is a run of <keylen><key><valuelen><value> records closed by a
// zero-length key.
Psbt Psbt::parse(std::span<const uint8_t> data) {
    if (data.size() < sizeof(PSBT_MAGIC) ||
        !std::equal(std::begin(PSBT_MAGIC), std::end(PSBT_MAGIC), data.begin())) {
        invalid("Missing PSBT magic bytes");
    }

    Psbt psbt;
    try {
        ByteReader reader(data.subspan(sizeof(PSBT_MAGIC)));
        psbt.global_ = read_map(reader);

        const Bytes* raw_tx = psbt.global_.find(PSBT_GLOBAL_UNSIGNED_TX);
        if (raw_tx == nullptr) {
            invalid("PSBT has no unsigned transaction");
        }
        if (const Bytes* version = psbt.global_.find(PSBT_GLOBAL_VERSION)) {
            if (version->size() != 4 || (*version)[0] != 0 || (*version)[1] != 0 ||
                (*version)[2] != 0 || (*version)[3] != 0) {
                invalid("Unsupported PSBT version");
            }
        }

        psbt.tx_ = Transaction::parse(*raw_tx, false);
        for (const auto& input : psbt.tx_.inputs) {
            if (!input.script_sig.empty()) {
                invalid("Unsigned transaction carries a scriptSig");
            }
        }

        for (size_t i = 0; i < psbt.tx_.inputs.size(); ++i) {
            psbt.inputs_.push_back(read_map(reader));
        }
        for (size_t i = 0; i < psbt.tx_.outputs.size(); ++i) {
            psbt.outputs_.push_back(read_map(reader));
        }
        if (!reader.empty()) {
            invalid("Trailing bytes after PSBT");
        }
    } catch (const std::out_of_range& e) {
        invalid(std::string("Truncated PSBT: ") + e.what());
    } catch (const std::invalid_argument& e) {
        invalid(std::string("Malformed PSBT: ") + e.what());
    }

    return psbt;
}

Psbt Psbt::from_base64(const std::string& encoded) {
    std::vector<uint8_t> bytes;
    try {
        bytes = Base64::decode(encoded);
    } catch (const std::invalid_argument& e) {
        invalid(std::string("PSBT is not valid base64: ") + e.what());
    }
    return parse(bytes);
}

Bytes Psbt::serialize() const {
    ByteWriter writer;
    writer.write_bytes(PSBT_MAGIC);
    write_map(writer, global_);
    for (const auto& input : inputs_) {
        write_map(writer, input);
    }
    for (const auto& output : outputs_) {
        write_map(writer, output);
    }
    return writer.release();
}

std::string Psbt::to_base64() const {
    return Base64::encode(serialize());
}

void Psbt::require_input(size_t index) const {
    if (index >= inputs_.size()) {
        throw SigningError(SigningError::ErrorType::InputNotFound,
                           "Input " + std::to_string(index) + " not found in PSBT");
    }
}

PsbtMap& Psbt::input(size_t index) {
    require_input(index);
    return inputs_[index];
}

const PsbtMap& Psbt::input(size_t index) const {
    require_input(index);
    return inputs_[index];
}

std::optional<Transaction> Psbt::non_witness_utxo(size_t index) const {
    const Bytes* raw = input(index).find(PSBT_IN_NON_WITNESS_UTXO);
    if (raw == nullptr) {
        return std::nullopt;
    }

    Transaction prev;
    try {
        prev = Transaction::parse(*raw);
    } catch (const std::exception& e) {
        invalid("Input " + std::to_string(index) + " has a malformed non_witness_utxo: " + e.what());
    }
    if (prev.txid() != tx_.inputs[index].prevout.txid) {
        throw SigningError(SigningError::ErrorType::PsbtInputMismatch,
                           "non_witness_utxo of input " + std::to_string(index) +
                           " does not match the spent outpoint");
    }
    return prev;
}

// witness_utxo value layout: [8 bytes] amount, [varint] script length, script
std::optional<TxOut> Psbt::spent_output(size_t index) const {
    if (const Bytes* raw = input(index).find(PSBT_IN_WITNESS_UTXO)) {
        try {
            ByteReader reader(*raw);
            TxOut out;
            out.amount = reader.read_u64();
            out.script_pubkey = reader.read_var_bytes();
            if (!reader.empty()) {
                invalid("Trailing bytes in witness_utxo");
            }
            return out;
        } catch (const std::out_of_range&) {
            invalid("Input " + std::to_string(index) + " has a truncated witness_utxo");
        }
    }

    auto prev = non_witness_utxo(index);
    if (!prev) {
        return std::nullopt;
    }
    uint32_t vout = tx_.inputs[index].prevout.index;
    if (vout >= prev->outputs.size()) {
        return std::nullopt;
    }
    return prev->outputs[vout];
}

std::optional<uint32_t> Psbt::sighash_type(size_t index) const {
    const Bytes* raw = input(index).find(PSBT_IN_SIGHASH_TYPE);
    if (raw == nullptr) {
        return std::nullopt;
    }
    if (raw->size() != 4) {
        invalid("Input " + std::to_string(index) + " has a malformed sighash type");
    }
    ByteReader reader(*raw);
    return reader.read_u32();
}

void Psbt::add_partial_signature(size_t index, const PublicKey& pubkey, Bytes signature) {
    Bytes key{PSBT_IN_PARTIAL_SIG};
    key.insert(key.end(), pubkey.begin(), pubkey.end());
    input(index).set(std::move(key), std::move(signature));
}

void Psbt::set_tap_key_signature(size_t index, Bytes signature) {
    input(index).set(PSBT_IN_TAP_KEY_SIG, std::move(signature));
}

bool Psbt::is_finalized(size_t index) const {
    const PsbtMap& map = input(index);
    return map.contains(PSBT_IN_FINAL_SCRIPTSIG) || map.contains(PSBT_IN_FINAL_SCRIPTWITNESS);
}

// Finalizer for single-key templates:
//   P2PKH       scriptSig <sig> <pubkey>
//   P2SH-P2WPKH scriptSig <redeemScript>, witness [sig, pubkey]
//   P2WPKH      witness [sig, pubkey]
//   P2TR        witness [schnorr sig] (key path)
void Psbt::finalize_input(size_t index) {
    PsbtMap& map = input(index);
    if (is_finalized(index)) {
        return;
    }

    auto spent = spent_output(index);
    if (!spent) {
        throw SigningError(SigningError::ErrorType::CannotDetermineScript,
                           "Cannot determine script for input " + std::to_string(index));
    }

    ScriptInfo info = Script::classify(spent->script_pubkey);
    Bytes script_sig;
    std::vector<Bytes> witness;

    switch (info.type) {
        case ScriptType::P2tr: {
            const Bytes* sig = map.find(PSBT_IN_TAP_KEY_SIG);
            if (sig == nullptr) {
                throw SigningError(SigningError::ErrorType::SigningFailure,
                                   "Input " + std::to_string(index) + " has no taproot key signature");
            }
            witness.push_back(*sig);
            break;
        }
        case ScriptType::P2wpkh: {
            auto found = find_signature_for_hash(map, info.payload);
            if (!found) {
                throw SigningError(SigningError::ErrorType::SigningFailure,
                                   "Input " + std::to_string(index) + " is missing a signature");
            }
            witness = {found->first, found->second};
            break;
        }
        case ScriptType::P2sh: {
            const Bytes* redeem = map.find(PSBT_IN_REDEEM_SCRIPT);
            if (redeem == nullptr) {
                throw SigningError(SigningError::ErrorType::SigningFailure,
                                   "Input " + std::to_string(index) + " has no redeem script");
            }
            Hash160 redeem_hash = HashUtils::hash160(*redeem);
            ScriptInfo inner = Script::classify(*redeem);
            if (!std::equal(redeem_hash.begin(), redeem_hash.end(), info.payload.begin(), info.payload.end()) ||
                inner.type != ScriptType::P2wpkh) {
                throw SigningError(SigningError::ErrorType::SigningFailure,
                                   "Input " + std::to_string(index) + " is not P2SH-P2WPKH");
            }
            auto found = find_signature_for_hash(map, inner.payload);
            if (!found) {
                throw SigningError(SigningError::ErrorType::SigningFailure,
                                   "Input " + std::to_string(index) + " is missing a signature");
            }
            Script::push_data(script_sig, *redeem);
            witness = {found->first, found->second};
            break;
        }
        case ScriptType::P2pkh: {
            auto found = find_signature_for_hash(map, info.payload);
            if (!found) {
                throw SigningError(SigningError::ErrorType::SigningFailure,
                                   "Input " + std::to_string(index) + " is missing a signature");
            }
            Script::push_data(script_sig, found->first);
            Script::push_data(script_sig, found->second);
            break;
        }
        case ScriptType::Unknown:
            throw SigningError(SigningError::ErrorType::CannotDetermineScript,
                               "Input " + std::to_string(index) + " spends a non-standard script");
    }

    for (uint8_t type : FINALIZER_CLEARED_TYPES) {
        map.erase_type(type);
    }
    if (!script_sig.empty()) {
        map.set(PSBT_IN_FINAL_SCRIPTSIG, std::move(script_sig));
    }
    if (!witness.empty()) {
        map.set(PSBT_IN_FINAL_SCRIPTWITNESS, encode_witness(witness));
    }
}

Transaction Psbt::extract() const {
    Transaction tx = tx_;
    for (size_t i = 0; i < inputs_.size(); ++i) {
        if (!is_finalized(i)) {
            throw SigningError(SigningError::ErrorType::SigningFailure,
                               "Input " + std::to_string(i) + " is not finalized");
        }
        if (const Bytes* script_sig = inputs_[i].find(PSBT_IN_FINAL_SCRIPTSIG)) {
            tx.inputs[i].script_sig = *script_sig;
        }
        if (const Bytes* witness = inputs_[i].find(PSBT_IN_FINAL_SCRIPTWITNESS)) {
            try {
                tx.inputs[i].witness = decode_witness(*witness);
            } catch (const std::exception& e) {
                invalid("Input " + std::to_string(i) + " has a malformed final witness: " + e.what());
            }
        }
    }
    return tx;
}

} // namespace zeldwallet
