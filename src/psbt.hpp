#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "curve_utils.hpp"
#include "transaction.hpp"

namespace zeldwallet {

// BIP174 key types
constexpr uint8_t PSBT_GLOBAL_UNSIGNED_TX = 0x00;
constexpr uint8_t PSBT_GLOBAL_VERSION = 0xFB;

constexpr uint8_t PSBT_IN_NON_WITNESS_UTXO = 0x00;
constexpr uint8_t PSBT_IN_WITNESS_UTXO = 0x01;
constexpr uint8_t PSBT_IN_PARTIAL_SIG = 0x02;
constexpr uint8_t PSBT_IN_SIGHASH_TYPE = 0x03;
constexpr uint8_t PSBT_IN_REDEEM_SCRIPT = 0x04;
constexpr uint8_t PSBT_IN_WITNESS_SCRIPT = 0x05;
constexpr uint8_t PSBT_IN_BIP32_DERIVATION = 0x06;
constexpr uint8_t PSBT_IN_FINAL_SCRIPTSIG = 0x07;
constexpr uint8_t PSBT_IN_FINAL_SCRIPTWITNESS = 0x08;
constexpr uint8_t PSBT_IN_RIPEMD160 = 0x0A;
constexpr uint8_t PSBT_IN_SHA256 = 0x0B;
constexpr uint8_t PSBT_IN_HASH160 = 0x0C;
constexpr uint8_t PSBT_IN_HASH256 = 0x0D;
constexpr uint8_t PSBT_IN_TAP_KEY_SIG = 0x13;
constexpr uint8_t PSBT_IN_TAP_SCRIPT_SIG = 0x14;
constexpr uint8_t PSBT_IN_TAP_LEAF_SCRIPT = 0x15;
constexpr uint8_t PSBT_IN_TAP_BIP32_DERIVATION = 0x16;
constexpr uint8_t PSBT_IN_TAP_INTERNAL_KEY = 0x17;
constexpr uint8_t PSBT_IN_TAP_MERKLE_ROOT = 0x18;

// One PSBT key-value map. Entries keep their wire order so that records the
// wallet does not understand (proprietary, newer BIPs) survive a round trip
// unchanged.
class PsbtMap {
public:
    using Entry = std::pair<Bytes, Bytes>;

    const std::vector<Entry>& entries() const { return entries_; }

    // Value stored under the exact key, or nullptr
    const Bytes* find(std::span<const uint8_t> key) const;

    // Value of the single-byte key `type`, or nullptr
    const Bytes* find(uint8_t type) const;

    bool contains(uint8_t type) const { return find(type) != nullptr; }

    // Inserts or replaces
    void set(Bytes key, Bytes value);
    void set(uint8_t type, Bytes value) { set(Bytes{type}, std::move(value)); }

    // Appends while parsing; throws SigningError(InvalidPsbt) on duplicates
    void add_unique(Bytes key, Bytes value);

    // Removes every record whose key type (first byte) equals `type`
    void erase_type(uint8_t type);

    // Every record whose key starts with `type`
    std::vector<const Entry*> entries_of_type(uint8_t type) const;

private:
    std::vector<Entry> entries_;
};

// Partially signed transaction, version 0 (BIP174) with the taproot fields
// of BIP371.
class Psbt {
public:
    // Throws SigningError(InvalidPsbt) on any structural problem
    static Psbt parse(std::span<const uint8_t> data);
    static Psbt from_base64(const std::string& encoded);

    Bytes serialize() const;
    std::string to_base64() const;

    const Transaction& unsigned_tx() const { return tx_; }

    size_t input_count() const { return inputs_.size(); }
    size_t output_count() const { return outputs_.size(); }

    PsbtMap& input(size_t index);
    const PsbtMap& input(size_t index) const;

    // Output being spent by the input, from witness_utxo or, failing that,
    // from the full previous transaction. A non_witness_utxo whose txid does
    // not match the outpoint is rejected with PsbtInputMismatch.
    std::optional<TxOut> spent_output(size_t index) const;

    // Full previous transaction, checked against the outpoint
    std::optional<Transaction> non_witness_utxo(size_t index) const;

    std::optional<uint32_t> sighash_type(size_t index) const;

    void add_partial_signature(size_t index, const PublicKey& pubkey, Bytes signature);
    void set_tap_key_signature(size_t index, Bytes signature);

    // Builds final_scriptsig/final_scriptwitness from the collected
    // signatures for P2PKH, P2SH-P2WPKH, P2WPKH and P2TR key path, then
    // strips the signing metadata. Throws SigningError when the input is not
    // complete yet.
    void finalize_input(size_t index);

    bool is_finalized(size_t index) const;

    // Network transaction once every input is finalized
    Transaction extract() const;

private:
    Psbt() = default;

    void require_input(size_t index) const;

    Transaction tx_;
    PsbtMap global_;
    std::vector<PsbtMap> inputs_;
    std::vector<PsbtMap> outputs_;
};

} // namespace zeldwallet
