#include "message_signer.hpp"
#include "base64.hpp"
#include "consts.hpp"
#include "address.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "script.hpp"
#include "secure_memory.hpp"
#include "serialize.hpp"
#include "sighash.hpp"
#include <openssl/rand.h>
#include <algorithm>

namespace zeldwallet {

namespace {

constexpr uint8_t HEADER_P2PKH_COMPRESSED = 31;
constexpr uint8_t HEADER_P2SH_P2WPKH = 35;
constexpr uint8_t HEADER_P2WPKH = 39;

uint8_t header_base(AddressType type) {
    switch (type) {
        case AddressType::P2pkh: return HEADER_P2PKH_COMPRESSED;
        case AddressType::P2shP2wpkh: return HEADER_P2SH_P2WPKH;
        case AddressType::P2wpkh: return HEADER_P2WPKH;
        case AddressType::P2tr: break;
    }
    throw SigningError(SigningError::ErrorType::TaprootRequiresBip322,
                       "Taproot addresses require bip322-simple signing");
}

std::array<uint8_t, 32> random_aux() {
    std::array<uint8_t, 32> aux{};
    if (RAND_bytes(aux.data(), static_cast<int>(aux.size())) != 1) {
        throw SigningError(SigningError::ErrorType::SigningFailure, "Random generator failure");
    }
    return aux;
}

} // namespace

const char* to_string(MessageProtocol protocol) {
    switch (protocol) {
        case MessageProtocol::Ecdsa: return "ecdsa";
        case MessageProtocol::Bip322Simple: return "bip322-simple";
    }
    return "unknown";
}

std::optional<MessageProtocol> message_protocol_from_string(const std::string& name) {
    if (name == "ecdsa") return MessageProtocol::Ecdsa;
    if (name == "bip322-simple") return MessageProtocol::Bip322Simple;
    return std::nullopt;
}

Hash256 MessageSigner::message_hash(const std::string& message) {
    static const std::string MAGIC = "Bitcoin Signed Message:\n";

    ByteWriter writer;
    writer.write_var_bytes(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(MAGIC.data()), MAGIC.size()));
    writer.write_var_bytes(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(message.data()), message.size()));
    return HashUtils::double_sha256(writer.data());
}

// Compact signature layout (65 bytes):
// - [1 byte]  : header = base for the address type + recovery id
// - [32 bytes]: r
// - [32 bytes]: s (low-S)
std::string MessageSigner::sign_ecdsa(const std::string& message, const PrivateKey& private_key,
                                      AddressType type) {
    uint8_t base = header_base(type);
    auto hash = message_hash(message);
    auto signature = CurveUtils::sign_ecdsa(private_key, hash);

    std::vector<uint8_t> compact;
    compact.reserve(65);
    compact.push_back(static_cast<uint8_t>(base + signature.recovery_id));
    compact.insert(compact.end(), signature.r.begin(), signature.r.end());
    compact.insert(compact.end(), signature.s.begin(), signature.s.end());
    return Base64::encode(compact);
}

Hash256 MessageSigner::bip322_message_hash(const std::string& message) {
    return HashUtils::tagged_hash("BIP0322-signed-message", std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(message.data()), message.size()));
}

// to_spend:
// - version 0, locktime 0
// - one input: prevout 000...000:0xFFFFFFFF, scriptSig OP_0 PUSH32 <message hash>, sequence 0
// - one output: value 0, the address script
Transaction MessageSigner::bip322_to_spend(const std::string& message, const Bytes& script_pubkey) {
    auto hash = bip322_message_hash(message);

    TxIn input;
    input.prevout.index = 0xFFFFFFFF;
    input.sequence = 0;
    input.script_sig.push_back(OP_0);
    Script::push_data(input.script_sig, hash);

    Transaction tx;
    tx.version = 0;
    tx.locktime = 0;
    tx.inputs.push_back(std::move(input));
    tx.outputs.push_back(TxOut{0, script_pubkey});
    return tx;
}

// to_sign:
// - version 0, locktime 0
// - one input spending to_spend:0 with sequence 0
// - one output: value 0, OP_RETURN
Transaction MessageSigner::bip322_to_sign(const Transaction& to_spend) {
    TxIn input;
    input.prevout.txid = to_spend.txid();
    input.prevout.index = 0;
    input.sequence = 0;

    Transaction tx;
    tx.version = 0;
    tx.locktime = 0;
    tx.inputs.push_back(std::move(input));
    tx.outputs.push_back(TxOut{0, Bytes{OP_RETURN}});
    return tx;
}

std::string MessageSigner::sign_bip322_simple(const std::string& message, const PrivateKey& private_key) {
    // BIP340 works on the even-Y form of the key; the P2TR output commits to
    // its x-only public key
    auto even_key = CurveUtils::normalize_even_y(private_key);
    WipeGuard<PrivateKey> even_guard(even_key);
    auto internal_key = CurveUtils::x_only(CurveUtils::derive_public_key(even_key));
    auto output_key = CurveUtils::taproot_tweak_public_key(internal_key);
    Bytes script = Script::p2tr(output_key.x_only);

    Transaction to_spend = bip322_to_spend(message, script);
    Transaction to_sign = bip322_to_sign(to_spend);

    std::vector<std::optional<TxOut>> spent = {to_spend.outputs[0]};
    auto sighash = Sighash::taproot_key_path(to_sign, 0, spent, SIGHASH_DEFAULT);

    auto tweaked_key = CurveUtils::taproot_tweak_private_key(even_key);
    WipeGuard<PrivateKey> tweaked_guard(tweaked_key);
    auto aux = random_aux();
    auto signature = CurveUtils::sign_schnorr(tweaked_key, sighash, aux);

    ByteWriter witness;
    witness.write_compact_size(1);
    witness.write_var_bytes(signature);
    return Base64::encode(witness.data());
}

bool MessageSigner::verify(const std::string& message, const std::string& address,
                           const std::string& signature, Network network) {
    Bytes script_pubkey;
    std::vector<uint8_t> raw;
    try {
        script_pubkey = Address::to_script(address, network);
        raw = Base64::decode(signature);
    } catch (const KeyError& e) {
        LogPrintSigning(DEBUG, "Cannot verify message: %s", e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        LogPrintSigning(DEBUG, "Signature is not base64: %s", e.what());
        return false;
    }

    if (raw.size() == 65 && raw[0] >= 27 && raw[0] <= 42) {
        return verify_ecdsa(message, script_pubkey, raw);
    }
    return verify_bip322_simple(message, script_pubkey, raw);
}

// Recovers the key from the compact signature and checks that it pays to
// the address. Headers 31-34 are accepted for any single-key type, as
// several wallets sign segwit messages with the P2PKH header.
bool MessageSigner::verify_ecdsa(const std::string& message, const Bytes& script_pubkey,
                                 const std::vector<uint8_t>& signature) {
    uint8_t header = signature[0];
    if (header < HEADER_P2PKH_COMPRESSED) {
        return false;  // uncompressed keys are never produced by this wallet
    }

    EcdsaSignature sig{};
    std::copy_n(signature.begin() + 1, 32, sig.r.begin());
    std::copy_n(signature.begin() + 33, 32, sig.s.begin());
    sig.recovery_id = (header - 27) & 0x03;

    auto hash = message_hash(message);
    auto pubkey = CurveUtils::recover_public_key(hash, sig);
    if (!pubkey || !CurveUtils::verify_ecdsa(*pubkey, hash, sig)) {
        return false;
    }

    std::vector<AddressType> candidates;
    if (header >= HEADER_P2WPKH) {
        candidates = {AddressType::P2wpkh};
    } else if (header >= HEADER_P2SH_P2WPKH) {
        candidates = {AddressType::P2shP2wpkh};
    } else {
        candidates = {AddressType::P2pkh, AddressType::P2shP2wpkh, AddressType::P2wpkh};
    }

    return std::any_of(candidates.begin(), candidates.end(), [&](AddressType type) {
        return Script::for_public_key(*pubkey, type) == script_pubkey;
    });
}

bool MessageSigner::verify_bip322_simple(const std::string& message, const Bytes& script_pubkey,
                                         const std::vector<uint8_t>& witness) {
    ScriptInfo info = Script::classify(script_pubkey);
    if (info.type != ScriptType::P2tr) {
        return false;
    }

    Bytes signature;
    try {
        ByteReader reader(witness);
        if (reader.read_compact_size() != 1) {
            return false;
        }
        signature = reader.read_var_bytes();
        if (!reader.empty()) {
            return false;
        }
    } catch (const std::out_of_range&) {
        return false;
    }

    uint8_t hash_type = SIGHASH_DEFAULT;
    if (signature.size() == 65) {
        hash_type = signature[64];
        if (hash_type == SIGHASH_DEFAULT || !Sighash::is_valid_taproot_hash_type(hash_type)) {
            return false;
        }
    } else if (signature.size() != 64) {
        return false;
    }

    Transaction to_spend = bip322_to_spend(message, script_pubkey);
    Transaction to_sign = bip322_to_sign(to_spend);
    std::vector<std::optional<TxOut>> spent = {to_spend.outputs[0]};
    Hash256 sighash;
    try {
        sighash = Sighash::taproot_key_path(to_sign, 0, spent, hash_type);
    } catch (const SigningError& e) {
        LogPrintSigning(DEBUG, "BIP322 sighash failed: %s", e.what());
        return false;
    }

    XOnlyPublicKey output_key{};
    std::copy(info.payload.begin(), info.payload.end(), output_key.begin());
    return CurveUtils::verify_schnorr(output_key, sighash,
                                      std::span<const uint8_t>(signature.data(), 64));
}

} // namespace zeldwallet
