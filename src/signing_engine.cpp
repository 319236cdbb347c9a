#include "signing_engine.hpp"
#include "address.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "logging.hpp"
#include "script.hpp"
#include "sighash.hpp"
#include <openssl/rand.h>
#include <algorithm>

namespace zeldwallet {

namespace {

// Hash type for an input: the PSBT's declared type if any, otherwise the
// caller's first choice, otherwise the default. It must be on the caller's
// allowed list (the default alone when the list is empty).
uint32_t select_sighash(const Psbt& psbt, size_t index, const std::vector<uint32_t>& requested,
                        uint32_t default_type) {
    auto declared = psbt.sighash_type(index);
    uint32_t hash_type = declared ? *declared : (requested.empty() ? default_type : requested.front());

    bool allowed = requested.empty() ? hash_type == default_type
                                     : std::find(requested.begin(), requested.end(), hash_type) != requested.end();
    if (!allowed) {
        throw SigningError(SigningError::ErrorType::SighashNotAllowed,
                           "Sighash type " + std::to_string(hash_type) + " not allowed for input " +
                           std::to_string(index));
    }
    return hash_type;
}

} // namespace

std::string SigningEngine::sign_message(const std::string& message, const std::string& address,
                                        std::optional<MessageProtocol> protocol) {
    auto resolved = keys_.find_address_path(address);
    if (!resolved) {
        throw SigningError(SigningError::ErrorType::AddressNotFound, "Address not found: " + address);
    }

    bool taproot = resolved->type == AddressType::P2tr;
    MessageProtocol selected = protocol.value_or(taproot ? MessageProtocol::Bip322Simple
                                                         : MessageProtocol::Ecdsa);
    if (selected == MessageProtocol::Bip322Simple && !taproot) {
        throw SigningError(SigningError::ErrorType::Bip322RequiresTaproot,
                           "BIP322 simple signing is only supported for taproot addresses");
    }
    if (selected == MessageProtocol::Ecdsa && taproot) {
        throw SigningError(SigningError::ErrorType::TaprootRequiresBip322,
                           "Taproot addresses require bip322-simple signing");
    }

    KeyPair key = keys_.derive_key(resolved->path);
    LogPrintSigning(INFO, "Signing message with %s (%s)", resolved->path.c_str(), to_string(selected));

    if (selected == MessageProtocol::Bip322Simple) {
        return MessageSigner::sign_bip322_simple(message, key.private_key);
    }
    return MessageSigner::sign_ecdsa(message, key.private_key, resolved->type);
}

bool SigningEngine::verify_message(const std::string& message, const std::string& address,
                                   const std::string& signature) const {
    return MessageSigner::verify(message, address, signature, keys_.network());
}

std::string SigningEngine::sign_psbt(const std::string& psbt_base64,
                                     const std::vector<SignInputRequest>& requests) {
    Psbt psbt = Psbt::from_base64(psbt_base64);
    sign_psbt(psbt, requests);
    return psbt.to_base64();
}

void SigningEngine::sign_psbt(Psbt& psbt, const std::vector<SignInputRequest>& requests) {
    if (!keys_.is_unlocked()) {
        throw KeyError(KeyError::ErrorType::WalletLocked, "Wallet is locked");
    }

    // Script-path spending is not supported; refuse before touching anything
    for (const auto& request : requests) {
        if (request.tap_merkle_root_hex || request.tap_leaf_hash_hex) {
            throw SigningError(SigningError::ErrorType::TaprootScriptPathUnsupported,
                               "Taproot script-path signing is not supported");
        }
    }

    for (const auto& request : requests) {
        sign_input(psbt, request);

        // Finalizing fails while other signatures are still missing
        if (request.finalize) {
            try {
                psbt.finalize_input(request.index);
            } catch (const SigningError& e) {
                LogPrintSigning(DEBUG, "Input %zu not finalized: %s", request.index, e.what());
            }
        }
    }
}

// Key resolution priority: explicit path, explicit address, then the
// address encoded by the spent script itself
std::optional<SigningEngine::ResolvedKey> SigningEngine::resolve_key(const SignInputRequest& request,
                                                                     const TxOut& spent) {
    ResolvedKey resolved;

    if (request.derivation_path) {
        DerivationPathType path_type = DerivationPaths::type_of_path(*request.derivation_path);
        resolved.key = keys_.derive_key(*request.derivation_path);
        resolved.path = *request.derivation_path;
        resolved.type = DerivationPaths::address_type(path_type);
        return resolved;
    }

    if (request.address) {
        auto found = keys_.find_address_path(*request.address);
        if (!found) {
            throw SigningError(SigningError::ErrorType::AddressNotFound,
                               "Address not found: " + *request.address);
        }
        resolved.key = keys_.derive_key(found->path);
        resolved.path = found->path;
        resolved.type = found->type;
        return resolved;
    }

    auto address = Address::from_script(spent.script_pubkey, keys_.network());
    if (!address) {
        return std::nullopt;
    }
    auto found = keys_.find_address_path(*address);
    if (!found) {
        return std::nullopt;
    }
    resolved.key = keys_.derive_key(found->path);
    resolved.path = found->path;
    resolved.type = found->type;
    return resolved;
}

void SigningEngine::sign_input(Psbt& psbt, const SignInputRequest& request) {
    psbt.input(request.index);  // InputNotFound for out of range indices

    auto spent = psbt.spent_output(request.index);
    if (!spent) {
        throw SigningError(SigningError::ErrorType::CannotDetermineScript,
                           "Cannot determine script for input " + std::to_string(request.index));
    }

    auto resolved = resolve_key(request, *spent);
    if (!resolved) {
        throw SigningError(SigningError::ErrorType::AddressNotFound,
                           "Cannot find key for input " + std::to_string(request.index));
    }

    // The script our key would produce must be the script being spent
    Bytes expected = Script::for_public_key(resolved->key.public_key, resolved->type);
    if (expected != spent->script_pubkey) {
        throw SigningError(SigningError::ErrorType::PsbtInputMismatch,
                           "PSBT input " + std::to_string(request.index) +
                           " does not match the key at " + resolved->path);
    }

    LogPrintSigning(INFO, "Signing input %zu with %s", request.index, resolved->path.c_str());
    if (resolved->type == AddressType::P2tr) {
        sign_taproot_input(psbt, request, *resolved);
    } else {
        sign_ecdsa_input(psbt, request, *resolved, *spent);
    }
}

// Taproot key-path spend (BIP341/BIP371):
// 1. At most one sighash type, SIGHASH_DEFAULT when none is given
// 2. A declared tap_internal_key must equal our untweaked x-only key
// 3. d' = even_y(d) + H_TapTweak(P) signs the BIP341 signature message
// 4. 64-byte signature for SIGHASH_DEFAULT, 65 bytes otherwise
void SigningEngine::sign_taproot_input(Psbt& psbt, const SignInputRequest& request,
                                       const ResolvedKey& resolved) {
    if (request.sighash_types.size() > 1) {
        throw SigningError(SigningError::ErrorType::TaprootMultiSighashUnsupported,
                           "Taproot signing supports a single sighash type");
    }
    uint32_t selected = select_sighash(psbt, request.index, request.sighash_types, SIGHASH_DEFAULT);
    if (selected > 0xFF || !Sighash::is_valid_taproot_hash_type(static_cast<uint8_t>(selected))) {
        throw SigningError(SigningError::ErrorType::SighashNotAllowed,
                           "Invalid taproot sighash type " + std::to_string(selected));
    }
    uint8_t hash_type = static_cast<uint8_t>(selected);

    XOnlyPublicKey internal_key = CurveUtils::x_only(resolved.key.public_key);
    PsbtMap& input = psbt.input(request.index);
    if (const Bytes* declared = input.find(PSBT_IN_TAP_INTERNAL_KEY)) {
        if (!std::equal(declared->begin(), declared->end(), internal_key.begin(), internal_key.end())) {
            throw SigningError(SigningError::ErrorType::PsbtInputMismatch,
                               "Taproot input " + std::to_string(request.index) +
                               " does not match derived internal key");
        }
    }

    std::vector<std::optional<TxOut>> spent_outputs;
    spent_outputs.reserve(psbt.input_count());
    for (size_t i = 0; i < psbt.input_count(); ++i) {
        spent_outputs.push_back(psbt.spent_output(i));
    }
    auto sighash = Sighash::taproot_key_path(psbt.unsigned_tx(), request.index, spent_outputs, hash_type);

    auto tweaked_key = CurveUtils::taproot_tweak_private_key(resolved.key.private_key);
    WipeGuard<PrivateKey> tweaked_guard(tweaked_key);

    std::array<uint8_t, 32> aux{};
    if (RAND_bytes(aux.data(), static_cast<int>(aux.size())) != 1) {
        throw SigningError(SigningError::ErrorType::SigningFailure, "Random generator failure");
    }
    auto signature = CurveUtils::sign_schnorr(tweaked_key, sighash, aux);

    Bytes encoded(signature.begin(), signature.end());
    if (hash_type != SIGHASH_DEFAULT) {
        encoded.push_back(hash_type);
    }

    if (!input.contains(PSBT_IN_TAP_INTERNAL_KEY)) {
        input.set(PSBT_IN_TAP_INTERNAL_KEY, Bytes(internal_key.begin(), internal_key.end()));
    }
    psbt.set_tap_key_signature(request.index, std::move(encoded));
}

// ECDSA inputs:
//   P2PKH       legacy sighash over the full previous transaction
//   P2SH-P2WPKH BIP143 sighash, redeem script added when missing
//   P2WPKH      BIP143 sighash
// The partial signature is DER || hash type byte under key 0x02 || pubkey.
void SigningEngine::sign_ecdsa_input(Psbt& psbt, const SignInputRequest& request,
                                     const ResolvedKey& resolved, const TxOut& spent) {
    uint32_t hash_type = select_sighash(psbt, request.index, request.sighash_types, SIGHASH_ALL);
    if (hash_type > 0xFF) {
        throw SigningError(SigningError::ErrorType::SighashNotAllowed,
                           "Invalid sighash type " + std::to_string(hash_type));
    }

    const PublicKey& pubkey = resolved.key.public_key;
    Hash256 sighash{};
    std::optional<Bytes> redeem_to_add;

    switch (resolved.type) {
        case AddressType::P2pkh: {
            if (!psbt.non_witness_utxo(request.index)) {
                throw SigningError(SigningError::ErrorType::CannotDetermineScript,
                                   "Legacy input " + std::to_string(request.index) +
                                   " requires the full previous transaction");
            }
            sighash = Sighash::legacy(psbt.unsigned_tx(), request.index, spent.script_pubkey, hash_type);
            break;
        }
        case AddressType::P2shP2wpkh: {
            Bytes redeem = Script::p2sh_p2wpkh_redeem_script(pubkey);
            if (const Bytes* declared = psbt.input(request.index).find(PSBT_IN_REDEEM_SCRIPT)) {
                if (*declared != redeem) {
                    throw SigningError(SigningError::ErrorType::PsbtInputMismatch,
                                       "Redeem script of input " + std::to_string(request.index) +
                                       " does not match the derived key");
                }
            } else {
                redeem_to_add = redeem;
            }
            Bytes script_code = Script::p2wpkh_scriptcode(HashUtils::hash160(pubkey));
            sighash = Sighash::segwit_v0(psbt.unsigned_tx(), request.index, script_code,
                                         spent.amount, hash_type);
            break;
        }
        case AddressType::P2wpkh: {
            Bytes script_code = Script::p2wpkh_scriptcode(HashUtils::hash160(pubkey));
            sighash = Sighash::segwit_v0(psbt.unsigned_tx(), request.index, script_code,
                                         spent.amount, hash_type);
            break;
        }
        case AddressType::P2tr:
            throw SigningError(SigningError::ErrorType::SigningFailure, "Taproot input routed to ECDSA");
    }

    auto signature = CurveUtils::sign_ecdsa(resolved.key.private_key, sighash);
    Bytes encoded = CurveUtils::der_encode(signature);
    encoded.push_back(static_cast<uint8_t>(hash_type));

    if (redeem_to_add) {
        psbt.input(request.index).set(PSBT_IN_REDEEM_SCRIPT, std::move(*redeem_to_add));
    }
    psbt.add_partial_signature(request.index, pubkey, std::move(encoded));
}

} // namespace zeldwallet
