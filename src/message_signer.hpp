#pragma once

#include <optional>
#include <string>
#include "curve_utils.hpp"
#include "derivation_path.hpp"
#include "hash_utils.hpp"
#include "network.hpp"
#include "transaction.hpp"

namespace zeldwallet {

enum class MessageProtocol {
    Ecdsa,         // Bitcoin signed message, compact recoverable signature
    Bip322Simple   // BIP322 "simple" witness signature
};

const char* to_string(MessageProtocol protocol);
std::optional<MessageProtocol> message_protocol_from_string(const std::string& name);

// Message signatures over raw key material.
//
// ECDSA signatures use the classic "Bitcoin Signed Message" digest and the
// 65-byte compact format whose header byte encodes the recovery id and the
// address type (BIP137):
//   31-34  P2PKH (compressed key)
//   35-38  P2SH-P2WPKH
//   39-42  P2WPKH
//
// BIP322-simple signatures are the serialized witness of a virtual
// transaction spending a virtual output locked to the address.
class MessageSigner {
public:
    // SHA256d(0x18 "Bitcoin Signed Message:\n" || varint(len) || message)
    static Hash256 message_hash(const std::string& message);

    // Base64 of header || r || s
    static std::string sign_ecdsa(const std::string& message, const PrivateKey& private_key,
                                  AddressType type);

    // tagged_hash("BIP0322-signed-message", message)
    static Hash256 bip322_message_hash(const std::string& message);

    // Virtual transaction committing to the message and the address script
    static Transaction bip322_to_spend(const std::string& message, const Bytes& script_pubkey);

    // Virtual transaction spending to_spend:0 into an OP_RETURN output
    static Transaction bip322_to_sign(const Transaction& to_spend);

    // Key-path Schnorr signature of to_sign with the BIP341 tweaked key of
    // the P2TR output for private_key. Returns base64 of the witness stack.
    static std::string sign_bip322_simple(const std::string& message, const PrivateKey& private_key);

    // Accepts either format for the address; false on any mismatch or
    // malformed signature
    static bool verify(const std::string& message, const std::string& address,
                       const std::string& signature, Network network);

private:
    static bool verify_ecdsa(const std::string& message, const Bytes& script_pubkey,
                             const std::vector<uint8_t>& signature);
    static bool verify_bip322_simple(const std::string& message, const Bytes& script_pubkey,
                                     const std::vector<uint8_t>& witness);

    MessageSigner() = delete;
};

} // namespace zeldwallet
