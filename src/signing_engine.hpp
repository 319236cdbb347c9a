#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "key_manager.hpp"
#include "message_signer.hpp"
#include "psbt.hpp"

namespace zeldwallet {

// Which input of a PSBT to sign and how
struct SignInputRequest {
    size_t index = 0;
    std::optional<std::string> address;          // resolved through reverse lookup
    std::optional<std::string> derivation_path;  // wins over address
    std::vector<uint32_t> sighash_types;         // allowed types; empty means the default
    bool finalize = false;
    // Script-path hints; any of them makes the request fail
    std::optional<std::string> tap_merkle_root_hex;
    std::optional<std::string> tap_leaf_hash_hex;
};

// SigningEngine produces message signatures and PSBT signatures with keys
// obtained from the derivation engine. It keeps no state between calls.
class SigningEngine {
public:
    explicit SigningEngine(KeyManager& keys) : keys_(keys) {}

    // ECDSA for P2PKH/P2SH-P2WPKH/P2WPKH addresses, BIP322-simple for P2TR.
    // An explicit protocol that does not fit the address type is rejected.
    std::string sign_message(const std::string& message, const std::string& address,
                             std::optional<MessageProtocol> protocol = std::nullopt);

    bool verify_message(const std::string& message, const std::string& address,
                        const std::string& signature) const;

    // Signs the requested inputs and returns the updated PSBT in base64
    std::string sign_psbt(const std::string& psbt_base64, const std::vector<SignInputRequest>& requests);

    // Same, on an already decoded PSBT
    void sign_psbt(Psbt& psbt, const std::vector<SignInputRequest>& requests);

private:
    struct ResolvedKey {
        KeyPair key;
        std::string path;
        AddressType type;
    };

    std::optional<ResolvedKey> resolve_key(const SignInputRequest& request, const TxOut& spent);
    void sign_input(Psbt& psbt, const SignInputRequest& request);
    void sign_taproot_input(Psbt& psbt, const SignInputRequest& request, const ResolvedKey& resolved);
    void sign_ecdsa_input(Psbt& psbt, const SignInputRequest& request, const ResolvedKey& resolved,
                          const TxOut& spent);

    KeyManager& keys_;
};

} // namespace zeldwallet
