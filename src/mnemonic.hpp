#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "secure_memory.hpp"

namespace zeldwallet {

// BIP39 mnemonic sentences: generation from entropy, checksum validation
// and seed derivation.
//
// Word count and entropy size:
//   entropy bits | checksum bits | words
//   128          | 4             | 12
//   256          | 8             | 24
// Each word encodes 11 bits; the checksum is the first ENT/32 bits of
// SHA256(entropy).
class Mnemonic {
public:
    enum class Strength {
        Words12 = 128,
        Words24 = 256
    };

    // Generates a fresh mnemonic from the OpenSSL CSPRNG
    static std::string generate(Strength strength = Strength::Words12);

    // Encodes 16, 20, 24, 28 or 32 bytes of entropy as a mnemonic
    static std::string from_entropy(std::span<const uint8_t> entropy);

    // True if every word is in the list and the checksum matches
    static bool validate(const std::string& mnemonic);

    // Collapses runs of whitespace into single spaces and trims the ends
    static std::string normalize(const std::string& mnemonic);

    // Unicode NFKD form of UTF-8 text; BIP39 hashes mnemonics and
    // passphrases in this form
    static std::string nfkd(const std::string& text);

    // seed = PBKDF2-HMAC-SHA512(NFKD(mnemonic), NFKD("mnemonic" || passphrase), 2048, 64)
    static SecureMemory to_seed(const std::string& mnemonic, const std::string& passphrase);

    static const std::array<const char*, 2048> WORDLIST;

private:
    static int word_index(const std::string& word);

    Mnemonic() = delete;
};

} // namespace zeldwallet
