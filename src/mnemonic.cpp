#include "mnemonic.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include <openssl/rand.h>
#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <algorithm>
#include <cstring>
#include <sstream>

namespace zeldwallet {

namespace {

constexpr uint32_t BIP39_PBKDF2_ROUNDS = 2048;
constexpr size_t BIP39_SEED_SIZE = 64;

std::vector<std::string> split_words(const std::string& mnemonic) {
    std::vector<std::string> words;
    std::istringstream stream(mnemonic);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

// Zeroes the UTF-16 buffer of a UnicodeString holding secret text
void wipe_unicode(icu::UnicodeString& text) {
    int32_t length = text.length();
    char16_t* buffer = text.getBuffer(length);
    if (buffer != nullptr) {
        secure_wipe(buffer, static_cast<size_t>(length) * sizeof(char16_t));
        text.releaseBuffer(0);
    }
}

} // namespace

std::string Mnemonic::generate(Strength strength) {
    std::vector<uint8_t> entropy(static_cast<size_t>(strength) / 8);
    WipeGuard<std::vector<uint8_t>> entropy_guard(entropy);
    if (RAND_bytes(entropy.data(), static_cast<int>(entropy.size())) != 1) {
        throw KeyError(KeyError::ErrorType::DerivationFailure, "Random generator failure");
    }
    return from_entropy(entropy);
}

// Converts entropy to words:
// 1. Append the first ENT/32 bits of SHA256(entropy) as checksum
// 2. Split the bit string into 11-bit groups
// 3. Map each group to its word
std::string Mnemonic::from_entropy(std::span<const uint8_t> entropy) {
    if (entropy.size() < 16 || entropy.size() > 32 || entropy.size() % 4 != 0) {
        throw KeyError(KeyError::ErrorType::InvalidSeedPhrase, "Entropy must be 16-32 bytes in steps of 4");
    }

    auto checksum = HashUtils::sha256(entropy);
    std::vector<uint8_t> bits(entropy.begin(), entropy.end());
    WipeGuard<std::vector<uint8_t>> bits_guard(bits);
    bits.push_back(checksum[0]);

    size_t total_bits = entropy.size() * 8 + entropy.size() / 4;
    std::string sentence;
    for (size_t offset = 0; offset < total_bits; offset += 11) {
        uint32_t index = 0;
        for (size_t bit = 0; bit < 11; ++bit) {
            size_t position = offset + bit;
            index <<= 1;
            index |= (bits[position / 8] >> (7 - (position % 8))) & 1;
        }
        if (!sentence.empty()) {
            sentence.push_back(' ');
        }
        sentence += WORDLIST[index];
    }
    return sentence;
}

int Mnemonic::word_index(const std::string& word) {
    auto it = std::lower_bound(WORDLIST.begin(), WORDLIST.end(), word,
        [](const char* candidate, const std::string& value) { return value.compare(candidate) > 0; });
    if (it == WORDLIST.end() || word != *it) {
        return -1;
    }
    return static_cast<int>(it - WORDLIST.begin());
}

bool Mnemonic::validate(const std::string& mnemonic) {
    auto words = split_words(mnemonic);
    if (words.size() < 12 || words.size() > 24 || words.size() % 3 != 0) {
        return false;
    }

    size_t total_bits = words.size() * 11;
    size_t checksum_bits = total_bits / 33;
    size_t entropy_bits = total_bits - checksum_bits;

    std::vector<uint8_t> bits((total_bits + 7) / 8, 0);
    WipeGuard<std::vector<uint8_t>> bits_guard(bits);
    for (size_t w = 0; w < words.size(); ++w) {
        int index = word_index(words[w]);
        secure_wipe(words[w]);
        if (index < 0) {
            for (auto& remaining : words) {
                secure_wipe(remaining);
            }
            return false;
        }
        for (size_t bit = 0; bit < 11; ++bit) {
            if ((index >> (10 - bit)) & 1) {
                size_t position = w * 11 + bit;
                bits[position / 8] |= static_cast<uint8_t>(0x80 >> (position % 8));
            }
        }
    }

    auto hash = HashUtils::sha256(std::span<const uint8_t>(bits.data(), entropy_bits / 8));
    for (size_t bit = 0; bit < checksum_bits; ++bit) {
        size_t position = entropy_bits + bit;
        bool expected = (hash[bit / 8] >> (7 - (bit % 8))) & 1;
        bool actual = (bits[position / 8] >> (7 - (position % 8))) & 1;
        if (expected != actual) {
            return false;
        }
    }
    return true;
}

std::string Mnemonic::normalize(const std::string& mnemonic) {
    auto words = split_words(mnemonic);
    std::string sentence;
    for (auto& word : words) {
        if (!sentence.empty()) {
            sentence.push_back(' ');
        }
        sentence += word;
        secure_wipe(word);
    }
    return sentence;
}

std::string Mnemonic::nfkd(const std::string& text) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* normalizer = icu::Normalizer2::getNFKDInstance(status);
    if (U_FAILURE(status)) {
        throw KeyError(KeyError::ErrorType::DerivationFailure,
                       std::string("NFKD normalizer unavailable: ") + u_errorName(status));
    }

    icu::UnicodeString source = icu::UnicodeString::fromUTF8(text);
    icu::UnicodeString normalized = normalizer->normalize(source, status);
    wipe_unicode(source);
    if (U_FAILURE(status)) {
        wipe_unicode(normalized);
        throw KeyError(KeyError::ErrorType::DerivationFailure,
                       std::string("NFKD normalization failed: ") + u_errorName(status));
    }

    std::string result;
    normalized.toUTF8String(result);
    wipe_unicode(normalized);
    return result;
}

SecureMemory Mnemonic::to_seed(const std::string& mnemonic, const std::string& passphrase) {
    std::string password = nfkd(mnemonic);
    WipeGuard<std::string> password_guard(password);
    std::string prefixed = "mnemonic" + passphrase;
    WipeGuard<std::string> prefixed_guard(prefixed);
    std::string salt = nfkd(prefixed);
    WipeGuard<std::string> salt_guard(salt);

    auto seed = HashUtils::pbkdf2_sha512(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(password.data()), password.size()),
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(salt.data()), salt.size()),
        BIP39_PBKDF2_ROUNDS, BIP39_SEED_SIZE);
    WipeGuard<std::vector<uint8_t>> seed_guard(seed);
    return SecureMemory(seed);
}

} // namespace zeldwallet
