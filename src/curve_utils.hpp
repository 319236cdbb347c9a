#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace zeldwallet {

using PrivateKey = std::array<uint8_t, 32>;
using PublicKey = std::array<uint8_t, 33>;   // SEC1 compressed
using XOnlyPublicKey = std::array<uint8_t, 32>;
using SchnorrSignature = std::array<uint8_t, 64>;

// ECDSA signature in (r, s) form plus the recovery id that lets a verifier
// rebuild the public key from the signature and the digest
struct EcdsaSignature {
    std::array<uint8_t, 32> r;
    std::array<uint8_t, 32> s;
    int recovery_id;
};

// Output of the BIP341 key tweak: x coordinate and Y parity of Q = P + tG
struct TweakedPublicKey {
    XOnlyPublicKey x_only;
    bool odd_y;
};

// CurveUtils wraps the secp256k1 arithmetic the wallet needs on top of
// OpenSSL's EC_POINT and BIGNUM primitives: key generation checks, scalar
// and point tweaks, RFC6979 ECDSA with low-S normalization, public key
// recovery and BIP340 Schnorr signatures.
class CurveUtils {
public:
    // True if 0 < key < n
    static bool is_valid_private_key(std::span<const uint8_t> key);

    // True if the bytes are a SEC1 encoding of a point on the curve
    static bool is_valid_public_key(std::span<const uint8_t> pubkey);

    // public_key = private_key * G, compressed
    static PublicKey derive_public_key(std::span<const uint8_t> private_key);

    // (key + tweak) mod n; nullopt if tweak >= n or the result is zero
    static std::optional<PrivateKey> tweak_add(std::span<const uint8_t> key,
                                               std::span<const uint8_t> tweak);

    // n - key
    static PrivateKey negate(std::span<const uint8_t> key);

    // Returns the key unchanged if key*G has even Y, otherwise n - key
    static PrivateKey normalize_even_y(std::span<const uint8_t> key);

    static XOnlyPublicKey x_only(const PublicKey& pubkey);

    // BIP341: Q = lift_x(P) + H_TapTweak(P)*G for a key-path-only output
    static TweakedPublicKey taproot_tweak_public_key(const XOnlyPublicKey& internal_key);

    // BIP341: d' = even_y(d) + H_TapTweak(x(d*G)) mod n
    static PrivateKey taproot_tweak_private_key(std::span<const uint8_t> private_key);

    // Deterministic (RFC6979, HMAC-SHA256) ECDSA with low-S normalization
    static EcdsaSignature sign_ecdsa(std::span<const uint8_t> private_key,
                                     std::span<const uint8_t> hash);

    static bool verify_ecdsa(std::span<const uint8_t> pubkey, std::span<const uint8_t> hash,
                             const EcdsaSignature& signature);

    // Rebuilds the signer's public key; nullopt if the signature does not
    // describe a valid point
    static std::optional<PublicKey> recover_public_key(std::span<const uint8_t> hash,
                                                       const EcdsaSignature& signature);

    // Strict DER encoding of (r, s) as used in Bitcoin scripts
    static std::vector<uint8_t> der_encode(const EcdsaSignature& signature);

    // BIP340 Schnorr signature over a 32-byte message with 32 bytes of
    // auxiliary randomness
    static SchnorrSignature sign_schnorr(std::span<const uint8_t> private_key,
                                         std::span<const uint8_t> message,
                                         std::span<const uint8_t> aux_rand);

    static bool verify_schnorr(const XOnlyPublicKey& pubkey, std::span<const uint8_t> message,
                               std::span<const uint8_t> signature);

private:
    CurveUtils() = delete;
};

} // namespace zeldwallet
