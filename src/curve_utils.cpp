#include "curve_utils.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "secure_memory.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <algorithm>
#include <memory>

namespace zeldwallet {

namespace {

// RAII wrappers for the OpenSSL objects used below. Scalars are cleared on
// release since they may hold private keys or nonces.
struct BnDeleter {
    void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};
struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
struct PointDeleter {
    void operator()(EC_POINT* point) const { EC_POINT_clear_free(point); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

[[noreturn]] void curve_failure(const char* what) {
    throw KeyError(KeyError::ErrorType::DerivationFailure, what);
}

// secp256k1 group parameters, created once and shared read-only
const EC_GROUP* group() {
    static const std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)> secp256k1(
        EC_GROUP_new_by_curve_name(NID_secp256k1), EC_GROUP_free);
    if (!secp256k1) {
        curve_failure("secp256k1 is not available");
    }
    return secp256k1.get();
}

const BIGNUM* order() {
    const BIGNUM* n = EC_GROUP_get0_order(group());
    if (!n) {
        curve_failure("Cannot read curve order");
    }
    return n;
}

const BIGNUM* field_prime() {
    static const BnPtr p = [] {
        BnPtr prime(BN_new());
        if (!prime || !EC_GROUP_get_curve(group(), prime.get(), nullptr, nullptr, nullptr)) {
            curve_failure("Cannot read field prime");
        }
        return prime;
    }();
    return p.get();
}

BnCtxPtr new_ctx() {
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) curve_failure("BN_CTX_new failed");
    return ctx;
}

BnPtr new_bn() {
    BnPtr bn(BN_new());
    if (!bn) curve_failure("BN_new failed");
    return bn;
}

BnPtr bn_from_bytes(std::span<const uint8_t> bytes) {
    BnPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
    if (!bn) curve_failure("BN_bin2bn failed");
    return bn;
}

std::array<uint8_t, 32> bn_to_bytes(const BIGNUM* bn) {
    std::array<uint8_t, 32> out{};
    if (BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) != 32) {
        curve_failure("BN_bn2binpad failed");
    }
    return out;
}

PointPtr new_point() {
    PointPtr point(EC_POINT_new(group()));
    if (!point) curve_failure("EC_POINT_new failed");
    return point;
}

// scalar * G
PointPtr mul_generator(const BIGNUM* scalar, BN_CTX* ctx) {
    auto point = new_point();
    if (!EC_POINT_mul(group(), point.get(), scalar, nullptr, nullptr, ctx)) {
        curve_failure("EC_POINT_mul failed");
    }
    return point;
}

void affine(const EC_POINT* point, BIGNUM* x, BIGNUM* y, BN_CTX* ctx) {
    if (!EC_POINT_get_affine_coordinates(group(), point, x, y, ctx)) {
        curve_failure("EC_POINT_get_affine_coordinates failed");
    }
}

bool has_odd_y(const EC_POINT* point, BN_CTX* ctx) {
    auto x = new_bn();
    auto y = new_bn();
    affine(point, x.get(), y.get(), ctx);
    return BN_is_odd(y.get());
}

std::array<uint8_t, 32> point_x_bytes(const EC_POINT* point, BN_CTX* ctx) {
    auto x = new_bn();
    affine(point, x.get(), nullptr, ctx);
    return bn_to_bytes(x.get());
}

PublicKey serialize_point(const EC_POINT* point, BN_CTX* ctx) {
    PublicKey out{};
    size_t size = EC_POINT_point2oct(group(), point, POINT_CONVERSION_COMPRESSED,
                                     out.data(), out.size(), ctx);
    if (size != out.size()) {
        curve_failure("EC_POINT_point2oct failed");
    }
    return out;
}

// Parses a SEC1 point; null for anything off the curve
PointPtr parse_point(std::span<const uint8_t> bytes, BN_CTX* ctx) {
    auto point = new_point();
    if (bytes.empty() ||
        !EC_POINT_oct2point(group(), point.get(), bytes.data(), bytes.size(), ctx) ||
        EC_POINT_is_at_infinity(group(), point.get())) {
        return nullptr;
    }
    return point;
}

// BIP340 lift_x: the point with the given x coordinate and even Y
PointPtr lift_x(std::span<const uint8_t> x_bytes, BN_CTX* ctx) {
    auto x = bn_from_bytes(x_bytes);
    if (BN_cmp(x.get(), field_prime()) >= 0) {
        return nullptr;
    }
    auto point = new_point();
    if (!EC_POINT_set_compressed_coordinates(group(), point.get(), x.get(), 0, ctx)) {
        return nullptr;
    }
    return point;
}

bool in_scalar_range(const BIGNUM* value) {
    return !BN_is_zero(value) && BN_cmp(value, order()) < 0;
}

// Deterministic nonce generation per RFC6979 section 3.2 with HMAC-SHA256.
// For secp256k1 qlen equals the hash length, so bits2int is the identity.
class Rfc6979NonceGenerator {
public:
    Rfc6979NonceGenerator(std::span<const uint8_t> private_key, std::span<const uint8_t> hash_mod_n) {
        v_.fill(0x01);
        k_.fill(0x00);

        std::vector<uint8_t> seed;
        WipeGuard<std::vector<uint8_t>> seed_guard(seed);
        seed.reserve(32 + 1 + 32 + 32);

        for (uint8_t separator : {uint8_t{0x00}, uint8_t{0x01}}) {
            seed.assign(v_.begin(), v_.end());
            seed.push_back(separator);
            seed.insert(seed.end(), private_key.begin(), private_key.end());
            seed.insert(seed.end(), hash_mod_n.begin(), hash_mod_n.end());
            k_ = HashUtils::hmac_sha256(k_, seed);
            v_ = HashUtils::hmac_sha256(k_, v_);
        }
    }

    ~Rfc6979NonceGenerator() {
        secure_wipe(k_);
        secure_wipe(v_);
    }

    std::array<uint8_t, 32> next() {
        if (!first_) {
            std::vector<uint8_t> data(v_.begin(), v_.end());
            data.push_back(0x00);
            k_ = HashUtils::hmac_sha256(k_, data);
            v_ = HashUtils::hmac_sha256(k_, v_);
        }
        first_ = false;
        v_ = HashUtils::hmac_sha256(k_, v_);
        return v_;
    }

private:
    std::array<uint8_t, 32> k_;
    std::array<uint8_t, 32> v_;
    bool first_ = true;
};

} // namespace

bool CurveUtils::is_valid_private_key(std::span<const uint8_t> key) {
    if (key.size() != 32) {
        return false;
    }
    auto k = bn_from_bytes(key);
    return in_scalar_range(k.get());
}

bool CurveUtils::is_valid_public_key(std::span<const uint8_t> pubkey) {
    if (pubkey.size() != 33 && pubkey.size() != 65) {
        return false;
    }
    auto ctx = new_ctx();
    auto point = parse_point(pubkey, ctx.get());
    return point && EC_POINT_is_on_curve(group(), point.get(), ctx.get()) == 1;
}

// Derives a public key from a private key using elliptic curve multiplication
// This implements the secp256k1 curve operation: public_key = private_key * G
// where G is the generator point of the curve.
//
// Compressed public key format:
// - First byte: 0x02 if y-coordinate is even, 0x03 if y-coordinate is odd
// - Remaining 32 bytes: x-coordinate
PublicKey CurveUtils::derive_public_key(std::span<const uint8_t> private_key) {
    if (!is_valid_private_key(private_key)) {
        throw KeyError(KeyError::ErrorType::DerivationFailure, "Private key out of range");
    }
    auto ctx = new_ctx();
    auto k = bn_from_bytes(private_key);
    BN_set_flags(k.get(), BN_FLG_CONSTTIME);
    auto point = mul_generator(k.get(), ctx.get());
    return serialize_point(point.get(), ctx.get());
}

std::optional<PrivateKey> CurveUtils::tweak_add(std::span<const uint8_t> key,
                                                std::span<const uint8_t> tweak) {
    auto ctx = new_ctx();
    auto k = bn_from_bytes(key);
    auto t = bn_from_bytes(tweak);
    if (BN_cmp(t.get(), order()) >= 0) {
        return std::nullopt;
    }
    auto sum = new_bn();
    if (!BN_mod_add(sum.get(), k.get(), t.get(), order(), ctx.get())) {
        curve_failure("BN_mod_add failed");
    }
    if (BN_is_zero(sum.get())) {
        return std::nullopt;
    }
    return bn_to_bytes(sum.get());
}

PrivateKey CurveUtils::negate(std::span<const uint8_t> key) {
    auto k = bn_from_bytes(key);
    auto result = new_bn();
    if (!BN_sub(result.get(), order(), k.get())) {
        curve_failure("BN_sub failed");
    }
    return bn_to_bytes(result.get());
}

// BIP340 keys are x-only and implicitly have an even Y coordinate. A signer
// whose point has odd Y signs with n - d instead, which maps to the same
// x coordinate.
PrivateKey CurveUtils::normalize_even_y(std::span<const uint8_t> key) {
    auto pubkey = derive_public_key(key);
    if (pubkey[0] == 0x03) {
        return negate(key);
    }
    PrivateKey out;
    std::copy(key.begin(), key.end(), out.begin());
    return out;
}

XOnlyPublicKey CurveUtils::x_only(const PublicKey& pubkey) {
    XOnlyPublicKey out;
    std::copy(pubkey.begin() + 1, pubkey.end(), out.begin());
    return out;
}

// Taproot output key for a key-path-only output (BIP86):
//   t = tagged_hash("TapTweak", x(P))
//   Q = lift_x(x(P)) + t*G
// The output script commits to x(Q); the parity is needed only for
// script-path control blocks but is reported for completeness.
TweakedPublicKey CurveUtils::taproot_tweak_public_key(const XOnlyPublicKey& internal_key) {
    auto ctx = new_ctx();
    auto p = lift_x(internal_key, ctx.get());
    if (!p) {
        throw KeyError(KeyError::ErrorType::DerivedInvalidPublicKey, "Internal key is not on the curve");
    }

    auto tweak = HashUtils::tagged_hash("TapTweak", internal_key);
    auto t = bn_from_bytes(tweak);
    if (BN_cmp(t.get(), order()) >= 0) {
        curve_failure("Taproot tweak out of range");
    }

    auto tg = mul_generator(t.get(), ctx.get());
    auto q = new_point();
    if (!EC_POINT_add(group(), q.get(), p.get(), tg.get(), ctx.get()) ||
        EC_POINT_is_at_infinity(group(), q.get())) {
        curve_failure("Taproot tweak produced an invalid point");
    }

    return TweakedPublicKey{point_x_bytes(q.get(), ctx.get()), has_odd_y(q.get(), ctx.get())};
}

// Key-path signing key for a Taproot output:
// 1. Normalize d so that d*G has even Y (the internal key is x-only)
// 2. Add t = tagged_hash("TapTweak", x(d*G)) modulo n
PrivateKey CurveUtils::taproot_tweak_private_key(std::span<const uint8_t> private_key) {
    auto even = normalize_even_y(private_key);
    WipeGuard<PrivateKey> even_guard(even);

    auto internal = x_only(derive_public_key(even));
    auto tweak = HashUtils::tagged_hash("TapTweak", internal);
    auto tweaked = tweak_add(even, tweak);
    if (!tweaked) {
        curve_failure("Taproot tweak produced an invalid key");
    }
    return *tweaked;
}

// Sign a digest with ECDSA on secp256k1.
//
// The nonce k is derived deterministically from the key and the digest
// (RFC6979) so that the same message always yields the same signature and
// a weak random source can never leak the key.
//
// For any valid signature (r, s), (r, n - s) is valid too. BIP62/BIP146
// require the lower of the two, so s is replaced by n - s when s > n/2;
// flipping s also flips the parity bit of the recovery id.
//
// Recovery id bits:
// - bit 0: parity of R.y
// - bit 1: set when R.x overflowed the group order (practically never)
EcdsaSignature CurveUtils::sign_ecdsa(std::span<const uint8_t> private_key,
                                      std::span<const uint8_t> hash) {
    if (hash.size() != 32 || !is_valid_private_key(private_key)) {
        throw SigningError(SigningError::ErrorType::SigningFailure, "Invalid ECDSA signing input");
    }

    auto ctx = new_ctx();
    auto d = bn_from_bytes(private_key);
    BN_set_flags(d.get(), BN_FLG_CONSTTIME);

    auto e = bn_from_bytes(hash);
    auto e_mod_n = new_bn();
    if (!BN_nnmod(e_mod_n.get(), e.get(), order(), ctx.get())) {
        curve_failure("BN_nnmod failed");
    }
    auto hash_mod_n = bn_to_bytes(e_mod_n.get());

    auto half_order = new_bn();
    if (!BN_rshift1(half_order.get(), order())) {
        curve_failure("BN_rshift1 failed");
    }

    Rfc6979NonceGenerator nonces(private_key, hash_mod_n);
    for (;;) {
        auto candidate = nonces.next();
        auto k = bn_from_bytes(candidate);
        secure_wipe(candidate);
        BN_set_flags(k.get(), BN_FLG_CONSTTIME);
        if (!in_scalar_range(k.get())) {
            continue;
        }

        auto r_point = mul_generator(k.get(), ctx.get());
        auto rx = new_bn();
        auto ry = new_bn();
        affine(r_point.get(), rx.get(), ry.get(), ctx.get());

        auto r = new_bn();
        if (!BN_nnmod(r.get(), rx.get(), order(), ctx.get())) {
            curve_failure("BN_nnmod failed");
        }
        if (BN_is_zero(r.get())) {
            continue;
        }

        // s = k^-1 * (e + r*d) mod n
        auto k_inv = new_bn();
        auto rd = new_bn();
        auto s = new_bn();
        if (!BN_mod_inverse(k_inv.get(), k.get(), order(), ctx.get()) ||
            !BN_mod_mul(rd.get(), r.get(), d.get(), order(), ctx.get()) ||
            !BN_mod_add(s.get(), e.get(), rd.get(), order(), ctx.get()) ||
            !BN_mod_mul(s.get(), s.get(), k_inv.get(), order(), ctx.get())) {
            curve_failure("ECDSA arithmetic failed");
        }
        if (BN_is_zero(s.get())) {
            continue;
        }

        int recovery_id = (BN_is_odd(ry.get()) ? 1 : 0) | (BN_cmp(rx.get(), order()) >= 0 ? 2 : 0);
        if (BN_cmp(s.get(), half_order.get()) > 0) {
            if (!BN_sub(s.get(), order(), s.get())) {
                curve_failure("BN_sub failed");
            }
            recovery_id ^= 1;
        }

        return EcdsaSignature{bn_to_bytes(r.get()), bn_to_bytes(s.get()), recovery_id};
    }
}

bool CurveUtils::verify_ecdsa(std::span<const uint8_t> pubkey, std::span<const uint8_t> hash,
                              const EcdsaSignature& signature) {
    if (hash.size() != 32) {
        return false;
    }
    auto ctx = new_ctx();
    auto q = parse_point(pubkey, ctx.get());
    if (!q) {
        return false;
    }

    auto r = bn_from_bytes(signature.r);
    auto s = bn_from_bytes(signature.s);
    if (!in_scalar_range(r.get()) || !in_scalar_range(s.get())) {
        return false;
    }

    // X = (e * s^-1) G + (r * s^-1) Q; valid iff x(X) mod n == r
    auto e = bn_from_bytes(hash);
    auto w = new_bn();
    auto u1 = new_bn();
    auto u2 = new_bn();
    if (!BN_mod_inverse(w.get(), s.get(), order(), ctx.get()) ||
        !BN_mod_mul(u1.get(), e.get(), w.get(), order(), ctx.get()) ||
        !BN_mod_mul(u2.get(), r.get(), w.get(), order(), ctx.get())) {
        return false;
    }

    auto x_point = new_point();
    if (!EC_POINT_mul(group(), x_point.get(), u1.get(), q.get(), u2.get(), ctx.get()) ||
        EC_POINT_is_at_infinity(group(), x_point.get())) {
        return false;
    }

    auto x = new_bn();
    affine(x_point.get(), x.get(), nullptr, ctx.get());
    auto v = new_bn();
    if (!BN_nnmod(v.get(), x.get(), order(), ctx.get())) {
        return false;
    }
    return BN_cmp(v.get(), r.get()) == 0;
}

// Public key recovery (SEC1 4.1.6):
//   R = point with x = r + j*n and the parity from the recovery id
//   Q = r^-1 * (s*R - e*G)
std::optional<PublicKey> CurveUtils::recover_public_key(std::span<const uint8_t> hash,
                                                        const EcdsaSignature& signature) {
    if (hash.size() != 32 || signature.recovery_id < 0 || signature.recovery_id > 3) {
        return std::nullopt;
    }
    auto ctx = new_ctx();
    auto r = bn_from_bytes(signature.r);
    auto s = bn_from_bytes(signature.s);
    if (!in_scalar_range(r.get()) || !in_scalar_range(s.get())) {
        return std::nullopt;
    }

    auto x = new_bn();
    if (!BN_copy(x.get(), r.get())) {
        return std::nullopt;
    }
    if (signature.recovery_id & 2) {
        if (!BN_add(x.get(), x.get(), order())) {
            return std::nullopt;
        }
    }
    if (BN_cmp(x.get(), field_prime()) >= 0) {
        return std::nullopt;
    }

    auto r_point = new_point();
    if (!EC_POINT_set_compressed_coordinates(group(), r_point.get(), x.get(),
                                             signature.recovery_id & 1, ctx.get())) {
        return std::nullopt;
    }

    auto e = bn_from_bytes(hash);
    auto r_inv = new_bn();
    auto u1 = new_bn();
    auto u2 = new_bn();
    auto zero = new_bn();
    BN_zero(zero.get());
    if (!BN_mod_inverse(r_inv.get(), r.get(), order(), ctx.get()) ||
        !BN_mod_sub(u1.get(), zero.get(), e.get(), order(), ctx.get()) ||
        !BN_mod_mul(u1.get(), u1.get(), r_inv.get(), order(), ctx.get()) ||
        !BN_mod_mul(u2.get(), s.get(), r_inv.get(), order(), ctx.get())) {
        return std::nullopt;
    }

    auto q = new_point();
    if (!EC_POINT_mul(group(), q.get(), u1.get(), r_point.get(), u2.get(), ctx.get()) ||
        EC_POINT_is_at_infinity(group(), q.get())) {
        return std::nullopt;
    }
    return serialize_point(q.get(), ctx.get());
}

// DER encoding of an ECDSA signature:
//   0x30 [total-length] 0x02 [R-length] [R] 0x02 [S-length] [S]
// Integers are big-endian, minimal, and get a 0x00 prefix when the top bit
// is set so they are not read as negative.
std::vector<uint8_t> CurveUtils::der_encode(const EcdsaSignature& signature) {
    auto encode_integer = [](const std::array<uint8_t, 32>& value) {
        auto first = std::find_if(value.begin(), value.end(), [](uint8_t b) { return b != 0; });
        std::vector<uint8_t> out(first, value.end());
        if (out.empty() || (out.front() & 0x80)) {
            out.insert(out.begin(), 0x00);
        }
        return out;
    };

    auto r = encode_integer(signature.r);
    auto s = encode_integer(signature.s);

    std::vector<uint8_t> der;
    der.reserve(6 + r.size() + s.size());
    der.push_back(0x30);
    der.push_back(static_cast<uint8_t>(4 + r.size() + s.size()));
    der.push_back(0x02);
    der.push_back(static_cast<uint8_t>(r.size()));
    der.insert(der.end(), r.begin(), r.end());
    der.push_back(0x02);
    der.push_back(static_cast<uint8_t>(s.size()));
    der.insert(der.end(), s.begin(), s.end());
    return der;
}

// BIP340 signing:
//   d  = even-Y normalized secret, P = d*G
//   t  = bytes(d) xor tagged_hash("BIP0340/aux", a)
//   k0 = tagged_hash("BIP0340/nonce", t || x(P) || m) mod n
//   R  = k0*G, k = k0 or n - k0 so that R has even Y
//   e  = tagged_hash("BIP0340/challenge", x(R) || x(P) || m) mod n
//   sig = x(R) || bytes((k + e*d) mod n)
SchnorrSignature CurveUtils::sign_schnorr(std::span<const uint8_t> private_key,
                                          std::span<const uint8_t> message,
                                          std::span<const uint8_t> aux_rand) {
    if (message.size() != 32 || aux_rand.size() != 32 || !is_valid_private_key(private_key)) {
        throw SigningError(SigningError::ErrorType::SigningFailure, "Invalid Schnorr signing input");
    }

    auto ctx = new_ctx();
    auto secret = normalize_even_y(private_key);
    WipeGuard<PrivateKey> secret_guard(secret);
    auto pubkey_x = x_only(derive_public_key(secret));

    auto aux_hash = HashUtils::tagged_hash("BIP0340/aux", aux_rand);
    std::vector<uint8_t> nonce_input;
    WipeGuard<std::vector<uint8_t>> nonce_guard(nonce_input);
    nonce_input.reserve(96);
    for (size_t i = 0; i < 32; ++i) {
        nonce_input.push_back(secret[i] ^ aux_hash[i]);
    }
    nonce_input.insert(nonce_input.end(), pubkey_x.begin(), pubkey_x.end());
    nonce_input.insert(nonce_input.end(), message.begin(), message.end());
    auto nonce_hash = HashUtils::tagged_hash("BIP0340/nonce", nonce_input);

    auto k = bn_from_bytes(nonce_hash);
    secure_wipe(nonce_hash);
    BN_set_flags(k.get(), BN_FLG_CONSTTIME);
    if (!BN_nnmod(k.get(), k.get(), order(), ctx.get())) {
        curve_failure("BN_nnmod failed");
    }
    if (BN_is_zero(k.get())) {
        throw SigningError(SigningError::ErrorType::SigningFailure, "Schnorr nonce is zero");
    }

    auto r_point = mul_generator(k.get(), ctx.get());
    if (has_odd_y(r_point.get(), ctx.get())) {
        if (!BN_sub(k.get(), order(), k.get())) {
            curve_failure("BN_sub failed");
        }
    }
    auto r_x = point_x_bytes(r_point.get(), ctx.get());

    std::vector<uint8_t> challenge_input;
    challenge_input.reserve(96);
    challenge_input.insert(challenge_input.end(), r_x.begin(), r_x.end());
    challenge_input.insert(challenge_input.end(), pubkey_x.begin(), pubkey_x.end());
    challenge_input.insert(challenge_input.end(), message.begin(), message.end());
    auto challenge = HashUtils::tagged_hash("BIP0340/challenge", challenge_input);

    auto e = bn_from_bytes(challenge);
    auto d = bn_from_bytes(secret);
    BN_set_flags(d.get(), BN_FLG_CONSTTIME);
    auto s = new_bn();
    if (!BN_nnmod(e.get(), e.get(), order(), ctx.get()) ||
        !BN_mod_mul(s.get(), e.get(), d.get(), order(), ctx.get()) ||
        !BN_mod_add(s.get(), s.get(), k.get(), order(), ctx.get())) {
        curve_failure("Schnorr arithmetic failed");
    }

    SchnorrSignature signature;
    std::copy(r_x.begin(), r_x.end(), signature.begin());
    auto s_bytes = bn_to_bytes(s.get());
    std::copy(s_bytes.begin(), s_bytes.end(), signature.begin() + 32);

    if (!verify_schnorr(pubkey_x, message, signature)) {
        throw SigningError(SigningError::ErrorType::SigningFailure, "Produced Schnorr signature does not verify");
    }
    return signature;
}

// BIP340 verification:
//   P = lift_x(pk), r = sig[0:32] < p, s = sig[32:64] < n
//   e = tagged_hash("BIP0340/challenge", r || pk || m) mod n
//   R = s*G - e*P must be finite, have even Y and x(R) == r
bool CurveUtils::verify_schnorr(const XOnlyPublicKey& pubkey, std::span<const uint8_t> message,
                                std::span<const uint8_t> signature) {
    if (message.size() != 32 || signature.size() != 64) {
        return false;
    }
    auto ctx = new_ctx();
    auto p = lift_x(pubkey, ctx.get());
    if (!p) {
        return false;
    }

    auto r = bn_from_bytes(signature.subspan(0, 32));
    auto s = bn_from_bytes(signature.subspan(32, 32));
    if (BN_cmp(r.get(), field_prime()) >= 0 || BN_cmp(s.get(), order()) >= 0) {
        return false;
    }

    std::vector<uint8_t> challenge_input;
    challenge_input.reserve(96);
    challenge_input.insert(challenge_input.end(), signature.begin(), signature.begin() + 32);
    challenge_input.insert(challenge_input.end(), pubkey.begin(), pubkey.end());
    challenge_input.insert(challenge_input.end(), message.begin(), message.end());
    auto challenge = HashUtils::tagged_hash("BIP0340/challenge", challenge_input);

    auto e = bn_from_bytes(challenge);
    auto neg_e = new_bn();
    auto zero = new_bn();
    BN_zero(zero.get());
    if (!BN_nnmod(e.get(), e.get(), order(), ctx.get()) ||
        !BN_mod_sub(neg_e.get(), zero.get(), e.get(), order(), ctx.get())) {
        return false;
    }

    auto r_point = new_point();
    if (!EC_POINT_mul(group(), r_point.get(), s.get(), p.get(), neg_e.get(), ctx.get()) ||
        EC_POINT_is_at_infinity(group(), r_point.get())) {
        return false;
    }
    if (has_odd_y(r_point.get(), ctx.get())) {
        return false;
    }
    auto r_x = point_x_bytes(r_point.get(), ctx.get());
    return std::equal(r_x.begin(), r_x.end(), signature.begin());
}

} // namespace zeldwallet
