/**
 * Codec and Hash Tests
 *
 * - SHA256 / HASH160 / HMAC / PBKDF2 against published vectors
 * - BIP340 tagged hashes
 * - Base58Check, Bech32 and Bech32m (BIP173 / BIP350)
 * - Base64 and CompactSize edge cases
 */

#include <boost/test/unit_test.hpp>

#include "../base58.hpp"
#include "../base64.hpp"
#include "../bech32.hpp"
#include "../hash_utils.hpp"
#include "../serialize.hpp"
#include "test_util.hpp"

using namespace zeldwallet;
using namespace zeldwallet::test;

BOOST_AUTO_TEST_SUITE(codec_tests)

BOOST_AUTO_TEST_SUITE(hash_tests)

BOOST_AUTO_TEST_CASE(sha256_abc) {
    auto digest = HashUtils::sha256(bytes_of("abc"));
    BOOST_CHECK_EQUAL(to_hex(digest), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

BOOST_AUTO_TEST_CASE(hmac_sha256_rfc4231_case2) {
    auto mac = HashUtils::hmac_sha256(bytes_of("Jefe"), bytes_of("what do ya want for nothing?"));
    BOOST_CHECK_EQUAL(to_hex(mac), "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

BOOST_AUTO_TEST_CASE(pbkdf2_sha256_rfc7914) {
    auto key = HashUtils::pbkdf2_sha256(bytes_of("passwd"), bytes_of("salt"), 1, 64);
    BOOST_CHECK_EQUAL(to_hex(key),
        "55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc"
        "49ca9cccf179b645991664b39d77ef317c71b845b1e30bd509112041d3a19783");
}

BOOST_AUTO_TEST_CASE(tagged_hash_bip322_messages) {
    BOOST_CHECK_EQUAL(to_hex(HashUtils::tagged_hash("BIP0322-signed-message", bytes_of(""))),
                      "c90c269c4f8fcbe6880f72a721ddfbf1914268a794cbb21cfafee13770ae19f1");
    BOOST_CHECK_EQUAL(to_hex(HashUtils::tagged_hash("BIP0322-signed-message", bytes_of("Hello World"))),
                      "f0eb03b1a75ac6d9847f55c624a99169b5dccba2a31f5b23bea77ba270de0a7a");
}

BOOST_AUTO_TEST_CASE(hash160_is_ripemd_of_sha) {
    auto data = bytes_of("zeldwallet");
    auto sha = HashUtils::sha256(data);
    BOOST_CHECK(HashUtils::hash160(data) == HashUtils::ripemd160(sha));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(base58_tests)

BOOST_AUTO_TEST_CASE(encode_known_strings) {
    BOOST_CHECK_EQUAL(Base58::encode(bytes_of("hello world")), "StV1DL6CwTryKyV");
    std::vector<uint8_t> leading_zeros = {0x00, 0x00, 0x01};
    BOOST_CHECK_EQUAL(Base58::encode(leading_zeros), "112");
    BOOST_CHECK(Base58::decode("112") == leading_zeros);
}

BOOST_AUTO_TEST_CASE(check_roundtrip_and_corruption) {
    auto payload = hex("00751e76e8199196d454941c45d1b3a323f1433bd6");
    std::string encoded = Base58::encode_check(payload);
    BOOST_CHECK(Base58::decode_check(encoded) == payload);

    // Changing one character breaks the checksum
    std::string corrupted = encoded;
    corrupted[5] = corrupted[5] == 'a' ? 'b' : 'a';
    BOOST_CHECK_THROW(Base58::decode_check(corrupted), std::exception);
}

BOOST_AUTO_TEST_CASE(rejects_characters_outside_alphabet) {
    BOOST_CHECK_THROW(Base58::decode("0OIl"), std::exception);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(bech32_tests)

BOOST_AUTO_TEST_CASE(bip173_p2wpkh) {
    auto program = hex("751e76e8199196d454941c45d1b3a323f1433bd6");
    BOOST_CHECK_EQUAL(Bech32::encode_segwit("bc", 0, program),
                      "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4");

    auto decoded = Bech32::decode_segwit("bc", "BC1QW508D6QEJXTDG4Y5R3ZARVARY0C5XW7KV8F3T4");
    BOOST_REQUIRE(decoded.has_value());
    BOOST_CHECK_EQUAL(decoded->version, 0);
    BOOST_CHECK(decoded->program == program);
}

BOOST_AUTO_TEST_CASE(bip350_p2tr) {
    auto program = hex("79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    BOOST_CHECK_EQUAL(Bech32::encode_segwit("bc", 1, program),
                      "bc1p0xlxvlhemja6c4dqv22uapctqupfhlxm9h8z3k2e72q4k9hcz7vqzk5jj0");
}

BOOST_AUTO_TEST_CASE(rejects_wrong_checksum_variant) {
    // Witness v1 encoded with the original Bech32 constant is invalid under BIP350
    BOOST_CHECK(!Bech32::decode_segwit(
        "bc", "bc1pw508d6qejxtdg4y5r3zarvary0c5xw7kw508d6qejxtdg4y5r3zarvary0c5xw7k7grplx").has_value());
}

BOOST_AUTO_TEST_CASE(rejects_wrong_hrp_and_mixed_case) {
    BOOST_CHECK(!Bech32::decode_segwit("tb", "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4").has_value());
    BOOST_CHECK(!Bech32::decode_segwit("bc", "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kV8f3t4").has_value());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(base64_tests)

BOOST_AUTO_TEST_CASE(encode_decode) {
    BOOST_CHECK_EQUAL(Base64::encode(bytes_of("hello")), "aGVsbG8=");
    BOOST_CHECK_EQUAL(Base64::encode(bytes_of("")), "");
    auto decoded = Base64::decode("aGVsbG8=");
    BOOST_CHECK_EQUAL(std::string(decoded.begin(), decoded.end()), "hello");
}

BOOST_AUTO_TEST_CASE(rejects_malformed) {
    BOOST_CHECK_THROW(Base64::decode("abc"), std::invalid_argument);
    BOOST_CHECK_THROW(Base64::decode("ab$d"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(rejects_nonzero_trailing_bits) {
    BOOST_CHECK_EQUAL(Base64::decode("QQ==").size(), 1u);
    BOOST_CHECK_THROW(Base64::decode("QR=="), std::invalid_argument);
    BOOST_CHECK_THROW(Base64::decode("aGVsbG9="), std::invalid_argument);

    // 32 zero bytes have exactly one encoding
    std::string zeros(43, 'A');
    BOOST_CHECK_EQUAL(Base64::decode(zeros + "=").size(), 32u);
    BOOST_CHECK_THROW(Base64::decode(zeros.substr(0, 42) + "B="), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(compact_size_tests)

BOOST_AUTO_TEST_CASE(boundaries) {
    ByteWriter writer;
    writer.write_compact_size(0xfc);
    writer.write_compact_size(0xfd);
    writer.write_compact_size(0x10000);
    BOOST_CHECK_EQUAL(to_hex(writer.data()), "fcfdfd00fe00000100");

    ByteReader reader(writer.data());
    BOOST_CHECK_EQUAL(reader.read_compact_size(), 0xfcU);
    BOOST_CHECK_EQUAL(reader.read_compact_size(), 0xfdU);
    BOOST_CHECK_EQUAL(reader.read_compact_size(), 0x10000U);
    BOOST_CHECK(reader.empty());
}

BOOST_AUTO_TEST_CASE(rejects_non_canonical_and_truncated) {
    auto non_canonical = hex("fd0500");
    ByteReader reader(non_canonical);
    BOOST_CHECK_THROW(reader.read_compact_size(), std::out_of_range);

    auto truncated = hex("fe0100");
    ByteReader short_reader(truncated);
    BOOST_CHECK_THROW(short_reader.read_compact_size(), std::out_of_range);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
