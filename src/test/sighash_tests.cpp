/**
 * Signature Hash Tests
 *
 * - BIP143 native P2WPKH example
 * - Legacy SIGHASH_SINGLE quirk and hash type coverage
 * - BIP341 key-path commitments
 */

#include <boost/test/unit_test.hpp>

#include "../consts.hpp"
#include "../error.hpp"
#include "../sighash.hpp"
#include "test_util.hpp"

using namespace zeldwallet;
using namespace zeldwallet::test;

namespace {

const std::string BIP143_UNSIGNED_TX =
    "0100000002fff7f7881a8099afa6940d42d1e7f6362bec38171ea3edf433541db4e4ad969f0000000000eeffffff"
    "ef51e1b804cc89d182d279655c3aa89e815b1b309fe287d9b2b55d57b90ec68a0100000000ffffffff02202cb206"
    "000000001976a9148280b37df378db99f66f85c95a783a76ac7a6d5988ac9093510d000000001976a9143bde42db"
    "ee7e4dbe6a21b2d50ce2f0167faa815988ac11000000";

Transaction two_in_one_out() {
    std::array<uint8_t, 32> txid{};
    txid.fill(0x11);
    Transaction tx = spending_tx(txid, 0, 50000, hex("0014751e76e8199196d454941c45d1b3a323f1433bd6"));
    TxIn second;
    second.prevout.txid.fill(0x22);
    second.prevout.index = 1;
    tx.inputs.push_back(second);
    return tx;
}

} // namespace

BOOST_AUTO_TEST_SUITE(sighash_tests)

BOOST_AUTO_TEST_CASE(bip143_native_p2wpkh) {
    Transaction tx = Transaction::parse(hex(BIP143_UNSIGNED_TX));
    BOOST_REQUIRE_EQUAL(tx.inputs.size(), 2u);
    BOOST_CHECK_EQUAL(tx.locktime, 17u);

    auto script_code = hex("76a9141d0f172a0ecb48aee1be1f2687d2963ae33f71a188ac");
    auto sighash = Sighash::segwit_v0(tx, 1, script_code, 600000000, SIGHASH_ALL);
    BOOST_CHECK_EQUAL(to_hex(sighash), "c37af31116d1b27caf68aae9e3ac82f1477929014d5b917657d0eb49478cb670");

    // Serialization round trip keeps the txid stable
    BOOST_CHECK_EQUAL(to_hex(tx.serialize(false)), BIP143_UNSIGNED_TX);
}

BOOST_AUTO_TEST_CASE(segwit_hash_types_differ) {
    Transaction tx = Transaction::parse(hex(BIP143_UNSIGNED_TX));
    auto script_code = hex("76a9141d0f172a0ecb48aee1be1f2687d2963ae33f71a188ac");

    auto all = Sighash::segwit_v0(tx, 1, script_code, 600000000, SIGHASH_ALL);
    auto none = Sighash::segwit_v0(tx, 1, script_code, 600000000, SIGHASH_NONE);
    auto single = Sighash::segwit_v0(tx, 1, script_code, 600000000, SIGHASH_SINGLE);
    auto acp = Sighash::segwit_v0(tx, 1, script_code, 600000000, SIGHASH_ALL | SIGHASH_ANYONECANPAY);
    BOOST_CHECK(all != none);
    BOOST_CHECK(all != single);
    BOOST_CHECK(all != acp);

    // The amount is committed to
    BOOST_CHECK(all != Sighash::segwit_v0(tx, 1, script_code, 600000001, SIGHASH_ALL));
}

BOOST_AUTO_TEST_CASE(legacy_single_without_output) {
    Transaction tx = two_in_one_out();
    auto script = hex("76a914751e76e8199196d454941c45d1b3a323f1433bd688ac");
    auto hash = Sighash::legacy(tx, 1, script, SIGHASH_SINGLE);
    BOOST_CHECK_EQUAL(to_hex(hash), "0100000000000000000000000000000000000000000000000000000000000000");

    // With a matching output it is an ordinary digest
    auto normal = Sighash::legacy(tx, 0, script, SIGHASH_SINGLE);
    BOOST_CHECK(normal != hash);
}

BOOST_AUTO_TEST_CASE(legacy_anyonecanpay_ignores_other_inputs) {
    Transaction tx = two_in_one_out();
    auto script = hex("76a914751e76e8199196d454941c45d1b3a323f1433bd688ac");
    auto before = Sighash::legacy(tx, 0, script, SIGHASH_ALL | SIGHASH_ANYONECANPAY);
    auto all_before = Sighash::legacy(tx, 0, script, SIGHASH_ALL);

    tx.inputs[1].prevout.index = 7;
    BOOST_CHECK(Sighash::legacy(tx, 0, script, SIGHASH_ALL | SIGHASH_ANYONECANPAY) == before);
    BOOST_CHECK(Sighash::legacy(tx, 0, script, SIGHASH_ALL) != all_before);
}

BOOST_AUTO_TEST_CASE(out_of_range_input) {
    Transaction tx = two_in_one_out();
    BOOST_CHECK_THROW(Sighash::legacy(tx, 2, Bytes{}, SIGHASH_ALL), SigningError);
    BOOST_CHECK_THROW(Sighash::segwit_v0(tx, 5, Bytes{}, 0, SIGHASH_ALL), SigningError);
}

BOOST_AUTO_TEST_CASE(taproot_hash_type_range) {
    for (uint8_t valid : {0x00, 0x01, 0x02, 0x03, 0x81, 0x82, 0x83}) {
        BOOST_CHECK(Sighash::is_valid_taproot_hash_type(valid));
    }
    for (uint8_t invalid : {0x04, 0x80, 0x84, 0xff}) {
        BOOST_CHECK(!Sighash::is_valid_taproot_hash_type(invalid));
    }
}

BOOST_AUTO_TEST_CASE(taproot_commits_to_every_spent_output) {
    Transaction tx = two_in_one_out();
    TxOut first{40000, hex("5120" + std::string(64, 'a'))};
    TxOut second{20000, hex("5120" + std::string(64, 'b'))};
    std::vector<std::optional<TxOut>> spent = {first, second};

    auto default_hash = Sighash::taproot_key_path(tx, 0, spent, SIGHASH_DEFAULT);
    auto all_hash = Sighash::taproot_key_path(tx, 0, spent, SIGHASH_ALL);
    BOOST_CHECK(default_hash != all_hash);

    // The other input's amount is part of the message
    std::vector<std::optional<TxOut>> changed = spent;
    changed[1]->amount += 1;
    BOOST_CHECK(Sighash::taproot_key_path(tx, 0, changed, SIGHASH_DEFAULT) != default_hash);

    // ...unless ANYONECANPAY is set
    uint8_t acp = SIGHASH_ALL | SIGHASH_ANYONECANPAY;
    BOOST_CHECK(Sighash::taproot_key_path(tx, 0, changed, acp) ==
                Sighash::taproot_key_path(tx, 0, spent, acp));

    std::vector<std::optional<TxOut>> missing = {first, std::nullopt};
    try {
        Sighash::taproot_key_path(tx, 0, missing, SIGHASH_DEFAULT);
        BOOST_ERROR("Missing spent output accepted");
    } catch (const SigningError& e) {
        BOOST_CHECK(e.type() == SigningError::ErrorType::CannotDetermineScript);
    }
    BOOST_CHECK_THROW(Sighash::taproot_key_path(tx, 0, spent, 0x84), SigningError);
}

BOOST_AUTO_TEST_SUITE_END()
