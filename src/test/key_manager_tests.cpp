/**
 * Derivation Engine Tests
 *
 * - BIP44/49/84/86 addresses for the "abandon ... about" mnemonic
 * - Custom path priority and reverse lookup
 * - Lookup window validation and clamping
 * - Locked-state errors
 */

#include <boost/test/unit_test.hpp>

#include "../address.hpp"
#include "../error.hpp"
#include "../key_manager.hpp"
#include "test_util.hpp"

using namespace zeldwallet;
using namespace zeldwallet::test;

namespace {

struct UnlockedKeys {
    KeyManager keys;
    UnlockedKeys() { keys.from_mnemonic(ABANDON_MNEMONIC); }
};

template <typename Fn>
void check_key_error(Fn&& fn, KeyError::ErrorType expected) {
    try {
        fn();
        BOOST_ERROR("Expected KeyError");
    } catch (const KeyError& e) {
        BOOST_CHECK(e.type() == expected);
    }
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(key_manager_tests, UnlockedKeys)

BOOST_AUTO_TEST_CASE(standard_mainnet_addresses) {
    auto native = keys.derive_address(DerivationPathType::NativeSegwit);
    BOOST_CHECK_EQUAL(native.address, "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
    BOOST_CHECK_EQUAL(to_hex(native.public_key),
                      "0330d54fd0dd420a6e5f8d3624f5f3482cae350f79d5f0753bf5beef9c2d91af3c");
    BOOST_CHECK_EQUAL(native.path, "m/84'/0'/0'/0/0");
    BOOST_CHECK(native.type == AddressType::P2wpkh);

    BOOST_CHECK_EQUAL(keys.derive_address(DerivationPathType::NativeSegwit, 0, 0, 1).address,
                      "bc1qnjg0jd8228aq7egyzacy8cys3knf9xvrerkf9g");
    BOOST_CHECK_EQUAL(keys.derive_address(DerivationPathType::NativeSegwit, 0, 1, 0).address,
                      "bc1q8c6fshw2dlwun7ekn9qwf37cu2rn755upcp6el");

    BOOST_CHECK_EQUAL(keys.derive_address(DerivationPathType::Legacy).address,
                      "1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabA");
    BOOST_CHECK_EQUAL(keys.derive_address(DerivationPathType::NestedSegwit).address,
                      "37VucYSaXLCAsxYyAPfbSi9eh4iEcbShgf");

    auto taproot = keys.derive_address(DerivationPathType::Taproot);
    BOOST_CHECK_EQUAL(taproot.address, "bc1p5cyxnuxmeuwuvkwfem96lqzszd02n6xdcjrs20cac6yqjjwudpxqkedrcr");
    BOOST_CHECK_EQUAL(to_hex(CurveUtils::x_only(taproot.public_key)),
                      "cc8a4bc64d897bddc5fbc2f670f7a8ba0b386779106cf1223c6fc5d7cd6fc115");
    BOOST_CHECK(taproot.type == AddressType::P2tr);
}

BOOST_AUTO_TEST_CASE(passphrase_changes_every_address) {
    KeyManager protected_keys;
    protected_keys.from_mnemonic(ABANDON_MNEMONIC, "TREZOR");
    BOOST_CHECK(protected_keys.derive_address(DerivationPathType::NativeSegwit).address !=
                keys.derive_address(DerivationPathType::NativeSegwit).address);
}

BOOST_AUTO_TEST_CASE(passphrase_normalization_form_is_irrelevant) {
    KeyManager composed;
    composed.from_mnemonic(ABANDON_MNEMONIC, "caf\xC3\xA9");
    KeyManager decomposed;
    decomposed.from_mnemonic(ABANDON_MNEMONIC, "cafe\xCC\x81");

    auto address = composed.derive_address(DerivationPathType::NativeSegwit).address;
    BOOST_CHECK_EQUAL(decomposed.derive_address(DerivationPathType::NativeSegwit).address, address);
    BOOST_CHECK_NE(address, "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
}

BOOST_AUTO_TEST_CASE(derivation_is_deterministic) {
    KeyManager again;
    again.from_mnemonic("  " + ABANDON_MNEMONIC + "\n");
    for (DerivationPathType type : DerivationPaths::ALL_TYPES) {
        BOOST_CHECK_EQUAL(again.derive_address(type, 1, 0, 3).address,
                          keys.derive_address(type, 1, 0, 3).address);
    }
}

BOOST_AUTO_TEST_CASE(testnet_uses_coin_type_one) {
    keys.set_network(Network::Testnet);
    auto native = keys.derive_address(DerivationPathType::NativeSegwit);
    BOOST_CHECK_EQUAL(native.path, "m/84'/1'/0'/0/0");
    BOOST_CHECK(native.address.starts_with("tb1q"));
    BOOST_CHECK(keys.derive_address(DerivationPathType::Taproot).address.starts_with("tb1p"));
    BOOST_CHECK(keys.derive_address(DerivationPathType::NestedSegwit).address.starts_with("2"));

    keys.set_network(Network::Mainnet);
    BOOST_CHECK_EQUAL(keys.derive_address(DerivationPathType::NativeSegwit).address,
                      "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
}

BOOST_AUTO_TEST_CASE(default_addresses_per_purpose) {
    auto addresses = keys.get_addresses({AddressPurpose::Payment, AddressPurpose::Ordinals});
    BOOST_REQUIRE_EQUAL(addresses.size(), 2u);

    BOOST_CHECK(addresses[0].purpose == AddressPurpose::Payment);
    BOOST_CHECK(addresses[0].address_type == AddressType::P2wpkh);
    BOOST_CHECK_EQUAL(addresses[0].derivation_path, "m/84'/0'/0'/0/0");
    BOOST_CHECK_EQUAL(addresses[0].address, "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");

    BOOST_CHECK(addresses[1].purpose == AddressPurpose::Ordinals);
    BOOST_CHECK(addresses[1].address_type == AddressType::P2tr);
    BOOST_CHECK_EQUAL(addresses[1].derivation_path, "m/86'/0'/0'/0/0");
}

BOOST_AUTO_TEST_CASE(custom_paths_take_priority) {
    CustomPaths stored;
    stored.payment = "m/84'/0'/7'/0/2";
    keys.set_custom_paths(stored);

    auto addresses = keys.get_addresses({AddressPurpose::Payment, AddressPurpose::Ordinals});
    BOOST_CHECK_EQUAL(addresses[0].derivation_path, "m/84'/0'/7'/0/2");
    BOOST_CHECK_EQUAL(addresses[1].derivation_path, "m/86'/0'/0'/0/0");

    // Paths passed with the call win over the stored ones
    CustomPaths call_paths;
    call_paths.payment = "m/44'/0'/0'/0/3";
    auto overridden = keys.get_addresses({AddressPurpose::Payment}, call_paths);
    BOOST_CHECK_EQUAL(overridden[0].derivation_path, "m/44'/0'/0'/0/3");
    BOOST_CHECK(overridden[0].address_type == AddressType::P2pkh);

    // Account 7 lies outside the default scan, only the custom path finds it
    auto resolved = keys.find_address_path(addresses[0].address);
    BOOST_REQUIRE(resolved.has_value());
    BOOST_CHECK_EQUAL(resolved->path, "m/84'/0'/7'/0/2");
    BOOST_CHECK(resolved->type == AddressType::P2wpkh);
}

BOOST_AUTO_TEST_CASE(reverse_lookup_standard_paths) {
    for (DerivationPathType type : DerivationPaths::ALL_TYPES) {
        auto derived = keys.derive_address(type, 2, 1, 13);
        auto resolved = keys.find_address_path(derived.address);
        BOOST_REQUIRE(resolved.has_value());
        BOOST_CHECK_EQUAL(resolved->path, derived.path);
        BOOST_CHECK(resolved->type == derived.type);
    }
}

BOOST_AUTO_TEST_CASE(reverse_lookup_respects_window) {
    auto outside = keys.derive_address(DerivationPathType::NativeSegwit, 0, 0, 25);
    BOOST_CHECK(!keys.find_address_path(outside.address).has_value());

    AddressLookupUpdate update;
    update.receive_window = 30;
    keys.set_address_lookup_config(update);
    auto resolved = keys.find_address_path(outside.address);
    BOOST_REQUIRE(resolved.has_value());
    BOOST_CHECK_EQUAL(resolved->path, "m/84'/0'/0'/0/25");

    BOOST_CHECK(!keys.find_address_path("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4").has_value());
}

BOOST_AUTO_TEST_CASE(lookup_config_validation_and_clamping) {
    AddressLookupUpdate negative;
    negative.change_window = -1;
    check_key_error([&] { keys.set_address_lookup_config(negative); },
                    KeyError::ErrorType::InvalidLookupConfig);

    // A rejected update leaves the config untouched
    BOOST_CHECK_EQUAL(keys.address_lookup_config().change_window, 20u);

    AddressLookupUpdate huge;
    huge.max_account = 1000000;
    huge.receive_window = 5;
    keys.set_address_lookup_config(huge);
    auto config = keys.address_lookup_config();
    BOOST_CHECK_EQUAL(config.max_account, ADDRESS_LOOKUP_LIMITS.max_account);
    BOOST_CHECK_EQUAL(config.receive_window, 5u);
    BOOST_CHECK_EQUAL(config.change_window, 20u);
}

BOOST_AUTO_TEST_CASE(path_errors) {
    check_key_error([&] { keys.derive_address_from_path("m/45'/0'/0'/0/0"); },
                    KeyError::ErrorType::UnsupportedDerivationPurpose);
    check_key_error([&] { keys.derive_address_from_path("m/84/0'/0'/0/0"); },
                    KeyError::ErrorType::UnsupportedDerivationPurpose);
    check_key_error([&] { keys.derive_address_from_path("m/84'/x"); },
                    KeyError::ErrorType::InvalidDerivationPath);
    check_key_error([&] { keys.derive_address(DerivationPathType::NativeSegwit, 0, 2, 0); },
                    KeyError::ErrorType::InvalidDerivationPath);
}

BOOST_AUTO_TEST_CASE(derive_key_matches_address) {
    auto derived = keys.derive_address(DerivationPathType::NativeSegwit);
    KeyPair pair = keys.derive_key(derived.path);
    BOOST_CHECK(pair.public_key == derived.public_key);
    BOOST_CHECK(CurveUtils::derive_public_key(pair.private_key) == derived.public_key);
}

BOOST_AUTO_TEST_CASE(locked_manager_refuses_work) {
    BOOST_CHECK(keys.is_unlocked());
    BOOST_CHECK_EQUAL(keys.export_mnemonic(), ABANDON_MNEMONIC);

    CustomPaths stored;
    stored.ordinals = "m/86'/0'/3'/0/0";
    keys.set_custom_paths(stored);

    keys.lock();
    BOOST_CHECK(!keys.is_unlocked());
    BOOST_CHECK(keys.custom_paths().empty());
    check_key_error([&] { keys.derive_address(DerivationPathType::Taproot); },
                    KeyError::ErrorType::WalletLocked);
    check_key_error([&] { keys.find_address_path("bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu"); },
                    KeyError::ErrorType::WalletLocked);
    check_key_error([&] { keys.export_mnemonic(); }, KeyError::ErrorType::WalletLocked);
    check_key_error([&] { keys.derive_key("m/84'/0'/0'/0/0"); }, KeyError::ErrorType::WalletLocked);
}

BOOST_AUTO_TEST_CASE(rejects_invalid_mnemonic) {
    KeyManager fresh;
    check_key_error([&] { fresh.from_mnemonic("abandon abandon abandon"); },
                    KeyError::ErrorType::InvalidSeedPhrase);
    BOOST_CHECK(!fresh.is_unlocked());
}

BOOST_AUTO_TEST_SUITE_END()
