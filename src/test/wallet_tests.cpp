/**
 * Wallet Session Tests
 *
 * - Create, restore, unlock and lock lifecycle
 * - Password management and passphrase checks on unlock
 * - Backup export and import
 * - Network persistence and event delivery
 * - Process-wide DefaultWallet
 */

#include <boost/test/unit_test.hpp>

#include "../default_wallet.hpp"
#include "../error.hpp"
#include "../wallet.hpp"
#include "test_util.hpp"
#include <algorithm>
#include <stdexcept>

using namespace zeldwallet;
using namespace zeldwallet::test;

namespace {

const std::string ABANDON_NATIVE = "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu";
const std::string ABANDON_TAPROOT = "bc1p5cyxnuxmeuwuvkwfem96lqzszd02n6xdcjrs20cac6yqjjwudpxqkedrcr";

struct WalletFixture {
    std::shared_ptr<MemoryStorageBackend> backend = std::make_shared<MemoryStorageBackend>();
    Wallet wallet{memory_wallet_options(backend)};

    std::string payment_address() {
        return wallet.get_addresses({AddressPurpose::Payment}).at(0).address;
    }
};

template <typename Fn>
void check_wallet_error(Fn&& fn, WalletError::ErrorType expected) {
    try {
        fn();
        BOOST_ERROR("Expected WalletError");
    } catch (const WalletError& e) {
        BOOST_CHECK_MESSAGE(e.type() == expected, e.what());
    }
}

template <typename Fn>
void check_storage_error(Fn&& fn, StorageError::ErrorType expected) {
    try {
        fn();
        BOOST_ERROR("Expected StorageError");
    } catch (const StorageError& e) {
        BOOST_CHECK_MESSAGE(e.type() == expected, e.what());
    }
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(wallet_tests, WalletFixture)

BOOST_AUTO_TEST_CASE(create_unlock_lock) {
    BOOST_CHECK(!wallet.exists());
    BOOST_CHECK(!wallet.is_unlocked());

    std::string mnemonic = wallet.create(STRONG_PASSWORD);
    BOOST_CHECK(Mnemonic::validate(mnemonic));
    BOOST_CHECK_EQUAL(std::count(mnemonic.begin(), mnemonic.end(), ' '), 11);
    BOOST_CHECK(wallet.exists());
    BOOST_CHECK(wallet.is_unlocked());
    BOOST_CHECK(wallet.has_password());
    BOOST_CHECK_EQUAL(wallet.export_mnemonic(), mnemonic);
    std::string address = payment_address();

    wallet.lock();
    BOOST_CHECK(!wallet.is_unlocked());
    check_wallet_error([&] { payment_address(); }, WalletError::ErrorType::WalletLocked);
    check_wallet_error([&] { wallet.export_mnemonic(); }, WalletError::ErrorType::WalletLocked);
    check_wallet_error([&] { wallet.sign_message("m", address); }, WalletError::ErrorType::WalletLocked);

    check_storage_error([&] { wallet.unlock(); }, StorageError::ErrorType::PasswordRequired);
    check_storage_error([&] { wallet.unlock(OTHER_STRONG_PASSWORD); }, StorageError::ErrorType::WrongPassword);
    BOOST_CHECK(!wallet.is_unlocked());

    wallet.unlock(STRONG_PASSWORD);
    BOOST_CHECK(wallet.is_unlocked());
    BOOST_CHECK_EQUAL(payment_address(), address);
    BOOST_CHECK_EQUAL(wallet.export_mnemonic(), mnemonic);
}

BOOST_AUTO_TEST_CASE(create_with_24_words) {
    std::string mnemonic = wallet.create(STRONG_PASSWORD, std::nullopt, Mnemonic::Strength::Words24);
    BOOST_CHECK_EQUAL(std::count(mnemonic.begin(), mnemonic.end(), ' '), 23);
}

BOOST_AUTO_TEST_CASE(device_key_wallet) {
    wallet.restore(ABANDON_MNEMONIC);
    BOOST_CHECK(!wallet.has_password());
    BOOST_CHECK_EQUAL(payment_address(), ABANDON_NATIVE);

    wallet.lock();
    wallet.unlock();
    BOOST_CHECK_EQUAL(payment_address(), ABANDON_NATIVE);

    // A supplied password is ignored by a device-key store
    wallet.lock();
    wallet.unlock(STRONG_PASSWORD);
    BOOST_CHECK(wallet.is_unlocked());

    // An empty password means none
    wallet.destroy();
    wallet.create(std::string());
    BOOST_CHECK(!wallet.has_password());
}

BOOST_AUTO_TEST_CASE(existing_wallet_is_protected) {
    wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD);
    check_storage_error([&] { wallet.create(STRONG_PASSWORD); }, StorageError::ErrorType::WalletExists);
    check_storage_error([&] { wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD); },
                        StorageError::ErrorType::WalletExists);

    wallet.destroy();
    BOOST_CHECK(!wallet.exists());
    BOOST_CHECK(!wallet.is_unlocked());
    check_storage_error([&] { wallet.unlock(STRONG_PASSWORD); }, StorageError::ErrorType::NoWallet);
}

BOOST_AUTO_TEST_CASE(weak_passwords_rejected) {
    check_wallet_error([&] { wallet.create(std::string("short")); }, WalletError::ErrorType::WeakPassword);
    check_wallet_error([&] { wallet.restore(ABANDON_MNEMONIC, std::string("password123!")); },
                       WalletError::ErrorType::WeakPassword);
    BOOST_CHECK(!wallet.exists());

    wallet.restore(ABANDON_MNEMONIC);
    check_wallet_error([&] { wallet.set_password("alllowercaseletters"); }, WalletError::ErrorType::WeakPassword);
    check_wallet_error([&] { wallet.set_password("   "); }, WalletError::ErrorType::WeakPassword);
    BOOST_CHECK(!wallet.has_password());
}

BOOST_AUTO_TEST_CASE(policy_can_be_relaxed) {
    WalletOptions options = memory_wallet_options(std::make_shared<MemoryStorageBackend>());
    options.enforce_password_policy = false;
    Wallet relaxed(options);
    relaxed.create(std::string("short"));
    BOOST_CHECK(relaxed.has_password());
}

BOOST_AUTO_TEST_CASE(invalid_mnemonic_rejected) {
    BOOST_CHECK_THROW(wallet.restore("abandon abandon abandon"), KeyError);
    BOOST_CHECK(!wallet.exists());
}

BOOST_AUTO_TEST_CASE(mnemonic_passphrase) {
    wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD, std::string("TREZOR"));
    std::string with_passphrase = payment_address();
    BOOST_CHECK_NE(with_passphrase, ABANDON_NATIVE);

    wallet.lock();
    check_wallet_error([&] { wallet.unlock(STRONG_PASSWORD, std::string("trezor")); },
                       WalletError::ErrorType::PassphraseMismatch);
    BOOST_CHECK(!wallet.is_unlocked());

    // The stored passphrase is used when none is given
    wallet.unlock(STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(payment_address(), with_passphrase);
    wallet.lock();
    wallet.unlock(STRONG_PASSWORD, std::string("TREZOR"));
    BOOST_CHECK_EQUAL(payment_address(), with_passphrase);
}

BOOST_AUTO_TEST_CASE(passphrase_accepted_in_either_normalization_form) {
    wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD, std::string("caf\xC3\xA9"));
    std::string address = payment_address();

    wallet.lock();
    wallet.unlock(STRONG_PASSWORD, std::string("cafe\xCC\x81"));
    BOOST_CHECK_EQUAL(payment_address(), address);
}

BOOST_AUTO_TEST_CASE(passphrase_given_for_wallet_without_one) {
    wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD);
    wallet.lock();
    check_wallet_error([&] { wallet.unlock(STRONG_PASSWORD, std::string("extra")); },
                       WalletError::ErrorType::PassphraseMismatch);

    // Blank is the same as none
    wallet.unlock(STRONG_PASSWORD, std::string("  "));
    BOOST_CHECK_EQUAL(payment_address(), ABANDON_NATIVE);
}

BOOST_AUTO_TEST_CASE(password_lifecycle) {
    wallet.restore(ABANDON_MNEMONIC);
    wallet.set_password(STRONG_PASSWORD);
    BOOST_CHECK(wallet.has_password());

    wallet.change_password(STRONG_PASSWORD, OTHER_STRONG_PASSWORD);
    wallet.lock();
    check_storage_error([&] { wallet.unlock(STRONG_PASSWORD); }, StorageError::ErrorType::WrongPassword);
    wallet.unlock(OTHER_STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(payment_address(), ABANDON_NATIVE);

    check_wallet_error([&] { wallet.remove_password(" "); }, WalletError::ErrorType::InvalidArgument);
    check_storage_error([&] { wallet.remove_password(STRONG_PASSWORD); }, StorageError::ErrorType::WrongPassword);
    wallet.remove_password(OTHER_STRONG_PASSWORD);
    BOOST_CHECK(!wallet.has_password());

    wallet.lock();
    wallet.unlock();
    BOOST_CHECK_EQUAL(payment_address(), ABANDON_NATIVE);
}

BOOST_AUTO_TEST_CASE(default_addresses) {
    wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD);
    auto addresses = wallet.get_addresses({AddressPurpose::Payment, AddressPurpose::Ordinals});
    BOOST_REQUIRE_EQUAL(addresses.size(), 2u);
    BOOST_CHECK_EQUAL(addresses[0].address, ABANDON_NATIVE);
    BOOST_CHECK(addresses[0].address_type == AddressType::P2wpkh);
    BOOST_CHECK_EQUAL(addresses[0].derivation_path, "m/84'/0'/0'/0/0");
    BOOST_CHECK_EQUAL(addresses[1].address, ABANDON_TAPROOT);
    BOOST_CHECK(addresses[1].address_type == AddressType::P2tr);
    BOOST_CHECK_EQUAL(addresses[1].derivation_path, "m/86'/0'/0'/0/0");
}

BOOST_AUTO_TEST_CASE(custom_paths_from_restore) {
    CustomPaths paths;
    paths.payment = "m/84'/0'/7'/0/2";
    wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD, std::nullopt, paths);

    auto payment = wallet.get_addresses({AddressPurpose::Payment}).at(0);
    BOOST_CHECK_EQUAL(payment.derivation_path, "m/84'/0'/7'/0/2");
    BOOST_CHECK_NE(payment.address, ABANDON_NATIVE);
    BOOST_CHECK_EQUAL(wallet.get_addresses({AddressPurpose::Ordinals}).at(0).address, ABANDON_TAPROOT);

    // Stored with the wallet
    wallet.lock();
    wallet.unlock(STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(payment_address(), payment.address);

    // Custom addresses are signable
    std::string signature = wallet.sign_message("hello", payment.address);
    BOOST_CHECK(wallet.verify_message("hello", payment.address, signature));
}

BOOST_AUTO_TEST_CASE(invalid_custom_paths_rejected) {
    CustomPaths bad_purpose;
    bad_purpose.payment = "m/45'/0'/0'/0/0";
    BOOST_CHECK_THROW(wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD, std::nullopt, bad_purpose), KeyError);

    CustomPaths garbage;
    garbage.ordinals = "m/86'/zero";
    BOOST_CHECK_THROW(wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD, std::nullopt, garbage), KeyError);
    BOOST_CHECK(!wallet.exists());
}

BOOST_AUTO_TEST_CASE(network_persists_across_sessions) {
    wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD);
    wallet.set_network(Network::Testnet);
    BOOST_CHECK(wallet.network() == Network::Testnet);
    std::string testnet_address = payment_address();
    BOOST_CHECK(testnet_address.starts_with("tb1q"));

    Wallet second(memory_wallet_options(backend));
    BOOST_CHECK(second.network() == Network::Mainnet);
    second.unlock(STRONG_PASSWORD);
    BOOST_CHECK(second.network() == Network::Testnet);
    BOOST_CHECK_EQUAL(second.get_addresses({AddressPurpose::Payment}).at(0).address, testnet_address);
}

BOOST_AUTO_TEST_CASE(network_change_rolls_back_on_failed_write) {
    wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD);
    int network_events = 0;
    wallet.on(WalletEvent::NetworkChanged, [&](const WalletEventData&) { ++network_events; });

    backend->fail_next_commits(1);
    check_wallet_error([&] { wallet.set_network(Network::Testnet); },
                       WalletError::ErrorType::NetworkPersistFailure);
    BOOST_CHECK(wallet.network() == Network::Mainnet);
    BOOST_CHECK_EQUAL(payment_address(), ABANDON_NATIVE);
    BOOST_CHECK_EQUAL(network_events, 0);

    wallet.lock();
    wallet.unlock(STRONG_PASSWORD);
    BOOST_CHECK(wallet.network() == Network::Mainnet);
}

BOOST_AUTO_TEST_CASE(events) {
    int unlocks = 0;
    int locks = 0;
    std::vector<WalletEventData> network_changes;
    std::vector<AddressInfo> accounts;

    // A failing handler does not stop the others or the operation
    wallet.on(WalletEvent::Unlock, [](const WalletEventData&) { throw std::runtime_error("handler failed"); });
    uint64_t unlock_id = wallet.on(WalletEvent::Unlock, [&](const WalletEventData&) { ++unlocks; });
    wallet.on(WalletEvent::Lock, [&](const WalletEventData&) { ++locks; });
    wallet.on(WalletEvent::NetworkChanged, [&](const WalletEventData& data) { network_changes.push_back(data); });
    wallet.on(WalletEvent::AccountsChanged, [&](const WalletEventData& data) { accounts = data.accounts; });

    wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD);
    BOOST_CHECK(wallet.is_unlocked());
    BOOST_CHECK_EQUAL(unlocks, 1);
    BOOST_REQUIRE_EQUAL(accounts.size(), 2u);
    BOOST_CHECK_EQUAL(accounts[0].address, ABANDON_NATIVE);
    BOOST_CHECK_EQUAL(accounts[1].address, ABANDON_TAPROOT);

    wallet.set_network(Network::Testnet);
    BOOST_REQUIRE_EQUAL(network_changes.size(), 1u);
    BOOST_CHECK(network_changes[0].network == Network::Testnet);
    BOOST_CHECK(accounts[0].address.starts_with("tb1q"));

    // Setting the current network is a no-op
    wallet.set_network(Network::Testnet);
    BOOST_CHECK_EQUAL(network_changes.size(), 1u);

    wallet.lock();
    BOOST_CHECK_EQUAL(locks, 1);

    wallet.off(WalletEvent::Unlock, unlock_id);
    wallet.unlock(STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(unlocks, 1);
    BOOST_CHECK_EQUAL(std::string(to_string(WalletEvent::AccountsChanged)), "accountsChanged");
}

BOOST_AUTO_TEST_CASE(lookup_config_passthrough) {
    AddressLookupUpdate update;
    update.receive_window = 500;
    wallet.set_address_lookup_config(update);
    BOOST_CHECK_EQUAL(wallet.address_lookup_config().receive_window, ADDRESS_LOOKUP_LIMITS.receive_window);
    BOOST_CHECK_EQUAL(wallet.address_lookup_config().max_account, 4u);
}

BOOST_AUTO_TEST_CASE(backup_requires_password) {
    wallet.restore(ABANDON_MNEMONIC);
    check_storage_error([&] { wallet.export_backup(OTHER_STRONG_PASSWORD); },
                        StorageError::ErrorType::BackupRequiresPassword);

    wallet.set_password(STRONG_PASSWORD);
    check_wallet_error([&] { wallet.export_backup("weak"); }, WalletError::ErrorType::WeakPassword);
}

BOOST_AUTO_TEST_CASE(backup_roundtrip) {
    CustomPaths paths;
    paths.ordinals = "m/86'/0'/3'/0/0";
    wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD, std::string("TREZOR"), paths);
    wallet.set_network(Network::Testnet);
    auto original = wallet.get_addresses({AddressPurpose::Payment, AddressPurpose::Ordinals});

    BOOST_CHECK(!wallet.has_backup());
    std::string backup = wallet.export_backup(OTHER_STRONG_PASSWORD);
    BOOST_CHECK(wallet.has_backup());

    auto other_backend = std::make_shared<MemoryStorageBackend>();
    Wallet restored(memory_wallet_options(other_backend));
    int network_events = 0;
    restored.on(WalletEvent::NetworkChanged, [&](const WalletEventData&) { ++network_events; });

    restored.import_backup(backup, OTHER_STRONG_PASSWORD, STRONG_PASSWORD);
    BOOST_CHECK(restored.is_unlocked());
    BOOST_CHECK(restored.has_backup());
    BOOST_CHECK(restored.network() == Network::Testnet);
    BOOST_CHECK_EQUAL(network_events, 1);
    BOOST_CHECK_EQUAL(restored.export_mnemonic(), ABANDON_MNEMONIC);

    auto imported = restored.get_addresses({AddressPurpose::Payment, AddressPurpose::Ordinals});
    BOOST_REQUIRE_EQUAL(imported.size(), original.size());
    for (size_t i = 0; i < imported.size(); ++i) {
        BOOST_CHECK_EQUAL(imported[i].address, original[i].address);
        BOOST_CHECK_EQUAL(imported[i].derivation_path, original[i].derivation_path);
    }

    // The imported wallet is protected by the new wallet password
    restored.lock();
    restored.unlock(STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(restored.get_addresses({AddressPurpose::Payment}).at(0).address, original[0].address);
}

BOOST_AUTO_TEST_CASE(import_refuses_to_overwrite) {
    wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD);
    std::string backup = wallet.export_backup(OTHER_STRONG_PASSWORD);

    check_storage_error([&] { wallet.import_backup(backup, OTHER_STRONG_PASSWORD, STRONG_PASSWORD); },
                        StorageError::ErrorType::WalletExists);
    BOOST_CHECK(wallet.is_unlocked());

    ImportBackupOptions overwrite;
    overwrite.overwrite = true;
    wallet.import_backup(backup, OTHER_STRONG_PASSWORD, OTHER_STRONG_PASSWORD, overwrite);
    wallet.lock();
    wallet.unlock(OTHER_STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(payment_address(), ABANDON_NATIVE);
}

BOOST_AUTO_TEST_CASE(bad_backup_leaves_existing_wallet) {
    std::string mnemonic = wallet.create(STRONG_PASSWORD);
    std::string address = payment_address();

    Wallet source(memory_wallet_options(std::make_shared<MemoryStorageBackend>()));
    source.restore(ABANDON_MNEMONIC, STRONG_PASSWORD);
    std::string backup = source.export_backup(OTHER_STRONG_PASSWORD);

    // Corrupt the MAC inside the envelope
    auto document = Base64::decode(backup);
    nlohmann::json envelope = nlohmann::json::parse(document.begin(), document.end());
    auto mac = Base64::decode(envelope["mac"].get<std::string>());
    mac[0] ^= 0x01;
    envelope["mac"] = Base64::encode(mac);
    std::string tampered = envelope.dump();

    ImportBackupOptions overwrite;
    overwrite.overwrite = true;
    check_storage_error([&] { wallet.import_backup(tampered, OTHER_STRONG_PASSWORD, STRONG_PASSWORD, overwrite); },
                        StorageError::ErrorType::BackupIntegrityFailure);
    check_storage_error([&] { wallet.import_backup(backup, STRONG_PASSWORD, STRONG_PASSWORD, overwrite); },
                        StorageError::ErrorType::BackupIntegrityFailure);
    check_storage_error([&] { wallet.import_backup("garbage", OTHER_STRONG_PASSWORD, STRONG_PASSWORD, overwrite); },
                        StorageError::ErrorType::BackupFormatInvalid);

    BOOST_CHECK(wallet.is_unlocked());
    wallet.lock();
    wallet.unlock(STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(wallet.export_mnemonic(), mnemonic);
    BOOST_CHECK_EQUAL(payment_address(), address);
}

BOOST_AUTO_TEST_CASE(backup_marker) {
    wallet.restore(ABANDON_MNEMONIC, STRONG_PASSWORD);
    BOOST_CHECK(!wallet.has_backup());
    wallet.mark_backup_completed();
    BOOST_CHECK(wallet.has_backup());
}

BOOST_AUTO_TEST_SUITE_END()

namespace {

struct DefaultWalletFixture {
    std::shared_ptr<MemoryStorageBackend> backend = std::make_shared<MemoryStorageBackend>();

    DefaultWalletFixture() {
        DefaultWallet::reset();
        DefaultWallet::configure(memory_wallet_options(backend));
    }
    ~DefaultWalletFixture() {
        DefaultWallet::reset();
        DefaultWallet::configure(WalletOptions{});
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(default_wallet_tests, DefaultWalletFixture)

BOOST_AUTO_TEST_CASE(shared_instance) {
    BOOST_CHECK(!DefaultWallet::exists());
    DefaultWallet::restore(ABANDON_MNEMONIC, STRONG_PASSWORD);
    BOOST_CHECK(&DefaultWallet::instance() == &DefaultWallet::instance());
    BOOST_CHECK_EQUAL(DefaultWallet::get_addresses({AddressPurpose::Payment}).at(0).address, ABANDON_NATIVE);

    // A fresh instance over the same store starts locked
    DefaultWallet::reset();
    BOOST_CHECK(DefaultWallet::exists());
    BOOST_CHECK(!DefaultWallet::is_unlocked());
    DefaultWallet::unlock(STRONG_PASSWORD);
    BOOST_CHECK(DefaultWallet::is_unlocked());

    DefaultWallet::lock();
    BOOST_CHECK(!DefaultWallet::is_unlocked());
}

BOOST_AUTO_TEST_SUITE_END()
