/**
 * Encrypted Storage Tests
 *
 * - Device-key and password modes
 * - Password lifecycle: set, change, remove
 * - Tamper detection and slot binding
 * - Failed commits leave the previous document in place
 * - File backend persistence
 */

#include <boost/test/unit_test.hpp>

#include "../error.hpp"
#include "../secure_storage.hpp"
#include "../storage_backend.hpp"
#include "test_util.hpp"
#include <filesystem>

using namespace zeldwallet;
using namespace zeldwallet::test;

namespace {

// Delegates to the real KDF and records the iteration count it was asked for
class RecordingKdf : public KeyDerivationFunction {
public:
    explicit RecordingKdf(std::shared_ptr<KeyDerivationFunction> inner) : inner_(std::move(inner)) {}

    std::string name() const override { return inner_->name(); }
    std::string hash() const override { return inner_->hash(); }

    SecureMemory derive(std::span<const uint8_t> password, std::span<const uint8_t> salt,
                        uint32_t iterations, size_t length) override {
        last_iterations = iterations;
        ++calls;
        return inner_->derive(password, salt, iterations, length);
    }

    uint32_t last_iterations = 0;
    int calls = 0;

private:
    std::shared_ptr<KeyDerivationFunction> inner_;
};

struct StorageFixture {
    std::shared_ptr<MemoryStorageBackend> backend = std::make_shared<MemoryStorageBackend>();

    std::unique_ptr<SecureStorage> open_storage() {
        return std::make_unique<SecureStorage>(backend, CryptoProvider::openssl(), TEST_ITERATIONS);
    }

    static std::string read_slot(SecureStorage& storage, const std::string& slot) {
        auto value = storage.get(slot);
        BOOST_REQUIRE(value.has_value());
        return value->to_string();
    }
};

template <typename Fn>
void check_storage_error(Fn&& fn, StorageError::ErrorType expected) {
    try {
        fn();
        BOOST_ERROR("Expected StorageError");
    } catch (const StorageError& e) {
        BOOST_CHECK(e.type() == expected);
    }
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(storage_tests, StorageFixture)

BOOST_AUTO_TEST_CASE(device_mode_roundtrip) {
    auto storage = open_storage();
    storage->init(std::nullopt);
    BOOST_CHECK(storage->is_open());
    BOOST_CHECK(!storage->has_password());
    BOOST_CHECK(!storage->exists());

    storage->set(SecureStorage::SLOT_MNEMONIC, bytes_of(ABANDON_MNEMONIC));
    BOOST_CHECK(storage->exists());
    BOOST_CHECK(!storage->get(SecureStorage::SLOT_PASSPHRASE).has_value());

    // The document holds ciphertext only
    std::string dumped = backend->load()->dump();
    BOOST_CHECK(dumped.find("abandon") == std::string::npos);
    BOOST_CHECK_EQUAL(backend->load()->at("meta").at("mode").get<std::string>(), "device");

    storage->close();
    BOOST_CHECK(!storage->is_open());
    check_storage_error([&] { storage->get(SecureStorage::SLOT_MNEMONIC); },
                        StorageError::ErrorType::StorageClosed);

    auto reopened = open_storage();
    reopened->init(std::nullopt, StorageInitOptions{true});
    BOOST_CHECK_EQUAL(read_slot(*reopened, SecureStorage::SLOT_MNEMONIC), ABANDON_MNEMONIC);
}

BOOST_AUTO_TEST_CASE(device_mode_ignores_password) {
    auto storage = open_storage();
    storage->init(std::nullopt);
    storage->set("note", bytes_of("hello"));

    auto reopened = open_storage();
    reopened->init(std::string("whatever"));
    BOOST_CHECK(!reopened->has_password());
    BOOST_CHECK_EQUAL(read_slot(*reopened, "note"), "hello");
}

BOOST_AUTO_TEST_CASE(password_mode_errors) {
    auto storage = open_storage();
    storage->init(STRONG_PASSWORD);
    storage->set(SecureStorage::SLOT_MNEMONIC, bytes_of(ABANDON_MNEMONIC));
    BOOST_CHECK(storage->has_password());
    BOOST_CHECK(!backend->load_device_key().has_value());

    auto reopened = open_storage();
    check_storage_error([&] { reopened->init(std::nullopt); }, StorageError::ErrorType::PasswordRequired);
    check_storage_error([&] { reopened->init(OTHER_STRONG_PASSWORD); }, StorageError::ErrorType::WrongPassword);
    BOOST_CHECK(!reopened->is_open());

    reopened->init(STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(read_slot(*reopened, SecureStorage::SLOT_MNEMONIC), ABANDON_MNEMONIC);

    // has_password works on a closed store too
    reopened->close();
    BOOST_CHECK(reopened->has_password());
}

BOOST_AUTO_TEST_CASE(read_only_never_creates) {
    auto storage = open_storage();
    check_storage_error([&] { storage->init(std::nullopt, StorageInitOptions{true}); },
                        StorageError::ErrorType::NoWallet);
    BOOST_CHECK(!backend->load().has_value());
    BOOST_CHECK(!storage->exists());
    BOOST_CHECK(!storage->has_password());
}

BOOST_AUTO_TEST_CASE(tampered_slot_fails) {
    auto storage = open_storage();
    storage->init(STRONG_PASSWORD);
    storage->set(SecureStorage::SLOT_MNEMONIC, bytes_of(ABANDON_MNEMONIC));

    auto document = *backend->load();
    auto data = document["slots"][SecureStorage::SLOT_MNEMONIC]["data"].get<std::string>();
    data[4] = data[4] == 'A' ? 'B' : 'A';
    document["slots"][SecureStorage::SLOT_MNEMONIC]["data"] = data;
    backend->commit(document);

    auto reopened = open_storage();
    reopened->init(STRONG_PASSWORD);
    check_storage_error([&] { reopened->get(SecureStorage::SLOT_MNEMONIC); },
                        StorageError::ErrorType::DecryptionFailed);
}

BOOST_AUTO_TEST_CASE(slots_are_bound_to_their_names) {
    auto storage = open_storage();
    storage->init(STRONG_PASSWORD);
    storage->set(SecureStorage::SLOT_MNEMONIC, bytes_of(ABANDON_MNEMONIC));
    storage->set(SecureStorage::SLOT_PASSPHRASE, bytes_of("TREZOR"));

    // Moving a valid blob under another name must not decrypt
    auto document = *backend->load();
    document["slots"][SecureStorage::SLOT_PASSPHRASE] = document["slots"][SecureStorage::SLOT_MNEMONIC];
    backend->commit(document);

    auto reopened = open_storage();
    reopened->init(STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(read_slot(*reopened, SecureStorage::SLOT_MNEMONIC), ABANDON_MNEMONIC);
    check_storage_error([&] { reopened->get(SecureStorage::SLOT_PASSPHRASE); },
                        StorageError::ErrorType::DecryptionFailed);
}

BOOST_AUTO_TEST_CASE(corrupt_document_reported) {
    backend->commit(nlohmann::json{{"version", 7}, {"meta", nlohmann::json::object()}});
    auto storage = open_storage();
    check_storage_error([&] { storage->init(STRONG_PASSWORD); }, StorageError::ErrorType::StorageFailure);
}

BOOST_AUTO_TEST_CASE(set_password_removes_device_key) {
    auto storage = open_storage();
    storage->init(std::nullopt);
    storage->set(SecureStorage::SLOT_MNEMONIC, bytes_of(ABANDON_MNEMONIC));
    BOOST_CHECK(backend->load_device_key().has_value());

    storage->set_password(STRONG_PASSWORD);
    BOOST_CHECK(storage->has_password());
    BOOST_CHECK(!backend->load_device_key().has_value());
    BOOST_CHECK_EQUAL(read_slot(*storage, SecureStorage::SLOT_MNEMONIC), ABANDON_MNEMONIC);
    check_storage_error([&] { storage->set_password(OTHER_STRONG_PASSWORD); },
                        StorageError::ErrorType::PasswordAlreadySet);

    auto reopened = open_storage();
    check_storage_error([&] { reopened->init(std::nullopt); }, StorageError::ErrorType::PasswordRequired);
    reopened->init(STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(read_slot(*reopened, SecureStorage::SLOT_MNEMONIC), ABANDON_MNEMONIC);
}

BOOST_AUTO_TEST_CASE(change_password_rewraps_everything) {
    auto storage = open_storage();
    storage->init(STRONG_PASSWORD);
    storage->set(SecureStorage::SLOT_MNEMONIC, bytes_of(ABANDON_MNEMONIC));
    storage->set(SecureStorage::SLOT_CONFIG, bytes_of("{}"));

    check_storage_error([&] { storage->change_password(OTHER_STRONG_PASSWORD, "x"); },
                        StorageError::ErrorType::WrongPassword);

    storage->change_password(STRONG_PASSWORD, OTHER_STRONG_PASSWORD, 2000u);
    BOOST_CHECK_EQUAL(storage->pbkdf2_iterations(), 2000u);

    auto reopened = open_storage();
    check_storage_error([&] { reopened->init(STRONG_PASSWORD); }, StorageError::ErrorType::WrongPassword);
    reopened->init(OTHER_STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(read_slot(*reopened, SecureStorage::SLOT_MNEMONIC), ABANDON_MNEMONIC);
    BOOST_CHECK_EQUAL(read_slot(*reopened, SecureStorage::SLOT_CONFIG), "{}");
}

BOOST_AUTO_TEST_CASE(remove_password_returns_to_device_key) {
    auto storage = open_storage();
    storage->init(STRONG_PASSWORD);
    storage->set(SecureStorage::SLOT_MNEMONIC, bytes_of(ABANDON_MNEMONIC));

    check_storage_error([&] { storage->remove_password(OTHER_STRONG_PASSWORD); },
                        StorageError::ErrorType::WrongPassword);
    storage->remove_password(STRONG_PASSWORD);
    BOOST_CHECK(!storage->has_password());
    BOOST_CHECK(backend->load_device_key().has_value());
    BOOST_CHECK(!backend->load()->at("meta").contains("kdf"));

    check_storage_error([&] { storage->remove_password(STRONG_PASSWORD); },
                        StorageError::ErrorType::PasswordNotSet);
    check_storage_error([&] { storage->change_password(STRONG_PASSWORD, OTHER_STRONG_PASSWORD); },
                        StorageError::ErrorType::PasswordNotSet);

    auto reopened = open_storage();
    reopened->init(std::nullopt);
    BOOST_CHECK_EQUAL(read_slot(*reopened, SecureStorage::SLOT_MNEMONIC), ABANDON_MNEMONIC);
}

BOOST_AUTO_TEST_CASE(failed_commit_keeps_previous_state) {
    auto storage = open_storage();
    storage->init(STRONG_PASSWORD);
    storage->set(SecureStorage::SLOT_MNEMONIC, bytes_of(ABANDON_MNEMONIC));

    backend->fail_next_commits(1);
    check_storage_error([&] { storage->set(SecureStorage::SLOT_CONFIG, bytes_of("{}")); },
                        StorageError::ErrorType::StorageFailure);
    BOOST_CHECK(!storage->get(SecureStorage::SLOT_CONFIG).has_value());

    backend->fail_next_commits(1);
    check_storage_error([&] { storage->change_password(STRONG_PASSWORD, OTHER_STRONG_PASSWORD); },
                        StorageError::ErrorType::StorageFailure);

    // The old password still opens both the live and the persisted store
    BOOST_CHECK_EQUAL(read_slot(*storage, SecureStorage::SLOT_MNEMONIC), ABANDON_MNEMONIC);
    auto reopened = open_storage();
    reopened->init(STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(read_slot(*reopened, SecureStorage::SLOT_MNEMONIC), ABANDON_MNEMONIC);
}

BOOST_AUTO_TEST_CASE(failed_device_store_creation_drops_key) {
    auto storage = open_storage();
    backend->fail_next_commits(1);
    check_storage_error([&] { storage->init(std::nullopt); }, StorageError::ErrorType::StorageFailure);
    BOOST_CHECK(!backend->load().has_value());
    BOOST_CHECK(!backend->load_device_key().has_value());
    BOOST_CHECK(!storage->is_open());
}

BOOST_AUTO_TEST_CASE(remove_and_clear) {
    auto storage = open_storage();
    storage->init(std::nullopt);
    storage->set(SecureStorage::SLOT_MNEMONIC, bytes_of(ABANDON_MNEMONIC));
    storage->set(SecureStorage::SLOT_PASSPHRASE, bytes_of("pp"));

    storage->remove(SecureStorage::SLOT_PASSPHRASE);
    BOOST_CHECK(!storage->get(SecureStorage::SLOT_PASSPHRASE).has_value());

    storage->clear();
    BOOST_CHECK(!storage->is_open());
    BOOST_CHECK(!storage->exists());
    BOOST_CHECK(!backend->load().has_value());
    BOOST_CHECK(!backend->load_device_key().has_value());
}

BOOST_AUTO_TEST_CASE(backup_marker) {
    auto storage = open_storage();
    BOOST_CHECK(!storage->has_backup());

    storage->init(STRONG_PASSWORD);
    BOOST_CHECK(!storage->has_backup());
    storage->mark_backup_completed(1700000000000);
    BOOST_CHECK(storage->has_backup());

    // Also readable and writable while closed
    storage->close();
    BOOST_CHECK(storage->has_backup());
    BOOST_CHECK_EQUAL(backend->load()->at("meta").at("backupCompletedAt").get<int64_t>(), 1700000000000);
}

BOOST_AUTO_TEST_CASE(iterations_reach_the_kdf) {
    auto crypto = CryptoProvider::openssl();
    auto recording = std::make_shared<RecordingKdf>(crypto.kdf);
    crypto.kdf = recording;

    SecureStorage storage(backend, crypto, 1500);
    BOOST_CHECK_EQUAL(storage.pbkdf2_iterations(), 1500u);
    storage.init(STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(recording->last_iterations, 1500u);
    BOOST_CHECK_EQUAL(backend->load()->at("meta").at("kdf").at("iterations").get<uint32_t>(), 1500u);

    // Reopening uses the stored count, not the configured one
    SecureStorage other(backend, crypto, 4000);
    other.init(STRONG_PASSWORD);
    BOOST_CHECK_EQUAL(recording->last_iterations, 1500u);
    BOOST_CHECK_EQUAL(other.pbkdf2_iterations(), 1500u);

    BOOST_CHECK_THROW(SecureStorage(backend, crypto, 0), StorageError);
    BOOST_CHECK_THROW(SecureStorage(backend, crypto, MAX_PBKDF2_ITERATIONS + 1), StorageError);
}

BOOST_AUTO_TEST_CASE(stored_iterations_are_bounded) {
    open_storage()->init(STRONG_PASSWORD);
    nlohmann::json original = *backend->load();

    auto crypto = CryptoProvider::openssl();
    auto recording = std::make_shared<RecordingKdf>(crypto.kdf);
    crypto.kdf = recording;

    std::vector<nlohmann::json> bad_counts = {
        nlohmann::json(4294967297ULL),
        nlohmann::json(MAX_PBKDF2_ITERATIONS + 1),
        nlohmann::json(-1000),
        nlohmann::json(1500.5),
        nlohmann::json("1500"),
    };
    for (const auto& count : bad_counts) {
        nlohmann::json tampered = original;
        tampered["meta"]["kdf"]["iterations"] = count;
        backend->commit(tampered);

        SecureStorage storage(backend, crypto, TEST_ITERATIONS);
        check_storage_error([&] { storage.init(STRONG_PASSWORD); }, StorageError::ErrorType::StorageFailure);
        check_storage_error([&] { storage.pbkdf2_iterations(); }, StorageError::ErrorType::StorageFailure);
    }
    BOOST_CHECK_EQUAL(recording->calls, 0);

    // The bound itself is still accepted
    nlohmann::json at_limit = original;
    at_limit["meta"]["kdf"]["iterations"] = MAX_PBKDF2_ITERATIONS;
    backend->commit(at_limit);
    SecureStorage storage(backend, crypto, TEST_ITERATIONS);
    BOOST_CHECK_EQUAL(storage.pbkdf2_iterations(), MAX_PBKDF2_ITERATIONS);
}

BOOST_AUTO_TEST_CASE(file_backend_persists) {
    auto path = std::filesystem::temp_directory_path() / "zeldwallet_storage_test.json";
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + ".key");

    {
        SecureStorage storage(std::make_shared<FileStorageBackend>(path), CryptoProvider::openssl(),
                              TEST_ITERATIONS);
        storage.init(std::nullopt);
        storage.set(SecureStorage::SLOT_MNEMONIC, bytes_of(ABANDON_MNEMONIC));
    }
    BOOST_CHECK(std::filesystem::exists(path));
    BOOST_CHECK(std::filesystem::exists(path.string() + ".key"));

    {
        SecureStorage storage(std::make_shared<FileStorageBackend>(path), CryptoProvider::openssl(),
                              TEST_ITERATIONS);
        storage.init(std::nullopt, StorageInitOptions{true});
        BOOST_CHECK_EQUAL(read_slot(storage, SecureStorage::SLOT_MNEMONIC), ABANDON_MNEMONIC);
        storage.clear();
    }
    BOOST_CHECK(!std::filesystem::exists(path));
    BOOST_CHECK(!std::filesystem::exists(path.string() + ".key"));
}

BOOST_AUTO_TEST_SUITE_END()
