#include "secure_storage.hpp"
#include "base64.hpp"
#include "error.hpp"
#include "logging.hpp"
#include <chrono>

namespace zeldwallet {

namespace {

constexpr int DOCUMENT_VERSION = 1;
constexpr size_t SALT_SIZE = 16;
constexpr const char* VERIFIER_PLAINTEXT = "zeldwallet-key-check";
constexpr const char* VERIFIER_AAD = "verifier";
constexpr const char* MODE_PASSWORD = "password";
constexpr const char* MODE_DEVICE = "device";

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::span<const uint8_t> as_bytes(const std::string& value) {
    return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
}

[[noreturn]] void corrupt(const std::string& detail) {
    throw StorageError(StorageError::ErrorType::StorageFailure, "Wallet document is corrupt: " + detail);
}

void check_iterations(uint32_t iterations) {
    if (iterations == 0 || iterations > MAX_PBKDF2_ITERATIONS) {
        throw StorageError(StorageError::ErrorType::StorageFailure,
                           "PBKDF2 iterations must be between 1 and " + std::to_string(MAX_PBKDF2_ITERATIONS));
    }
}

// Rounds recorded in a password-mode document
uint32_t stored_iterations(const nlohmann::json& kdf) {
    const auto& value = kdf.at("iterations");
    if (!value.is_number_unsigned()) {
        corrupt("bad KDF iterations");
    }
    uint64_t iterations = value.get<uint64_t>();
    if (iterations == 0 || iterations > MAX_PBKDF2_ITERATIONS) {
        corrupt("KDF iterations out of range: " + std::to_string(iterations));
    }
    return static_cast<uint32_t>(iterations);
}

bool is_password_mode(const nlohmann::json& document) {
    return document.at("meta").at("mode").get<std::string>() == MODE_PASSWORD;
}

} // namespace

SecureStorage::SecureStorage(std::shared_ptr<StorageBackend> backend, CryptoProvider crypto,
                             uint32_t iterations)
    : backend_(std::move(backend))
    , crypto_(std::move(crypto))
    , iterations_(iterations)
{
    check_iterations(iterations_);
    if (iterations_ < DEFAULT_PBKDF2_ITERATIONS) {
        LogPrintStorage(WARN, "PBKDF2 iteration count %u is below the recommended %u",
                        iterations_, DEFAULT_PBKDF2_ITERATIONS);
    }
}

SecureStorage::~SecureStorage() {
    close();
}

void SecureStorage::require_open() const {
    if (!is_open()) {
        throw StorageError(StorageError::ErrorType::StorageClosed, "Storage is locked");
    }
}

nlohmann::json SecureStorage::load_document() {
    auto document = backend_->load();
    if (!document) {
        throw StorageError(StorageError::ErrorType::NoWallet, "No wallet stored");
    }
    try {
        if (document->at("version").get<int>() != DOCUMENT_VERSION) {
            corrupt("unsupported version");
        }
        const auto& meta = document->at("meta");
        std::string mode = meta.at("mode").get<std::string>();
        if (mode != MODE_PASSWORD && mode != MODE_DEVICE) {
            corrupt("unknown key mode " + mode);
        }
        if (mode == MODE_PASSWORD) {
            const auto& kdf = meta.at("kdf");
            stored_iterations(kdf);
            if (kdf.at("salt").get<std::string>().empty()) {
                corrupt("bad KDF parameters");
            }
        }
        if (!meta.at("verifier").is_object()) {
            corrupt("missing verifier");
        }
        if (!document->contains("slots")) {
            (*document)["slots"] = nlohmann::json::object();
        }
    } catch (const nlohmann::json::exception& e) {
        corrupt(e.what());
    }
    return *document;
}

SecureMemory SecureStorage::derive_password_key(const std::string& password, std::span<const uint8_t> salt,
                                                uint32_t iterations) {
    return crypto_.kdf->derive(as_bytes(password), salt, iterations, crypto_.aead->key_size());
}

nlohmann::json SecureStorage::seal(std::span<const uint8_t> key, std::span<const uint8_t> plaintext,
                                   const std::string& aad) {
    auto iv = crypto_.random->bytes(crypto_.aead->iv_size());
    auto ciphertext = crypto_.aead->encrypt(key, iv, plaintext, as_bytes(aad));
    return {{"iv", Base64::encode(iv)}, {"data", Base64::encode(ciphertext)}};
}

bool SecureStorage::open_blob(std::span<const uint8_t> key, const nlohmann::json& blob,
                              const std::string& aad, SecureMemory& plaintext) {
    std::vector<uint8_t> iv;
    std::vector<uint8_t> ciphertext;
    try {
        iv = Base64::decode(blob.at("iv").get<std::string>());
        ciphertext = Base64::decode(blob.at("data").get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        LogPrintStorage(DEBUG, "Malformed blob for %s: %s", aad.c_str(), e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        LogPrintStorage(DEBUG, "Malformed blob for %s: %s", aad.c_str(), e.what());
        return false;
    }
    return crypto_.aead->decrypt(key, iv, ciphertext, as_bytes(aad), plaintext);
}

bool SecureStorage::check_verifier(std::span<const uint8_t> key, const nlohmann::json& document) {
    SecureMemory plaintext;
    if (!open_blob(key, document.at("meta").at("verifier"), VERIFIER_AAD, plaintext)) {
        return false;
    }
    return plaintext.to_string() == VERIFIER_PLAINTEXT;
}

// Derives the key from the document's KDF parameters and checks it against
// the verifier
SecureMemory SecureStorage::key_for_password(const nlohmann::json& document, const std::string& password) {
    const auto& kdf = document.at("meta").at("kdf");
    std::vector<uint8_t> salt;
    try {
        salt = Base64::decode(kdf.at("salt").get<std::string>());
    } catch (const std::invalid_argument& e) {
        corrupt(std::string("bad salt: ") + e.what());
    }
    auto key = derive_password_key(password, salt, stored_iterations(kdf));
    if (!check_verifier(key.span(), document)) {
        throw StorageError(StorageError::ErrorType::WrongPassword, "Incorrect password");
    }
    return key;
}

void SecureStorage::init(const std::optional<std::string>& password, StorageInitOptions options) {
    close();

    auto stored = backend_->load();
    if (!stored) {
        if (options.read_only) {
            throw StorageError(StorageError::ErrorType::NoWallet, "No wallet stored");
        }

        nlohmann::json meta = {
            {"createdAt", now_ms()},
            {"backupCompletedAt", nullptr}
        };
        SecureMemory key;
        bool device_key_stored = false;
        if (password) {
            auto salt = crypto_.random->bytes(SALT_SIZE);
            key = derive_password_key(*password, salt, iterations_);
            meta["mode"] = MODE_PASSWORD;
            meta["kdf"] = {
                {"name", crypto_.kdf->name()},
                {"hash", crypto_.kdf->hash()},
                {"iterations", iterations_},
                {"salt", Base64::encode(salt)}
            };
        } else {
            auto device_key = crypto_.random->bytes(crypto_.aead->key_size());
            key = SecureMemory(device_key);
            secure_wipe(device_key);
            backend_->store_device_key(key.span());
            device_key_stored = true;
            meta["mode"] = MODE_DEVICE;
        }
        meta["verifier"] = seal(key.span(), as_bytes(VERIFIER_PLAINTEXT), VERIFIER_AAD);

        nlohmann::json document = {
            {"version", DOCUMENT_VERSION},
            {"meta", meta},
            {"slots", nlohmann::json::object()}
        };
        try {
            backend_->commit(document);
        } catch (const StorageError&) {
            if (device_key_stored) {
                backend_->erase_device_key();
            }
            throw;
        }

        key_ = std::move(key);
        document_ = std::move(document);
        LogPrintStorage(INFO, "Created %s-protected store", password ? "password" : "device key");
        return;
    }

    nlohmann::json document = load_document();
    SecureMemory key;
    if (is_password_mode(document)) {
        if (!password) {
            throw StorageError(StorageError::ErrorType::PasswordRequired,
                               "Password required to unlock storage");
        }
        key = key_for_password(document, *password);
    } else {
        if (password) {
            LogPrintStorage(WARN, "Store has no password; ignoring the supplied one");
        }
        auto device_key = backend_->load_device_key();
        if (!device_key) {
            throw StorageError(StorageError::ErrorType::StorageFailure, "Device key is missing");
        }
        if (!check_verifier(device_key->span(), document)) {
            throw StorageError(StorageError::ErrorType::DecryptionFailed, "Device key does not open the store");
        }
        key = std::move(*device_key);
    }

    key_ = std::move(key);
    document_ = std::move(document);
    LogPrintStorage(DEBUG, "Store opened");
}

bool SecureStorage::exists() {
    auto stored = backend_->load();
    if (!stored) {
        return false;
    }
    auto slots = stored->find("slots");
    return slots != stored->end() && slots->is_object() && slots->contains(SLOT_MNEMONIC);
}

std::optional<SecureMemory> SecureStorage::get(const std::string& slot) {
    require_open();
    const auto& slots = document_["slots"];
    auto it = slots.find(slot);
    if (it == slots.end()) {
        return std::nullopt;
    }

    SecureMemory plaintext;
    if (!open_blob(key_.span(), *it, slot, plaintext)) {
        throw StorageError(StorageError::ErrorType::DecryptionFailed, "Decryption failed for slot " + slot);
    }
    return plaintext;
}

void SecureStorage::set(const std::string& slot, std::span<const uint8_t> value) {
    require_open();
    nlohmann::json next = document_;
    next["slots"][slot] = seal(key_.span(), value, slot);
    backend_->commit(next);
    document_ = std::move(next);
}

void SecureStorage::remove(const std::string& slot) {
    require_open();
    nlohmann::json next = document_;
    next["slots"].erase(slot);
    backend_->commit(next);
    document_ = std::move(next);
}

void SecureStorage::clear() {
    close();
    backend_->erase();
    backend_->erase_device_key();
    LogPrintStorage(INFO, "Store erased");
}

void SecureStorage::close() {
    key_ = SecureMemory();
    document_ = nlohmann::json();
}

bool SecureStorage::request_persistence() {
    return backend_->request_persistence();
}

bool SecureStorage::has_password() {
    if (is_open()) {
        return is_password_mode(document_);
    }
    if (!backend_->load()) {
        return false;
    }
    return is_password_mode(load_document());
}

nlohmann::json SecureStorage::rewrap(std::span<const uint8_t> new_key, const nlohmann::json& meta) {
    nlohmann::json next = {
        {"version", DOCUMENT_VERSION},
        {"meta", meta},
        {"slots", nlohmann::json::object()}
    };
    next["meta"]["verifier"] = seal(new_key, as_bytes(VERIFIER_PLAINTEXT), VERIFIER_AAD);

    for (const auto& [slot, blob] : document_["slots"].items()) {
        SecureMemory plaintext;
        if (!open_blob(key_.span(), blob, slot, plaintext)) {
            throw StorageError(StorageError::ErrorType::DecryptionFailed, "Decryption failed for slot " + slot);
        }
        next["slots"][slot] = seal(new_key, plaintext.span(), slot);
    }
    return next;
}

void SecureStorage::set_password(const std::string& password) {
    require_open();
    if (is_password_mode(document_)) {
        throw StorageError(StorageError::ErrorType::PasswordAlreadySet, "Password already set");
    }

    auto salt = crypto_.random->bytes(SALT_SIZE);
    SecureMemory new_key = derive_password_key(password, salt, iterations_);

    nlohmann::json meta = document_["meta"];
    meta["mode"] = MODE_PASSWORD;
    meta["kdf"] = {
        {"name", crypto_.kdf->name()},
        {"hash", crypto_.kdf->hash()},
        {"iterations", iterations_},
        {"salt", Base64::encode(salt)}
    };

    nlohmann::json next = rewrap(new_key.span(), meta);
    backend_->commit(next);

    key_ = std::move(new_key);
    document_ = std::move(next);
    try {
        backend_->erase_device_key();
    } catch (const StorageError& e) {
        LogPrintStorage(WARN, "Stale device key left behind: %s", e.what());
    }
    LogPrintStorage(INFO, "Password protection enabled");
}

void SecureStorage::change_password(const std::string& old_password, const std::string& new_password,
                                    std::optional<uint32_t> iterations) {
    require_open();
    if (!is_password_mode(document_)) {
        throw StorageError(StorageError::ErrorType::PasswordNotSet, "No password set");
    }
    key_for_password(document_, old_password);

    uint32_t rounds = iterations.value_or(iterations_);
    check_iterations(rounds);

    auto salt = crypto_.random->bytes(SALT_SIZE);
    SecureMemory new_key = derive_password_key(new_password, salt, rounds);

    nlohmann::json meta = document_["meta"];
    meta["kdf"]["iterations"] = rounds;
    meta["kdf"]["salt"] = Base64::encode(salt);

    nlohmann::json next = rewrap(new_key.span(), meta);
    backend_->commit(next);

    key_ = std::move(new_key);
    document_ = std::move(next);
    LogPrintStorage(INFO, "Password changed");
}

void SecureStorage::remove_password(const std::string& current_password) {
    require_open();
    if (!is_password_mode(document_)) {
        throw StorageError(StorageError::ErrorType::PasswordNotSet, "No password set");
    }
    key_for_password(document_, current_password);

    auto raw_key = crypto_.random->bytes(crypto_.aead->key_size());
    SecureMemory new_key(raw_key);
    secure_wipe(raw_key);

    nlohmann::json meta = document_["meta"];
    meta["mode"] = MODE_DEVICE;
    meta.erase("kdf");
    nlohmann::json next = rewrap(new_key.span(), meta);

    // The device key must exist before a document that needs it is committed
    backend_->store_device_key(new_key.span());
    try {
        backend_->commit(next);
    } catch (const StorageError&) {
        backend_->erase_device_key();
        throw;
    }

    key_ = std::move(new_key);
    document_ = std::move(next);
    LogPrintStorage(INFO, "Password protection removed");
}

bool SecureStorage::has_backup() {
    if (!backend_->load()) {
        return false;
    }
    nlohmann::json document = is_open() ? document_ : load_document();
    const auto& meta = document.at("meta");
    auto it = meta.find("backupCompletedAt");
    return it != meta.end() && it->is_number();
}

void SecureStorage::mark_backup_completed(int64_t timestamp_ms) {
    nlohmann::json next = is_open() ? document_ : load_document();
    next["meta"]["backupCompletedAt"] = timestamp_ms;
    backend_->commit(next);
    if (is_open()) {
        document_ = std::move(next);
    }
}

uint32_t SecureStorage::pbkdf2_iterations() {
    if (!backend_->load()) {
        return iterations_;
    }
    nlohmann::json document = is_open() ? document_ : load_document();
    if (!is_password_mode(document)) {
        return iterations_;
    }
    return stored_iterations(document.at("meta").at("kdf"));
}

} // namespace zeldwallet
