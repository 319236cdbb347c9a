#include "backup.hpp"
#include "base64.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "secure_memory.hpp"
#include "wallet_config.hpp"

namespace zeldwallet {

namespace {

constexpr size_t BACKUP_SALT_SIZE = 16;
constexpr size_t MAC_KEY_SIZE = 32;
constexpr const char* MAC_ALGORITHM = "HMAC-SHA256";

[[noreturn]] void format_invalid(const std::string& message) {
    throw StorageError(StorageError::ErrorType::BackupFormatInvalid, message);
}

std::span<const uint8_t> as_bytes(const std::string& value) {
    return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
}

std::vector<uint8_t> decode_field(const std::string& value, const char* field) {
    try {
        return Base64::decode(value);
    } catch (const std::invalid_argument& e) {
        format_invalid(std::string("Backup field ") + field + " is not base64: " + e.what());
    }
}

// Encryption key || MAC key
SecureMemory derive_backup_keys(KeyDerivationFunction& kdf, size_t cipher_key_size,
                                const std::string& password, std::span<const uint8_t> salt,
                                uint32_t iterations) {
    return kdf.derive(as_bytes(password), salt, iterations, cipher_key_size + MAC_KEY_SIZE);
}

// Clears the secret strings of a decrypted payload document on every exit
class PayloadSecretsGuard {
public:
    explicit PayloadSecretsGuard(nlohmann::json& inner) : inner_(inner) {}
    ~PayloadSecretsGuard() {
        wipe("mnemonic");
        wipe("passphrase");
    }

    PayloadSecretsGuard(const PayloadSecretsGuard&) = delete;
    PayloadSecretsGuard& operator=(const PayloadSecretsGuard&) = delete;

private:
    void wipe(const char* key) {
        if (!inner_.is_object()) {
            return;
        }
        auto it = inner_.find(key);
        if (it != inner_.end() && it->is_string()) {
            secure_wipe(it->get_ref<std::string&>());
        }
    }

    nlohmann::json& inner_;
};

} // namespace

BackupPayload::~BackupPayload() {
    secure_wipe(mnemonic);
    if (passphrase) {
        secure_wipe(*passphrase);
    }
}

void to_json(nlohmann::json& j, const BackupEnvelope& envelope) {
    j = nlohmann::json{
        {"version", envelope.version},
        {"cipher", envelope.cipher},
        {"kdf", {
            {"name", envelope.kdf.name},
            {"hash", envelope.kdf.hash},
            {"iterations", envelope.kdf.iterations},
            {"salt", envelope.kdf.salt}
        }},
        {"iv", envelope.iv},
        {"ciphertext", envelope.ciphertext},
        {"createdAt", envelope.created_at},
        {"network", envelope.network},
        {"mac", envelope.mac},
        {"macAlgo", envelope.mac_algo}
    };
}

void from_json(const nlohmann::json& j, BackupEnvelope& envelope) {
    j.at("version").get_to(envelope.version);
    j.at("cipher").get_to(envelope.cipher);
    const auto& kdf = j.at("kdf");
    kdf.at("name").get_to(envelope.kdf.name);
    kdf.at("hash").get_to(envelope.kdf.hash);
    kdf.at("iterations").get_to(envelope.kdf.iterations);
    kdf.at("salt").get_to(envelope.kdf.salt);
    j.at("iv").get_to(envelope.iv);
    j.at("ciphertext").get_to(envelope.ciphertext);
    j.at("createdAt").get_to(envelope.created_at);
    j.at("network").get_to(envelope.network);
    j.at("mac").get_to(envelope.mac);
    j.at("macAlgo").get_to(envelope.mac_algo);
}

std::string BackupCodec::mac_payload(const BackupEnvelope& envelope) {
    nlohmann::ordered_json ordered;
    ordered["version"] = envelope.version;
    ordered["cipher"] = envelope.cipher;
    ordered["kdf"]["name"] = envelope.kdf.name;
    ordered["kdf"]["hash"] = envelope.kdf.hash;
    ordered["kdf"]["iterations"] = envelope.kdf.iterations;
    ordered["kdf"]["salt"] = envelope.kdf.salt;
    ordered["iv"] = envelope.iv;
    ordered["ciphertext"] = envelope.ciphertext;
    ordered["createdAt"] = envelope.created_at;
    ordered["network"] = envelope.network;
    return ordered.dump();
}

BackupEnvelope BackupCodec::seal(const BackupPayload& payload, const std::string& backup_password,
                                 uint32_t iterations) {
    if (iterations == 0 || iterations > BACKUP_MAX_ITERATIONS) {
        throw StorageError(StorageError::ErrorType::StorageFailure,
                           "Backup iteration count out of range");
    }

    nlohmann::json inner = {
        {"version", BACKUP_VERSION},
        {"mnemonic", payload.mnemonic},
        {"network", to_string(payload.network)},
        {"createdAt", payload.created_at}
    };
    if (payload.passphrase) {
        inner["passphrase"] = *payload.passphrase;
    }
    if (payload.custom_paths && !payload.custom_paths->empty()) {
        inner["customPaths"] = *payload.custom_paths;
    }
    std::string plaintext = inner.dump();
    WipeGuard<std::string> plaintext_guard(plaintext);
    secure_wipe(inner["mnemonic"].get_ref<std::string&>());
    if (payload.passphrase) {
        secure_wipe(inner["passphrase"].get_ref<std::string&>());
    }

    auto salt = crypto_.random->bytes(BACKUP_SALT_SIZE);
    auto iv = crypto_.random->bytes(crypto_.aead->iv_size());
    size_t cipher_key_size = crypto_.aead->key_size();
    SecureMemory keys = derive_backup_keys(*crypto_.kdf, cipher_key_size, backup_password, salt, iterations);
    std::span<const uint8_t> cipher_key = keys.span().first(cipher_key_size);
    std::span<const uint8_t> mac_key = keys.span().subspan(cipher_key_size);

    auto ciphertext = crypto_.aead->encrypt(cipher_key, iv, as_bytes(plaintext), {});

    BackupEnvelope envelope;
    envelope.version = BACKUP_VERSION;
    envelope.cipher = crypto_.aead->name();
    envelope.kdf.name = crypto_.kdf->name();
    envelope.kdf.hash = crypto_.kdf->hash();
    envelope.kdf.iterations = iterations;
    envelope.kdf.salt = Base64::encode(salt);
    envelope.iv = Base64::encode(iv);
    envelope.ciphertext = Base64::encode(ciphertext);
    envelope.created_at = payload.created_at;
    envelope.network = to_string(payload.network);
    envelope.mac = Base64::encode(crypto_.mac->compute(mac_key, as_bytes(mac_payload(envelope))));
    envelope.mac_algo = crypto_.mac->name();
    LogPrintStorage(INFO, "Backup sealed with %u iterations", iterations);
    return envelope;
}

std::string BackupCodec::encode(const BackupEnvelope& envelope) {
    nlohmann::json j = envelope;
    return Base64::encode(as_bytes(j.dump()));
}

BackupEnvelope BackupCodec::parse(const std::string& text) {
    std::optional<nlohmann::json> document;

    try {
        auto decoded = Base64::decode(text);
        document = nlohmann::json::parse(decoded.begin(), decoded.end());
    } catch (const std::invalid_argument&) {
        document.reset();  // not base64, try plain JSON
    } catch (const nlohmann::json::parse_error&) {
        document.reset();  // base64 of something other than JSON
    }

    if (!document) {
        try {
            document = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            format_invalid(std::string("Backup is neither base64 nor JSON: ") + e.what());
        }
    }

    BackupEnvelope envelope;
    try {
        envelope = document->get<BackupEnvelope>();
    } catch (const nlohmann::json::exception& e) {
        format_invalid(std::string("Backup envelope is incomplete: ") + e.what());
    }

    if (envelope.version != BACKUP_VERSION) {
        format_invalid("Unsupported backup version " + std::to_string(envelope.version));
    }
    if (envelope.kdf.iterations == 0 || envelope.kdf.iterations > BACKUP_MAX_ITERATIONS) {
        format_invalid("Backup iteration count out of range");
    }
    if (envelope.mac_algo != MAC_ALGORITHM) {
        format_invalid("Unsupported MAC algorithm " + envelope.mac_algo);
    }
    if (!network_from_string(envelope.network)) {
        format_invalid("Unknown backup network " + envelope.network);
    }
    return envelope;
}

BackupPayload BackupCodec::open(const BackupEnvelope& envelope, const std::string& backup_password) {
    if (envelope.cipher != crypto_.aead->name() || envelope.kdf.name != crypto_.kdf->name() ||
        envelope.kdf.hash != crypto_.kdf->hash() || envelope.mac_algo != crypto_.mac->name()) {
        format_invalid("Unsupported backup algorithms");
    }

    auto salt = decode_field(envelope.kdf.salt, "kdf.salt");

    size_t cipher_key_size = crypto_.aead->key_size();
    SecureMemory keys = derive_backup_keys(*crypto_.kdf, cipher_key_size, backup_password, salt,
                                           envelope.kdf.iterations);
    std::span<const uint8_t> cipher_key = keys.span().first(cipher_key_size);
    std::span<const uint8_t> mac_key = keys.span().subspan(cipher_key_size);

    // The MAC covers the encoded field strings, so it is checked before
    // anything else is decoded
    std::vector<uint8_t> mac;
    try {
        mac = Base64::decode(envelope.mac);
    } catch (const std::invalid_argument& e) {
        throw StorageError(StorageError::ErrorType::BackupIntegrityFailure,
                           std::string("Backup MAC is unreadable: ") + e.what());
    }
    if (!crypto_.mac->verify(mac_key, as_bytes(mac_payload(envelope)), mac)) {
        throw StorageError(StorageError::ErrorType::BackupIntegrityFailure,
                           "Backup integrity check failed (MAC mismatch)");
    }

    auto iv = decode_field(envelope.iv, "iv");
    auto ciphertext = decode_field(envelope.ciphertext, "ciphertext");

    SecureMemory plaintext;
    if (!crypto_.aead->decrypt(cipher_key, iv, ciphertext, {}, plaintext)) {
        throw StorageError(StorageError::ErrorType::DecryptionFailed, "Backup decryption failed");
    }

    nlohmann::json inner;
    PayloadSecretsGuard inner_guard(inner);
    try {
        inner = nlohmann::json::parse(plaintext.data(), plaintext.data() + plaintext.size());
    } catch (const nlohmann::json::parse_error&) {
        format_invalid("Backup payload is not JSON");
    }

    BackupPayload payload;
    try {
        if (inner.at("version").get<int>() != BACKUP_VERSION) {
            format_invalid("Unsupported backup payload version");
        }
        payload.mnemonic = inner.at("mnemonic").get<std::string>();
        if (inner.contains("passphrase") && inner["passphrase"].is_string()) {
            payload.passphrase = inner["passphrase"].get<std::string>();
        }
        if (inner.contains("network") && inner["network"].is_string()) {
            auto network = network_from_string(inner["network"].get<std::string>());
            if (!network) {
                format_invalid("Unknown network in backup payload");
            }
            payload.network = *network;
        } else {
            auto network = network_from_string(envelope.network);
            if (!network) {
                format_invalid("Unknown backup network " + envelope.network);
            }
            payload.network = *network;
        }
        payload.created_at = inner.value("createdAt", envelope.created_at);
        if (inner.contains("customPaths") && inner["customPaths"].is_object()) {
            CustomPaths paths = inner["customPaths"].get<CustomPaths>();
            if (!paths.empty()) {
                payload.custom_paths = paths;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        format_invalid(std::string("Backup payload is incomplete: ") + e.what());
    }

    if (payload.mnemonic.empty()) {
        format_invalid("Backup payload has no mnemonic");
    }
    LogPrintStorage(INFO, "Backup from %lld opened", static_cast<long long>(payload.created_at));
    return payload;
}

} // namespace zeldwallet
