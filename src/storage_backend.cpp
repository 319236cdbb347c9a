#include "storage_backend.hpp"
#include "error.hpp"
#include "logging.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <system_error>

namespace zeldwallet {

namespace {

std::atomic<uint64_t> temp_counter{0};

[[noreturn]] void storage_failure(const std::string& message) {
    throw StorageError(StorageError::ErrorType::StorageFailure, message);
}

std::filesystem::path make_temp_path(const std::filesystem::path& target) {
    auto nonce = temp_counter.fetch_add(1, std::memory_order_relaxed);
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::string name = target.filename().string() + ".tmp." + std::to_string(now) + "." + std::to_string(nonce);
    return target.parent_path() / name;
}

// Writes to a sibling temp file, then renames it over the target
void atomic_write(const std::filesystem::path& path, std::span<const uint8_t> data,
                  std::filesystem::perms permissions) {
    std::error_code ec;
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            storage_failure("Cannot create " + parent.string() + ": " + ec.message());
        }
    }

    auto tmp_path = make_temp_path(path);
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            storage_failure("Cannot open " + tmp_path.string() + " for writing");
        }
        std::filesystem::permissions(tmp_path, permissions, ec);
        if (ec) {
            LogPrintStorage(WARN, "Cannot restrict permissions of %s: %s",
                            tmp_path.string().c_str(), ec.message().c_str());
            ec.clear();
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(tmp_path, ec);
            storage_failure("Write to " + tmp_path.string() + " failed");
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(tmp_path, cleanup);
        storage_failure("Cannot replace " + path.string() + ": " + ec.message());
    }
}

std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        storage_failure("Cannot open " + path.string());
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        storage_failure("Read from " + path.string() + " failed");
    }
    return data;
}

void remove_file(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        storage_failure("Cannot remove " + path.string() + ": " + ec.message());
    }
}

} // namespace

FileStorageBackend::FileStorageBackend(std::filesystem::path path) : path_(std::move(path)) {}

std::filesystem::path FileStorageBackend::key_path() const {
    std::filesystem::path key = path_;
    key += ".key";
    return key;
}

std::optional<nlohmann::json> FileStorageBackend::load() {
    auto data = read_file(path_);
    if (!data) {
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(data->begin(), data->end());
    } catch (const nlohmann::json::parse_error& e) {
        storage_failure("Wallet file " + path_.string() + " is corrupt: " + e.what());
    }
}

void FileStorageBackend::commit(const nlohmann::json& document) {
    std::string text = document.dump(4);
    atomic_write(path_, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()),
                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
    LogPrintStorage(DEBUG, "Committed wallet document to %s", path_.string().c_str());
}

void FileStorageBackend::erase() {
    remove_file(path_);
}

std::optional<SecureMemory> FileStorageBackend::load_device_key() {
    auto data = read_file(key_path());
    if (!data) {
        return std::nullopt;
    }
    SecureMemory key(*data);
    secure_wipe(*data);
    return key;
}

void FileStorageBackend::store_device_key(std::span<const uint8_t> key) {
    atomic_write(key_path(), key, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
}

void FileStorageBackend::erase_device_key() {
    auto path = key_path();
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        // Overwrite before unlinking so the key does not linger in the file's blocks
        std::vector<uint8_t> zeros(std::filesystem::file_size(path, ec), 0);
        if (!ec) {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char*>(zeros.data()), static_cast<std::streamsize>(zeros.size()));
        }
    }
    remove_file(path);
}

void MemoryStorageBackend::commit(const nlohmann::json& document) {
    if (failing_commits_ > 0) {
        --failing_commits_;
        storage_failure("Simulated commit failure");
    }
    document_ = document;
}

std::optional<SecureMemory> MemoryStorageBackend::load_device_key() {
    if (device_key_.isEmpty()) {
        return std::nullopt;
    }
    return SecureMemory(device_key_.span());
}

void MemoryStorageBackend::store_device_key(std::span<const uint8_t> key) {
    device_key_ = SecureMemory(key);
}

} // namespace zeldwallet
