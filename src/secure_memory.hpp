// File: secure_memory.hpp
// Brief: Secure memory handling for sensitive cryptographic data
//
// SecureMemory owns a buffer holding key material, seeds or decrypted
// payloads:
// - Prevents memory from being swapped to disk
// - Zeroes memory on destruction with OPENSSL_cleanse
// - Provides controlled access to the underlying data
//
// secure_wipe() and WipeGuard cover secrets that have to live in ordinary
// containers (mnemonic strings, JSON payloads) for a short while.

#pragma once

#include <array>
#include <string>
#include <vector>
#include <span>
#include <cstdint>
#include <cstring>
#include <openssl/crypto.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#endif

namespace zeldwallet {

inline void secure_wipe(void* data, size_t size) {
    if (data != nullptr && size > 0) {
        OPENSSL_cleanse(data, size);
    }
}

inline void secure_wipe(std::string& value) {
    secure_wipe(value.data(), value.size());
    value.clear();
}

inline void secure_wipe(std::vector<uint8_t>& value) {
    secure_wipe(value.data(), value.size());
    value.clear();
}

template <size_t N>
inline void secure_wipe(std::array<uint8_t, N>& value) {
    secure_wipe(value.data(), value.size());
}

// Wipes the referenced container when the scope exits, on every path.
template <typename T>
class WipeGuard {
public:
    explicit WipeGuard(T& target) : target_(target) {}
    ~WipeGuard() { secure_wipe(target_); }

    WipeGuard(const WipeGuard&) = delete;
    WipeGuard& operator=(const WipeGuard&) = delete;

private:
    T& target_;
};

class SecureMemory {
private:
    uint8_t* data_ = nullptr;
    size_t size_ = 0;

    void release() {
        if (data_) {
            OPENSSL_cleanse(data_, size_);
            #ifdef _WIN32
            VirtualUnlock(data_, size_);
            #else
            munlock(data_, size_);
            #endif
            delete[] data_;
            data_ = nullptr;
            size_ = 0;
        }
    }

public:
    SecureMemory() = default;

    // Allocates a zero-filled locked buffer
    explicit SecureMemory(size_t length) {
        if (length == 0) {
            return;
        }
        size_ = length;
        data_ = new uint8_t[size_]();

        // Lock the memory to prevent swapping to disk. Failure is tolerated:
        // unprivileged processes may exceed RLIMIT_MEMLOCK.
        #ifdef _WIN32
        VirtualLock(data_, size_);
        #else
        mlock(data_, size_);
        #endif
    }

    // Copies sensitive data into a locked buffer
    SecureMemory(const uint8_t* input, size_t length) : SecureMemory(length) {
        if (length > 0) {
            std::memcpy(data_, input, size_);
        }
    }

    explicit SecureMemory(std::span<const uint8_t> input)
        : SecureMemory(input.data(), input.size()) {}

    ~SecureMemory() { release(); }

    // Prevent copying
    SecureMemory(const SecureMemory&) = delete;
    SecureMemory& operator=(const SecureMemory&) = delete;

    // Allow moving
    SecureMemory(SecureMemory&& other) noexcept : data_(other.data_), size_(other.size_) {
        other.data_ = nullptr;
        other.size_ = 0;
    }

    SecureMemory& operator=(SecureMemory&& other) noexcept {
        if (this != &other) {
            release();
            data_ = other.data_;
            size_ = other.size_;
            other.data_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    static SecureMemory from_string(const std::string& value) {
        return SecureMemory(reinterpret_cast<const uint8_t*>(value.data()), value.size());
    }

    // Controlled access to data
    uint8_t* data() { return data_; }
    const uint8_t* data() const { return data_; }
    size_t size() const { return size_; }
    std::span<const uint8_t> span() const { return {data_, size_}; }

    // Copies the contents into a string; the caller owns wiping it
    std::string to_string() const {
        return std::string(reinterpret_cast<const char*>(data_), size_);
    }

    bool isEmpty() const { return size_ == 0 || data_ == nullptr; }
};

} // namespace zeldwallet
