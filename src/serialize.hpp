#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

namespace zeldwallet {

// Little-endian writer for the Bitcoin wire format
class ByteWriter {
public:
    void write_u8(uint8_t value) { data_.push_back(value); }

    void write_u32(uint32_t value) {
        for (int i = 0; i < 4; ++i) {
            data_.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xff));
        }
    }

    void write_u64(uint64_t value) {
        for (int i = 0; i < 8; ++i) {
            data_.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xff));
        }
    }

    void write_i32(int32_t value) { write_u32(static_cast<uint32_t>(value)); }

    // CompactSize: 1, 3, 5 or 9 bytes depending on magnitude
    void write_compact_size(uint64_t value) {
        if (value < 0xfd) {
            write_u8(static_cast<uint8_t>(value));
        } else if (value <= 0xffff) {
            write_u8(0xfd);
            write_u8(static_cast<uint8_t>(value & 0xff));
            write_u8(static_cast<uint8_t>((value >> 8) & 0xff));
        } else if (value <= 0xffffffff) {
            write_u8(0xfe);
            write_u32(static_cast<uint32_t>(value));
        } else {
            write_u8(0xff);
            write_u64(value);
        }
    }

    void write_bytes(std::span<const uint8_t> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    // CompactSize length prefix followed by the bytes
    void write_var_bytes(std::span<const uint8_t> bytes) {
        write_compact_size(bytes.size());
        write_bytes(bytes);
    }

    const std::vector<uint8_t>& data() const { return data_; }
    std::vector<uint8_t> release() { return std::move(data_); }

private:
    std::vector<uint8_t> data_;
};

// Bounds-checked little-endian reader; throws std::out_of_range on truncation
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    uint8_t read_u8() {
        require(1);
        return data_[pos_++];
    }

    uint32_t read_u32() {
        require(4);
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<uint32_t>(data_[pos_++]) << (8 * i);
        }
        return value;
    }

    uint64_t read_u64() {
        require(8);
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value |= static_cast<uint64_t>(data_[pos_++]) << (8 * i);
        }
        return value;
    }

    int32_t read_i32() { return static_cast<int32_t>(read_u32()); }

    uint64_t read_compact_size() {
        uint8_t first = read_u8();
        uint64_t value;
        if (first < 0xfd) {
            return first;
        } else if (first == 0xfd) {
            require(2);
            value = static_cast<uint64_t>(data_[pos_]) | (static_cast<uint64_t>(data_[pos_ + 1]) << 8);
            pos_ += 2;
            if (value < 0xfd) throw std::out_of_range("Non-canonical compact size");
        } else if (first == 0xfe) {
            value = read_u32();
            if (value <= 0xffff) throw std::out_of_range("Non-canonical compact size");
        } else {
            value = read_u64();
            if (value <= 0xffffffff) throw std::out_of_range("Non-canonical compact size");
        }
        return value;
    }

    std::vector<uint8_t> read_bytes(uint64_t count) {
        require(count);
        std::vector<uint8_t> out(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                 data_.begin() + static_cast<std::ptrdiff_t>(pos_ + count));
        pos_ += static_cast<size_t>(count);
        return out;
    }

    std::vector<uint8_t> read_var_bytes() { return read_bytes(read_compact_size()); }

    size_t position() const { return pos_; }
    size_t remaining() const { return data_.size() - pos_; }
    bool empty() const { return pos_ >= data_.size(); }

private:
    void require(uint64_t count) const {
        if (count > data_.size() - pos_) {
            throw std::out_of_range("Unexpected end of data");
        }
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

} // namespace zeldwallet
