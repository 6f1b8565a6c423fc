#pragma once

#include "common/types.h"
#include <cstring>
#include <vector>

namespace pinion {
namespace common {

/**
 * Bounds-checked little-endian reader over a byte buffer.
 *
 * Every read returns false without advancing when the buffer is too short
 * or the value is out of range for its type (booleans other than 0/1).
 */
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::vector<uint8_t>& data)
        : data_(data.data()), size_(data.size()) {}

    bool read_u8(uint8_t& out) {
        if (remaining() < 1) return false;
        out = data_[offset_++];
        return true;
    }

    bool read_bool(bool& out) {
        if (remaining() < 1 || data_[offset_] > 1) return false;
        out = data_[offset_++] == 1;
        return true;
    }

    bool read_u16(uint16_t& out) { return read_le(out); }
    bool read_u32(uint32_t& out) { return read_le(out); }
    bool read_u64(uint64_t& out) { return read_le(out); }

    bool read_i64(int64_t& out) {
        uint64_t raw = 0;
        if (!read_le(raw)) return false;
        std::memcpy(&out, &raw, sizeof(out));
        return true;
    }

    bool read_pubkey(PublicKey& out) { return read_bytes(PUBKEY_BYTES, out); }

    bool read_bytes(size_t count, std::vector<uint8_t>& out) {
        if (remaining() < count) return false;
        out.assign(data_ + offset_, data_ + offset_ + count);
        offset_ += count;
        return true;
    }

    bool skip(size_t count) {
        if (remaining() < count) return false;
        offset_ += count;
        return true;
    }

    size_t position() const { return offset_; }
    size_t remaining() const { return size_ - offset_; }
    bool exhausted() const { return offset_ == size_; }

private:
    template <typename T>
    bool read_le(T& out) {
        if (remaining() < sizeof(T)) return false;
        T value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            value |= static_cast<T>(data_[offset_ + i]) << (i * 8);
        }
        offset_ += sizeof(T);
        out = value;
        return true;
    }

    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

/**
 * Little-endian writer that appends to an owned buffer.
 */
class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(size_t reserve) { bytes_.reserve(reserve); }

    ByteWriter& write_u8(uint8_t value) {
        bytes_.push_back(value);
        return *this;
    }

    ByteWriter& write_bool(bool value) { return write_u8(value ? 1 : 0); }
    ByteWriter& write_u16(uint16_t value) { return write_le(value); }
    ByteWriter& write_u32(uint32_t value) { return write_le(value); }
    ByteWriter& write_u64(uint64_t value) { return write_le(value); }

    ByteWriter& write_i64(int64_t value) {
        uint64_t raw = 0;
        std::memcpy(&raw, &value, sizeof(raw));
        return write_le(raw);
    }

    /// Writes exactly 32 bytes; shorter keys are zero-padded
    ByteWriter& write_pubkey(const PublicKey& key) {
        for (size_t i = 0; i < PUBKEY_BYTES; ++i) {
            bytes_.push_back(i < key.size() ? key[i] : 0);
        }
        return *this;
    }

    ByteWriter& write_bytes(const std::vector<uint8_t>& bytes) {
        bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
        return *this;
    }

    ByteWriter& write_zeros(size_t count) {
        bytes_.insert(bytes_.end(), count, 0);
        return *this;
    }

    size_t size() const { return bytes_.size(); }
    const std::vector<uint8_t>& bytes() const { return bytes_; }
    std::vector<uint8_t> take() { return std::move(bytes_); }

private:
    template <typename T>
    ByteWriter& write_le(T value) {
        for (size_t i = 0; i < sizeof(T); ++i) {
            bytes_.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
        }
        return *this;
    }

    std::vector<uint8_t> bytes_;
};

/// Little-endian encoding of a u64 seed value
inline std::vector<uint8_t> u64_le_bytes(uint64_t value) {
    std::vector<uint8_t> bytes(8);
    for (size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
    return bytes;
}

} // namespace common
} // namespace pinion
