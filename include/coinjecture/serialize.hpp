#pragma once

#include "coinjecture/crypto.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <vector>

namespace coinjecture::serialize {

using crypto::Bytes;
using crypto::Hash256;

// Fixed-width little-endian writers
inline void write_u8(Bytes& data, uint8_t value) {
    data.push_back(value);
}

inline void write_u32_le(Bytes& data, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

inline void write_u64_le(Bytes& data, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

// Two's complement, same bytes as the u64 of the same bit pattern
inline void write_i64_le(Bytes& data, int64_t value) {
    write_u64_le(data, static_cast<uint64_t>(value));
}

inline void write_hash(Bytes& data, const Hash256& hash) {
    data.insert(data.end(), hash.begin(), hash.end());
}

/**
 * @brief Bounds-checked cursor over an untrusted byte range
 *
 * Every read either consumes exactly the requested width or fails and
 * leaves the cursor where it was. The reader never owns the bytes.
 */
class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(data ? size : 0) {}

    size_t remaining() const { return size_ - offset_; }
    size_t offset() const { return offset_; }
    bool empty() const { return remaining() == 0; }

    std::optional<uint8_t> read_u8() {
        if (remaining() < 1) return std::nullopt;
        return data_[offset_++];
    }

    std::optional<uint32_t> read_u32_le() {
        if (remaining() < 4) return std::nullopt;
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<uint32_t>(data_[offset_ + i]) << (i * 8);
        }
        offset_ += 4;
        return value;
    }

    std::optional<uint64_t> read_u64_le() {
        if (remaining() < 8) return std::nullopt;
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value |= static_cast<uint64_t>(data_[offset_ + i]) << (i * 8);
        }
        offset_ += 8;
        return value;
    }

    std::optional<int64_t> read_i64_le() {
        auto value = read_u64_le();
        if (!value) return std::nullopt;
        return static_cast<int64_t>(*value);
    }

    bool read_hash(Hash256& out) {
        if (remaining() < out.size()) return false;
        std::memcpy(out.data(), data_ + offset_, out.size());
        offset_ += out.size();
        return true;
    }

    bool skip(size_t count) {
        if (remaining() < count) return false;
        offset_ += count;
        return true;
    }

    bool read_bytes(size_t count, Bytes& out) {
        if (remaining() < count) return false;
        out.assign(data_ + offset_, data_ + offset_ + count);
        offset_ += count;
        return true;
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

} // namespace coinjecture::serialize
