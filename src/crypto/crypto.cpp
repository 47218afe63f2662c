#include "coinjecture/crypto.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <algorithm>
#include <new>
#include <stdexcept>

namespace coinjecture::crypto {

// SHA-256 Implementation
Hash256 SHA256::hash(const Bytes& data) {
    return hash(data.data(), data.size());
}

Hash256 SHA256::hash(const uint8_t* data, size_t length) {
    Hash256 result;
    // OpenSSL reads nothing when length is zero, but wants a valid pointer
    static const uint8_t empty = 0;
    if (!::SHA256(length == 0 ? &empty : data, length, result.data())) {
        throw std::runtime_error("SHA256 digest failed");
    }
    return result;
}

// SHA-256 Hasher implementation
class SHA256::Hasher::Impl {
public:
    EVP_MD_CTX* ctx;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            throw std::bad_alloc();
        }
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }
};

SHA256::Hasher::Hasher() : impl_(std::make_unique<Impl>()) {}

SHA256::Hasher::~Hasher() = default;

void SHA256::Hasher::update(const uint8_t* data, size_t length) {
    if (length == 0) {
        return;
    }
    if (EVP_DigestUpdate(impl_->ctx, data, length) != 1) {
        throw std::runtime_error("SHA256 digest update failed");
    }
}

void SHA256::Hasher::update(const Bytes& data) {
    update(data.data(), data.size());
}

void SHA256::Hasher::update(const Hash256& hash) {
    update(hash.data(), hash.size());
}

Hash256 SHA256::Hasher::finalize() {
    Hash256 result;
    unsigned int result_len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, result.data(), &result_len) != 1) {
        throw std::runtime_error("SHA256 digest finalization failed");
    }
    return result;
}

// Utility functions
namespace utils {

std::string to_hex(const Bytes& data) {
    std::string hex;
    hex.reserve(data.size() * 2);

    static const char hex_chars[] = "0123456789abcdef";
    for (uint8_t byte : data) {
        hex.push_back(hex_chars[byte >> 4]);
        hex.push_back(hex_chars[byte & 0x0F]);
    }

    return hex;
}

std::string to_hex(const Hash256& hash) {
    return to_hex(Bytes(hash.begin(), hash.end()));
}

std::optional<Bytes> from_hex(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    auto hex_to_nibble = [](char c) -> std::optional<uint8_t> {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return std::nullopt;
    };

    Bytes bytes;
    bytes.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        auto high_nibble = hex_to_nibble(hex[i]);
        auto low_nibble = hex_to_nibble(hex[i + 1]);

        if (!high_nibble || !low_nibble) {
            return std::nullopt;
        }

        bytes.push_back(static_cast<uint8_t>((*high_nibble << 4) | *low_nibble));
    }

    return bytes;
}

std::optional<Hash256> hash256_from_hex(const std::string& hex) {
    if (hex.length() != 64) {
        return std::nullopt;
    }

    auto bytes = from_hex(hex);
    if (!bytes || bytes->size() != 32) {
        return std::nullopt;
    }

    Hash256 hash;
    std::copy(bytes->begin(), bytes->end(), hash.begin());
    return hash;
}

bool secure_compare(const Bytes& a, const Bytes& b) {
    if (a.size() != b.size()) {
        return false;
    }

    volatile uint8_t result = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        result |= a[i] ^ b[i];
    }

    return result == 0;
}

bool secure_compare(const Hash256& a, const Hash256& b) {
    volatile uint8_t result = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        result |= a[i] ^ b[i];
    }

    return result == 0;
}

} // namespace utils

} // namespace coinjecture::crypto
