#pragma once

#include <array>
#include <vector>
#include <string>
#include <memory>
#include <cstdint>
#include <cstddef>
#include <optional>

namespace coinjecture::crypto {

// Type aliases for cryptographic primitives
using Hash256 = std::array<uint8_t, 32>;
using Bytes = std::vector<uint8_t>;

/**
 * @brief SHA-256 (FIPS 180-4), the trust anchor of every consensus hash
 *
 * Total over every input including the empty sequence. No state is kept
 * between calls.
 */
class SHA256 {
public:
    static Hash256 hash(const Bytes& data);
    static Hash256 hash(const uint8_t* data, size_t length);

    // Streaming interface for large data
    class Hasher {
    public:
        Hasher();
        ~Hasher();

        Hasher(const Hasher&) = delete;
        Hasher& operator=(const Hasher&) = delete;

        void update(const uint8_t* data, size_t length);
        void update(const Bytes& data);
        void update(const Hash256& hash);
        Hash256 finalize();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
};

/**
 * @brief Utility functions for cryptographic operations
 */
namespace utils {
    std::string to_hex(const Bytes& data);
    std::string to_hex(const Hash256& hash);

    std::optional<Bytes> from_hex(const std::string& hex);
    std::optional<Hash256> hash256_from_hex(const std::string& hex);

    // Constant-time comparison to prevent timing attacks
    bool secure_compare(const Bytes& a, const Bytes& b);
    bool secure_compare(const Hash256& a, const Hash256& b);
}

} // namespace coinjecture::crypto
