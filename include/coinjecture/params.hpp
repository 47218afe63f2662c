#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

namespace coinjecture::params {

/// Canonical header codec version
constexpr uint8_t CODEC_VERSION = 1;

/// Maximum extra_data length in a block header
constexpr size_t MAX_EXTRA_DATA_SIZE = 256;

/// Maximum transaction hashes carried by one block
constexpr size_t MAX_BLOCK_TRANSACTIONS = 10000;

/// Frozen genesis header fields
constexpr uint64_t GENESIS_BLOCK_INDEX = 0;
constexpr int64_t GENESIS_TIMESTAMP = 1609459200; // 2021-01-01 00:00:00 UTC
constexpr uint64_t GENESIS_DIFFICULTY_TARGET = 1000;
constexpr uint64_t GENESIS_NONCE = 0;

/// Computational capacity classes, ordered by capability.
/// The numeric values are the wire tags.
enum class HardwareTier : uint8_t {
    Mobile = 0,
    Desktop = 1,
    Workstation = 2,
    Server = 3,
    Cluster = 4,
};

/// Per-tier consensus parameters
struct TierProfile {
    HardwareTier tier;
    const char* name;
    size_t min_elements;
    size_t max_elements;
    uint64_t max_ops;
    uint64_t max_duration_ms;
    uint64_t max_memory_bytes;
};

constexpr uint64_t MiB = 1024ULL * 1024ULL;

/// Every field is non-decreasing from one row to the next
constexpr std::array<TierProfile, 5> TIER_PROFILES = {{
    {HardwareTier::Mobile,      "mobile",      1,  16,  10000ULL,     100,  16 * MiB},
    {HardwareTier::Desktop,     "desktop",     2,  32,  100000ULL,    500,  64 * MiB},
    {HardwareTier::Workstation, "workstation", 4,  64,  1000000ULL,   1000, 256 * MiB},
    {HardwareTier::Server,      "server",      8,  128, 10000000ULL,  2000, 1024 * MiB},
    {HardwareTier::Cluster,     "cluster",     16, 256, 100000000ULL, 5000, 4096 * MiB},
}};

/// Tier for a wire tag, nullopt for unknown tags
std::optional<HardwareTier> tier_from_u32(uint32_t value);

/// True when tier is one of the enumerated values
bool is_valid_tier(HardwareTier tier);

/// Profile row for tier; nullptr when the tier is not recognized
const TierProfile* tier_profile(HardwareTier tier);

/// Permitted problem element count [min, max] for tier.
/// An unrecognized tier yields the empty range {1, 0}.
std::pair<size_t, size_t> element_range(HardwareTier tier);

const char* to_string(HardwareTier tier);

/// Library version string
const char* version();

} // namespace coinjecture::params
