#pragma once

#include "coinjecture/crypto.hpp"
#include "coinjecture/params.hpp"
#include <cstdint>
#include <vector>

namespace coinjecture {
namespace block {

using crypto::Bytes;
using crypto::Hash256;

/// Canonical summary of one block. A value type: a modified header is a new
/// value, the core never mutates one it was given.
struct BlockHeader {
    uint8_t codec_version = params::CODEC_VERSION; ///< Canonical codec version
    uint64_t block_index = 0;                      ///< Height in the chain
    int64_t timestamp = 0;                         ///< Seconds since epoch
    Hash256 parent_hash{};                         ///< Hash of the preceding header
    Hash256 merkle_root{};                         ///< Merkle root of transaction hashes
    Hash256 miner_address{};                       ///< Miner identity
    Hash256 commitment{};                          ///< Puzzle commitment
    uint64_t difficulty_target = 0;                ///< Difficulty target
    uint64_t nonce = 0;                            ///< Nonce
    Bytes extra_data;                              ///< At most MAX_EXTRA_DATA_SIZE bytes

    bool is_genesis() const { return block_index == params::GENESIS_BLOCK_INDEX; }

    /// Genesis header with every frozen field set and all hashes zero
    static BlockHeader genesis();

    bool operator==(const BlockHeader& other) const;
    bool operator!=(const BlockHeader& other) const { return !(*this == other); }
};

/// Header plus the ordered transaction hashes its merkle_root commits to
struct Block {
    BlockHeader header;
    std::vector<Hash256> tx_hashes;

    bool operator==(const Block& other) const {
        return header == other.header && tx_hashes == other.tx_hashes;
    }
};

} // namespace block
} // namespace coinjecture
