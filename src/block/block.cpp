#include "coinjecture/block.hpp"

namespace coinjecture {
namespace block {

BlockHeader BlockHeader::genesis() {
    BlockHeader header;
    header.codec_version = params::CODEC_VERSION;
    header.block_index = params::GENESIS_BLOCK_INDEX;
    header.timestamp = params::GENESIS_TIMESTAMP;
    header.parent_hash = Hash256{}; // All zeros
    header.merkle_root = Hash256{};
    header.miner_address = Hash256{};
    header.commitment = Hash256{};
    header.difficulty_target = params::GENESIS_DIFFICULTY_TARGET;
    header.nonce = params::GENESIS_NONCE;
    return header;
}

bool BlockHeader::operator==(const BlockHeader& other) const {
    return codec_version == other.codec_version &&
           block_index == other.block_index &&
           timestamp == other.timestamp &&
           parent_hash == other.parent_hash &&
           merkle_root == other.merkle_root &&
           miner_address == other.miner_address &&
           commitment == other.commitment &&
           difficulty_target == other.difficulty_target &&
           nonce == other.nonce &&
           extra_data == other.extra_data;
}

} // namespace block
} // namespace coinjecture
