#include "coinjecture/codec.hpp"
#include "coinjecture/log.hpp"
#include "coinjecture/merkle.hpp"
#include "coinjecture/serialize.hpp"
#include <string>

namespace coinjecture::codec {

using namespace serialize;

namespace {
    std::nullopt_t fail(CodecError* error, CodecError reason) {
        if (error) {
            *error = reason;
        }
        COINJ_LOG_DEBUG(std::string("codec: rejected: ") + to_string(reason));
        return std::nullopt;
    }

    std::optional<CodecError> check_encodable(const BlockHeader& header) {
        if (header.codec_version != params::CODEC_VERSION) {
            return CodecError::UnsupportedVersion;
        }
        if (header.extra_data.size() > params::MAX_EXTRA_DATA_SIZE) {
            return CodecError::ExtraDataTooLarge;
        }
        return std::nullopt;
    }
}

const char* to_string(CodecError error) {
    switch (error) {
        case CodecError::Truncated:           return "truncated input";
        case CodecError::UnsupportedVersion:  return "unsupported codec version";
        case CodecError::ExtraDataTooLarge:   return "extra_data too large";
        case CodecError::LengthMismatch:      return "declared length does not match input";
        case CodecError::TrailingBytes:       return "trailing bytes after value";
        case CodecError::TooManyTransactions: return "too many transactions";
        case CodecError::InvalidGenesis:      return "invalid genesis header";
        case CodecError::MalformedJson:       return "malformed json";
        case CodecError::InvalidField:        return "invalid field";
    }
    return "unknown codec error";
}

std::optional<Bytes> encode_header(const BlockHeader& header, CodecError* error) {
    if (auto reason = check_encodable(header)) {
        return fail(error, *reason);
    }

    Bytes data;
    data.reserve(HEADER_FIXED_SIZE + header.extra_data.size());

    write_u8(data, header.codec_version);
    write_u64_le(data, header.block_index);
    write_i64_le(data, header.timestamp);
    write_hash(data, header.parent_hash);
    write_hash(data, header.merkle_root);
    write_hash(data, header.miner_address);
    write_hash(data, header.commitment);
    write_u64_le(data, header.difficulty_target);
    write_u64_le(data, header.nonce);

    // Length prefix, never a delimiter
    write_u32_le(data, static_cast<uint32_t>(header.extra_data.size()));
    data.insert(data.end(), header.extra_data.begin(), header.extra_data.end());

    return data;
}

std::optional<BlockHeader> decode_header(const uint8_t* data, size_t size, CodecError* error) {
    Reader reader(data, size);
    BlockHeader header;

    auto version = reader.read_u8();
    if (!version) {
        return fail(error, CodecError::Truncated);
    }
    if (*version != params::CODEC_VERSION) {
        return fail(error, CodecError::UnsupportedVersion);
    }
    header.codec_version = *version;

    if (size < HEADER_FIXED_SIZE) {
        return fail(error, CodecError::Truncated);
    }

    // Width is guaranteed from here to the extra_data length prefix
    header.block_index = *reader.read_u64_le();
    header.timestamp = *reader.read_i64_le();
    reader.read_hash(header.parent_hash);
    reader.read_hash(header.merkle_root);
    reader.read_hash(header.miner_address);
    reader.read_hash(header.commitment);
    header.difficulty_target = *reader.read_u64_le();
    header.nonce = *reader.read_u64_le();
    uint32_t extra_len = *reader.read_u32_le();

    if (extra_len > params::MAX_EXTRA_DATA_SIZE) {
        return fail(error, CodecError::ExtraDataTooLarge);
    }
    if (reader.remaining() != extra_len) {
        return fail(error, CodecError::LengthMismatch);
    }
    reader.read_bytes(extra_len, header.extra_data);

    return header;
}

std::optional<BlockHeader> decode_header(const Bytes& data, CodecError* error) {
    return decode_header(data.data(), data.size(), error);
}

std::optional<Hash256> compute_header_hash(const BlockHeader& header, CodecError* error) {
    auto encoded = encode_header(header, error);
    if (!encoded) {
        return std::nullopt;
    }
    return crypto::SHA256::hash(*encoded);
}

std::optional<CodecError> validate_header(const BlockHeader& header) {
    if (auto reason = check_encodable(header)) {
        return reason;
    }
    if (header.is_genesis()) {
        if (header.timestamp != params::GENESIS_TIMESTAMP ||
            header.difficulty_target != params::GENESIS_DIFFICULTY_TARGET ||
            header.nonce != params::GENESIS_NONCE) {
            return CodecError::InvalidGenesis;
        }
    }
    return std::nullopt;
}

// Block codec
std::optional<Bytes> encode_block(const Block& block, CodecError* error) {
    if (block.tx_hashes.size() > params::MAX_BLOCK_TRANSACTIONS) {
        return fail(error, CodecError::TooManyTransactions);
    }

    auto header_bytes = encode_header(block.header, error);
    if (!header_bytes) {
        return std::nullopt;
    }

    Bytes data;
    data.reserve(4 + header_bytes->size() + 4 + block.tx_hashes.size() * 32);

    write_u32_le(data, static_cast<uint32_t>(header_bytes->size()));
    data.insert(data.end(), header_bytes->begin(), header_bytes->end());

    write_u32_le(data, static_cast<uint32_t>(block.tx_hashes.size()));
    for (const auto& tx_hash : block.tx_hashes) {
        write_hash(data, tx_hash);
    }

    return data;
}

std::optional<Block> decode_block(const uint8_t* data, size_t size, CodecError* error) {
    Reader reader(data, size);
    Block block;

    auto header_len = reader.read_u32_le();
    if (!header_len) {
        return fail(error, CodecError::Truncated);
    }
    if (*header_len < HEADER_FIXED_SIZE || *header_len > HEADER_MAX_SIZE) {
        return fail(error, CodecError::LengthMismatch);
    }
    if (reader.remaining() < *header_len) {
        return fail(error, CodecError::Truncated);
    }

    auto header = decode_header(data + reader.offset(), *header_len, error);
    if (!header) {
        return std::nullopt;
    }
    block.header = std::move(*header);

    reader.skip(*header_len);

    auto tx_count = reader.read_u32_le();
    if (!tx_count) {
        return fail(error, CodecError::Truncated);
    }
    if (*tx_count > params::MAX_BLOCK_TRANSACTIONS) {
        return fail(error, CodecError::TooManyTransactions);
    }

    // Check the exact size before allocating anything for the hashes
    const size_t needed = static_cast<size_t>(*tx_count) * 32;
    if (reader.remaining() < needed) {
        return fail(error, CodecError::Truncated);
    }
    if (reader.remaining() > needed) {
        return fail(error, CodecError::TrailingBytes);
    }

    block.tx_hashes.resize(*tx_count);
    for (auto& tx_hash : block.tx_hashes) {
        reader.read_hash(tx_hash);
    }

    return block;
}

std::optional<Block> decode_block(const Bytes& data, CodecError* error) {
    return decode_block(data.data(), data.size(), error);
}

bool validate_merkle_root(const Block& block) {
    return merkle::compute_merkle_root(block.tx_hashes) == block.header.merkle_root;
}

} // namespace coinjecture::codec
