#include <gtest/gtest.h>
#include "coinjecture/codec.hpp"
#include "coinjecture/merkle.hpp"
#include <string>
#include <vector>

using namespace coinjecture::codec;
using coinjecture::crypto::utils::to_hex;
namespace params = coinjecture::params;

class CodecTest : public ::testing::Test {
protected:
    BlockHeader sample_header() {
        BlockHeader header;
        header.block_index = 7;
        header.timestamp = 1609459900;
        header.parent_hash.fill(0x01);
        header.merkle_root.fill(0x02);
        header.miner_address.fill(0x03);
        header.commitment.fill(0x04);
        header.difficulty_target = 5000;
        header.nonce = 99;
        header.extra_data = {'h', 'i'};
        return header;
    }

    Bytes encode(const BlockHeader& header) {
        auto encoded = encode_header(header);
        EXPECT_TRUE(encoded.has_value());
        return encoded.value_or(Bytes{});
    }

    CodecError decode_error(const Bytes& data) {
        CodecError error = CodecError::InvalidField;
        auto decoded = decode_header(data, &error);
        EXPECT_FALSE(decoded.has_value());
        return error;
    }
};

TEST_F(CodecTest, FixedLayout) {
    auto header = sample_header();
    auto bytes = encode(header);

    ASSERT_EQ(bytes.size(), HEADER_FIXED_SIZE + 2);
    EXPECT_EQ(bytes[0], params::CODEC_VERSION);
    EXPECT_EQ(bytes[1], 7);                  // block_index low byte first
    EXPECT_EQ(bytes[9], 0xBC);               // 1609459900 = 0x5FEE68BC
    EXPECT_EQ(bytes[17], 0x01);              // parent_hash
    EXPECT_EQ(bytes[17 + 32], 0x02);         // merkle_root
    EXPECT_EQ(bytes[17 + 64], 0x03);         // miner_address
    EXPECT_EQ(bytes[17 + 96], 0x04);         // commitment
    EXPECT_EQ(bytes[145], 0x88);             // 5000 = 0x1388
    EXPECT_EQ(bytes[146], 0x13);
    EXPECT_EQ(bytes[153], 99);               // nonce
    EXPECT_EQ(bytes[161], 2);                // extra_data length
    EXPECT_EQ(bytes[165], 'h');
    EXPECT_EQ(bytes[166], 'i');
}

TEST_F(CodecTest, NegativeTimestampIsTwosComplement) {
    auto header = sample_header();
    header.timestamp = -1;
    auto bytes = encode(header);
    for (size_t i = 9; i < 17; ++i) {
        EXPECT_EQ(bytes[i], 0xFF);
    }

    auto decoded = decode_header(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->timestamp, -1);
}

TEST_F(CodecTest, RoundTrip) {
    auto header = sample_header();
    auto decoded = decode_header(encode(header));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, header);

    header.extra_data.assign(params::MAX_EXTRA_DATA_SIZE, 0x7F);
    decoded = decode_header(encode(header));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, header);
}

TEST_F(CodecTest, GenesisHashIsFrozen) {
    auto genesis = BlockHeader::genesis();
    EXPECT_TRUE(genesis.is_genesis());
    EXPECT_EQ(genesis.timestamp, params::GENESIS_TIMESTAMP);
    EXPECT_EQ(genesis.difficulty_target, params::GENESIS_DIFFICULTY_TARGET);

    auto hash = compute_header_hash(genesis);
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(to_hex(*hash), "013cc06c55b2c30c19c38d57a625275f029ffb7e21844ee4b686152ed20db649");
}

TEST_F(CodecTest, HashIsSha256OfEncoding) {
    auto header = sample_header();
    auto hash = compute_header_hash(header);
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(*hash, coinjecture::crypto::SHA256::hash(encode(header)));
}

TEST_F(CodecTest, EncodeRejectsBadHeaders) {
    CodecError error = CodecError::Truncated;

    auto header = sample_header();
    header.codec_version = 2;
    EXPECT_FALSE(encode_header(header, &error).has_value());
    EXPECT_EQ(error, CodecError::UnsupportedVersion);
    EXPECT_FALSE(compute_header_hash(header, &error).has_value());

    header = sample_header();
    header.extra_data.assign(params::MAX_EXTRA_DATA_SIZE + 1, 0);
    EXPECT_FALSE(encode_header(header, &error).has_value());
    EXPECT_EQ(error, CodecError::ExtraDataTooLarge);
}

TEST_F(CodecTest, DecodeEmptyAndShortInputs) {
    EXPECT_EQ(decode_error(Bytes{}), CodecError::Truncated);
    EXPECT_FALSE(decode_header(nullptr, 0).has_value());

    auto bytes = encode(sample_header());
    for (size_t len : {size_t(1), size_t(64), HEADER_FIXED_SIZE - 1}) {
        Bytes prefix(bytes.begin(), bytes.begin() + len);
        EXPECT_EQ(decode_error(prefix), CodecError::Truncated) << "length " << len;
    }
}

TEST_F(CodecTest, DecodeUnsupportedVersion) {
    auto bytes = encode(sample_header());
    bytes[0] = 0;
    EXPECT_EQ(decode_error(bytes), CodecError::UnsupportedVersion);
    bytes[0] = 2;
    EXPECT_EQ(decode_error(bytes), CodecError::UnsupportedVersion);

    // Version is checked before length
    EXPECT_EQ(decode_error(Bytes{9}), CodecError::UnsupportedVersion);
}

TEST_F(CodecTest, DecodeExtraDataTooLarge) {
    auto header = sample_header();
    header.extra_data.clear();
    auto bytes = encode(header);

    // Declare 257 bytes of extra_data
    bytes[161] = 0x01;
    bytes[162] = 0x01;
    bytes.resize(bytes.size() + 257, 0);
    EXPECT_EQ(decode_error(bytes), CodecError::ExtraDataTooLarge);

    // A huge declared length must be refused without reading it
    bytes.resize(HEADER_FIXED_SIZE);
    bytes[161] = bytes[162] = bytes[163] = bytes[164] = 0xFF;
    EXPECT_EQ(decode_error(bytes), CodecError::ExtraDataTooLarge);
}

TEST_F(CodecTest, DecodeLengthMismatch) {
    auto bytes = encode(sample_header());

    auto missing = bytes;
    missing.pop_back();
    EXPECT_EQ(decode_error(missing), CodecError::LengthMismatch);

    auto extra = bytes;
    extra.push_back(0);
    EXPECT_EQ(decode_error(extra), CodecError::LengthMismatch);
}

TEST_F(CodecTest, ValidateHeaderGenesisRule) {
    EXPECT_FALSE(validate_header(BlockHeader::genesis()).has_value());
    EXPECT_FALSE(validate_header(sample_header()).has_value());

    auto genesis = BlockHeader::genesis();
    genesis.nonce = 1;
    EXPECT_EQ(validate_header(genesis), CodecError::InvalidGenesis);

    genesis = BlockHeader::genesis();
    genesis.timestamp += 1;
    EXPECT_EQ(validate_header(genesis), CodecError::InvalidGenesis);

    genesis = BlockHeader::genesis();
    genesis.difficulty_target = 1;
    EXPECT_EQ(validate_header(genesis), CodecError::InvalidGenesis);

    // Decoding does not enforce the genesis rule
    auto bytes = encode(genesis);
    EXPECT_TRUE(decode_header(bytes).has_value());

    auto oversized = sample_header();
    oversized.extra_data.assign(300, 0);
    EXPECT_EQ(validate_header(oversized), CodecError::ExtraDataTooLarge);
}

TEST_F(CodecTest, ErrorNames) {
    EXPECT_STREQ(to_string(CodecError::Truncated), "truncated input");
    EXPECT_STREQ(to_string(CodecError::TrailingBytes), "trailing bytes after value");
}

// =============================================================================
// Block codec
// =============================================================================

class BlockCodecTest : public CodecTest {
protected:
    Block sample_block(size_t tx_count) {
        Block block;
        for (size_t i = 0; i < tx_count; ++i) {
            Hash256 tx_hash;
            tx_hash.fill(static_cast<uint8_t>(0xA0 + i));
            block.tx_hashes.push_back(tx_hash);
        }
        block.header = sample_header();
        block.header.merkle_root = coinjecture::merkle::compute_merkle_root(block.tx_hashes);
        return block;
    }

    CodecError block_error(const Bytes& data) {
        CodecError error = CodecError::InvalidField;
        EXPECT_FALSE(decode_block(data, &error).has_value());
        return error;
    }
};

TEST_F(BlockCodecTest, RoundTrip) {
    for (size_t count : {0, 1, 3}) {
        auto block = sample_block(count);
        auto encoded = encode_block(block);
        ASSERT_TRUE(encoded.has_value());
        EXPECT_EQ(encoded->size(), 4 + HEADER_FIXED_SIZE + 2 + 4 + 32 * count);

        auto decoded = decode_block(*encoded);
        ASSERT_TRUE(decoded.has_value());
        EXPECT_EQ(*decoded, block);
        EXPECT_TRUE(validate_merkle_root(*decoded));
    }
}

TEST_F(BlockCodecTest, MerkleRootMismatchDetected) {
    auto block = sample_block(3);
    block.tx_hashes[1][0] ^= 0x01;
    EXPECT_FALSE(validate_merkle_root(block));
}

TEST_F(BlockCodecTest, Truncation) {
    auto encoded = *encode_block(sample_block(2));

    EXPECT_EQ(block_error(Bytes{}), CodecError::Truncated);
    EXPECT_EQ(block_error(Bytes(encoded.begin(), encoded.begin() + 3)), CodecError::Truncated);
    EXPECT_EQ(block_error(Bytes(encoded.begin(), encoded.begin() + 100)), CodecError::Truncated);

    auto missing_hash = encoded;
    missing_hash.resize(encoded.size() - 1);
    EXPECT_EQ(block_error(missing_hash), CodecError::Truncated);
}

TEST_F(BlockCodecTest, TrailingBytes) {
    auto encoded = *encode_block(sample_block(2));
    encoded.push_back(0x00);
    EXPECT_EQ(block_error(encoded), CodecError::TrailingBytes);
}

TEST_F(BlockCodecTest, HeaderLengthOutOfRange) {
    auto encoded = *encode_block(sample_block(0));
    encoded[0] = 10;
    encoded[1] = 0;
    EXPECT_EQ(block_error(encoded), CodecError::LengthMismatch);

    encoded[0] = 0xFF;
    encoded[1] = 0xFF;
    EXPECT_EQ(block_error(encoded), CodecError::LengthMismatch);
}

TEST_F(BlockCodecTest, HeaderErrorsPropagate) {
    auto encoded = *encode_block(sample_block(0));
    encoded[4] = 3; // codec_version inside the embedded header
    EXPECT_EQ(block_error(encoded), CodecError::UnsupportedVersion);
}

TEST_F(BlockCodecTest, TooManyTransactions) {
    auto block = sample_block(0);
    block.tx_hashes.resize(params::MAX_BLOCK_TRANSACTIONS + 1);
    CodecError error = CodecError::Truncated;
    EXPECT_FALSE(encode_block(block, &error).has_value());
    EXPECT_EQ(error, CodecError::TooManyTransactions);

    // Declared count above the limit is refused before the hashes are read
    auto encoded = *encode_block(sample_block(0));
    size_t count_offset = encoded.size() - 4;
    encoded[count_offset] = 0x11;
    encoded[count_offset + 1] = 0x27; // 10001
    EXPECT_EQ(block_error(encoded), CodecError::TooManyTransactions);
}
