#pragma once

#include "coinjecture/block.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace coinjecture::codec {

using block::Block;
using block::BlockHeader;
using crypto::Bytes;
using crypto::Hash256;

/// Why an encode or decode was refused
enum class CodecError : uint8_t {
    Truncated,           ///< Input ends before a fixed-width field
    UnsupportedVersion,  ///< codec_version is not recognized
    ExtraDataTooLarge,   ///< extra_data exceeds MAX_EXTRA_DATA_SIZE
    LengthMismatch,      ///< A declared length disagrees with the bytes present
    TrailingBytes,       ///< Bytes left over after a complete value
    TooManyTransactions, ///< Block carries more than MAX_BLOCK_TRANSACTIONS hashes
    InvalidGenesis,      ///< block_index 0 with non-frozen genesis fields
    MalformedJson,       ///< Interchange text is not a JSON object
    InvalidField,        ///< Interchange field missing, unknown, or out of range
};

const char* to_string(CodecError error);

/// Size of the header encoding without extra_data:
/// version(1) index(8) timestamp(8) 4 x hash(32) difficulty(8) nonce(8) extra_len(4)
constexpr size_t HEADER_FIXED_SIZE = 1 + 8 + 8 + 4 * 32 + 8 + 8 + 4;
constexpr size_t HEADER_MAX_SIZE = HEADER_FIXED_SIZE + params::MAX_EXTRA_DATA_SIZE;

// =============================================================================
// Canonical header codec
// =============================================================================

/// Canonical bytes of header. Fails for an unrecognized codec_version or
/// oversized extra_data.
std::optional<Bytes> encode_header(const BlockHeader& header, CodecError* error = nullptr);

/// Strict decode. The whole input must be exactly one header.
std::optional<BlockHeader> decode_header(const uint8_t* data, size_t size,
                                         CodecError* error = nullptr);
std::optional<BlockHeader> decode_header(const Bytes& data, CodecError* error = nullptr);

/// SHA256 of the canonical encoding; the only header hash used by consensus
std::optional<Hash256> compute_header_hash(const BlockHeader& header,
                                           CodecError* error = nullptr);

/// Encode preconditions plus the genesis rule
std::optional<CodecError> validate_header(const BlockHeader& header);

// =============================================================================
// Interchange form (JSON)
// =============================================================================

/// Descriptive form for storage and tooling; hashes and extra_data as
/// lowercase hex. Never hashed directly.
std::string header_to_json(const BlockHeader& header, int indent = -1);

/// Strict: every field present, no unknown fields, exact hex widths
std::optional<BlockHeader> header_from_json(const std::string& text,
                                            CodecError* error = nullptr);

// =============================================================================
// Block codec
// =============================================================================

/// u32 header_len || header || u32 tx_count || tx_count x 32 bytes
std::optional<Bytes> encode_block(const Block& block, CodecError* error = nullptr);

std::optional<Block> decode_block(const uint8_t* data, size_t size,
                                  CodecError* error = nullptr);
std::optional<Block> decode_block(const Bytes& data, CodecError* error = nullptr);

/// True when header.merkle_root matches the root over tx_hashes
bool validate_merkle_root(const Block& block);

} // namespace coinjecture::codec
