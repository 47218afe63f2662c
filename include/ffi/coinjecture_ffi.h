#pragma once

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Result codes for cross-language error handling
typedef enum {
    COINJ_OK = 0,
    COINJ_ERROR_INVALID_INPUT = 1,
    COINJ_ERROR_OUT_OF_MEMORY = 2,
    COINJ_ERROR_VERIFICATION_FAILED = 3,
    COINJ_ERROR_ENCODING = 4,
    COINJ_ERROR_INTERNAL = 5,
} CoinjResult;

// Shared data structures. The caller owns every buffer they point to;
// nothing is retained after a call returns.

typedef struct {
    uint8_t codec_version;
    uint64_t block_index;
    int64_t timestamp;
    uint8_t parent_hash[32];
    uint8_t merkle_root[32];
    uint8_t miner_address[32];
    uint8_t commitment[32];
    uint64_t difficulty_target;
    uint64_t nonce;
    const uint8_t* extra_data;
    size_t extra_data_len;
} CoinjBlockHeader;

typedef struct {
    uint32_t problem_type;   // 0 = subset sum
    uint32_t tier;           // 0 = mobile ... 4 = cluster
    const int64_t* elements;
    size_t element_count;
    int64_t target;
    int64_t timestamp;
} CoinjProblem;

typedef struct {
    const uint32_t* indices;
    size_t index_count;
    int64_t timestamp;
} CoinjSolution;

typedef struct {
    uint64_t max_ops;
    uint64_t max_duration_ms;
    uint64_t max_memory_bytes;
} CoinjVerifyBudget;

typedef struct {
    int32_t valid;
    uint64_t ops_used;
} CoinjVerifyResult;

// =============================================================================
// HASHING
// =============================================================================

/// SHA-256 of input. input may be NULL only when input_len is 0.
CoinjResult coinjecture_sha256_hash(const uint8_t* input, size_t input_len, uint8_t output[32]);

/// SHA-256 of the canonical header encoding
CoinjResult coinjecture_compute_header_hash(const CoinjBlockHeader* header, uint8_t output[32]);

/// Merkle root of count 32-byte leaves laid out contiguously. leaves may be
/// NULL only when count is 0.
CoinjResult coinjecture_compute_merkle_root(const uint8_t* leaves, size_t count, uint8_t output[32]);

// =============================================================================
// CODEC
// =============================================================================

/// Write the canonical header bytes into output.
/// When capacity is too small, returns COINJ_ERROR_INVALID_INPUT and sets
/// *output_len to the required size.
CoinjResult coinjecture_encode_header(const CoinjBlockHeader* header,
                                      uint8_t* output, size_t capacity, size_t* output_len);

/// Strict decode of one header. extra_data is copied into extra_buf and
/// out_header->extra_data points at it. When extra_cap is too small, returns
/// COINJ_ERROR_INVALID_INPUT with out_header->extra_data_len set to the
/// required size.
CoinjResult coinjecture_decode_header(const uint8_t* data, size_t data_len,
                                      CoinjBlockHeader* out_header,
                                      uint8_t* extra_buf, size_t extra_cap);

// =============================================================================
// VERIFICATION
// =============================================================================

/// Verify a subset-sum solution under budget.
/// COINJ_OK with the verdict in out_result; COINJ_ERROR_INVALID_INPUT for a
/// malformed problem; COINJ_ERROR_VERIFICATION_FAILED when the budget runs out.
CoinjResult coinjecture_verify_subset_sum(const CoinjProblem* problem,
                                          const CoinjSolution* solution,
                                          const CoinjVerifyBudget* budget,
                                          CoinjVerifyResult* out_result);

/// Standard budget for a hardware tier
CoinjResult coinjecture_budget_for_tier(uint32_t tier, CoinjVerifyBudget* out_budget);

// =============================================================================
// UTILITY
// =============================================================================

/// Static description of a result code
const char* coinjecture_result_string(CoinjResult result);

/// Library version, static storage
const char* coinjecture_version(void);

/// Canonical header codec version
uint32_t coinjecture_codec_version(void);

#ifdef __cplusplus
}
#endif
