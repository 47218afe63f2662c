#include "ffi/coinjecture_ffi.h"
#include "coinjecture/codec.hpp"
#include "coinjecture/log.hpp"
#include "coinjecture/merkle.hpp"
#include "coinjecture/verify.hpp"
#include <cstring>
#include <exception>
#include <new>
#include <string>

using namespace coinjecture;

// Helper macro for exception handling at the C boundary
#define HANDLE_EXCEPTIONS(...) \
    try { \
        __VA_ARGS__ \
    } catch (const std::bad_alloc&) { \
        COINJ_LOG_ERROR(std::string(__func__) + ": allocation failed"); \
        return COINJ_ERROR_OUT_OF_MEMORY; \
    } catch (const std::exception& e) { \
        COINJ_LOG_ERROR(std::string(__func__) + ": " + e.what()); \
        return COINJ_ERROR_INTERNAL; \
    } catch (...) { \
        COINJ_LOG_ERROR(std::string(__func__) + ": unknown exception"); \
        return COINJ_ERROR_INTERNAL; \
    }

namespace {

// Copy a C header into the value type. Oversized extra_data is refused
// before anything is copied.
CoinjResult header_from_c(const CoinjBlockHeader& c_header, block::BlockHeader& header) {
    if (c_header.extra_data_len > 0 && !c_header.extra_data) {
        return COINJ_ERROR_INVALID_INPUT;
    }
    if (c_header.extra_data_len > params::MAX_EXTRA_DATA_SIZE) {
        return COINJ_ERROR_ENCODING;
    }
    header.codec_version = c_header.codec_version;
    header.block_index = c_header.block_index;
    header.timestamp = c_header.timestamp;
    std::memcpy(header.parent_hash.data(), c_header.parent_hash, 32);
    std::memcpy(header.merkle_root.data(), c_header.merkle_root, 32);
    std::memcpy(header.miner_address.data(), c_header.miner_address, 32);
    std::memcpy(header.commitment.data(), c_header.commitment, 32);
    header.difficulty_target = c_header.difficulty_target;
    header.nonce = c_header.nonce;
    header.extra_data.assign(c_header.extra_data, c_header.extra_data + c_header.extra_data_len);
    return COINJ_OK;
}

void header_to_c(const block::BlockHeader& header, CoinjBlockHeader& c_header) {
    c_header.codec_version = header.codec_version;
    c_header.block_index = header.block_index;
    c_header.timestamp = header.timestamp;
    std::memcpy(c_header.parent_hash, header.parent_hash.data(), 32);
    std::memcpy(c_header.merkle_root, header.merkle_root.data(), 32);
    std::memcpy(c_header.miner_address, header.miner_address.data(), 32);
    std::memcpy(c_header.commitment, header.commitment.data(), 32);
    c_header.difficulty_target = header.difficulty_target;
    c_header.nonce = header.nonce;
}

} // namespace

extern "C" {

// =============================================================================
// HASHING
// =============================================================================

CoinjResult coinjecture_sha256_hash(const uint8_t* input, size_t input_len, uint8_t output[32]) {
    HANDLE_EXCEPTIONS({
        if (!output || (!input && input_len > 0)) {
            return COINJ_ERROR_INVALID_INPUT;
        }

        auto hash = crypto::SHA256::hash(input, input_len);
        std::memcpy(output, hash.data(), 32);
        return COINJ_OK;
    })
}

CoinjResult coinjecture_compute_header_hash(const CoinjBlockHeader* header, uint8_t output[32]) {
    HANDLE_EXCEPTIONS({
        if (!header || !output) {
            return COINJ_ERROR_INVALID_INPUT;
        }

        block::BlockHeader cpp_header;
        CoinjResult copied = header_from_c(*header, cpp_header);
        if (copied != COINJ_OK) {
            return copied;
        }

        auto hash = codec::compute_header_hash(cpp_header);
        if (!hash) {
            return COINJ_ERROR_ENCODING;
        }
        std::memcpy(output, hash->data(), 32);
        return COINJ_OK;
    })
}

CoinjResult coinjecture_compute_merkle_root(const uint8_t* leaves, size_t count, uint8_t output[32]) {
    HANDLE_EXCEPTIONS({
        if (!output || (!leaves && count > 0)) {
            return COINJ_ERROR_INVALID_INPUT;
        }

        std::vector<crypto::Hash256> leaf_hashes(count);
        for (size_t i = 0; i < count; ++i) {
            std::memcpy(leaf_hashes[i].data(), leaves + i * 32, 32);
        }

        auto root = merkle::compute_merkle_root(leaf_hashes);
        std::memcpy(output, root.data(), 32);
        return COINJ_OK;
    })
}

// =============================================================================
// CODEC
// =============================================================================

CoinjResult coinjecture_encode_header(const CoinjBlockHeader* header,
                                      uint8_t* output, size_t capacity, size_t* output_len) {
    HANDLE_EXCEPTIONS({
        if (!header || !output_len || (!output && capacity > 0)) {
            return COINJ_ERROR_INVALID_INPUT;
        }

        block::BlockHeader cpp_header;
        CoinjResult copied = header_from_c(*header, cpp_header);
        if (copied != COINJ_OK) {
            return copied;
        }

        auto encoded = codec::encode_header(cpp_header);
        if (!encoded) {
            return COINJ_ERROR_ENCODING;
        }

        *output_len = encoded->size();
        if (capacity < encoded->size()) {
            return COINJ_ERROR_INVALID_INPUT;
        }
        std::memcpy(output, encoded->data(), encoded->size());
        return COINJ_OK;
    })
}

CoinjResult coinjecture_decode_header(const uint8_t* data, size_t data_len,
                                      CoinjBlockHeader* out_header,
                                      uint8_t* extra_buf, size_t extra_cap) {
    HANDLE_EXCEPTIONS({
        if (!out_header || (!data && data_len > 0) || (!extra_buf && extra_cap > 0)) {
            return COINJ_ERROR_INVALID_INPUT;
        }

        auto header = codec::decode_header(data, data_len);
        if (!header) {
            return COINJ_ERROR_ENCODING;
        }

        out_header->extra_data_len = header->extra_data.size();
        if (extra_cap < header->extra_data.size()) {
            out_header->extra_data = nullptr;
            return COINJ_ERROR_INVALID_INPUT;
        }

        header_to_c(*header, *out_header);
        if (!header->extra_data.empty()) {
            std::memcpy(extra_buf, header->extra_data.data(), header->extra_data.size());
        }
        out_header->extra_data = extra_buf;
        return COINJ_OK;
    })
}

// =============================================================================
// VERIFICATION
// =============================================================================

CoinjResult coinjecture_verify_subset_sum(const CoinjProblem* problem,
                                          const CoinjSolution* solution,
                                          const CoinjVerifyBudget* budget,
                                          CoinjVerifyResult* out_result) {
    HANDLE_EXCEPTIONS({
        if (!problem || !solution || !budget || !out_result) {
            return COINJ_ERROR_INVALID_INPUT;
        }
        if (!problem->elements || problem->element_count == 0) {
            return COINJ_ERROR_INVALID_INPUT;
        }
        if (!solution->indices && solution->index_count > 0) {
            return COINJ_ERROR_INVALID_INPUT;
        }

        auto type = verify::problem_type_from_u32(problem->problem_type);
        auto tier = params::tier_from_u32(problem->tier);
        if (!type || !tier) {
            return COINJ_ERROR_INVALID_INPUT;
        }

        // Refuse out-of-range sizes before copying anything
        auto range = params::element_range(*tier);
        if (problem->element_count < range.first || problem->element_count > range.second) {
            return COINJ_ERROR_INVALID_INPUT;
        }

        verify::Problem cpp_problem;
        cpp_problem.problem_type = *type;
        cpp_problem.tier = *tier;
        cpp_problem.elements.assign(problem->elements, problem->elements + problem->element_count);
        cpp_problem.target = problem->target;
        cpp_problem.timestamp = problem->timestamp;

        // Indices past max_ops + 1 can never be reached by the walk
        size_t reachable = solution->index_count;
        if (budget->max_ops < reachable) {
            reachable = static_cast<size_t>(budget->max_ops) + 1;
        }

        verify::Solution cpp_solution;
        cpp_solution.indices.assign(solution->indices, solution->indices + reachable);
        cpp_solution.timestamp = solution->timestamp;

        verify::VerifyBudget cpp_budget;
        cpp_budget.max_ops = budget->max_ops;
        cpp_budget.max_duration_ms = budget->max_duration_ms;
        cpp_budget.max_memory_bytes = budget->max_memory_bytes;

        verify::VerifyError error = verify::VerifyError::InvalidInput;
        auto result = verify::verify_solution(cpp_problem, cpp_solution, cpp_budget, &error);
        if (!result) {
            return error == verify::VerifyError::BudgetExceeded
                ? COINJ_ERROR_VERIFICATION_FAILED
                : COINJ_ERROR_INVALID_INPUT;
        }

        out_result->valid = result->valid ? 1 : 0;
        out_result->ops_used = result->ops_used;
        return COINJ_OK;
    })
}

CoinjResult coinjecture_budget_for_tier(uint32_t tier, CoinjVerifyBudget* out_budget) {
    HANDLE_EXCEPTIONS({
        if (!out_budget) {
            return COINJ_ERROR_INVALID_INPUT;
        }

        auto parsed = params::tier_from_u32(tier);
        if (!parsed) {
            return COINJ_ERROR_INVALID_INPUT;
        }
        auto budget = verify::VerifyBudget::from_tier(*parsed);
        if (!budget) {
            return COINJ_ERROR_INVALID_INPUT;
        }

        out_budget->max_ops = budget->max_ops;
        out_budget->max_duration_ms = budget->max_duration_ms;
        out_budget->max_memory_bytes = budget->max_memory_bytes;
        return COINJ_OK;
    })
}

// =============================================================================
// UTILITY
// =============================================================================

const char* coinjecture_result_string(CoinjResult result) {
    switch (result) {
        case COINJ_OK:                        return "ok";
        case COINJ_ERROR_INVALID_INPUT:       return "invalid input";
        case COINJ_ERROR_OUT_OF_MEMORY:       return "out of memory";
        case COINJ_ERROR_VERIFICATION_FAILED: return "verification failed";
        case COINJ_ERROR_ENCODING:            return "encoding error";
        case COINJ_ERROR_INTERNAL:            return "internal error";
    }
    return "unknown result";
}

const char* coinjecture_version(void) {
    return params::version();
}

uint32_t coinjecture_codec_version(void) {
    return params::CODEC_VERSION;
}

} // extern "C"
