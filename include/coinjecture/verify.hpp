#pragma once

#include "coinjecture/params.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace coinjecture::verify {

using params::HardwareTier;

/// Puzzle classes. The numeric values are the wire tags.
enum class ProblemType : uint8_t {
    SubsetSum = 0,
};

std::optional<ProblemType> problem_type_from_u32(uint32_t value);
const char* to_string(ProblemType type);

/// A published puzzle instance
struct Problem {
    ProblemType problem_type = ProblemType::SubsetSum;
    HardwareTier tier = HardwareTier::Mobile;
    std::vector<int64_t> elements;
    int64_t target = 0;
    int64_t timestamp = 0;
};

/// A claimed answer; every field is untrusted
struct Solution {
    std::vector<uint32_t> indices;
    int64_t timestamp = 0;
};

/**
 * @brief Resource limits for one verification
 *
 * Only max_ops is enforced by the verifier. The duration and memory limits
 * are carried for callers that schedule verification work.
 */
struct VerifyBudget {
    uint64_t max_ops = 0;
    uint64_t max_duration_ms = 0;
    uint64_t max_memory_bytes = 0;

    /// Budget row for tier; nullopt for an unrecognized tier
    static std::optional<VerifyBudget> from_tier(HardwareTier tier);

    bool operator==(const VerifyBudget& other) const {
        return max_ops == other.max_ops &&
               max_duration_ms == other.max_duration_ms &&
               max_memory_bytes == other.max_memory_bytes;
    }
};

struct VerifyResult {
    bool valid = false;
    uint64_t ops_used = 0;
};

/// Why a verification produced no verdict
enum class VerifyError : uint8_t {
    InvalidInput,   ///< Problem is malformed for its tier or type
    BudgetExceeded, ///< max_ops reached before the walk finished
};

const char* to_string(VerifyError error);

/**
 * @brief Check a subset-sum solution against its problem under a budget
 *
 * The solution indices are walked once. Each index costs one op and the walk
 * stops with BudgetExceeded as soon as the count passes max_ops. Out-of-range
 * or repeated indices and sum overflow make the verdict invalid without
 * stopping the walk. Memory used is proportional to problem.elements.size().
 *
 * @return The verdict, or nullopt with error set to the reason
 */
std::optional<VerifyResult> verify_solution(const Problem& problem,
                                            const Solution& solution,
                                            const VerifyBudget& budget,
                                            VerifyError* error = nullptr);

} // namespace coinjecture::verify
