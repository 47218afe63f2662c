#include "coinjecture/verify.hpp"
#include "coinjecture/log.hpp"
#include <limits>
#include <string>

namespace coinjecture::verify {

namespace {
    std::nullopt_t reject(VerifyError* error, VerifyError reason) {
        if (error) {
            *error = reason;
        }
        return std::nullopt;
    }

    bool checked_add(int64_t a, int64_t b, int64_t& out) {
        if (b > 0 && a > std::numeric_limits<int64_t>::max() - b) {
            return false;
        }
        if (b < 0 && a < std::numeric_limits<int64_t>::min() - b) {
            return false;
        }
        out = a + b;
        return true;
    }
}

std::optional<ProblemType> problem_type_from_u32(uint32_t value) {
    if (value == static_cast<uint32_t>(ProblemType::SubsetSum)) {
        return ProblemType::SubsetSum;
    }
    return std::nullopt;
}

const char* to_string(ProblemType type) {
    switch (type) {
        case ProblemType::SubsetSum: return "subset_sum";
    }
    return "unknown";
}

const char* to_string(VerifyError error) {
    switch (error) {
        case VerifyError::InvalidInput:   return "invalid input";
        case VerifyError::BudgetExceeded: return "budget exceeded";
    }
    return "unknown verify error";
}

std::optional<VerifyBudget> VerifyBudget::from_tier(HardwareTier tier) {
    const params::TierProfile* profile = params::tier_profile(tier);
    if (!profile) {
        return std::nullopt;
    }
    VerifyBudget budget;
    budget.max_ops = profile->max_ops;
    budget.max_duration_ms = profile->max_duration_ms;
    budget.max_memory_bytes = profile->max_memory_bytes;
    return budget;
}

std::optional<VerifyResult> verify_solution(const Problem& problem,
                                            const Solution& solution,
                                            const VerifyBudget& budget,
                                            VerifyError* error) {
    if (problem.elements.empty() || !problem_type_from_u32(static_cast<uint32_t>(problem.problem_type)) ||
        !params::is_valid_tier(problem.tier)) {
        return reject(error, VerifyError::InvalidInput);
    }

    auto range = params::element_range(problem.tier);
    const size_t count = problem.elements.size();
    if (count < range.first || count > range.second) {
        COINJ_LOG_DEBUG("verify: " + std::to_string(count) + " elements outside " +
                        params::to_string(problem.tier) + " range");
        return reject(error, VerifyError::InvalidInput);
    }

    // Indexed by element position, never by the untrusted index value
    std::vector<bool> seen(count, false);

    VerifyResult result;
    bool bad_index = false;
    bool overflow = false;
    int64_t sum = 0;

    for (uint32_t index : solution.indices) {
        if (++result.ops_used > budget.max_ops) {
            COINJ_LOG_DEBUG("verify: budget of " + std::to_string(budget.max_ops) +
                            " ops exhausted after " + std::to_string(result.ops_used - 1));
            return reject(error, VerifyError::BudgetExceeded);
        }

        if (index >= count || seen[index]) {
            bad_index = true;
            continue;
        }
        seen[index] = true;

        if (!overflow && !checked_add(sum, problem.elements[index], sum)) {
            overflow = true;
        }
    }

    result.valid = !bad_index && !overflow && sum == problem.target;
    return result;
}

} // namespace coinjecture::verify
