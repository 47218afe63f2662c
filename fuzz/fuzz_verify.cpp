#include "coinjecture/serialize.hpp"
#include "coinjecture/verify.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdlib>

using namespace coinjecture;

// Layout: u8 tier | u8 element_count | u16 max_ops | i64 target |
//         element_count x i64 | remaining bytes as u32 indices
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    serialize::Reader reader(data, size);

    auto tier = reader.read_u8();
    auto count = reader.read_u8();
    auto ops_low = reader.read_u8();
    auto ops_high = reader.read_u8();
    auto target = reader.read_i64_le();
    if (!tier || !count || !ops_low || !ops_high || !target) {
        return 0;
    }

    verify::Problem problem;
    problem.tier = static_cast<params::HardwareTier>(*tier % 6);
    problem.target = *target;
    for (uint8_t i = 0; i < *count; ++i) {
        auto element = reader.read_i64_le();
        if (!element) {
            return 0;
        }
        problem.elements.push_back(*element);
    }

    verify::Solution solution;
    while (auto index = reader.read_u32_le()) {
        solution.indices.push_back(*index);
    }

    verify::VerifyBudget budget;
    budget.max_ops = static_cast<uint64_t>(*ops_low) | (static_cast<uint64_t>(*ops_high) << 8);

    verify::VerifyError error = verify::VerifyError::InvalidInput;
    auto result = verify::verify_solution(problem, solution, budget, &error);
    if (result && result->ops_used > budget.max_ops) {
        std::abort();
    }
    if (!result && error == verify::VerifyError::BudgetExceeded &&
        solution.indices.size() <= budget.max_ops) {
        std::abort();
    }
    return 0;
}
