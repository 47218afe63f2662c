#include <gtest/gtest.h>
#include "coinjecture/verify.hpp"
#include <limits>
#include <vector>

using namespace coinjecture::verify;

class VerifyTest : public ::testing::Test {
protected:
    Problem problem_;
    VerifyBudget budget_;

    void SetUp() override {
        problem_.problem_type = ProblemType::SubsetSum;
        problem_.tier = HardwareTier::Mobile;
        problem_.elements = {3, 7, 11};
        problem_.target = 18;
        problem_.timestamp = 1609459260;
        budget_ = *VerifyBudget::from_tier(HardwareTier::Mobile);
    }

    Solution solution(std::vector<uint32_t> indices) {
        Solution s;
        s.indices = std::move(indices);
        s.timestamp = 1609459261;
        return s;
    }
};

TEST_F(VerifyTest, ValidSubset) {
    auto result = verify_solution(problem_, solution({1, 2}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->valid);
    EXPECT_EQ(result->ops_used, 2u);
}

TEST_F(VerifyTest, WrongSum) {
    auto result = verify_solution(problem_, solution({0, 1}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->valid);
    EXPECT_EQ(result->ops_used, 2u);
}

TEST_F(VerifyTest, DuplicateIndexInvalid) {
    auto result = verify_solution(problem_, solution({0, 0}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->valid);
}

TEST_F(VerifyTest, DuplicateCannotReachTarget) {
    // 7 + 11 = 18 is correct, but the repeated 7 must still invalidate it
    auto result = verify_solution(problem_, solution({1, 2, 1}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->valid);
    EXPECT_EQ(result->ops_used, 3u);
}

TEST_F(VerifyTest, OutOfRangeIndexInvalid) {
    auto result = verify_solution(problem_, solution({0, 3}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->valid);

    result = verify_solution(problem_, solution({0xFFFFFFFFu, 0, 2}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->valid);
    EXPECT_EQ(result->ops_used, 3u);
}

TEST_F(VerifyTest, EmptySolutionEvaluatedLiterally) {
    auto result = verify_solution(problem_, solution({}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->valid);
    EXPECT_EQ(result->ops_used, 0u);

    problem_.target = 0;
    result = verify_solution(problem_, solution({}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->valid);
}

TEST_F(VerifyTest, BudgetExceeded) {
    VerifyError error = VerifyError::InvalidInput;
    budget_.max_ops = 1;
    EXPECT_FALSE(verify_solution(problem_, solution({1, 2}), budget_, &error).has_value());
    EXPECT_EQ(error, VerifyError::BudgetExceeded);

    // Exactly max_ops indices fit
    budget_.max_ops = 2;
    auto result = verify_solution(problem_, solution({1, 2}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->valid);
    EXPECT_LE(result->ops_used, budget_.max_ops);
}

TEST_F(VerifyTest, BudgetExhaustionBeatsInvalidity) {
    VerifyError error = VerifyError::InvalidInput;
    budget_.max_ops = 3;
    std::vector<uint32_t> indices(10, 99);
    EXPECT_FALSE(verify_solution(problem_, solution(indices), budget_, &error).has_value());
    EXPECT_EQ(error, VerifyError::BudgetExceeded);
}

TEST_F(VerifyTest, ZeroBudget) {
    VerifyError error = VerifyError::InvalidInput;
    budget_.max_ops = 0;
    EXPECT_FALSE(verify_solution(problem_, solution({0}), budget_, &error).has_value());
    EXPECT_EQ(error, VerifyError::BudgetExceeded);

    problem_.target = 0;
    auto result = verify_solution(problem_, solution({}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->valid);
}

TEST_F(VerifyTest, AdvisoryLimitsDoNotAffectVerdict) {
    budget_.max_duration_ms = 0;
    budget_.max_memory_bytes = 0;
    auto result = verify_solution(problem_, solution({1, 2}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->valid);
}

TEST_F(VerifyTest, OverflowIsInvalidNotError) {
    problem_.tier = HardwareTier::Desktop;
    problem_.elements = {std::numeric_limits<int64_t>::max(), 1};
    problem_.target = std::numeric_limits<int64_t>::min();
    auto result = verify_solution(problem_, solution({0, 1}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->valid);
    EXPECT_EQ(result->ops_used, 2u);

    problem_.elements = {std::numeric_limits<int64_t>::min(), -1};
    problem_.target = std::numeric_limits<int64_t>::max();
    result = verify_solution(problem_, solution({0, 1}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->valid);
}

TEST_F(VerifyTest, NegativeElements) {
    problem_.elements = {-5, 10, 3};
    problem_.target = 5;
    auto result = verify_solution(problem_, solution({0, 1}), budget_);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->valid);
}

TEST_F(VerifyTest, MalformedProblems) {
    VerifyError error = VerifyError::BudgetExceeded;

    auto empty = problem_;
    empty.elements.clear();
    EXPECT_FALSE(verify_solution(empty, solution({}), budget_, &error).has_value());
    EXPECT_EQ(error, VerifyError::InvalidInput);

    auto bad_tier = problem_;
    bad_tier.tier = static_cast<HardwareTier>(5);
    error = VerifyError::BudgetExceeded;
    EXPECT_FALSE(verify_solution(bad_tier, solution({0}), budget_, &error).has_value());
    EXPECT_EQ(error, VerifyError::InvalidInput);

    auto bad_type = problem_;
    bad_type.problem_type = static_cast<ProblemType>(1);
    error = VerifyError::BudgetExceeded;
    EXPECT_FALSE(verify_solution(bad_type, solution({0}), budget_, &error).has_value());
    EXPECT_EQ(error, VerifyError::InvalidInput);
}

TEST_F(VerifyTest, ElementCountOutsideTierRange) {
    VerifyError error = VerifyError::BudgetExceeded;

    auto too_many = problem_;
    too_many.elements.assign(17, 1);
    EXPECT_FALSE(verify_solution(too_many, solution({0}), budget_, &error).has_value());
    EXPECT_EQ(error, VerifyError::InvalidInput);

    auto too_few = problem_;
    too_few.tier = HardwareTier::Server;
    error = VerifyError::BudgetExceeded;
    EXPECT_FALSE(verify_solution(too_few, solution({0}), budget_, &error).has_value());
    EXPECT_EQ(error, VerifyError::InvalidInput);
}

TEST_F(VerifyTest, Names) {
    EXPECT_STREQ(to_string(VerifyError::BudgetExceeded), "budget exceeded");
    EXPECT_STREQ(to_string(ProblemType::SubsetSum), "subset_sum");
    EXPECT_EQ(problem_type_from_u32(0), ProblemType::SubsetSum);
    EXPECT_FALSE(problem_type_from_u32(1).has_value());
}
